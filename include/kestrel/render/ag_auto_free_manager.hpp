#pragma once

#include "kestrel/core/types.hpp"

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace kestrel {

/**
 * @brief Closes resources that stop being referenced between frames
 *
 * Every resource passed to reference() is tracked. Each GC interval,
 * tracked resources that were not referenced again since the previous GC
 * are closed and dropped. A resource that keeps being referenced every
 * frame stays alive.
 *
 * **When to use**:
 * - Per-frame cached objects (text layouts, filter textures) whose owner
 *   does not know when they are last used
 *
 * **When NOT to use**:
 * - Resources with a clear owner (just close them there)
 *
 * Usage:
 * @code
 * // Every frame the cache is still in use
 * ctx.refGcCloseable(cachedTexture);
 *
 * // RenderContext::afterRender() drives the manager
 * manager.afterRender();
 * @endcode
 *
 * Thread-safe: reference() may be called from any thread. Resources are
 * closed outside the internal lock.
 */
class AgAutoFreeManager {
public:
    explicit AgAutoFreeManager(int gcIntervalFrames = 60);
    ~AgAutoFreeManager();

    AgAutoFreeManager(const AgAutoFreeManager&) = delete;
    AgAutoFreeManager& operator=(const AgAutoFreeManager&) = delete;

    /// Track @p closeable and mark it as used in the current interval
    void reference(CloseableRef closeable);

    /// Count a frame; runs gc() every gcIntervalFrames frames
    void afterRender();

    /// Close every resource not referenced since the previous gc()
    void gc();

    /// Close every tracked resource immediately
    void close();

    /// Number of tracked resources
    size_t trackedCount() const;

    int gcIntervalFrames() const { return gcIntervalFrames_; }

private:
    struct Entry {
        CloseableRef closeable;
        bool referenced = true;
    };

    void closeAll(std::vector<CloseableRef>& closeables, const char* reason);

    mutable std::mutex mutex_;
    std::unordered_map<Closeable*, Entry> entries_;
    int gcIntervalFrames_;
    uint64_t frame_ = 0;
};

} // namespace kestrel
