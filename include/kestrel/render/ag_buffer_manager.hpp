#pragma once

#include "kestrel/core/types.hpp"
#include "kestrel/ag/ag.hpp"

#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace kestrel {

/**
 * @brief CPU-side buffer contents that AgBufferManager mirrors on the GPU
 */
class AgCachedBuffer {
public:
    explicit AgCachedBuffer(std::vector<uint8_t> data = {}, AGBufferKind kind = AGBufferKind::Vertex)
        : data_(std::move(data)), kind_(kind) {}

    template<typename T>
    static std::shared_ptr<AgCachedBuffer> of(const std::vector<T>& items,
                                              AGBufferKind kind = AGBufferKind::Vertex) {
        const auto* bytes = reinterpret_cast<const uint8_t*>(items.data());
        return std::make_shared<AgCachedBuffer>(
            std::vector<uint8_t>(bytes, bytes + items.size() * sizeof(T)), kind);
    }

    const std::vector<uint8_t>& data() const { return data_; }
    AGBufferKind kind() const { return kind_; }

    /// Replace the contents; the GPU copy is refreshed on next use
    void setData(std::vector<uint8_t> data) {
        data_ = std::move(data);
        version_++;
    }

    uint64_t version() const { return version_; }

private:
    std::vector<uint8_t> data_;
    AGBufferKind kind_;
    uint64_t version_ = 0;
};

using AgCachedBufferRef = std::shared_ptr<AgCachedBuffer>;

/**
 * @brief Uploads AgCachedBuffers to AG buffers on demand and frees unused ones
 *
 * Same lifetime rules as AgBitmapTextureManager.
 */
class AgBufferManager {
public:
    explicit AgBufferManager(AG& ag, int gcIntervalFrames = 60);
    ~AgBufferManager();

    AgBufferManager(const AgBufferManager&) = delete;
    AgBufferManager& operator=(const AgBufferManager&) = delete;

    AGBuffer& getBuffer(const AgCachedBufferRef& buffer);

    bool removeBuffer(const AgCachedBuffer* buffer);

    void afterRender();
    void gc();
    void close();

    size_t cachedCount() const { return entries_.size(); }

private:
    struct Entry {
        std::weak_ptr<AgCachedBuffer> source;
        AGBufferPtr buffer;
        uint64_t uploadedVersion = 0;
        bool uploaded = false;
        bool usedSinceGc = true;
    };

    AG& ag_;
    int gcIntervalFrames_;
    uint64_t frame_ = 0;
    std::unordered_map<const AgCachedBuffer*, Entry> entries_;
};

} // namespace kestrel
