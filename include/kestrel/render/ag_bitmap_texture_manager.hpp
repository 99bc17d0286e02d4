#pragma once

#include "kestrel/core/types.hpp"
#include "kestrel/render/texture.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>

namespace kestrel {

class BmpSlice;
struct Stats;

/**
 * @brief Uploads bitmaps to AG textures on demand and frees unused ones
 *
 * One texture is cached per bitmap. A bitmap whose contentVersion() moved
 * since the last upload is uploaded again on the next lookup. Every GC
 * interval, textures whose bitmap was not looked up during the interval
 * (or whose bitmap no longer exists) are closed.
 *
 * Pending draws may still reference a texture about to be freed, so the
 * owner installs a before-free callback that flushes them first.
 */
class AgBitmapTextureManager {
public:
    explicit AgBitmapTextureManager(AG& ag, int gcIntervalFrames = 60, Stats* stats = nullptr);
    ~AgBitmapTextureManager();

    AgBitmapTextureManager(const AgBitmapTextureManager&) = delete;
    AgBitmapTextureManager& operator=(const AgBitmapTextureManager&) = delete;

    /// Whole texture for @p bitmap, uploading it if new or modified
    TextureBase getTextureBase(const BitmapRef& bitmap);

    /// Texture region matching @p slice
    Texture getTexture(const BmpSlice& slice);

    /// Called before any cached texture is closed
    void setBeforeFree(std::function<void()> callback) { beforeFree_ = std::move(callback); }

    /// Free the texture of @p bitmap now; returns false if none was cached
    bool removeBitmap(const Bitmap32* bitmap);

    /// Count a frame; runs gc() every gcIntervalFrames frames
    void afterRender();

    /// Free textures not used since the previous gc()
    void gc();

    /// Free every texture
    void close();

    size_t cachedCount() const { return entries_.size(); }

    /// Total texture uploads performed
    uint64_t uploadCount() const { return uploadCount_; }

private:
    struct Entry {
        std::weak_ptr<Bitmap32> bitmap;
        AGTexturePtr texture;
        uint64_t uploadedVersion = 0;
        bool uploaded = false;
        bool usedSinceGc = true;
    };

    void notifyBeforeFree();

    AG& ag_;
    Stats* stats_;
    std::function<void()> beforeFree_;
    int gcIntervalFrames_;
    uint64_t frame_ = 0;
    uint64_t uploadCount_ = 0;
    std::unordered_map<const Bitmap32*, Entry> entries_;
};

} // namespace kestrel
