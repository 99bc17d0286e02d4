#include "kestrel/render/ag_bitmap_texture_manager.hpp"
#include "kestrel/render/stats.hpp"
#include "kestrel/ag/ag.hpp"
#include "kestrel/image/bitmap.hpp"
#include "kestrel/core/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace kestrel {

AgBitmapTextureManager::AgBitmapTextureManager(AG& ag, int gcIntervalFrames, Stats* stats)
    : ag_(ag)
    , stats_(stats)
    , gcIntervalFrames_(std::max(1, gcIntervalFrames)) {
}

AgBitmapTextureManager::~AgBitmapTextureManager() {
    close();
}

TextureBase AgBitmapTextureManager::getTextureBase(const BitmapRef& bitmap) {
    if (!bitmap) {
        throw std::invalid_argument("AgBitmapTextureManager: bitmap cannot be null");
    }

    Entry& entry = entries_[bitmap.get()];

    // A new bitmap may reuse the address of an expired one
    if (entry.texture && entry.bitmap.expired()) {
        notifyBeforeFree();
        entry.texture->close();
        entry = Entry{};
    }

    if (!entry.texture) {
        entry.bitmap = bitmap;
        entry.texture = ag_.createTexture(bitmap->premultiplied());
    }

    if (!entry.uploaded || entry.uploadedVersion != bitmap->contentVersion()) {
        entry.texture->upload(*bitmap);
        entry.uploadedVersion = bitmap->contentVersion();
        entry.uploaded = true;
        uploadCount_++;
        if (stats_) {
            stats_->textureUploads++;
        }
    }

    entry.usedSinceGc = true;
    return TextureBase{entry.texture.get(), bitmap->width(), bitmap->height()};
}

Texture AgBitmapTextureManager::getTexture(const BmpSlice& slice) {
    TextureBase base = getTextureBase(slice.bmp());
    const RectangleInt& bounds = slice.bounds();
    return Texture(base, bounds.x, bounds.y, bounds.x + bounds.width, bounds.y + bounds.height);
}

bool AgBitmapTextureManager::removeBitmap(const Bitmap32* bitmap) {
    auto it = entries_.find(bitmap);
    if (it == entries_.end()) {
        return false;
    }
    if (it->second.texture) {
        notifyBeforeFree();
        it->second.texture->close();
    }
    entries_.erase(it);
    return true;
}

void AgBitmapTextureManager::afterRender() {
    frame_++;
    if (frame_ % static_cast<uint64_t>(gcIntervalFrames_) == 0) {
        gc();
    }
}

void AgBitmapTextureManager::gc() {
    bool anyUnused = std::any_of(entries_.begin(), entries_.end(), [](const auto& item) {
        return !item.second.usedSinceGc || item.second.bitmap.expired();
    });
    if (anyUnused) {
        notifyBeforeFree();
    }

    size_t freed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        Entry& entry = it->second;
        if (!entry.usedSinceGc || entry.bitmap.expired()) {
            if (entry.texture) {
                entry.texture->close();
            }
            it = entries_.erase(it);
            freed++;
        } else {
            entry.usedSinceGc = false;
            ++it;
        }
    }

    if (freed > 0) {
        KESTREL_DEBUG(LogCategory::Render,
            "Freed " + std::to_string(freed) + " unused bitmap textures");
    }
}

void AgBitmapTextureManager::close() {
    if (!entries_.empty()) {
        notifyBeforeFree();
    }
    for (auto& [bitmap, entry] : entries_) {
        if (entry.texture) {
            entry.texture->close();
        }
    }
    entries_.clear();
}

void AgBitmapTextureManager::notifyBeforeFree() {
    if (beforeFree_) {
        beforeFree_();
    }
}

} // namespace kestrel
