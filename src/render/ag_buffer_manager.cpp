#include "kestrel/render/ag_buffer_manager.hpp"
#include "kestrel/core/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace kestrel {

AgBufferManager::AgBufferManager(AG& ag, int gcIntervalFrames)
    : ag_(ag)
    , gcIntervalFrames_(std::max(1, gcIntervalFrames)) {
}

AgBufferManager::~AgBufferManager() {
    close();
}

AGBuffer& AgBufferManager::getBuffer(const AgCachedBufferRef& buffer) {
    if (!buffer) {
        throw std::invalid_argument("AgBufferManager: buffer cannot be null");
    }

    Entry& entry = entries_[buffer.get()];
    if (entry.buffer && entry.source.expired()) {
        entry.buffer->close();
        entry = Entry{};
    }

    if (!entry.buffer) {
        entry.source = buffer;
        entry.buffer = ag_.createBuffer(buffer->kind());
    }

    if (!entry.uploaded || entry.uploadedVersion != buffer->version()) {
        entry.buffer->upload(buffer->data());
        entry.uploadedVersion = buffer->version();
        entry.uploaded = true;
    }

    entry.usedSinceGc = true;
    return *entry.buffer;
}

bool AgBufferManager::removeBuffer(const AgCachedBuffer* buffer) {
    auto it = entries_.find(buffer);
    if (it == entries_.end()) {
        return false;
    }
    if (it->second.buffer) {
        it->second.buffer->close();
    }
    entries_.erase(it);
    return true;
}

void AgBufferManager::afterRender() {
    frame_++;
    if (frame_ % static_cast<uint64_t>(gcIntervalFrames_) == 0) {
        gc();
    }
}

void AgBufferManager::gc() {
    size_t freed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        Entry& entry = it->second;
        if (!entry.usedSinceGc || entry.source.expired()) {
            if (entry.buffer) {
                entry.buffer->close();
            }
            it = entries_.erase(it);
            freed++;
        } else {
            entry.usedSinceGc = false;
            ++it;
        }
    }

    if (freed > 0) {
        KESTREL_DEBUG(LogCategory::Render, "Freed " + std::to_string(freed) + " unused buffers");
    }
}

void AgBufferManager::close() {
    for (auto& [source, entry] : entries_) {
        if (entry.buffer) {
            entry.buffer->close();
        }
    }
    entries_.clear();
}

} // namespace kestrel
