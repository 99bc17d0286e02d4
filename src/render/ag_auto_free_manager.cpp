#include "kestrel/render/ag_auto_free_manager.hpp"
#include "kestrel/core/logging.hpp"

#include <algorithm>
#include <exception>
#include <vector>

namespace kestrel {

AgAutoFreeManager::AgAutoFreeManager(int gcIntervalFrames)
    : gcIntervalFrames_(std::max(1, gcIntervalFrames)) {
}

AgAutoFreeManager::~AgAutoFreeManager() {
    close();
}

void AgAutoFreeManager::reference(CloseableRef closeable) {
    if (!closeable) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Closeable* key = closeable.get();
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.referenced = true;
    } else {
        entries_.emplace(key, Entry{std::move(closeable), true});
    }
}

void AgAutoFreeManager::afterRender() {
    bool runGc = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        frame_++;
        runGc = (frame_ % static_cast<uint64_t>(gcIntervalFrames_)) == 0;
    }
    if (runGc) {
        gc();
    }
}

void AgAutoFreeManager::gc() {
    std::vector<CloseableRef> toClose;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (!it->second.referenced) {
                toClose.push_back(std::move(it->second.closeable));
                it = entries_.erase(it);
            } else {
                it->second.referenced = false;
                ++it;
            }
        }
    }

    // Close outside the lock
    closeAll(toClose, "gc");
}

void AgAutoFreeManager::close() {
    std::vector<CloseableRef> toClose;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        toClose.reserve(entries_.size());
        for (auto& [key, entry] : entries_) {
            toClose.push_back(std::move(entry.closeable));
        }
        entries_.clear();
    }

    closeAll(toClose, "shutdown");
}

void AgAutoFreeManager::closeAll(std::vector<CloseableRef>& closeables, const char* reason) {
    for (auto& closeable : closeables) {
        try {
            closeable->close();
        } catch (const std::exception& e) {
            KESTREL_ERROR(LogCategory::Render,
                "Exception closing auto-freed resource during " + std::string(reason) + ": " + e.what());
        }
    }

    if (!closeables.empty()) {
        KESTREL_DEBUG(LogCategory::Render,
            "Auto-freed " + std::to_string(closeables.size()) + " resources (" + reason + ")");
    }
}

size_t AgAutoFreeManager::trackedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace kestrel
