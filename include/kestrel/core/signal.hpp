#pragma once

#include <functional>
#include <vector>
#include <cstddef>
#include <algorithm>

namespace kestrel {

/**
 * @brief Ordered list of handlers invoked together
 *
 * Handlers added or removed while the signal is firing take effect on the
 * next invocation.
 */
template<typename... Args>
class Signal {
public:
    using Handler = std::function<void(Args...)>;

    /// Register a handler, returns an id for remove()
    size_t add(Handler handler) {
        size_t id = nextId_++;
        handlers_.push_back({id, std::move(handler)});
        return id;
    }

    /// Unregister a handler; returns false if the id is unknown
    bool remove(size_t id) {
        auto it = std::find_if(handlers_.begin(), handlers_.end(),
            [id](const Entry& entry) { return entry.id == id; });
        if (it == handlers_.end()) {
            return false;
        }
        handlers_.erase(it);
        return true;
    }

    void clear() { handlers_.clear(); }

    size_t listenerCount() const { return handlers_.size(); }

    void operator()(Args... args) {
        auto snapshot = handlers_;
        for (auto& entry : snapshot) {
            entry.handler(args...);
        }
    }

private:
    struct Entry {
        size_t id;
        Handler handler;
    };

    std::vector<Entry> handlers_;
    size_t nextId_ = 1;
};

} // namespace kestrel
