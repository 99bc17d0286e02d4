#pragma once

#include "kestrel/core/finally.hpp"

#include <functional>
#include <memory>
#include <vector>
#include <cstddef>

namespace kestrel {

/**
 * @brief Pool of reusable heap objects
 *
 * Objects live behind unique_ptr so references handed to use() stay valid
 * while the pool grows. Freed objects are passed through the reset function
 * before they are made available again.
 *
 * Usage:
 * @code
 * Pool<Matrix> pool([](Matrix& m) { m.identity(); }, 8,
 *                   [] { return std::make_unique<Matrix>(); });
 * pool.use([](Matrix& temp) {
 *     temp.translate(10, 0);
 * });
 * @endcode
 */
template<typename T>
class Pool {
public:
    using Factory = std::function<std::unique_ptr<T>()>;
    using Reset = std::function<void(T&)>;

    explicit Pool(Factory factory)
        : Pool(nullptr, 0, std::move(factory)) {}

    Pool(Reset reset, size_t preallocate, Factory factory)
        : reset_(std::move(reset))
        , factory_(std::move(factory)) {
        items_.reserve(preallocate);
        for (size_t i = 0; i < preallocate; i++) {
            items_.push_back(factory_());
        }
    }

    // Non-copyable
    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    /// Take an object from the pool (or create one if empty)
    std::unique_ptr<T> alloc() {
        if (items_.empty()) {
            totalAllocated_++;
            return factory_();
        }
        auto item = std::move(items_.back());
        items_.pop_back();
        return item;
    }

    /// Reset an object and return it to the pool
    void free(std::unique_ptr<T> item) {
        if (!item) {
            return;
        }
        if (reset_) {
            reset_(*item);
        }
        items_.push_back(std::move(item));
    }

    /**
     * @brief Borrow an object for the duration of @p block
     *
     * The object is returned to the pool even if @p block throws.
     */
    template<typename F>
    auto use(F&& block) {
        auto item = alloc();
        T& ref = *item;
        return tryFinally(
            [&]() { return block(ref); },
            [&] { free(std::move(item)); });
    }

    /// Number of objects currently waiting in the pool
    size_t itemsInPool() const { return items_.size(); }

    /// Number of objects created on demand after construction
    size_t totalAllocated() const { return totalAllocated_; }

private:
    Reset reset_;
    Factory factory_;
    std::vector<std::unique_ptr<T>> items_;
    size_t totalAllocated_ = 0;
};

} // namespace kestrel
