#pragma once

#include <type_traits>
#include <utility>

namespace kestrel {

/**
 * @brief Run @p body, then @p finally, even when @p body throws
 *
 * The exception (if any) is rethrown after @p finally has run.
 * Returns whatever @p body returns.
 */
template<typename Body, typename Finally>
auto tryFinally(Body&& body, Finally&& finally) -> decltype(body()) {
    if constexpr (std::is_void_v<decltype(body())>) {
        try {
            body();
        } catch (...) {
            finally();
            throw;
        }
        finally();
    } else {
        auto result = [&]() {
            try {
                return body();
            } catch (...) {
                finally();
                throw;
            }
        }();
        finally();
        return result;
    }
}

} // namespace kestrel
