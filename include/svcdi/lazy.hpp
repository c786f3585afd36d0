#pragma once

#include "exceptions.hpp"
#include "provider.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace svcdi {

// ---------------------------------------------------------------
// lazy<V>: deferred, memoized resolution
// ---------------------------------------------------------------

/// Wraps a zero-argument thunk that produces V.  The thunk runs on the
/// first value() call only; copies share the memoized result.  The wrapper
/// adds no caching tier of its own: what V points at still follows the
/// lifetime policy of the contract it was resolved from.
template <typename V>
class lazy {
public:
    using value_type = V;
    using thunk_fn = std::function<V()>;

    explicit lazy(thunk_fn thunk)
        : state_(std::make_shared<state>(std::move(thunk))) {}

    const V& value() const {
        std::call_once(state_->once, [this] {
            state_->value.emplace(state_->thunk());
            state_->ready.store(true, std::memory_order_release);
        });
        return *state_->value;
    }

    const V& operator*() const { return value(); }

    /// Shorthand for value()->... when V is a pointer-like handle.
    const V& operator->() const { return value(); }

    /// True once some copy's value() has returned.  Safe to call while
    /// another thread is inside value().
    bool resolved() const noexcept { return state_->ready.load(std::memory_order_acquire); }

private:
    struct state {
        explicit state(thunk_fn fn) : thunk(std::move(fn)) {}
        thunk_fn thunk;
        std::once_flag once;
        std::optional<V> value;
        std::atomic<bool> ready{false};
    };

    std::shared_ptr<state> state_;
};

namespace detail {

/// Capture the provider weakly so a lazy held by a scoped service never
/// keeps that scope's cache alive.
inline std::weak_ptr<provider> weak_from(provider& p) {
    return p.weak_from_this();
}

inline std::shared_ptr<provider> lock_or_throw(const std::weak_ptr<provider>& weak) {
    auto p = weak.lock();
    if (!p) throw di_error("Deferred resolution attempted after its provider was released");
    return p;
}

} // namespace detail

/// Defer a get_required<T>() on `p`.
template <typename T>
lazy<std::shared_ptr<T>> lazy_exactly_one(provider& p) {
    return lazy<std::shared_ptr<T>>([weak = detail::weak_from(p)] {
        return detail::lock_or_throw(weak)->template get_required<T>();
    });
}

/// Defer a get<T>() on `p`.
template <typename T>
lazy<std::shared_ptr<T>> lazy_zero_or_one(provider& p) {
    return lazy<std::shared_ptr<T>>([weak = detail::weak_from(p)] {
        return detail::lock_or_throw(weak)->template get<T>();
    });
}

/// Defer a get_all<T>() on `p`.
template <typename T>
lazy<std::vector<std::shared_ptr<T>>> lazy_zero_or_more(provider& p) {
    return lazy<std::vector<std::shared_ptr<T>>>([weak = detail::weak_from(p)] {
        return detail::lock_or_throw(weak)->template get_all<T>();
    });
}

/// A lazy that always yields nullptr.
template <typename T>
lazy<std::shared_ptr<T>> lazy_missing() {
    return lazy<std::shared_ptr<T>>([] { return std::shared_ptr<T>{}; });
}

/// A lazy that always yields an empty collection.
template <typename T>
lazy<std::vector<std::shared_ptr<T>>> lazy_empty() {
    return lazy<std::vector<std::shared_ptr<T>>>([] { return std::vector<std::shared_ptr<T>>{}; });
}

/// A lazy over an already known value.
template <typename V>
lazy<V> lazy_init(V value) {
    return lazy<V>([v = std::move(value)] { return v; });
}

} // namespace svcdi
