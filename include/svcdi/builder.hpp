#pragma once

/// @file builder.hpp
/// Typed helpers that produce finished `descriptor` values.  Nothing in the
/// registry, validator or provider depends on this header; a descriptor
/// written by hand behaves identically.

#include "descriptor.hpp"
#include "erased_ref.hpp"
#include "exceptions.hpp"
#include "lazy.hpp"
#include "provider.hpp"
#include "type_traits.hpp"

#include <cstddef>
#include <memory>
#include <source_location>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

namespace svcdi {

/// Compile-time list of declared dependencies, passed by value as `deps<...>`.
template <typename... Deps>
struct dependency_list {
    static constexpr std::size_t size = sizeof...(Deps);

    static std::vector<dependency_info> info() {
        std::vector<dependency_info> out;
        out.reserve(size);
        (declare<Deps>(out), ...);
        return out;
    }

private:
    template <typename D>
    static void declare(std::vector<dependency_info>& out) {
        using traits = dependency_traits<D>;
        if constexpr (traits::is_declared) {
            out.push_back(dependency_info{
                contract(typeid(typename traits::contract_type)), traits::card });
        }
    }
};

template <typename... Deps>
inline constexpr dependency_list<Deps...> deps{};

namespace detail {

/// Produce the constructor argument for dependency D from `p`.
template <typename D>
injected_t<D> inject(provider& p) {
    using traits = dependency_traits<D>;
    using C = typename traits::contract_type;
    constexpr cardinality card = traits::card;

    if constexpr (std::is_same_v<D, provider_ref>) {
        return p.shared_from_this();
    } else if constexpr (traits::is_deferred) {
        if constexpr (card == cardinality::zero_or_more) return lazy_zero_or_more<C>(p);
        else if constexpr (card == cardinality::zero_or_one) return lazy_zero_or_one<C>(p);
        else return lazy_exactly_one<C>(p);
    } else {
        if constexpr (card == cardinality::zero_or_more) return p.get_all<C>();
        else if constexpr (card == cardinality::zero_or_one) return p.get<C>();
        else return p.get_required<C>();
    }
}

} // namespace detail

template <typename TContract, typename TImpl, typename... Deps>
concept registrable = implements<TImpl, TContract> && injectable_from<TImpl, Deps...>;

// ---------------------------------------------------------------
// Constructor-injected descriptors
// ---------------------------------------------------------------

/// Descriptor for `TContract` built as `TImpl(injected deps...)`.
template <typename TContract, typename TImpl = TContract, typename... Deps>
    requires registrable<TContract, TImpl, Deps...>
descriptor describe(lifetime_kind lifetime, dependency_list<Deps...> list = {},
                    std::source_location loc = std::source_location::current()) {
    return descriptor(
        typeid(TContract), typeid(TImpl), lifetime,
        [](provider& p) -> erased_ref {
            return make_erased_as<TContract, TImpl>(detail::inject<Deps>(p)...);
        },
        list.info(), loc);
}

template <typename TContract, typename TImpl = TContract, typename... Deps>
    requires registrable<TContract, TImpl, Deps...>
descriptor singleton(dependency_list<Deps...> list = {},
                     std::source_location loc = std::source_location::current()) {
    return describe<TContract, TImpl>(lifetime_kind::singleton, list, loc);
}

template <typename TContract, typename TImpl = TContract, typename... Deps>
    requires registrable<TContract, TImpl, Deps...>
descriptor scoped(dependency_list<Deps...> list = {},
                  std::source_location loc = std::source_location::current()) {
    return describe<TContract, TImpl>(lifetime_kind::scoped, list, loc);
}

template <typename TContract, typename TImpl = TContract, typename... Deps>
    requires registrable<TContract, TImpl, Deps...>
descriptor transient(dependency_list<Deps...> list = {},
                     std::source_location loc = std::source_location::current()) {
    return describe<TContract, TImpl>(lifetime_kind::transient, list, loc);
}

// ---------------------------------------------------------------
// Hand-written factories and pre-built instances
// ---------------------------------------------------------------

/// Wrap `fn(provider&) -> std::shared_ptr<TContract>`.  The dependency list
/// is only declared for validation; `fn` resolves what it needs itself.
/// TImpl is recorded as the implementation type, which tells factories for
/// the same contract apart in try_add_to_all().
template <typename TContract, typename TImpl = TContract, typename F, typename... Deps>
    requires implements<TImpl, TContract> && std::is_invocable_v<const F&, provider&>
descriptor from_factory(lifetime_kind lifetime, F fn, dependency_list<Deps...> list = {},
                        std::source_location loc = std::source_location::current()) {
    return descriptor(
        typeid(TContract), typeid(TImpl), lifetime,
        [fn = std::move(fn)](provider& p) -> erased_ref {
            std::shared_ptr<TContract> instance = fn(p);
            return erase_as<TContract>(std::move(instance));
        },
        list.info(), loc);
}

/// Singleton that always hands out `instance`.
template <typename TContract>
descriptor existing(std::shared_ptr<TContract> instance,
                    std::source_location loc = std::source_location::current()) {
    if (!instance) {
        throw di_error("existing<T>() requires a non-null instance", loc);
    }
    const contract impl_type = typeid(*instance);
    return descriptor(
        typeid(TContract), impl_type, lifetime_kind::singleton,
        [instance = std::move(instance)](provider&) -> erased_ref {
            return erase_as<TContract>(instance);
        },
        {}, loc);
}

} // namespace svcdi
