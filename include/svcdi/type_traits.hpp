#pragma once

#include "fwd.hpp"
#include "lifetime.hpp"

#include <memory>
#include <type_traits>
#include <vector>

namespace svcdi {

// ---------------------------------------------------------------
// Dependency tags
//
// A dependency list names each dependency either as a bare contract
// (same as exactly_one) or wrapped in one of these tags.
// ---------------------------------------------------------------

template <typename T> struct exactly_one  { using type = T; };
template <typename T> struct zero_or_one  { using type = T; };
template <typename T> struct zero_or_more { using type = T; };
template <typename D> struct deferred     { using type = D; };

/// The resolving provider itself: the root for singletons, the owning
/// scope for scoped services.  Not part of the dependency graph.  A
/// singleton holding it keeps the root alive for the process lifetime.
struct provider_ref {};

// ---------------------------------------------------------------
// dependency_traits<D>
//   contract_type  the contract D asks for
//   injected_type  what the implementation's constructor receives
//   card           cardinality recorded in dependency_info
//   is_deferred    injected as lazy<...>
//   is_declared    recorded in dependency_info for validation
// ---------------------------------------------------------------

namespace detail {

template <typename C, typename Injected, cardinality Card,
          bool Deferred = false, bool Declared = true>
struct dependency_shape {
    using contract_type = C;
    using injected_type = Injected;
    static constexpr cardinality card = Card;
    static constexpr bool is_deferred = Deferred;
    static constexpr bool is_declared = Declared;
};

} // namespace detail

template <typename D>
struct dependency_traits
    : detail::dependency_shape<D, std::shared_ptr<D>, cardinality::exactly_one> {};

template <typename T>
struct dependency_traits<exactly_one<T>> : dependency_traits<T> {};

template <typename T>
struct dependency_traits<zero_or_one<T>>
    : detail::dependency_shape<T, std::shared_ptr<T>, cardinality::zero_or_one> {};

template <typename T>
struct dependency_traits<zero_or_more<T>>
    : detail::dependency_shape<T, std::vector<std::shared_ptr<T>>, cardinality::zero_or_more> {};

template <typename D>
struct dependency_traits<deferred<D>>
    : detail::dependency_shape<typename dependency_traits<D>::contract_type,
                               lazy<typename dependency_traits<D>::injected_type>,
                               dependency_traits<D>::card, true> {};

template <>
struct dependency_traits<provider_ref>
    : detail::dependency_shape<provider, std::shared_ptr<provider>,
                               cardinality::exactly_one, false, false> {};

template <typename D>
using injected_t = typename dependency_traits<D>::injected_type;

// ---------------------------------------------------------------
// Registration constraints
// ---------------------------------------------------------------

/// TImpl can be handed out as TContract (identical types allowed).
template <typename TImpl, typename TContract>
concept implements = std::is_base_of_v<TContract, TImpl>;

/// TImpl's constructor accepts the injected form of every dependency.
template <typename TImpl, typename... Deps>
concept injectable_from = std::is_constructible_v<TImpl, injected_t<Deps>...>;

} // namespace svcdi
