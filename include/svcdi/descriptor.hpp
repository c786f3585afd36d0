#pragma once

#include "export.hpp"
#include "erased_ref.hpp"
#include "lifetime.hpp"

#include <any>
#include <functional>
#include <source_location>
#include <string>
#include <typeindex>
#include <vector>

namespace svcdi {

class provider;

/// Stable key naming the capability a consumer asks for.
using contract = std::type_index;

template <typename T>
contract contract_of() noexcept {
    return contract(typeid(T));
}

using factory_fn = std::function<erased_ref(provider&)>;

// ---------------------------------------------------------------
// build_options: configuration passed to registry::build / validate
// ---------------------------------------------------------------

/// Locking discipline of a provider's caches.
enum class concurrency_mode {
    /// Handles stay on one thread; caches are never locked.
    single_owner,
    /// Every cache is guarded independently; construction happens once.
    shared
};

struct build_options {
    bool validate_on_build  = true;
    bool validate_lifetimes = true;   // singleton -> scoped captivity check
    bool detect_cycles      = true;
    concurrency_mode concurrency = concurrency_mode::shared;
};

// ---------------------------------------------------------------
// dependency_info: metadata for a single declared dependency
// ---------------------------------------------------------------

struct dependency_info {
    contract    type;
    cardinality card = cardinality::exactly_one;

    bool operator==(const dependency_info&) const = default;
};

// ---------------------------------------------------------------
// descriptor: one immutable service registration record
// ---------------------------------------------------------------

class SVCDI_EXPORT descriptor {
public:
    /// Throws di_error if `factory` is empty.  An empty `dependencies`
    /// list opts the descriptor out of graph validation.
    descriptor(contract service_type,
               contract implementation_type,
               lifetime_kind lifetime,
               factory_fn factory,
               std::vector<dependency_info> dependencies = {},
               std::source_location loc = std::source_location::current());

    contract service_type() const noexcept { return service_type_; }
    contract implementation_type() const noexcept { return implementation_type_; }
    lifetime_kind lifetime() const noexcept { return lifetime_; }
    const factory_fn& factory() const noexcept { return factory_; }
    const std::vector<dependency_info>& dependencies() const noexcept { return dependencies_; }

    const std::source_location& registration_location() const noexcept { return location_; }

    /// Boost stacktrace captured at construction (empty when disabled).
    const std::any& registration_stacktrace() const noexcept { return stacktrace_; }

    /// "Contract [impl: Impl]" with demangled names.
    std::string display_name() const;

private:
    contract service_type_;
    contract implementation_type_;
    lifetime_kind lifetime_;
    factory_fn factory_;
    std::vector<dependency_info> dependencies_;
    std::source_location location_;
    std::any stacktrace_;
};

namespace internal {
/// Returns a boost::stacktrace::stacktrace wrapped in std::any when
/// SVCDI_HAS_STACKTRACE is defined, otherwise an empty any.
SVCDI_EXPORT std::any capture_stacktrace();
} // namespace internal

} // namespace svcdi
