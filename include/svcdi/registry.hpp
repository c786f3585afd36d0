#pragma once

#include "export.hpp"
#include "descriptor.hpp"
#include "provider.hpp"

#include <cstddef>
#include <memory>
#include <source_location>
#include <typeindex>
#include <vector>

namespace svcdi {

// ---------------------------------------------------------------
// registry
// ---------------------------------------------------------------

/// Ordered collection of service descriptors.  Insertion order is kept:
/// get_all() follows it and single-instance lookups pick the last
/// registration for a contract.  Becomes immutable after a successful build().
class SVCDI_EXPORT registry {
public:
    registry();
    ~registry();

    registry(const registry&) = delete;
    registry& operator=(const registry&) = delete;
    registry(registry&&) noexcept;
    registry& operator=(registry&&) noexcept;

    // ===============================================================
    // Mutation
    // ===============================================================

    /// Append unconditionally.
    registry& add(descriptor desc);

    /// Append only if nothing is registered for the descriptor's contract.
    registry& try_add(descriptor desc);

    /// Append unless the same (contract, implementation) pair is already
    /// registered.  Used to grow multi-implementation sets idempotently.
    registry& try_add_to_all(descriptor desc);

    /// Remove every registration for the contract, then append.
    registry& replace(descriptor desc);

    /// Remove every registration for the contract.
    registry& remove_all(contract type);

    template <typename T>
    registry& remove_all() {
        return remove_all(contract_of<T>());
    }

    // ===============================================================
    // Inspection
    // ===============================================================

    std::size_t count(contract type) const;

    template <typename T>
    std::size_t count() const {
        return count(contract_of<T>());
    }

    bool contains(contract type) const { return count(type) > 0; }

    std::size_t size() const noexcept;
    bool empty() const noexcept { return size() == 0; }

    const std::vector<descriptor>& descriptors() const noexcept;

    // ===============================================================
    // Validate / Build
    // ===============================================================

    /// Run the graph validator without building.  Throws validation_error.
    void validate(const build_options& options = {},
                  std::source_location loc = std::source_location::current()) const;

    /// Validate (unless disabled) and produce the root provider.  Throws
    /// validation_error listing every defect; no provider is created then.
    std::shared_ptr<provider> build(const build_options& options = {},
                                    std::source_location loc = std::source_location::current());

private:
    void ensure_mutable() const;

    struct impl;
    std::unique_ptr<impl> impl_;
};

} // namespace svcdi
