#pragma once

#include "export.hpp"
#include "descriptor.hpp"

#include <string>
#include <typeindex>
#include <variant>
#include <vector>

namespace svcdi {

class registry;

// ---------------------------------------------------------------
// Validation issues: one entry per configuration defect
// ---------------------------------------------------------------

/// `consumer` declares an exactly_one dependency on `missing`, but nothing
/// is registered for `missing`.
struct unregistered_dependency {
    contract consumer;
    contract consumer_implementation;
    contract missing;
};

/// Cycle path as found by the traversal, first node repeated at the end.
struct circular_dependency {
    std::vector<contract> cycle;
};

/// A singleton reaches a scoped service, directly or through a chain of
/// singletons.  `chain` runs from `singleton` to `scoped` inclusive.
struct captured_dependency {
    contract singleton;
    contract scoped;
    std::vector<contract> chain;
};

using validation_issue = std::variant<unregistered_dependency,
                                      circular_dependency,
                                      captured_dependency>;

/// Human-readable one-line rendering of an issue.
SVCDI_EXPORT std::string describe(const validation_issue& issue);

/// Run every graph check over `descriptors` and return all violations
/// (empty when the configuration is valid).  Never throws for defects.
SVCDI_EXPORT std::vector<validation_issue> collect_validation_issues(
    const std::vector<descriptor>& descriptors,
    const build_options& options = {});

/// Standalone validation of a registry without building a provider.
/// Throws validation_error carrying every issue found.
SVCDI_EXPORT void validate(const registry& reg, const build_options& options = {});

} // namespace svcdi
