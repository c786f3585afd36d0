#pragma once

#include "export.hpp"
#include "validation.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <source_location>
#include <typeindex>
#include <vector>

namespace svcdi {

namespace internal {
/// Demangle a type_index to human-readable name (GCC/Clang ABI-based).
SVCDI_EXPORT std::string demangle(std::type_index type);
} // namespace internal

/// Base of every error raised by svcdi.  Records where it was thrown and,
/// while it unwinds through nested factories, the chain of components that
/// were being resolved.
class SVCDI_EXPORT di_error : public std::runtime_error {
public:
    explicit di_error(const std::string& message,
                      std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Extra text for full_diagnostic(), such as registration stacktraces.
    void set_diagnostic_detail(std::string detail);
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// what(), then the diagnostic detail on the following lines.
    std::string full_diagnostic() const;

    /// Record that this error passed through the factory of `component`.
    /// Innermost first; what() renders the chain as
    ///   "... (while resolving B [impl: BImpl] -> A [impl: AImpl])"
    void append_resolution_context(const std::string& component);

    const std::vector<std::string>& resolution_chain() const noexcept { return chain_; }

    const char* what() const noexcept override;

private:
    std::source_location location_;
    std::string diagnostic_detail_;
    std::vector<std::string> chain_;
    std::string rendered_;   // what() text once chain_ is non-empty
};

/// Thrown by get_required when nothing is registered for the contract.
/// Signals a usage defect at the call site; it is never aggregated.
class SVCDI_EXPORT missing_required_service : public di_error {
public:
    explicit missing_required_service(std::type_index type,
                                      std::source_location loc = std::source_location::current());

    std::type_index service_type() const noexcept { return service_type_; }

private:
    std::type_index service_type_;
};

/// A factory threw a non-svcdi exception or returned a null handle.
class SVCDI_EXPORT resolution_error : public di_error {
public:
    resolution_error(std::type_index type, const std::string& reason,
                     std::source_location registration_loc);

    std::type_index service_type() const noexcept { return service_type_; }

private:
    std::type_index service_type_;
};

/// Resolution re-entered a descriptor that is still being constructed on
/// the same thread.  Only reachable when the graph was not validated.
class SVCDI_EXPORT cyclic_resolution : public di_error {
public:
    explicit cyclic_resolution(const std::vector<std::type_index>& cycle,
                               std::source_location loc = std::source_location::current());

    const std::vector<std::type_index>& cycle() const noexcept { return cycle_; }

private:
    std::vector<std::type_index> cycle_;
};

/// Aggregate of every defect found by the graph validator.
class SVCDI_EXPORT validation_error : public di_error {
public:
    explicit validation_error(std::vector<validation_issue> issues,
                              std::source_location loc = std::source_location::current());

    const std::vector<validation_issue>& issues() const noexcept { return issues_; }

    /// Number of issues holding alternative `Issue`.
    template <typename Issue>
    std::size_t count() const noexcept {
        std::size_t n = 0;
        for (const auto& issue : issues_) {
            if (std::holds_alternative<Issue>(issue)) ++n;
        }
        return n;
    }

private:
    std::vector<validation_issue> issues_;
    static std::string build_message(const std::vector<validation_issue>& issues);
};

} // namespace svcdi
