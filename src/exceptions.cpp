#include "svcdi/exceptions.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

#if defined(__GNUC__)
#include <cxxabi.h>
#endif

namespace svcdi {

namespace internal {

std::string demangle(std::type_index type) {
    const char* raw = type.name();
#if defined(__GNUC__)
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> readable(
        abi::__cxa_demangle(raw, nullptr, nullptr, &status), &std::free);
    if (status == 0 && readable) return readable.get();
#endif
    return raw;
}

} // namespace internal

namespace {

std::string at_location(const std::string& message, const std::source_location& loc) {
    std::string out = message;
    out += " [at ";
    out += loc.file_name();
    out += ':';
    out += std::to_string(loc.line());
    out += ']';
    return out;
}

std::string joined(const std::vector<std::type_index>& path) {
    std::string out;
    for (const auto& node : path) {
        if (!out.empty()) out += " -> ";
        out += internal::demangle(node);
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------
// di_error
// ---------------------------------------------------------------

di_error::di_error(const std::string& message, std::source_location loc)
    : std::runtime_error(at_location(message, loc))
    , location_(loc)
{}

void di_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

void di_error::append_resolution_context(const std::string& component) {
    chain_.push_back(component);

    // Rendered here rather than in what(), which may not throw.
    std::string text = std::runtime_error::what();
    text += " (while resolving ";
    for (std::size_t i = 0; i < chain_.size(); ++i) {
        if (i > 0) text += " -> ";
        text += chain_[i];
    }
    text += ')';
    rendered_ = std::move(text);
}

const char* di_error::what() const noexcept {
    return chain_.empty() ? std::runtime_error::what() : rendered_.c_str();
}

std::string di_error::full_diagnostic() const {
    std::string out = what();
    if (!diagnostic_detail_.empty()) {
        out += '\n';
        out += diagnostic_detail_;
    }
    return out;
}

// ---------------------------------------------------------------
// Resolution-time errors
// ---------------------------------------------------------------

missing_required_service::missing_required_service(std::type_index type,
                                                   std::source_location loc)
    : di_error("No service registered for required contract: "
               + internal::demangle(type), loc)
    , service_type_(type)
{}

resolution_error::resolution_error(std::type_index type,
                                   const std::string& reason,
                                   std::source_location registration_loc)
    : di_error([&] {
          std::string msg = "Failed to resolve service " + internal::demangle(type)
                            + ": " + reason;
          if (*registration_loc.file_name() != '\0') {
              msg += " (registered at " + std::string(registration_loc.file_name())
                     + ":" + std::to_string(registration_loc.line()) + ")";
          }
          return msg;
      }(), registration_loc)
    , service_type_(type)
{}

cyclic_resolution::cyclic_resolution(const std::vector<std::type_index>& cycle,
                                     std::source_location loc)
    : di_error("Cyclic dependency detected during resolution: " + joined(cycle), loc)
    , cycle_(cycle)
{}

// ---------------------------------------------------------------
// Validation
// ---------------------------------------------------------------

std::string validation_error::build_message(const std::vector<validation_issue>& issues) {
    std::string msg = "Dependency graph validation failed with "
                      + std::to_string(issues.size()) + " issue(s):";
    for (const auto& issue : issues) {
        msg += "\n  - " + describe(issue);
    }
    return msg;
}

validation_error::validation_error(std::vector<validation_issue> issues,
                                   std::source_location loc)
    : di_error(build_message(issues), loc)
    , issues_(std::move(issues))
{}

} // namespace svcdi
