#pragma once

// Internal: renders the traces captured by capture_stacktrace().  Not installed.

#include "svcdi/descriptor.hpp"
#include "svcdi/exceptions.hpp"

#include <any>
#include <string>
#include <sstream>

#ifdef SVCDI_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace svcdi::internal {

/// Empty unless `st` holds a non-empty boost::stacktrace::stacktrace.
inline std::string format_stacktrace(const std::any& st) {
#ifdef SVCDI_HAS_STACKTRACE
    if (const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&st)) {
        if (trace->size() > 0) {
            std::ostringstream oss;
            oss << *trace;
            return oss.str();
        }
    }
#else
    (void)st;
#endif
    return {};
}

/// Format one descriptor's registration trace for diagnostic output.
/// Returns a block like:
///   "Registration stacktrace for IFoo [impl: Foo] (scoped):\n  #0 ...\n"
/// or an empty string if no stacktrace is available.
inline std::string format_registration_trace(const descriptor& desc) {
    std::string trace = format_stacktrace(desc.registration_stacktrace());
    if (trace.empty()) return {};

    return "Registration stacktrace for " + desc.display_name()
           + " (" + std::string(to_string(desc.lifetime())) + "):\n" + trace;
}

} // namespace svcdi::internal
