#include "svcdi/descriptor.hpp"
#include "svcdi/exceptions.hpp"

#include <any>
#include <utility>

#ifdef SVCDI_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace svcdi {

namespace internal {

std::any capture_stacktrace() {
#ifdef SVCDI_HAS_STACKTRACE
    return boost::stacktrace::stacktrace();
#else
    return {};
#endif
}

} // namespace internal

descriptor::descriptor(contract service_type,
                       contract implementation_type,
                       lifetime_kind lifetime,
                       factory_fn factory,
                       std::vector<dependency_info> dependencies,
                       std::source_location loc)
    : service_type_(service_type)
    , implementation_type_(implementation_type)
    , lifetime_(lifetime)
    , factory_(std::move(factory))
    , dependencies_(std::move(dependencies))
    , location_(loc)
    , stacktrace_(internal::capture_stacktrace())
{
    if (!factory_) {
        throw di_error("Service factory cannot be empty for "
                       + internal::demangle(service_type_), loc);
    }
}

std::string descriptor::display_name() const {
    std::string name = internal::demangle(service_type_);
    if (implementation_type_ != service_type_) {
        name += " [impl: " + internal::demangle(implementation_type_) + "]";
    }
    return name;
}

} // namespace svcdi
