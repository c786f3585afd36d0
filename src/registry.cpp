#include "svcdi/registry.hpp"
#include "svcdi/exceptions.hpp"
#include "svcdi/logging.hpp"
#include "svcdi/provider.hpp"

#include <algorithm>
#include <source_location>
#include <typeindex>
#include <utility>
#include <vector>

namespace svcdi {

void validate_descriptors(const std::vector<descriptor>& descriptors,
                          const build_options& options,
                          std::source_location loc);

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct registry::impl {
    std::vector<descriptor> descriptors;
    bool built = false;
};

// ---------------------------------------------------------------
// Constructors / Destructor / Move
// ---------------------------------------------------------------

registry::registry()
    : impl_(std::make_unique<impl>())
{}

registry::~registry() = default;

registry::registry(registry&&) noexcept = default;
registry& registry::operator=(registry&&) noexcept = default;

void registry::ensure_mutable() const {
    if (impl_->built) {
        throw di_error("Cannot modify the registry after build() has been called");
    }
}

// ---------------------------------------------------------------
// Mutation
// ---------------------------------------------------------------

registry& registry::add(descriptor desc) {
    ensure_mutable();
    impl_->descriptors.push_back(std::move(desc));
    return *this;
}

registry& registry::try_add(descriptor desc) {
    ensure_mutable();
    if (!contains(desc.service_type())) {
        impl_->descriptors.push_back(std::move(desc));
    }
    return *this;
}

registry& registry::try_add_to_all(descriptor desc) {
    ensure_mutable();
    bool exists = std::any_of(impl_->descriptors.begin(), impl_->descriptors.end(),
        [&](const descriptor& d) {
            return d.service_type() == desc.service_type()
                && d.implementation_type() == desc.implementation_type();
        });
    if (!exists) {
        impl_->descriptors.push_back(std::move(desc));
    }
    return *this;
}

registry& registry::replace(descriptor desc) {
    ensure_mutable();
    auto type = desc.service_type();
    std::erase_if(impl_->descriptors, [&](const descriptor& d) {
        return d.service_type() == type;
    });
    impl_->descriptors.push_back(std::move(desc));
    return *this;
}

registry& registry::remove_all(contract type) {
    ensure_mutable();
    std::erase_if(impl_->descriptors, [&](const descriptor& d) {
        return d.service_type() == type;
    });
    return *this;
}

// ---------------------------------------------------------------
// Inspection
// ---------------------------------------------------------------

std::size_t registry::count(contract type) const {
    return static_cast<std::size_t>(std::count_if(
        impl_->descriptors.begin(), impl_->descriptors.end(),
        [&](const descriptor& d) { return d.service_type() == type; }));
}

std::size_t registry::size() const noexcept {
    return impl_->descriptors.size();
}

const std::vector<descriptor>& registry::descriptors() const noexcept {
    return impl_->descriptors;
}

// ---------------------------------------------------------------
// validate / build
// ---------------------------------------------------------------

void registry::validate(const build_options& options, std::source_location loc) const {
    validate_descriptors(impl_->descriptors, options, loc);
}

std::shared_ptr<provider> registry::build(const build_options& options,
                                          std::source_location loc) {
    if (impl_->built) {
        throw di_error("build() can only be called once", loc);
    }

    logger()->debug("svcdi: building provider from {} descriptor(s)", impl_->descriptors.size());

    // Validate before building; a failure leaves the registry mutable so
    // the configuration can be corrected and built again.
    if (options.validate_on_build) {
        validate_descriptors(impl_->descriptors, options, loc);
    }

    impl_->built = true;

    // The provider keeps its own copy; descriptors() stays readable here.
    return provider::create(impl_->descriptors, options);
}

} // namespace svcdi
