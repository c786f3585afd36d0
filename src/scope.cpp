#include "svcdi/scope.hpp"
#include "svcdi/exceptions.hpp"
#include "svcdi/logging.hpp"
#include "svcdi/provider.hpp"

namespace svcdi {

scope::scope(std::shared_ptr<provider> scoped_provider)
    : provider_(std::move(scoped_provider))
{}

scope::~scope() {
    dispose();
}

scope::scope(scope&&) noexcept = default;

scope& scope::operator=(scope&& other) noexcept {
    if (this != &other) {
        dispose();
        provider_ = std::move(other.provider_);
    }
    return *this;
}

provider& scope::get_provider() {
    if (!provider_) {
        throw di_error("Scope has already been disposed");
    }
    return *provider_;
}

void scope::dispose() noexcept {
    if (!provider_) return;
    // Clearing first releases the cache even if a deferred resolution
    // still holds the scoped provider alive.
    provider_->dispose();
    provider_.reset();
    logger()->debug("svcdi: scope disposed");
}

} // namespace svcdi
