#pragma once

#include "export.hpp"
#include "provider.hpp"

#include <memory>
#include <source_location>
#include <vector>

namespace svcdi {

/// RAII scope object. When disposed or destroyed, all scoped instances
/// resolved within this scope are released (shared_ptr refcount drops).
class SVCDI_EXPORT scope {
public:
    ~scope();

    scope(const scope&) = delete;
    scope& operator=(const scope&) = delete;
    scope(scope&&) noexcept;
    scope& operator=(scope&&) noexcept;

    /// Get the scoped provider associated with this scope.
    /// Throws di_error once the scope has been disposed.
    provider& get_provider();

    template <typename T>
    std::shared_ptr<T> get() {
        return get_provider().get<T>();
    }

    template <typename T>
    std::shared_ptr<T> get_required(std::source_location loc = std::source_location::current()) {
        return get_provider().get_required<T>(loc);
    }

    template <typename T>
    std::vector<std::shared_ptr<T>> get_all() {
        return get_provider().get_all<T>();
    }

    std::unique_ptr<scope> create_scope() {
        return get_provider().create_scope();
    }

    /// Release the scoped cache now instead of at destruction.
    void dispose() noexcept;

    bool disposed() const noexcept { return provider_ == nullptr; }

private:
    friend class provider;
    explicit scope(std::shared_ptr<provider> scoped_provider);

    std::shared_ptr<provider> provider_;
};

} // namespace svcdi
