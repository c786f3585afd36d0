#pragma once

#include "export.hpp"
#include "descriptor.hpp"
#include "erased_ref.hpp"
#include "exceptions.hpp"

#include <memory>
#include <source_location>
#include <string>
#include <typeindex>
#include <vector>

namespace svcdi {

class scope;

/// Resolution context handed to every factory.  The provider returned by
/// registry::build() is the root: it owns the singleton cache and acts as
/// its own implicit scope.  Providers obtained through create_scope() share
/// the root's registry and singletons but keep their own scoped cache.
class SVCDI_EXPORT provider : public std::enable_shared_from_this<provider> {
public:
    ~provider();

    provider(const provider&) = delete;
    provider& operator=(const provider&) = delete;

    // ---------------------------------------------------------------
    // Resolution
    // ---------------------------------------------------------------

    /// Zero-or-one: nullptr if nothing is registered for T, otherwise the
    /// instance of the last registration under its lifetime policy.
    template <typename T>
    std::shared_ptr<T> get() {
        return unerase<T>(get_impl(typeid(T)));
    }

    /// Exactly-one.  Throws missing_required_service if nothing is registered.
    template <typename T>
    std::shared_ptr<T> get_required(std::source_location loc = std::source_location::current()) {
        auto p = get_impl(typeid(T));
        if (!p) throw missing_required_service(typeid(T), loc);
        return unerase<T>(std::move(p));
    }

    /// Zero-or-more, in registration order.
    template <typename T>
    std::vector<std::shared_ptr<T>> get_all() {
        auto raw = get_all_impl(typeid(T));
        std::vector<std::shared_ptr<T>> result;
        result.reserve(raw.size());
        for (auto& p : raw) result.push_back(unerase<T>(std::move(p)));
        return result;
    }

    template <typename T>
    bool is_registered() const {
        return is_registered(typeid(T));
    }

    bool is_registered(contract type) const;

    // ---------------------------------------------------------------
    // Scoping
    // ---------------------------------------------------------------

    /// New scope with an empty scoped cache.  Always a sibling bound to the
    /// root, even when called on a scoped provider.
    std::unique_ptr<scope> create_scope();

    bool is_root() const noexcept;
    concurrency_mode concurrency() const noexcept;

    // ---------------------------------------------------------------
    // Non-template core (type-erased)
    // ---------------------------------------------------------------

    erased_ref get_impl(contract type);
    std::vector<erased_ref> get_all_impl(contract type);

private:
    friend class registry;
    friend class scope;

    struct shared_state;
    struct impl;

    static std::shared_ptr<provider> create(std::vector<descriptor> descriptors,
                                            const build_options& options);

    explicit provider(std::unique_ptr<impl> impl);

    provider& root() noexcept;
    erased_ref resolve_by_index(std::size_t idx);
    erased_ref invoke_factory(std::size_t idx, provider& context);

    /// Release the scoped cache; later resolutions through this provider throw.
    void dispose() noexcept;

    std::unique_ptr<impl> impl_;
};

} // namespace svcdi
