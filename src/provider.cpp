#include "svcdi/provider.hpp"
#include "svcdi/exceptions.hpp"
#include "svcdi/logging.hpp"
#include "svcdi/scope.hpp"
#include "instance_cache.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <atomic>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace svcdi {

// ---------------------------------------------------------------
// shared_state: read-only registry data + the singleton cache,
// shared by the root provider and every scope created from it
// ---------------------------------------------------------------

struct provider::shared_state {
    std::vector<descriptor> descriptors;

    // contract → descriptor indices, in registration order
    std::unordered_map<contract, std::vector<std::size_t>> by_contract;

    concurrency_mode mode;
    internal::instance_cache singletons;

    shared_state(std::vector<descriptor> descs, concurrency_mode m)
        : descriptors(std::move(descs))
        , mode(m)
        , singletons(m)
    {
        for (std::size_t i = 0; i < descriptors.size(); ++i) {
            by_contract[descriptors[i].service_type()].push_back(i);
        }
    }

    const std::vector<std::size_t>* find(contract type) const {
        auto it = by_contract.find(type);
        if (it == by_contract.end() || it->second.empty()) return nullptr;
        return &it->second;
    }
};

// ---------------------------------------------------------------
// impl: per-provider state (the root's implicit scope, or a created scope)
// ---------------------------------------------------------------

struct provider::impl {
    std::shared_ptr<shared_state> shared;
    std::shared_ptr<provider> root;     // null on the root itself
    internal::instance_cache scoped;
    std::atomic<bool> disposed{false};

    impl(std::shared_ptr<shared_state> s, std::shared_ptr<provider> r)
        : shared(std::move(s))
        , root(std::move(r))
        , scoped(shared->mode)
    {}
};

namespace {

// ---------------------------------------------------------------
// Per-thread record of descriptors under construction.  A frame is keyed
// on the cache that will hold the instance (the provider itself for
// transients), so the same contract built for another scope is not a
// cycle.  Re-entering a frame means the graph is cyclic; validated graphs
// never get here.
// ---------------------------------------------------------------

struct resolution_frame {
    const void* owner;
    std::size_t index;
};

thread_local std::vector<resolution_frame> active_resolutions;

class resolution_guard {
public:
    resolution_guard(const void* owner, std::size_t idx,
                     const std::vector<descriptor>& descriptors) {
        auto it = std::find_if(active_resolutions.begin(), active_resolutions.end(),
            [&](const resolution_frame& f) { return f.owner == owner && f.index == idx; });
        if (it != active_resolutions.end()) {
            std::vector<std::type_index> cycle;
            for (; it != active_resolutions.end(); ++it) {
                cycle.push_back(descriptors[it->index].service_type());
            }
            cycle.push_back(descriptors[idx].service_type());
            throw cyclic_resolution(cycle);
        }
        active_resolutions.push_back({owner, idx});
    }

    ~resolution_guard() { active_resolutions.pop_back(); }

    resolution_guard(const resolution_guard&) = delete;
    resolution_guard& operator=(const resolution_guard&) = delete;
};

} // namespace

// ---------------------------------------------------------------
// Constructors / Destructor
// ---------------------------------------------------------------

provider::provider(std::unique_ptr<impl> p_impl)
    : impl_(std::move(p_impl))
{}

provider::~provider() = default;

std::shared_ptr<provider> provider::create(std::vector<descriptor> descriptors,
                                           const build_options& options) {
    auto shared = std::make_shared<shared_state>(std::move(descriptors), options.concurrency);
    auto root_impl = std::make_unique<impl>(std::move(shared), nullptr);
    return std::shared_ptr<provider>(new provider(std::move(root_impl)));
}

provider& provider::root() noexcept {
    return impl_->root ? *impl_->root : *this;
}

bool provider::is_root() const noexcept {
    return impl_->root == nullptr;
}

concurrency_mode provider::concurrency() const noexcept {
    return impl_->shared->mode;
}

bool provider::is_registered(contract type) const {
    return impl_->shared->find(type) != nullptr;
}

// ---------------------------------------------------------------
// Factory invocation with diagnostics
// ---------------------------------------------------------------

erased_ref provider::invoke_factory(std::size_t idx, provider& context) {
    const auto& desc = impl_->shared->descriptors[idx];

    erased_ref instance;
    try {
        instance = desc.factory()(context);
    } catch (di_error& e) {
        // Innermost component first: "... (while resolving B -> A)".
        e.append_resolution_context(desc.display_name());
        if (e.diagnostic_detail().empty()) {
            auto trace = internal::format_registration_trace(desc);
            if (!trace.empty()) e.set_diagnostic_detail(trace);
        }
        throw;
    } catch (const std::exception& e) {
        logger()->error("svcdi: factory for {} threw: {}", desc.display_name(), e.what());
        auto ex = resolution_error(desc.service_type(), e.what(),
                                   desc.registration_location());
        ex.set_diagnostic_detail(internal::format_registration_trace(desc));
        throw ex;
    }

    if (!instance) {
        auto ex = resolution_error(desc.service_type(), "factory returned a null instance",
                                   desc.registration_location());
        ex.set_diagnostic_detail(internal::format_registration_trace(desc));
        throw ex;
    }

    if (auto log = logger(); log->should_log(spdlog::level::trace)) {
        log->trace("svcdi: created {} ({})", desc.display_name(), to_string(desc.lifetime()));
    }
    return instance;
}

// ---------------------------------------------------------------
// Lifetime policies
// ---------------------------------------------------------------

erased_ref provider::resolve_by_index(std::size_t idx) {
    const auto& descriptors = impl_->shared->descriptors;
    const auto& desc = descriptors[idx];

    // Guards are taken before touching a cache: re-entering a slot's
    // once_flag from the thread that is constructing it would never return.
    switch (desc.lifetime()) {
        case lifetime_kind::transient: {
            resolution_guard guard(impl_.get(), idx, descriptors);
            return invoke_factory(idx, *this);
        }

        case lifetime_kind::singleton: {
            auto& cache = impl_->shared->singletons;
            resolution_guard guard(&cache, idx, descriptors);
            // Singletons only ever see the root, never a scope.
            auto& r = root();
            return cache.get_or_create(idx, [&] {
                return r.invoke_factory(idx, r);
            });
        }

        case lifetime_kind::scoped: {
            auto& cache = impl_->scoped;
            resolution_guard guard(&cache, idx, descriptors);
            return cache.get_or_create(idx, [&] {
                return invoke_factory(idx, *this);
            });
        }
    }

    throw di_error("Invalid lifetime_kind");
}

// ---------------------------------------------------------------
// Non-template core
// ---------------------------------------------------------------

erased_ref provider::get_impl(contract type) {
    if (impl_->disposed) {
        throw di_error("Cannot resolve " + internal::demangle(type) + " through a disposed scope");
    }
    const auto* indices = impl_->shared->find(type);
    if (!indices) return {};
    // Last registration wins for single-instance lookups
    return resolve_by_index(indices->back());
}

std::vector<erased_ref> provider::get_all_impl(contract type) {
    if (impl_->disposed) {
        throw di_error("Cannot resolve " + internal::demangle(type) + " through a disposed scope");
    }
    const auto* indices = impl_->shared->find(type);
    if (!indices) return {};

    std::vector<erased_ref> result;
    result.reserve(indices->size());
    for (auto idx : *indices) {
        result.push_back(resolve_by_index(idx));
    }
    return result;
}

// ---------------------------------------------------------------
// Scoping
// ---------------------------------------------------------------

std::unique_ptr<scope> provider::create_scope() {
    if (impl_->disposed) {
        throw di_error("Cannot create a scope from a disposed scope");
    }
    auto root_ptr = root().shared_from_this();
    auto scoped_impl = std::make_unique<impl>(impl_->shared, std::move(root_ptr));
    auto scoped = std::shared_ptr<provider>(new provider(std::move(scoped_impl)));
    logger()->debug("svcdi: scope created");
    return std::unique_ptr<scope>(new scope(std::move(scoped)));
}

void provider::dispose() noexcept {
    if (impl_->disposed.exchange(true)) return;
    impl_->scoped.clear();
}

} // namespace svcdi
