#include "svcdi/validation.hpp"
#include "svcdi/exceptions.hpp"
#include "svcdi/logging.hpp"
#include "svcdi/registry.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <source_location>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace svcdi {

namespace {

// contract → indices of its descriptors, in registration order
using contract_index = std::unordered_map<contract, std::vector<std::size_t>>;

contract_index build_contract_index(const std::vector<descriptor>& descriptors) {
    contract_index idx;
    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        idx[descriptors[i].service_type()].push_back(i);
    }
    return idx;
}

std::string join_path(const std::vector<contract>& path) {
    std::string out;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out += " -> ";
        out += internal::demangle(path[i]);
    }
    return out;
}

// ------------------------------------------------------------------
// Check that every exactly_one dependency has a registration
// ------------------------------------------------------------------
void check_unregistered(const std::vector<descriptor>& descriptors,
                        const contract_index& idx,
                        std::vector<validation_issue>& issues) {
    std::set<std::pair<contract, contract>> reported;

    for (const auto& desc : descriptors) {
        for (const auto& dep : desc.dependencies()) {
            // zero_or_one / zero_or_more resolve to null / empty when
            // nothing is registered, so absence is not a defect for them.
            if (dep.card != cardinality::exactly_one) continue;
            if (idx.contains(dep.type)) continue;
            if (!reported.emplace(desc.service_type(), dep.type).second) continue;

            issues.emplace_back(unregistered_dependency{
                desc.service_type(), desc.implementation_type(), dep.type});
        }
    }
}

// ------------------------------------------------------------------
// Lifetime captivity: singleton reaching a scoped service
// ------------------------------------------------------------------
void walk_captivity(contract origin,
                    const std::vector<dependency_info>& deps,
                    const std::vector<descriptor>& descriptors,
                    const contract_index& idx,
                    std::set<contract>& visited,
                    std::vector<contract>& chain,
                    std::set<std::pair<contract, contract>>& reported,
                    std::vector<validation_issue>& issues) {
    for (const auto& dep : deps) {
        auto it = idx.find(dep.type);
        if (it == idx.end()) continue;

        chain.push_back(dep.type);

        bool has_scoped = std::any_of(it->second.begin(), it->second.end(),
            [&](std::size_t i) { return descriptors[i].lifetime() == lifetime_kind::scoped; });
        if (has_scoped && reported.emplace(origin, dep.type).second) {
            issues.emplace_back(captured_dependency{origin, dep.type, chain});
        }

        // Keep following singletons only: anything they resolve is cached
        // for the life of the root provider as well.
        if (visited.insert(dep.type).second) {
            for (auto i : it->second) {
                const auto& next = descriptors[i];
                if (next.lifetime() != lifetime_kind::singleton) continue;
                walk_captivity(origin, next.dependencies(), descriptors, idx,
                               visited, chain, reported, issues);
            }
        }

        chain.pop_back();
    }
}

void check_captivity(const std::vector<descriptor>& descriptors,
                     const contract_index& idx,
                     std::vector<validation_issue>& issues) {
    std::set<std::pair<contract, contract>> reported;

    for (const auto& desc : descriptors) {
        if (desc.lifetime() != lifetime_kind::singleton) continue;
        if (desc.dependencies().empty()) continue;

        std::set<contract> visited{desc.service_type()};
        std::vector<contract> chain{desc.service_type()};
        walk_captivity(desc.service_type(), desc.dependencies(), descriptors, idx,
                       visited, chain, reported, issues);
    }
}

// ------------------------------------------------------------------
// Cycle detection (DFS on the contract graph, three colours)
// ------------------------------------------------------------------
enum class visit_state { unvisited, in_progress, done };

struct cycle_finder {
    // contract → unique dependency contracts over all of its descriptors
    std::map<contract, std::vector<contract>> edges;
    std::map<contract, visit_state> states;
    std::vector<contract> path;
    std::vector<validation_issue>& issues;

    void visit(contract node) {
        states[node] = visit_state::in_progress;
        path.push_back(node);

        auto it = edges.find(node);
        if (it != edges.end()) {
            for (auto next : it->second) {
                auto& state = states[next];
                if (state == visit_state::in_progress) {
                    auto start = std::find(path.begin(), path.end(), next);
                    std::vector<contract> cycle(start, path.end());
                    cycle.push_back(next);
                    issues.emplace_back(circular_dependency{std::move(cycle)});
                } else if (state == visit_state::unvisited) {
                    visit(next);
                }
            }
        }

        path.pop_back();
        states[node] = visit_state::done;
    }
};

void check_cycles(const std::vector<descriptor>& descriptors,
                  std::vector<validation_issue>& issues) {
    cycle_finder finder{{}, {}, {}, issues};
    std::vector<contract> roots;

    for (const auto& desc : descriptors) {
        auto node = desc.service_type();
        if (std::find(roots.begin(), roots.end(), node) == roots.end()) {
            roots.push_back(node);
        }
        auto& out = finder.edges[node];
        for (const auto& dep : desc.dependencies()) {
            if (std::find(out.begin(), out.end(), dep.type) == out.end()) {
                out.push_back(dep.type);
            }
        }
    }

    for (auto node : roots) {
        if (finder.states[node] == visit_state::unvisited) {
            finder.visit(node);
        }
    }
}

// Registration traces of every descriptor named by the issues.
std::string collect_traces(const std::vector<descriptor>& descriptors,
                           const std::vector<validation_issue>& issues) {
    std::set<contract> involved;
    for (const auto& issue : issues) {
        std::visit([&](const auto& i) {
            using T = std::decay_t<decltype(i)>;
            if constexpr (std::is_same_v<T, unregistered_dependency>) {
                involved.insert(i.consumer);
            } else if constexpr (std::is_same_v<T, circular_dependency>) {
                involved.insert(i.cycle.begin(), i.cycle.end());
            } else {
                involved.insert(i.singleton);
                involved.insert(i.scoped);
            }
        }, issue);
    }

    std::string detail;
    for (const auto& d : descriptors) {
        if (!involved.contains(d.service_type())) continue;
        std::string trace = internal::format_registration_trace(d);
        if (trace.empty()) continue;
        if (!detail.empty()) detail += "\n";
        detail += trace;
    }
    return detail;
}

} // anonymous namespace

std::string describe(const validation_issue& issue) {
    return std::visit([](const auto& i) -> std::string {
        using T = std::decay_t<decltype(i)>;
        if constexpr (std::is_same_v<T, unregistered_dependency>) {
            std::string consumer = internal::demangle(i.consumer);
            if (i.consumer_implementation != i.consumer) {
                consumer += " [impl: " + internal::demangle(i.consumer_implementation) + "]";
            }
            return "Unregistered dependency: " + consumer + " requires "
                   + internal::demangle(i.missing) + ", which is not registered";
        } else if constexpr (std::is_same_v<T, circular_dependency>) {
            return "Circular dependency: " + join_path(i.cycle);
        } else {
            return "Captured dependency: singleton " + internal::demangle(i.singleton)
                   + " depends on scoped " + internal::demangle(i.scoped)
                   + " (" + join_path(i.chain) + ")";
        }
    }, issue);
}

std::vector<validation_issue> collect_validation_issues(
        const std::vector<descriptor>& descriptors,
        const build_options& options) {
    std::vector<validation_issue> issues;
    auto idx = build_contract_index(descriptors);

    check_unregistered(descriptors, idx, issues);

    if (options.detect_cycles) {
        check_cycles(descriptors, issues);
    }

    if (options.validate_lifetimes) {
        check_captivity(descriptors, idx, issues);
    }

    return issues;
}

// ------------------------------------------------------------------
// Throwing entry point shared by registry::validate / registry::build
// ------------------------------------------------------------------
void validate_descriptors(const std::vector<descriptor>& descriptors,
                          const build_options& options,
                          std::source_location loc) {
    auto issues = collect_validation_issues(descriptors, options);
    if (issues.empty()) return;

    auto log = logger();
    for (const auto& issue : issues) {
        log->warn("svcdi: {}", describe(issue));
    }

    auto detail = collect_traces(descriptors, issues);
    validation_error ex(std::move(issues), loc);
    if (!detail.empty()) ex.set_diagnostic_detail(std::move(detail));
    throw ex;
}

void validate(const registry& reg, const build_options& options) {
    reg.validate(options);
}

} // namespace svcdi
