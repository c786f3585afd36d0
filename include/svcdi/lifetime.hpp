#pragma once

#include <string_view>

namespace svcdi {

enum class lifetime_kind {
    transient,
    singleton,
    scoped
};

constexpr std::string_view to_string(lifetime_kind lt) noexcept {
    constexpr std::string_view names[] = {"transient", "singleton", "scoped"};
    return names[static_cast<int>(lt)];
}

/// How many instances a declared dependency expects.
enum class cardinality {
    exactly_one,
    zero_or_one,
    zero_or_more
};

constexpr std::string_view to_string(cardinality c) noexcept {
    constexpr std::string_view names[] = {"exactly_one", "zero_or_one", "zero_or_more"};
    return names[static_cast<int>(c)];
}

} // namespace svcdi
