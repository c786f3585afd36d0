#pragma once

// Declarations only.  Enough to name svcdi types in signatures without
// pulling in the container headers.

#include "export.hpp"

namespace svcdi {

enum class lifetime_kind;
enum class cardinality;
enum class concurrency_mode;

// Registration data
struct build_options;
struct dependency_info;
class descriptor;
template <typename... Deps>
struct dependency_list;

// Dependency tags
template <typename T> struct exactly_one;
template <typename T> struct zero_or_one;
template <typename T> struct zero_or_more;
template <typename D> struct deferred;
struct provider_ref;

// Container
class registry;
class provider;
class scope;
template <typename V>
class lazy;

// Validation issues and errors
struct unregistered_dependency;
struct circular_dependency;
struct captured_dependency;
class di_error;
class missing_required_service;
class resolution_error;
class cyclic_resolution;
class validation_error;

} // namespace svcdi
