#pragma once

#include "svcdi/export.hpp"
#include "svcdi/fwd.hpp"
#include "svcdi/lifetime.hpp"
#include "svcdi/erased_ref.hpp"
#include "svcdi/descriptor.hpp"
#include "svcdi/validation.hpp"
#include "svcdi/exceptions.hpp"
#include "svcdi/logging.hpp"
#include "svcdi/provider.hpp"
#include "svcdi/scope.hpp"
#include "svcdi/lazy.hpp"
#include "svcdi/type_traits.hpp"
#include "svcdi/builder.hpp"
#include "svcdi/registry.hpp"
