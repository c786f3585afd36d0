#pragma once

#include "export.hpp"

#include <memory>

#include <spdlog/spdlog.h>

namespace svcdi {

/// Logger used for build, scope and construction events.  Never null.
/// Starts as spdlog's default logger, captured on first use; a later
/// spdlog::set_default_logger() is picked up by set_logger(nullptr).
SVCDI_EXPORT std::shared_ptr<spdlog::logger> logger();

/// Route svcdi's log output to `target`.  Passing nullptr recaptures the
/// current spdlog default logger.
SVCDI_EXPORT void set_logger(std::shared_ptr<spdlog::logger> target);

} // namespace svcdi
