#include "svcdi/logging.hpp"

#include <atomic>
#include <utility>

namespace svcdi {

namespace {

// Read on every construction, so no mutex: spdlog's registry lock is only
// taken when the default logger is (re)captured.
std::atomic<std::shared_ptr<spdlog::logger>>& active_logger() {
    static std::atomic<std::shared_ptr<spdlog::logger>> slot{spdlog::default_logger()};
    return slot;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    return active_logger().load(std::memory_order_acquire);
}

void set_logger(std::shared_ptr<spdlog::logger> target) {
    if (!target) target = spdlog::default_logger();
    active_logger().store(std::move(target), std::memory_order_release);
}

} // namespace svcdi
