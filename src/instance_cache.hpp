#pragma once

// Internal: one lifetime cache (root singletons, or one scope's scoped
// instances).  Not installed.

#include "svcdi/descriptor.hpp"
#include "svcdi/erased_ref.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace svcdi::internal {

/// Slots are keyed by descriptor index.  In shared mode the slot table has
/// its own mutex and each slot constructs through a std::once_flag, so a
/// slot is built exactly once while unrelated slots never wait on each
/// other.  A factory that throws leaves its slot empty for the next caller.
class instance_cache {
public:
    explicit instance_cache(concurrency_mode mode) noexcept : mode_(mode) {}

    instance_cache(const instance_cache&) = delete;
    instance_cache& operator=(const instance_cache&) = delete;

    template <typename Make>
    erased_ref get_or_create(std::size_t idx, Make&& make) {
        if (mode_ == concurrency_mode::single_owner) {
            auto& s = slots_[idx];
            if (!s) s = std::make_shared<slot>();
            if (!s->instance) s->instance = make();
            return s->instance;
        }

        std::shared_ptr<slot> s;
        {
            std::lock_guard lock(table_mutex_);
            auto& entry = slots_[idx];
            if (!entry) entry = std::make_shared<slot>();
            s = entry;
        }
        std::call_once(s->once, [&] { s->instance = make(); });
        return s->instance;
    }

    /// Drop every cached handle.  Instances die here unless held elsewhere.
    void clear() noexcept {
        std::unordered_map<std::size_t, std::shared_ptr<slot>> released;
        if (mode_ == concurrency_mode::single_owner) {
            released.swap(slots_);
        } else {
            std::lock_guard lock(table_mutex_);
            released.swap(slots_);
        }
        // destructors of released instances run here, outside the lock
    }

private:
    struct slot {
        std::once_flag once;
        erased_ref instance;
    };

    concurrency_mode mode_;
    std::mutex table_mutex_;
    std::unordered_map<std::size_t, std::shared_ptr<slot>> slots_;
};

} // namespace svcdi::internal
