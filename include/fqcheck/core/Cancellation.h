#pragma once

#include <atomic>

namespace fqcheck {

// Run-level stop signal. requestStop() is async-signal-safe.
class CancellationToken {
public:
    void requestStop() noexcept { stopped_.store(true, std::memory_order_relaxed); }
    bool stopRequested() const noexcept {
        return stopped_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> stopped_{false};
    static_assert(std::atomic<bool>::is_always_lock_free);
};

} // namespace fqcheck
