#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace gattbench {

// Operator abort flag shared by every wait in a trial. cancel() is safe to
// call from a signal-watching thread; waiters wake immediately.
class CancelToken {
public:
    CancelToken() = default;
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel();
    bool isCancelled() const { return cancelled_.load(); }

    // Sleep up to timeout_ms. Returns false if cancelled before or during the wait.
    bool waitFor(uint32_t timeout_ms) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace gattbench
