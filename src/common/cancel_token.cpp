#include "cancel_token.hpp"

#include <chrono>

namespace gattbench {

void CancelToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancelToken::waitFor(uint32_t timeout_ms) const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return cancelled_.load(); });
    return !cancelled_.load();
}

} // namespace gattbench
