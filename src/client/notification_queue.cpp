#include "notification_queue.hpp"
#include "gattbench/logging.hpp"

namespace gattbench {
namespace client {

NotificationQueue::NotificationQueue(const Clock& clock, size_t capacity)
    : clock_(clock), capacity_(capacity > 0 ? capacity : 1) {
}

bool NotificationQueue::push(const Bytes& data) {
    uint64_t now = clock_.nowUs();
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.size() >= capacity_) {
        overflow_++;
        if (overflow_ == 1 || overflow_ % 100 == 0) {
            LOG_CLIENT(WARN, "Notification queue full (%zu), dropped %llu so far",
                       capacity_, static_cast<unsigned long long>(overflow_));
        }
        return false;
    }
    items_.push_back(Notification{data, now});
    pushed_++;
    return true;
}

std::optional<Notification> NotificationQueue::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) {
        return std::nullopt;
    }
    Notification n = std::move(items_.front());
    items_.pop_front();
    return n;
}

void NotificationQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.clear();
}

size_t NotificationQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

uint64_t NotificationQueue::getOverflowCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return overflow_;
}

uint64_t NotificationQueue::getPushedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pushed_;
}

} // namespace client
} // namespace gattbench
