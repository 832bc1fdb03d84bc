#pragma once

#include "../common/clock.hpp"
#include "gattbench/types.hpp"
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace gattbench {
namespace client {

struct Notification {
    Bytes data;
    uint64_t arrival_us = 0;     // Clock time at push
};

// Bounded FIFO between the transport's notify callback and the metrics
// engine. Preserves arrival order; on overflow the newest notification is
// dropped and counted. The notify callback may run on a transport thread.
class NotificationQueue {
public:
    explicit NotificationQueue(const Clock& clock, size_t capacity = 4096);

    // Transport side. False when full.
    bool push(const Bytes& data);

    // Consumer side, polled between clock sleeps
    std::optional<Notification> tryPop();
    void clear();

    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t getOverflowCount() const;
    uint64_t getPushedCount() const;

private:
    const Clock& clock_;
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<Notification> items_;
    uint64_t overflow_ = 0;
    uint64_t pushed_ = 0;
};

} // namespace client
} // namespace gattbench
