#include "notification_scheduler.hpp"
#include "../protocol/wire_format.hpp"
#include "gattbench/logging.hpp"
#include <algorithm>

namespace gattbench {
namespace peripheral {

const char* schedulerStateToString(SchedulerState state) {
    switch (state) {
        case SchedulerState::IDLE:      return "IDLE";
        case SchedulerState::ARMED:     return "ARMED";
        case SchedulerState::STREAMING: return "STREAMING";
        default: return "UNKNOWN";
    }
}

NotificationScheduler::NotificationScheduler(RandomSource& rng, const SchedulerConfig& config)
    : rng_(rng), config_(config), payload_bytes_(std::min(config.default_payload_bytes, MAX_PAYLOAD_BYTES)) {
}

bool NotificationScheduler::setFaultProfile(const FaultProfile& profile) {
    if (state_ == SchedulerState::STREAMING) {
        LOG_PERIPH(WARN, "Fault profile change to '%s' rejected while streaming", profile.name.c_str());
        return false;
    }
    profile_ = profile;
    drop_curve_pos_ = 0;
    interval_curve_pos_ = 0;
    return true;
}

uint32_t NotificationScheduler::getNominalIntervalMs() const {
    if (config_.interval_ms > 0) {
        return config_.interval_ms;
    }
    int hz = std::max(1, config_.notify_hz);
    return std::max<uint32_t>(1, 1000 / hz);
}

// ============================================================================
// Transitions
// ============================================================================

void NotificationScheduler::reset() {
    queue_.clear();
    next_sequence_ = 0;
    scheduled_in_stream_ = 0;
    packet_limit_ = 0;
    draining_ = false;
    burst_remaining_ = 0;
    drop_curve_pos_ = 0;
    interval_curve_pos_ = 0;
    phy_tick_ = 0;
    stats_ = SchedulerStats{};
    if (rssi_) {
        rssi_->restart(device_ms_);
    }
    LOG_PERIPH(INFO, "Reset: sequence=0, buffer cleared");
    setState(SchedulerState::ARMED);
}

void NotificationScheduler::start(std::optional<size_t> payload_bytes, uint16_t packet_count) {
    size_t requested = payload_bytes.value_or(config_.default_payload_bytes);
    payload_bytes_ = std::min(requested, MAX_PAYLOAD_BYTES);
    packet_limit_ = packet_count;
    scheduled_in_stream_ = 0;
    draining_ = false;

    if (state_ != SchedulerState::STREAMING) {
        next_due_ms_ = device_ms_;
    }
    LOG_PERIPH(INFO, "Start: payload=%zu bytes, limit=%u, interval=%u ms, seq=%u",
               payload_bytes_, packet_limit_, getNominalIntervalMs(), next_sequence_);
    setState(SchedulerState::STREAMING);
}

void NotificationScheduler::stop() {
    if (state_ == SchedulerState::IDLE) {
        return;
    }
    enterIdle("stop command");
}

void NotificationScheduler::enterIdle(const char* reason) {
    if (!queue_.empty()) {
        LOG_PERIPH(DEBUG, "Discarding %zu queued packets (%s)", queue_.size(), reason);
    }
    queue_.clear();
    draining_ = false;
    LOG_PERIPH(INFO, "Stream idle: %s (scheduled=%llu, sent=%llu, dropped=%llu)", reason,
               static_cast<unsigned long long>(stats_.scheduled),
               static_cast<unsigned long long>(stats_.transmitted),
               static_cast<unsigned long long>(stats_.droppedTotal()));
    setState(SchedulerState::IDLE);
}

void NotificationScheduler::setState(SchedulerState state) {
    if (state_ == state) {
        return;
    }
    state_ = state;
    if (on_state_changed_) {
        on_state_changed_(state);
    }
}

// ============================================================================
// Pacing
// ============================================================================

void NotificationScheduler::tick(uint32_t elapsed_ms) {
    device_ms_ += elapsed_ms;
    if (state_ != SchedulerState::STREAMING) {
        return;
    }
    if (paused_) {
        next_due_ms_ = std::max(next_due_ms_, device_ms_);
        return;
    }

    while (state_ == SchedulerState::STREAMING && !draining_ && next_due_ms_ <= device_ms_) {
        scheduleDuePacket();
    }
    if (state_ != SchedulerState::STREAMING) {
        return;
    }

    flushQueue();

    if (draining_ && queue_.empty()) {
        enterIdle("packet count reached");
    }
}

void NotificationScheduler::scheduleDuePacket() {
    uint64_t due_ms = next_due_ms_;
    uint16_t seq = next_sequence_++;
    stats_.scheduled++;
    scheduled_in_stream_++;

    // 1. Drop
    bool dropped = decideDrop();

    if (!dropped) {
        auto packet = protocol::NotificationPacket::make(seq, static_cast<uint16_t>(due_ms & 0xFFFF), payload_bytes_);
        Bytes bytes = packet.encode();

        // 2. Malform
        if (rng_.chancePercent(profile_.malformed_chance)) {
            corrupt(bytes);
            stats_.malformed++;
        }

        // 3. Latency spike - wall-clock release only, timestamp unchanged
        uint64_t release_ms = due_ms;
        if (profile_.latency_spike_ms > 0 && rng_.chancePercent(profile_.latency_spike_chance)) {
            release_ms += static_cast<uint64_t>(profile_.latency_spike_ms);
            stats_.latency_spikes++;
            LOG_PERIPH(TRACE, "seq=%u delayed by %d ms", seq, profile_.latency_spike_ms);
        }

        if (config_.backlog_limit > 0 && queue_.size() >= config_.backlog_limit) {
            stats_.dropped_backlog++;
            LOG_PERIPH(DEBUG, "Controller buffer full (%zu), seq=%u dropped", queue_.size(), seq);
        } else {
            queue_.push_back(QueuedPacket{std::move(bytes), release_ms, seq});
        }
    }

    // 4. Interval jitter, regardless of the outcome above
    next_due_ms_ = due_ms + nextIntervalMs();

    // 5. Simulated disconnect
    if (rng_.chancePercent(profile_.disconnect_chance)) {
        stats_.disconnects++;
        LOG_PERIPH(INFO, "Simulating disconnect at seq=%u", seq);
        enterIdle("simulated disconnect");
        if (on_link_lost_) {
            on_link_lost_("simulated disconnect");
        }
        return;
    }

    if (packet_limit_ > 0 && scheduled_in_stream_ >= packet_limit_) {
        draining_ = true;
    }
}

bool NotificationScheduler::decideDrop() {
    if (burst_remaining_ > 0) {
        burst_remaining_--;
        stats_.dropped_burst++;
        return true;
    }

    double drop_percent = profile_.drop_percent;
    if (!profile_.drop_curve.empty()) {
        drop_percent = profile_.drop_curve[drop_curve_pos_] * 100.0;
        drop_curve_pos_ = (drop_curve_pos_ + 1) % profile_.drop_curve.size();
    }

    if (rng_.chancePercent(drop_percent)) {
        stats_.dropped_random++;
        return true;
    }

    if (profile_.drop_burst_len > 0 && rng_.chancePercent(profile_.drop_burst_percent)) {
        burst_remaining_ = profile_.drop_burst_len - 1;
        stats_.dropped_burst++;
        LOG_PERIPH(TRACE, "Drop burst of %d packets", profile_.drop_burst_len);
        return true;
    }
    return false;
}

void NotificationScheduler::corrupt(Bytes& packet) {
    bool truncate = packet.size() <= PACKET_HEADER_BYTES || rng_.uniform() < 0.5;
    if (truncate) {
        packet.resize(std::max<size_t>(2, packet.size() / 2));
    } else {
        for (size_t i = PACKET_HEADER_BYTES; i < packet.size(); i++) {
            packet[i] ^= 0xFF;
        }
    }
}

uint32_t NotificationScheduler::nextIntervalMs() {
    int delay = static_cast<int>(getNominalIntervalMs());
    if (!profile_.interval_curve_ms.empty()) {
        delay = profile_.interval_curve_ms[interval_curve_pos_];
        interval_curve_pos_ = (interval_curve_pos_ + 1) % profile_.interval_curve_ms.size();
    }
    if (profile_.interval_jitter_ms > 0) {
        delay += rng_.uniformInt(-profile_.interval_jitter_ms, profile_.interval_jitter_ms);
    }
    delay = std::max(1, delay);

    if (profile_.phy_profile == PhyProfile::VARYING) {
        phy_tick_ = (phy_tick_ + 1) % 100;
        if (phy_tick_ == 0) {
            delay = delay * 3 / 2;
        } else if (phy_tick_ % 10 == 0) {
            delay = std::max(1, delay * 8 / 10);
        }
    }
    return static_cast<uint32_t>(delay);
}

void NotificationScheduler::flushQueue() {
    while (!queue_.empty() && queue_.front().release_ms <= device_ms_) {
        const QueuedPacket& head = queue_.front();
        if (on_transmit_ && !on_transmit_(head.bytes)) {
            stats_.busy_retries++;
            break;
        }
        stats_.transmitted++;
        queue_.pop_front();
    }
}

} // namespace peripheral
} // namespace gattbench
