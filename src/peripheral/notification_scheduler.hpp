#pragma once

#include "fault_profile.hpp"
#include "rssi_synth.hpp"
#include "../common/random_source.hpp"
#include "gattbench/types.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>

namespace gattbench {
namespace peripheral {

enum class SchedulerState {
    IDLE,
    ARMED,       // Reset received, sequence at 0, waiting for Start
    STREAMING,
};

const char* schedulerStateToString(SchedulerState state);

struct SchedulerConfig {
    int notify_hz = DEFAULT_NOTIFY_HZ;
    uint32_t interval_ms = 0;                              // Overrides notify_hz when non-zero
    size_t default_payload_bytes = DEFAULT_PAYLOAD_BYTES;  // Start without a payload field
    size_t backlog_limit = 16;                             // Controller buffer depth (0 = unlimited)
};

struct SchedulerStats {
    uint64_t scheduled = 0;        // Sequence numbers consumed
    uint64_t transmitted = 0;      // Accepted by the transmit callback
    uint64_t dropped_random = 0;
    uint64_t dropped_burst = 0;
    uint64_t dropped_backlog = 0;  // Controller buffer full at schedule time
    uint64_t malformed = 0;
    uint64_t latency_spikes = 0;
    uint64_t disconnects = 0;
    uint64_t busy_retries = 0;     // Transmit callback reported the link busy

    uint64_t droppedTotal() const { return dropped_random + dropped_burst + dropped_backlog; }
};

/**
 * NotificationScheduler - Peripheral packet stream
 *
 * Owns the sequence counter, the pacing clock and the simulated controller
 * buffer. Time only moves through tick(). Each scheduled packet passes, in
 * order: drop (random / burst / curve) -> malform -> latency spike ->
 * interval jitter -> simulated disconnect. Dropped packets still consume a
 * sequence number and count toward the Start packet limit.
 *
 * Packets sit in a FIFO until their release time; the head is retried on the
 * next tick while the transmit callback reports the link busy. When the FIFO
 * already holds backlog_limit packets, newly scheduled packets are dropped.
 */
class NotificationScheduler {
public:
    // Returns false when the link cannot take the packet right now
    using TransmitCallback = std::function<bool(const Bytes& packet)>;
    using LinkLostCallback = std::function<void(const std::string& reason)>;
    using StateChangedCallback = std::function<void(SchedulerState state)>;

    explicit NotificationScheduler(RandomSource& rng, const SchedulerConfig& config = SchedulerConfig{});

    // Rejected (returns false) while streaming
    bool setFaultProfile(const FaultProfile& profile);
    const FaultProfile& getFaultProfile() const { return profile_; }

    // RSSI waveform restarted on every Reset (optional)
    void setRssiSynthesizer(RssiSynthesizer* rssi) { rssi_ = rssi; }

    void setTransmitCallback(TransmitCallback cb) { on_transmit_ = std::move(cb); }
    void setLinkLostCallback(LinkLostCallback cb) { on_link_lost_ = std::move(cb); }
    void setStateChangedCallback(StateChangedCallback cb) { on_state_changed_ = std::move(cb); }

    // --- Transitions ---

    // Any state -> ARMED. Sequence 0, buffer and burst state cleared.
    void reset();

    // ARMED/IDLE -> STREAMING. While streaming, re-applies the parameters.
    // packet_count 0 = unbounded until stop().
    void start(std::optional<size_t> payload_bytes, uint16_t packet_count);

    // -> IDLE immediately, queued packets discarded
    void stop();

    // Advance the device clock, schedule due packets and release the buffer
    void tick(uint32_t elapsed_ms);

    // Notifications disabled on the client (CCCD off): pacing holds, no
    // catch-up burst when resumed
    void setPaused(bool paused) { paused_ = paused; }
    bool isPaused() const { return paused_; }

    // --- Status ---

    SchedulerState getState() const { return state_; }
    uint16_t getNextSequence() const { return next_sequence_; }
    uint64_t getDeviceTimeMs() const { return device_ms_; }
    size_t getPayloadBytes() const { return payload_bytes_; }
    uint16_t getPacketLimit() const { return packet_limit_; }
    size_t getQueuedPackets() const { return queue_.size(); }
    uint32_t getNominalIntervalMs() const;
    const SchedulerStats& getStats() const { return stats_; }
    const SchedulerConfig& getConfig() const { return config_; }

private:
    struct QueuedPacket {
        Bytes bytes;
        uint64_t release_ms = 0;
        uint16_t sequence = 0;
    };

    void scheduleDuePacket();
    bool decideDrop();
    void corrupt(Bytes& packet);
    uint32_t nextIntervalMs();
    void flushQueue();
    void enterIdle(const char* reason);
    void setState(SchedulerState state);

    RandomSource& rng_;
    SchedulerConfig config_;
    FaultProfile profile_;
    RssiSynthesizer* rssi_ = nullptr;

    TransmitCallback on_transmit_;
    LinkLostCallback on_link_lost_;
    StateChangedCallback on_state_changed_;

    SchedulerState state_ = SchedulerState::IDLE;
    uint64_t device_ms_ = 0;
    uint64_t next_due_ms_ = 0;
    uint16_t next_sequence_ = 0;
    size_t payload_bytes_ = DEFAULT_PAYLOAD_BYTES;
    uint16_t packet_limit_ = 0;
    uint32_t scheduled_in_stream_ = 0;
    bool draining_ = false;          // Limit reached, emptying the buffer
    bool paused_ = false;

    int burst_remaining_ = 0;
    size_t drop_curve_pos_ = 0;
    size_t interval_curve_pos_ = 0;
    int phy_tick_ = 0;

    std::deque<QueuedPacket> queue_;
    SchedulerStats stats_;
};

} // namespace peripheral
} // namespace gattbench
