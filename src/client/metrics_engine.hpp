#pragma once

#include "gattbench/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gattbench {
namespace client {

struct MetricsConfig {
    // Data bytes each notification should carry; unset disables the length check
    std::optional<size_t> expected_payload_bytes;
    // Count leading sequence numbers as lost when the first arrival is not 0
    // (stream started right after a Reset)
    bool expect_sequence_origin = false;
    // A first sequence beyond this is taken as a missed Reset, not as loss
    uint16_t origin_tolerance = 64;
    bool keep_records = true;
};

// One received notification as logged to the per-run files
struct PacketRecord {
    int seq = -1;                // -1 when too short to carry a sequence
    int dut_ts = -1;             // -1 when too short to carry a timestamp
    uint64_t arrival_us = 0;
    size_t raw_len = 0;
    size_t payload_len = 0;
    bool malformed = false;
    bool reordered = false;
};

struct ThroughputSummary {
    uint64_t packets = 0;
    uint64_t estimated_lost_packets = 0;
    uint64_t reordered_packets = 0;      // Includes duplicates
    uint64_t malformed_packets = 0;
    uint64_t bytes_recorded = 0;         // Raw bytes, header included
    double duration_s = 0.0;
    double throughput_kbps = 0.0;
    double notification_rate_per_s = 0.0;
    double avg_interarrival_ms = 0.0;
    double interarrival_stdev_ms = 0.0;
    double jitter_ms = 0.0;              // Stdev of (arrival delta - device timestamp delta)
    double loss_percent = 0.0;
    bool origin_mismatch = false;
    std::optional<uint16_t> first_sequence;
    std::optional<uint16_t> highest_sequence;
};

/**
 * MetricsEngine - Sequence-based stream statistics
 *
 * Fed in arrival order. Loss is derived only from sequence gaps with 16-bit
 * wraparound: a forward distance below 0x8000 from the highest sequence seen
 * is progress (gap - 1 packets lost), anything else is a late or duplicate
 * arrival, counted as reordering and never subtracted from the loss.
 */
class MetricsEngine {
public:
    explicit MetricsEngine(const MetricsConfig& config = MetricsConfig{});

    // Trial wall-clock window. Without begin()/finish() the duration falls
    // back to first..last arrival.
    void begin(uint64_t start_us);
    void finish(uint64_t end_us);

    void onNotification(ByteSpan raw, uint64_t arrival_us);

    ThroughputSummary summary() const;

    uint64_t getPacketCount() const { return packets_; }
    uint64_t getEstimatedLost() const { return lost_; }
    std::optional<uint16_t> getHighestSequence() const;
    const std::vector<PacketRecord>& getRecords() const { return records_; }

    void reset();

private:
    void trackSequence(uint16_t seq, PacketRecord& record);
    void trackTiming(const PacketRecord& record);

    MetricsConfig config_;

    std::optional<uint64_t> start_us_;
    std::optional<uint64_t> end_us_;
    std::optional<uint64_t> first_arrival_us_;
    std::optional<uint64_t> last_arrival_us_;

    uint64_t packets_ = 0;
    uint64_t bytes_ = 0;
    uint64_t lost_ = 0;
    uint64_t reordered_ = 0;
    uint64_t malformed_ = 0;
    bool have_highest_ = false;
    uint16_t highest_seq_ = 0;
    std::optional<uint16_t> first_seq_;
    bool origin_mismatch_ = false;

    // Running sums for inter-arrival and timestamp-relative jitter
    std::optional<uint64_t> prev_arrival_us_;
    std::optional<uint16_t> prev_ts_;
    std::optional<uint64_t> prev_ts_arrival_us_;
    uint64_t interarrival_count_ = 0;
    double interarrival_sum_ = 0.0;
    double interarrival_sq_sum_ = 0.0;
    uint64_t skew_count_ = 0;
    double skew_sum_ = 0.0;
    double skew_sq_sum_ = 0.0;

    std::vector<PacketRecord> records_;
};

// ============================================================================
// Latency trials
// ============================================================================

struct LatencySample {
    int iteration = 0;
    std::string mode;
    double start_s = 0.0;                 // Clock time the Start was written
    std::optional<double> latency_s;      // Empty = timeout
    int seq = -1;
    int dut_ts = -1;
};

struct LatencySummary {
    int samples = 0;
    int timeouts = 0;
    std::optional<double> avg_latency_s;
    std::optional<double> min_latency_s;
    std::optional<double> max_latency_s;
};

LatencySummary summarizeLatency(const std::vector<LatencySample>& samples);

} // namespace client
} // namespace gattbench
