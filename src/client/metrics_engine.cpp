#include "metrics_engine.hpp"
#include "../protocol/wire_format.hpp"
#include "gattbench/logging.hpp"
#include <algorithm>
#include <cmath>

namespace gattbench {
namespace client {

namespace {
double populationStdev(uint64_t n, double sum, double sq_sum) {
    if (n == 0) {
        return 0.0;
    }
    double mean = sum / n;
    double var = sq_sum / n - mean * mean;
    return var > 0.0 ? std::sqrt(var) : 0.0;
}
}

MetricsEngine::MetricsEngine(const MetricsConfig& config)
    : config_(config) {
}

void MetricsEngine::reset() {
    *this = MetricsEngine(config_);
}

void MetricsEngine::begin(uint64_t start_us) {
    start_us_ = start_us;
}

void MetricsEngine::finish(uint64_t end_us) {
    end_us_ = end_us;
}

std::optional<uint16_t> MetricsEngine::getHighestSequence() const {
    if (!have_highest_) {
        return std::nullopt;
    }
    return highest_seq_;
}

void MetricsEngine::onNotification(ByteSpan raw, uint64_t arrival_us) {
    auto header = protocol::decodeNotificationHeader(raw);

    PacketRecord record;
    record.arrival_us = arrival_us;
    record.raw_len = header.raw_len;
    record.payload_len = header.data_len;
    if (header.sequence) record.seq = *header.sequence;
    if (header.timestamp_ms) record.dut_ts = *header.timestamp_ms;

    // Integrity
    if (raw.size() < PACKET_HEADER_BYTES) {
        record.malformed = true;
    } else if (config_.expected_payload_bytes && header.data_len != *config_.expected_payload_bytes) {
        record.malformed = true;
    } else if (!protocol::hasIntactFiller(raw)) {
        record.malformed = true;
    }
    if (record.malformed) {
        malformed_++;
        LOG_CLIENT(DEBUG, "Malformed notification: %zu bytes, seq=%d", raw.size(), record.seq);
    }

    packets_++;
    bytes_ += raw.size();
    if (!first_arrival_us_) first_arrival_us_ = arrival_us;
    last_arrival_us_ = arrival_us;

    if (header.sequence) {
        trackSequence(*header.sequence, record);
    }
    trackTiming(record);

    if (config_.keep_records) {
        records_.push_back(record);
    }
}

void MetricsEngine::trackSequence(uint16_t seq, PacketRecord& record) {
    if (!have_highest_) {
        first_seq_ = seq;
        if (config_.expect_sequence_origin) {
            if (seq <= config_.origin_tolerance) {
                lost_ += seq;
            } else {
                origin_mismatch_ = true;
                LOG_CLIENT(WARN, "First sequence %u, expected 0 (reset missed?)", seq);
            }
        }
        highest_seq_ = seq;
        have_highest_ = true;
        return;
    }

    uint16_t delta = static_cast<uint16_t>(seq - highest_seq_);
    if (delta == 0 || delta >= 0x8000) {
        reordered_++;
        record.reordered = true;
        return;
    }
    if (delta > 1) {
        lost_ += delta - 1;
    }
    highest_seq_ = seq;
}

void MetricsEngine::trackTiming(const PacketRecord& record) {
    if (prev_arrival_us_) {
        double delta_ms = (record.arrival_us - *prev_arrival_us_) / 1000.0;
        interarrival_count_++;
        interarrival_sum_ += delta_ms;
        interarrival_sq_sum_ += delta_ms * delta_ms;
    }
    prev_arrival_us_ = record.arrival_us;

    // Arrival spacing against the device's own spacing; only for in-order packets
    if (record.dut_ts < 0 || record.reordered) {
        return;
    }
    uint16_t ts = static_cast<uint16_t>(record.dut_ts);
    if (prev_ts_) {
        double arrival_delta_ms = (record.arrival_us - *prev_ts_arrival_us_) / 1000.0;
        double device_delta_ms = static_cast<uint16_t>(ts - *prev_ts_);
        double skew = arrival_delta_ms - device_delta_ms;
        skew_count_++;
        skew_sum_ += skew;
        skew_sq_sum_ += skew * skew;
    }
    prev_ts_ = ts;
    prev_ts_arrival_us_ = record.arrival_us;
}

ThroughputSummary MetricsEngine::summary() const {
    ThroughputSummary s;
    s.packets = packets_;
    s.estimated_lost_packets = lost_;
    s.reordered_packets = reordered_;
    s.malformed_packets = malformed_;
    s.bytes_recorded = bytes_;
    s.origin_mismatch = origin_mismatch_;
    s.first_sequence = first_seq_;
    s.highest_sequence = getHighestSequence();

    if (start_us_ && end_us_ && *end_us_ > *start_us_) {
        s.duration_s = (*end_us_ - *start_us_) / 1e6;
    } else if (first_arrival_us_ && last_arrival_us_ && *last_arrival_us_ > *first_arrival_us_) {
        s.duration_s = (*last_arrival_us_ - *first_arrival_us_) / 1e6;
    }
    if (s.duration_s > 0.0) {
        s.throughput_kbps = (bytes_ * 8.0 / 1000.0) / s.duration_s;
        s.notification_rate_per_s = packets_ / s.duration_s;
    }

    if (interarrival_count_ > 0) {
        s.avg_interarrival_ms = interarrival_sum_ / interarrival_count_;
        s.interarrival_stdev_ms = populationStdev(interarrival_count_, interarrival_sum_, interarrival_sq_sum_);
    }
    s.jitter_ms = populationStdev(skew_count_, skew_sum_, skew_sq_sum_);

    uint64_t expected = packets_ - reordered_ + lost_;
    if (expected > 0) {
        s.loss_percent = 100.0 * lost_ / expected;
    }
    return s;
}

LatencySummary summarizeLatency(const std::vector<LatencySample>& samples) {
    LatencySummary s;
    s.samples = static_cast<int>(samples.size());
    double sum = 0.0;
    int valid = 0;
    for (const auto& sample : samples) {
        if (!sample.latency_s) {
            s.timeouts++;
            continue;
        }
        double v = *sample.latency_s;
        sum += v;
        valid++;
        s.min_latency_s = s.min_latency_s ? std::min(*s.min_latency_s, v) : v;
        s.max_latency_s = s.max_latency_s ? std::max(*s.max_latency_s, v) : v;
    }
    if (valid > 0) {
        s.avg_latency_s = sum / valid;
    }
    return s;
}

} // namespace client
} // namespace gattbench
