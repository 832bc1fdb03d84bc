// test_metrics_engine.cpp - Client-side stream statistics
//
// Tests:
// 1. In-order stream: throughput, rate, duration
// 2. Sequence gaps and 16-bit wraparound
// 3. Reordering and duplicates
// 4. Malformed notifications
// 5. Sequence origin after Reset
// 6. Jitter against device timestamps
// 7. Latency summary

#include "client/metrics_engine.hpp"
#include "protocol/wire_format.hpp"
#include "gattbench/logging.hpp"
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace gattbench;
using namespace gattbench::client;

namespace {

Bytes packet(uint16_t seq, uint16_t ts, size_t data_len = 20) {
    return protocol::NotificationPacket::make(seq, ts, data_len).encode();
}

void feed(MetricsEngine& m, const Bytes& raw, uint64_t arrival_us) {
    m.onNotification(ByteSpan(raw.data(), raw.size()), arrival_us);
}

void feedSequence(MetricsEngine& m, const std::vector<uint16_t>& seqs) {
    uint64_t t = 0;
    for (uint16_t s : seqs) {
        t += 25000;
        feed(m, packet(s, static_cast<uint16_t>(t / 1000)), t);
    }
}

bool near(double a, double b, double tol) {
    return std::fabs(a - b) <= tol;
}

} // namespace

int main() {
    std::cout << "=== Metrics Engine Tests ===\n\n";
    setLogLevel(LogLevel::ERROR);

    int pass = 0, fail = 0;
    auto check = [&](bool ok, const std::string& what) {
        std::cout << (ok ? "  [PASS] " : "  [FAIL] ") << what << "\n";
        if (ok) pass++; else fail++;
    };

    // ========================================================================
    // TEST 1: In-order stream
    // ========================================================================
    std::cout << "TEST 1: In-order stream\n";
    {
        MetricsConfig cfg;
        cfg.expected_payload_bytes = 20;
        MetricsEngine m(cfg);
        m.begin(0);
        for (uint16_t i = 0; i < 40; i++) {
            feed(m, packet(i, static_cast<uint16_t>(i * 25)), 1000 + i * 25000);
        }
        m.finish(1000000);

        ThroughputSummary s = m.summary();
        check(s.packets == 40 && s.estimated_lost_packets == 0, "40 packets, no loss");
        check(s.bytes_recorded == 40 * 24, "bytes include the 4-byte header");
        check(near(s.duration_s, 1.0, 1e-9), "duration from begin() to finish()");
        check(near(s.throughput_kbps, 7.68, 1e-6), "24 B x 40 / s = 7.68 kbps");
        check(near(s.notification_rate_per_s, 40.0, 1e-9), "40 notifications per second");
        check(near(s.avg_interarrival_ms, 25.0, 1e-9), "25 ms mean inter-arrival");
        check(s.malformed_packets == 0 && s.reordered_packets == 0, "nothing malformed or reordered");
        check(m.getRecords().size() == 40, "per-packet records kept");

        MetricsEngine bare;
        feed(bare, packet(0, 0), 0);
        feed(bare, packet(1, 25), 500000);
        check(near(bare.summary().duration_s, 0.5, 1e-9), "duration falls back to first..last arrival");

        MetricsEngine empty;
        check(empty.summary().packets == 0 && empty.summary().throughput_kbps == 0.0, "empty stream summarizes to zero");
    }

    // ========================================================================
    // TEST 2: Gaps and wraparound
    // ========================================================================
    std::cout << "\nTEST 2: Sequence gaps and 16-bit wraparound\n";
    {
        MetricsEngine wrap;
        feedSequence(wrap, {65533, 65534, 65535, 0, 1, 2});
        check(wrap.getEstimatedLost() == 0 && wrap.summary().reordered_packets == 0, "65535 -> 0 is not loss");
        check(wrap.getHighestSequence() == 2, "highest sequence follows the wrap");

        MetricsEngine gap;
        feedSequence(gap, {0, 1, 5, 6});
        check(gap.getEstimatedLost() == 3, "gap 1 -> 5 loses 3 packets");

        MetricsEngine wrap_gap;
        feedSequence(wrap_gap, {65534, 1});
        check(wrap_gap.getEstimatedLost() == 2, "gap across the wrap (65534 -> 1) loses 2");

        ThroughputSummary s = gap.summary();
        check(near(s.loss_percent, 100.0 * 3 / 7, 1e-9), "loss percent over expected packets");
    }

    // ========================================================================
    // TEST 3: Reordering and duplicates
    // ========================================================================
    std::cout << "\nTEST 3: Reordering and duplicates\n";
    {
        MetricsEngine m;
        feedSequence(m, {0, 1, 3, 2, 4});
        ThroughputSummary s = m.summary();
        check(s.reordered_packets == 1, "late packet counted as reordered");
        check(s.estimated_lost_packets == 1, "late arrival is not subtracted from loss");
        check(m.getHighestSequence() == 4, "late packet does not move the highest sequence");

        MetricsEngine dup;
        feedSequence(dup, {0, 1, 1, 2});
        check(dup.summary().reordered_packets == 1 && dup.getEstimatedLost() == 0, "duplicate counted as reordered");

        bool flagged = m.getRecords().size() == 5 && m.getRecords()[3].reordered && !m.getRecords()[2].reordered;
        check(flagged, "record of the late packet is flagged");
    }

    // ========================================================================
    // TEST 4: Malformed notifications
    // ========================================================================
    std::cout << "\nTEST 4: Malformed notifications\n";
    {
        MetricsConfig cfg;
        cfg.expected_payload_bytes = 20;
        MetricsEngine m(cfg);

        feed(m, packet(0, 0), 1000);
        Bytes truncated = packet(1, 25);
        truncated.resize(12);
        feed(m, truncated, 26000);
        Bytes flipped = packet(2, 50);
        flipped[10] ^= 0xFF;
        feed(m, flipped, 51000);
        Bytes tiny = {0x03};
        feed(m, tiny, 76000);
        feed(m, packet(4, 100), 101000);

        ThroughputSummary s = m.summary();
        check(s.packets == 5, "malformed notifications still counted as received");
        check(s.malformed_packets == 3, "truncated, corrupted and 1-byte packets flagged");
        check(s.estimated_lost_packets == 1, "seq 3 only lost (1-byte packet has no sequence)");
        check(m.getRecords()[3].seq == -1 && m.getRecords()[3].dut_ts == -1, "missing fields logged as -1");
        check(m.getRecords()[1].seq == 1 && m.getRecords()[1].payload_len == 8, "truncated packet keeps its header");

        MetricsEngine unchecked;
        feed(unchecked, packet(0, 0, 60), 0);
        check(unchecked.summary().malformed_packets == 0, "length check disabled without expected payload");
    }

    // ========================================================================
    // TEST 5: Sequence origin
    // ========================================================================
    std::cout << "\nTEST 5: Sequence origin after Reset\n";
    {
        MetricsConfig cfg;
        cfg.expect_sequence_origin = true;

        MetricsEngine late(cfg);
        feedSequence(late, {3, 4, 5});
        check(late.getEstimatedLost() == 3, "first arrival seq 3 -> 0..2 lost");
        check(!late.summary().origin_mismatch, "small offset is loss, not a mismatch");

        MetricsEngine stale(cfg);
        feedSequence(stale, {5000, 5001});
        check(stale.summary().origin_mismatch, "far-off first sequence flagged as missed reset");
        check(stale.getEstimatedLost() == 0, "missed reset not counted as loss");
        check(stale.summary().first_sequence == 5000, "first sequence reported");

        MetricsEngine plain;
        feedSequence(plain, {3, 4});
        check(plain.getEstimatedLost() == 0, "origin check off: leading gap ignored");
    }

    // ========================================================================
    // TEST 6: Jitter
    // ========================================================================
    std::cout << "\nTEST 6: Jitter against device timestamps\n";
    {
        MetricsEngine steady;
        feed(steady, packet(0, 0), 1000);
        feed(steady, packet(1, 25), 26000);
        feed(steady, packet(2, 50), 51000);
        check(near(steady.summary().jitter_ms, 0.0, 1e-9), "arrivals track device spacing -> 0 jitter");

        MetricsEngine shaky;
        feed(shaky, packet(0, 0), 0);
        feed(shaky, packet(1, 25), 30000);
        feed(shaky, packet(2, 50), 50000);
        ThroughputSummary s = shaky.summary();
        check(near(s.jitter_ms, 5.0, 1e-9), "skews +5 / -5 ms -> 5 ms jitter");
        check(near(s.interarrival_stdev_ms, 5.0, 1e-9), "inter-arrival stdev 5 ms");

        // Population standard deviation: a constant skew is not jitter
        MetricsEngine late;
        feed(late, packet(0, 0), 0);
        feed(late, packet(1, 25), 27000);
        feed(late, packet(2, 50), 54000);
        feed(late, packet(3, 75), 81000);
        check(near(late.summary().jitter_ms, 0.0, 1e-9), "constant +2 ms skew -> 0 jitter");

        MetricsEngine uneven;
        feed(uneven, packet(0, 0), 0);
        feed(uneven, packet(1, 25), 27000);
        feed(uneven, packet(2, 50), 58000);
        check(near(uneven.summary().jitter_ms, 2.0, 1e-9), "skews +2 / +6 ms -> 2 ms, divided by n");

        MetricsEngine wrapped;
        feed(wrapped, packet(0, 65530), 0);
        feed(wrapped, packet(1, 19), 25000);
        check(near(wrapped.summary().jitter_ms, 0.0, 1e-9), "device timestamp wrap handled");
    }

    // ========================================================================
    // TEST 7: Latency summary
    // ========================================================================
    std::cout << "\nTEST 7: Latency summary\n";
    {
        std::vector<LatencySample> samples(4);
        samples[0].latency_s = 0.010;
        samples[1].latency_s = 0.030;
        samples[3].latency_s = 0.020;

        LatencySummary s = summarizeLatency(samples);
        check(s.samples == 4 && s.timeouts == 1, "4 samples, 1 timeout");
        check(s.avg_latency_s && near(*s.avg_latency_s, 0.020, 1e-12), "average over answered iterations");
        check(s.min_latency_s == 0.010 && s.max_latency_s == 0.030, "min / max");

        LatencySummary none = summarizeLatency(std::vector<LatencySample>(2));
        check(!none.avg_latency_s && none.timeouts == 2, "all timeouts -> no average");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All metrics tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
