// test_end_to_end.cpp - Client trials against the simulated peripheral
//
// Runs the real GattTrialRunner over SimulatedLink + PeripheralSession on
// virtual time, so every trial completes in milliseconds of wall time.
//
// Tests:
// 1. Clean link: packet count and throughput match the pacing
// 2. 50% drop shows up as estimated loss
// 3. Packet-count bounded trial
// 4. Simulated disconnect -> link_lost record
// 5. Command write failure
// 6. Connection exhaustion
// 7. Latency (trigger mode)
// 8. RSSI sampling
// 9. Full sweep over the simulated link

#include "client/simulated_link.hpp"
#include "client/trial_runner.hpp"
#include "peripheral/peripheral_session.hpp"
#include "runner/trial_orchestrator.hpp"
#include "common/cancel_token.hpp"
#include "common/clock.hpp"
#include "common/fs_util.hpp"
#include "gattbench/errors.hpp"
#include "gattbench/logging.hpp"
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace gattbench;
using namespace gattbench::client;

namespace {

// One simulated bench: peripheral, link and runner on a shared virtual clock
struct SimBench {
    SimClock clock;
    peripheral::PeripheralSession session;
    SimulatedLink link;
    CancelToken cancel;
    GattTrialRunner runner;

    explicit SimBench(const peripheral::PeripheralConfig& periph = peripheral::PeripheralConfig{})
        : session(periph), link(clock, session), runner(link, clock, cancel, runnerConfig()) {
        runner.setPeerConfigurator([this](const peripheral::FaultProfile& profile) {
            return session.configure(profile);
        });
    }

    static TrialRunnerConfig runnerConfig() {
        TrialRunnerConfig cfg;
        cfg.write_logs = false;
        cfg.connect.target = "SIM:00:00:00:00:00:01";
        cfg.connect.timeout_s = 5.0;
        cfg.connect.max_attempts = 3;
        cfg.connect.retry_delay_s = 0.1;
        return cfg;
    }
};

ThroughputTrialParams throughputParams(int payload, double duration_s,
                                       const peripheral::FaultOverrides& overrides = peripheral::FaultOverrides{}) {
    ThroughputTrialParams p;
    p.payload_bytes = payload;
    p.duration_s = duration_s;
    p.fault_profile = peripheral::resolveFaultProfile("best", overrides);
    return p;
}

std::string makeTempDir() {
    char tmpl[] = "/tmp/gattbench_e2eXXXXXX";
    char* dir = mkdtemp(tmpl);
    return dir ? std::string(dir) : std::string("/tmp");
}

} // namespace

int main() {
    std::cout << "=== End-to-End Simulation Tests ===\n\n";
    setLogLevel(LogLevel::ERROR);

    int pass = 0, fail = 0;
    auto check = [&](bool ok, const std::string& what) {
        std::cout << (ok ? "  [PASS] " : "  [FAIL] ") << what << "\n";
        if (ok) pass++; else fail++;
    };

    // ========================================================================
    // TEST 1: Clean link
    // ========================================================================
    std::cout << "TEST 1: Clean link, 20-byte payload for 5 s at 40 Hz\n";
    {
        SimBench bench;
        TrialRecord r = bench.runner.runThroughput(throughputParams(20, 5.0));

        std::cout << "  packets=" << r.packets_received << " kbps=" << r.throughput_kbps << "\n";
        check(r.status == TrialStatus::OK, "trial completed");
        check(r.packets_received >= 199 && r.packets_received <= 201, "~200 notifications in 5 s");
        check(r.estimated_lost == 0 && r.malformed_packets == 0, "no loss on a clean link");
        check(std::fabs(r.throughput_kbps - 7.68) < 7.68 * 0.05, "throughput ~7.68 kbps");
        check(std::fabs(r.duration_s - 5.0) < 0.01, "duration measured from Start");
        check(r.connection_attempts_used == 1, "connected first time");
        check(!bench.link.isConnected(), "link released after the trial");
        check(bench.session.scheduler().getState() == peripheral::SchedulerState::IDLE, "peripheral back to idle");
    }

    // ========================================================================
    // TEST 2: Drop
    // ========================================================================
    std::cout << "\nTEST 2: 50% drop shows up as estimated loss\n";
    {
        SimBench bench;
        peripheral::FaultOverrides o;
        o.drop_percent = 50.0;
        TrialRecord r = bench.runner.runThroughput(throughputParams(20, 5.0, o));

        std::cout << "  received=" << r.packets_received << " lost=" << r.estimated_lost << "\n";
        check(r.packets_received >= 70 && r.packets_received <= 130, "about half received");
        check(r.estimated_lost >= 70 && r.estimated_lost <= 130, "about half estimated lost");
        uint64_t total = r.packets_received + r.estimated_lost;
        check(total >= 185 && total <= 201, "received + lost accounts for the stream");
        check(bench.session.getProfile().name == "best+custom", "overridden profile installed on the peer");
    }

    // ========================================================================
    // TEST 3: Packet count
    // ========================================================================
    std::cout << "\nTEST 3: Packet-count bounded trial\n";
    {
        SimBench bench;
        ThroughputTrialParams p = throughputParams(60, 0.0);
        p.packet_count = 50;
        TrialRecord r = bench.runner.runThroughput(p);
        check(r.status == TrialStatus::OK && r.packets_received == 50, "exactly 50 notifications");
        check(bench.session.scheduler().getStats().scheduled == 50, "peripheral stopped at the limit");

        ThroughputTrialParams bad = throughputParams(60, 0.0);
        bool rejected = false;
        try {
            bench.runner.runThroughput(bad);
        } catch (const ConfigError&) {
            rejected = true;
        }
        check(rejected, "no duration and no count is rejected");
    }

    // ========================================================================
    // TEST 4: Link loss
    // ========================================================================
    std::cout << "\nTEST 4: Simulated disconnect\n";
    {
        SimBench bench;
        peripheral::FaultOverrides o;
        o.disconnect_chance = 100.0;
        TrialRecord r = bench.runner.runThroughput(throughputParams(20, 5.0, o));
        check(r.status == TrialStatus::LINK_LOST, "status link_lost");
        check(r.notes.find("link lost") != std::string::npos, "note names the link loss");
        check(r.duration_s < 1.0, "trial ended early");
        check(!bench.link.isConnected(), "link down afterwards");
    }

    // ========================================================================
    // TEST 5: Command write failure
    // ========================================================================
    std::cout << "\nTEST 5: Command write failure\n";
    {
        SimBench bench;
        bench.link.failNextWrites(1);
        bool threw = false;
        try {
            bench.runner.runThroughput(throughputParams(20, 1.0));
        } catch (const CommandWriteError&) {
            threw = true;
        }
        check(threw, "rejected Reset write raises CommandWriteError");
        check(!bench.link.isConnected(), "link released on the error path");

        TrialRecord r = bench.runner.runThroughput(throughputParams(20, 1.0));
        check(r.status == TrialStatus::OK && r.packets_received > 0, "next trial on the same bench runs normally");
    }

    // ========================================================================
    // TEST 6: Connection exhaustion
    // ========================================================================
    std::cout << "\nTEST 6: Connection exhaustion\n";
    {
        SimBench bench;
        bench.link.scriptConnectOutcomes({AttemptOutcome::ERROR, AttemptOutcome::ERROR, AttemptOutcome::ERROR});
        bool exhausted = false;
        try {
            bench.runner.runThroughput(throughputParams(20, 1.0));
        } catch (const ConnectionExhaustedError& e) {
            exhausted = e.attempts().size() == 3;
        }
        check(exhausted, "ConnectionExhaustedError with 3 attempts");
        check(bench.runner.getLastLinkReport().attempts.size() == 3, "attempt history kept on the runner");
    }

    // ========================================================================
    // TEST 7: Latency
    // ========================================================================
    std::cout << "\nTEST 7: Latency (trigger mode)\n";
    {
        SimBench bench;
        LatencyTrialParams p;
        p.mode = "trigger";
        p.iterations = 3;
        p.fault_profile = peripheral::resolveFaultProfile("best");
        LatencyRecord r = bench.runner.runLatency(p);
        check(r.samples == 3 && r.timeouts == 0, "3 answered iterations");
        check(r.avg_latency_s && *r.avg_latency_s < 0.01, "first notification within a few ms of Start");

        SimBench deaf;
        peripheral::FaultOverrides o;
        o.command_ignore_chance = 100.0;
        LatencyTrialParams q = p;
        q.timeout_s = 0.2;
        q.fault_profile = peripheral::resolveFaultProfile("best", o);
        LatencyRecord d = deaf.runner.runLatency(q);
        check(d.timeouts == 3 && !d.avg_latency_s, "ignored commands -> every iteration times out");

        LatencyTrialParams bad = p;
        bad.mode = "ping";
        bool rejected = false;
        try {
            bench.runner.runLatency(bad);
        } catch (const ConfigError&) {
            rejected = true;
        }
        check(rejected, "unknown latency mode rejected");
    }

    // ========================================================================
    // TEST 8: RSSI
    // ========================================================================
    std::cout << "\nTEST 8: RSSI sampling\n";
    {
        SimBench bench;
        RssiTrialParams p;
        p.samples = 5;
        p.fault_profile = peripheral::resolveFaultProfile("best");
        RssiRecord r = bench.runner.runRssi(p);
        check(r.rssi_available && r.samples_collected == 5, "5 RSSI samples read");

        peripheral::PeripheralConfig hidden;
        hidden.expose_rssi = false;
        SimBench blind(hidden);
        RssiRecord b = blind.runner.runRssi(p);
        check(!b.rssi_available && b.samples_collected == 5, "samples recorded as unavailable");
        check(b.notes.find("RSSI not exposed") != std::string::npos, "note explains the missing RSSI");
    }

    // ========================================================================
    // TEST 9: Sweep over the simulated link
    // ========================================================================
    std::cout << "\nTEST 9: Full sweep over the simulated link\n";
    {
        std::string root = makeTempDir();
        SimBench bench;
        runner::SweepPlan plan;
        plan.adapter = "sim0";
        plan.scenarios = {"baseline"};
        plan.phys = {"auto", "2m"};
        plan.payloads = {20, 120};
        plan.repeats = 1;
        plan.duration_s = 1.0;
        plan.latency_iterations = 2;
        plan.rssi_samples = 3;
        plan.rssi_interval_s = 0.1;
        plan.results_dir = joinPath(root, "results");
        plan.manifest_dir = joinPath(root, "manifests");
        plan.lock_dir = joinPath(root, "locks");
        plan.run_id = "sim_sweep";

        runner::TrialOrchestrator orch(bench.runner, bench.cancel, plan);
        runner::SweepResult result = orch.run();

        check(result.throughput.size() == 4 && result.errors.empty(), "4 throughput trials, no errors");
        bool all_ok = true;
        for (const auto& t : result.throughput) {
            if (t.status != TrialStatus::OK || t.packets_received < 35) all_ok = false;
        }
        check(all_ok, "every trial streamed for its full second");
        check(result.throughput.size() == 4 && result.throughput[3].throughput_kbps > result.throughput[2].throughput_kbps,
              "larger payload, higher throughput");
        check(result.latency.size() == 2 && result.rssi.size() == 2, "latency and RSSI per PHY");
        check(fileExists(result.manifest_path), "manifest written");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All end-to-end tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
