// test_trial_orchestrator.cpp - Sweep ordering, resume, locking and the manifest
//
// Tests:
// 1. Matrix order and aggregate rows
// 2. Resume skips recorded trials only
// 3. Per-trial failures become itemized errors
// 4. Adapter lock exclusivity
// 5. Lock contention aborts the sweep
// 6. Cancellation marks the manifest interrupted
// 7. Scenario -> preset mapping
// 8. Result table round trip
// 9. Link loss is a trial status, not an abort

#include "runner/trial_orchestrator.hpp"
#include "runner/adapter_lock.hpp"
#include "runner/result_table.hpp"
#include "common/cancel_token.hpp"
#include "common/fs_util.hpp"
#include "gattbench/errors.hpp"
#include "gattbench/logging.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <vector>

using namespace gattbench;
using namespace gattbench::runner;

namespace {

// Records every call; trials can be made to fail through the hook
class FakeRunner : public client::TrialRunner {
public:
    std::vector<client::ThroughputTrialParams> throughput_calls;
    int latency_calls = 0;
    int rssi_calls = 0;
    std::function<void(const client::ThroughputTrialParams&)> before_throughput;
    std::function<void(const client::LatencyTrialParams&)> before_latency;
    std::function<void(const client::RssiTrialParams&)> before_rssi;
    TrialStatus throughput_status = TrialStatus::OK;

    TrialRecord runThroughput(const client::ThroughputTrialParams& params) override {
        throughput_calls.push_back(params);
        if (before_throughput) {
            before_throughput(params);
        }
        TrialRecord r;
        r.scenario = params.scenario;
        r.phy = params.phy;
        r.payload_bytes = params.payload_bytes;
        r.repeat_index = params.trial;
        r.packets_received = 100;
        r.duration_s = 1.0;
        r.throughput_kbps = params.payload_bytes * 0.32;
        r.notification_rate_per_s = 100.0;
        r.connection_attempts_used = 1;
        r.status = throughput_status;
        return r;
    }

    LatencyRecord runLatency(const client::LatencyTrialParams& params) override {
        latency_calls++;
        if (before_latency) {
            before_latency(params);
        }
        LatencyRecord r;
        r.scenario = params.scenario;
        r.phy = params.phy;
        r.trial = params.trial;
        r.mode = params.mode;
        r.avg_latency_s = 0.012;
        r.min_latency_s = 0.010;
        r.max_latency_s = 0.015;
        r.samples = params.iterations;
        return r;
    }

    RssiRecord runRssi(const client::RssiTrialParams& params) override {
        rssi_calls++;
        if (before_rssi) {
            before_rssi(params);
        }
        RssiRecord r;
        r.scenario = params.scenario;
        r.phy = params.phy;
        r.trial = params.trial;
        r.samples_collected = params.samples;
        r.rssi_available = true;
        return r;
    }
};

std::string makeTempDir() {
    char tmpl[] = "/tmp/gattbench_orchXXXXXX";
    char* dir = mkdtemp(tmpl);
    return dir ? std::string(dir) : std::string("/tmp");
}

SweepPlan basePlan(const std::string& root) {
    SweepPlan plan;
    plan.address = "SIM:00:00:00:00:00:01";
    plan.adapter = "hci9";
    plan.scenarios = {"baseline"};
    plan.phys = {"auto"};
    plan.payloads = {60};
    plan.repeats = 2;
    plan.duration_s = 1.0;
    plan.skip_latency = true;
    plan.skip_rssi = true;
    plan.results_dir = joinPath(root, "results");
    plan.manifest_dir = joinPath(root, "manifests");
    plan.lock_dir = joinPath(root, "locks");
    plan.run_id = "test_run";
    return plan;
}

nlohmann::json readJson(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return nlohmann::json();
    }
    return nlohmann::json::parse(in, nullptr, false);
}

int countLines(const std::string& path) {
    std::ifstream in(path);
    int lines = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines++;
    }
    return lines;
}

} // namespace

int main() {
    std::cout << "=== Trial Orchestrator Tests ===\n\n";
    setLogLevel(LogLevel::ERROR);

    int pass = 0, fail = 0;
    auto check = [&](bool ok, const std::string& what) {
        std::cout << (ok ? "  [PASS] " : "  [FAIL] ") << what << "\n";
        if (ok) pass++; else fail++;
    };

    // ========================================================================
    // TEST 1: Matrix order
    // ========================================================================
    std::cout << "TEST 1: Matrix order and aggregate rows\n";
    {
        std::string root = makeTempDir();
        SweepPlan plan = basePlan(root);
        plan.scenarios = {"baseline", "phone_in_pocket"};
        plan.phys = {"coded", "auto"};
        plan.payloads = {20, 244};
        plan.repeats = 2;
        plan.skip_latency = false;
        plan.skip_rssi = false;

        FakeRunner runner;
        CancelToken cancel;
        TrialOrchestrator orch(runner, cancel, plan);
        SweepResult result = orch.run();

        check(runner.throughput_calls.size() == 16, "2 x 2 x 2 x 2 = 16 throughput trials");
        bool order = runner.throughput_calls.size() == 16 &&
                     runner.throughput_calls[0].scenario == "baseline" &&
                     runner.throughput_calls[0].phy == "coded" &&
                     runner.throughput_calls[0].payload_bytes == 20 &&
                     runner.throughput_calls[1].trial == 2 &&
                     runner.throughput_calls[2].payload_bytes == 244 &&
                     runner.throughput_calls[4].phy == "auto" &&
                     runner.throughput_calls[8].scenario == "phone_in_pocket";
        check(order, "scenario > PHY > payload > repeat nesting");
        check(runner.latency_calls == 4 && runner.rssi_calls == 4, "one latency and one RSSI run per (scenario, PHY)");

        bool profiles = runner.throughput_calls.size() == 16 &&
                        runner.throughput_calls[0].fault_profile &&
                        runner.throughput_calls[0].fault_profile->name == "best" &&
                        runner.throughput_calls[8].fault_profile->name == "pocket";
        check(profiles, "fault profile resolved per scenario");

        check(countLines(orch.throughputTablePath()) == 17, "throughput table: header + 16 rows");
        check(countLines(orch.latencyTablePath()) == 5 && countLines(orch.rssiTablePath()) == 5,
              "latency / RSSI tables: header + 4 rows");

        nlohmann::json manifest = readJson(result.manifest_path);
        check(!manifest.is_discarded() && manifest.value("status", "") == "completed", "manifest status completed");
        check(manifest["trials"].size() == 16 && manifest["summary"].contains("baseline|coded"),
              "manifest lists trials and per-combination summaries");
        check(!manifest["ended_at"].is_null() && !manifest.value("interrupted", true), "manifest closed cleanly");
        check(result.errors.empty() && !result.interrupted, "no errors");

        SweepPlan bad = plan;
        bad.phys = {"5m"};
        TrialOrchestrator invalid(runner, cancel, bad);
        bool threw = false;
        try {
            invalid.run();
        } catch (const ConfigError&) {
            threw = true;
        }
        check(threw, "unknown PHY rejects the whole plan");
    }

    // ========================================================================
    // TEST 2: Resume
    // ========================================================================
    std::cout << "\nTEST 2: Resume skips recorded trials only\n";
    {
        std::string root = makeTempDir();
        SweepPlan plan = basePlan(root);
        plan.resume = true;

        // A previous run recorded (baseline, auto, 60, 1) and failed (baseline, auto, 60, 2)
        ResultTable previous(joinPath(plan.results_dir, "sweep_throughput.csv"), throughputColumns());
        TrialRecord done;
        done.scenario = "baseline";
        done.phy = "auto";
        done.payload_bytes = 60;
        done.repeat_index = 1;
        done.packets_received = 42;
        TrialRecord failed = done;
        failed.repeat_index = 2;
        failed.status = TrialStatus::FAILED;
        previous.append(throughputRow(done));
        previous.append(throughputRow(failed));

        FakeRunner runner;
        CancelToken cancel;
        TrialOrchestrator orch(runner, cancel, plan);
        SweepResult result = orch.run();

        check(runner.throughput_calls.size() == 1 && runner.throughput_calls[0].trial == 2,
              "only repeat 2 runs again");
        check(result.skipped_trials == 1, "one trial skipped");
        check(countLines(orch.throughputTablePath()) == 4, "new row appended after the old ones");

        std::vector<TrialRecord> rows = loadThroughputTable(orch.throughputTablePath());
        check(rows.size() == 3 && rows[0].packets_received == 42, "earlier rows preserved");

        FakeRunner rerun;
        TrialOrchestrator again(rerun, cancel, plan);
        SweepResult second = again.run();
        check(rerun.throughput_calls.empty() && second.skipped_trials == 2, "second resume has nothing left to run");

        plan.resume = false;
        FakeRunner fresh;
        TrialOrchestrator no_resume(fresh, cancel, plan);
        no_resume.run();
        check(fresh.throughput_calls.size() == 2, "without resume every trial runs");
    }

    // ========================================================================
    // TEST 3: Itemized failures
    // ========================================================================
    std::cout << "\nTEST 3: Per-trial failures become itemized errors\n";
    {
        std::string root = makeTempDir();
        SweepPlan plan = basePlan(root);
        plan.payloads = {10, 60, 120};
        plan.repeats = 1;
        plan.note = "bench A";

        FakeRunner runner;
        runner.before_throughput = [](const client::ThroughputTrialParams& p) {
            if (p.payload_bytes == 120) {
                std::vector<ConnectionAttempt> attempts(3);
                throw ConnectionExhaustedError("peer unreachable", attempts);
            }
        };
        CancelToken cancel;
        TrialOrchestrator orch(runner, cancel, plan);
        SweepResult result = orch.run();

        check(result.throughput.size() == 3, "every trial produces a row, failed or not");
        check(runner.throughput_calls.size() == 2, "payload 10 rejected before reaching the runner");
        check(result.errors.size() == 2, "two itemized errors");

        bool config_err = result.errors.size() == 2 && result.errors[0].kind == "config" &&
                          result.errors[0].payload_bytes == 10;
        bool conn_err = result.errors.size() == 2 && result.errors[1].kind == "connection_exhausted" &&
                        result.errors[1].stage == "throughput";
        check(config_err, "payload outside 20-244 is a config error");
        check(conn_err, "connection exhaustion recorded");

        const TrialRecord& exhausted = result.throughput[2];
        check(exhausted.status == TrialStatus::FAILED && exhausted.connection_attempts_used == 3,
              "failed row keeps the attempt count");
        check(exhausted.notes.rfind("bench A", 0) == 0, "run note prefixed to trial notes");
        check(result.throughput[1].status == TrialStatus::OK, "sweep continued after the failure");

        nlohmann::json manifest = readJson(result.manifest_path);
        check(manifest.value("status", "") == "completed_with_errors" && manifest["errors"].size() == 2,
              "manifest status completed_with_errors");

        // Failed rows do not count as done on resume
        CompletedTrialIndex index = CompletedTrialIndex::load(orch.throughputTablePath());
        check(index.contains(TrialKey{"baseline", "auto", 60, 1}) &&
              !index.contains(TrialKey{"baseline", "auto", 120, 1}), "failed trials stay eligible for resume");

        // Latency and RSSI outcomes are on disk before the next stage starts
        std::string lat_root = makeTempDir();
        SweepPlan lat_plan = basePlan(lat_root);
        lat_plan.phys = {"auto", "2m"};
        lat_plan.repeats = 1;
        lat_plan.skip_latency = false;
        lat_plan.skip_rssi = false;
        std::string manifest_path = joinPath(lat_plan.manifest_dir, lat_plan.run_id + "_manifest.json");

        FakeRunner flaky;
        flaky.before_latency = [](const client::LatencyTrialParams& p) {
            if (p.phy == "auto") {
                throw CommandWriteError("Start write rejected");
            }
        };
        std::map<std::string, nlohmann::json> on_disk;
        flaky.before_rssi = [&](const client::RssiTrialParams& p) {
            on_disk[p.phy] = readJson(manifest_path);
        };
        CancelToken lat_cancel;
        TrialOrchestrator lat_orch(flaky, lat_cancel, lat_plan);
        SweepResult lat_result = lat_orch.run();

        check(lat_result.latency.size() == 1 && lat_result.rssi.size() == 2 && lat_result.errors.size() == 1,
              "failed latency trial itemized, sweep continued");

        const nlohmann::json& after_fail = on_disk["auto"];
        bool fail_flushed = after_fail.is_object() && after_fail["errors"].size() == 1 &&
                            after_fail["errors"][0].value("stage", "") == "latency" &&
                            after_fail["errors"][0].value("kind", "") == "command" &&
                            after_fail["latency"].empty();
        check(fail_flushed, "latency error flushed to the manifest before the RSSI trial");

        const nlohmann::json& after_ok = on_disk["2m"];
        bool ok_flushed = after_ok.is_object() && after_ok["latency"].size() == 1 &&
                          after_ok["latency"][0].value("phy", "") == "2m" &&
                          after_ok["rssi"].size() == 1;
        check(ok_flushed, "successful latency and RSSI records flushed as they complete");

        nlohmann::json final_manifest = readJson(manifest_path);
        bool complete = final_manifest.is_object() && final_manifest["latency"].size() == 1 &&
                        final_manifest["rssi"].size() == 2 &&
                        final_manifest["latency"][0].value("samples", 0) == lat_plan.latency_iterations &&
                        final_manifest["rssi"][1].value("samples", 0) == lat_plan.rssi_samples &&
                        final_manifest.value("status", "") == "completed_with_errors";
        check(complete, "final manifest lists every latency and RSSI record");
    }

    // ========================================================================
    // TEST 4: Lock exclusivity
    // ========================================================================
    std::cout << "\nTEST 4: Adapter lock exclusivity\n";
    {
        std::string root = makeTempDir();
        std::string dir = joinPath(root, "locks");
        CancelToken cancel;

        AdapterLock a(dir, "hci0");
        AdapterLock b(dir, "hci0");
        AdapterLock other(dir, "hci1");

        check(a.tryAcquire(), "first holder acquires");
        check(!b.tryAcquire(), "second holder refused");
        check(other.tryAcquire(), "different adapter is independent");

        bool contended = false;
        try {
            b.acquire(LockMode::FAIL_FAST, 0, cancel);
        } catch (const LockContentionError& e) {
            contended = e.lockPath() == a.path();
        }
        check(contended, "fail-fast contention throws with the lock path");

        bool timed_out = false;
        try {
            b.acquire(LockMode::BLOCKING, 120, cancel);
        } catch (const LockContentionError&) {
            timed_out = true;
        }
        check(timed_out, "blocking mode gives up after its timeout");

        a.release();
        check(b.tryAcquire() && b.isHeld(), "lock available after release");
        b.release();

        {
            ScopedAdapterLock hold(a, LockMode::FAIL_FAST, 0, cancel);
            check(a.isHeld(), "scoped hold acquires");
        }
        check(!a.isHeld(), "scoped hold releases");

        LockMode mode = LockMode::FAIL_FAST;
        check(parseLockMode("blocking", mode) && mode == LockMode::BLOCKING, "parseLockMode(blocking)");
        check(!parseLockMode("sometimes", mode), "parseLockMode rejects unknown modes");
        check(AdapterLock::lockPathFor("/x", "hci 0/usb") == "/x/hci_0_usb.lock", "adapter name sanitized");
    }

    // ========================================================================
    // TEST 5: Lock contention aborts the sweep
    // ========================================================================
    std::cout << "\nTEST 5: Lock contention aborts the sweep\n";
    {
        std::string root = makeTempDir();
        SweepPlan plan = basePlan(root);
        AdapterLock other_run(plan.lock_dir, plan.adapter);
        other_run.tryAcquire();

        FakeRunner runner;
        CancelToken cancel;
        TrialOrchestrator orch(runner, cancel, plan);
        bool aborted = false;
        try {
            orch.run();
        } catch (const LockContentionError&) {
            aborted = true;
        }
        check(aborted, "LockContentionError propagates");
        check(runner.throughput_calls.empty(), "no trial ran without the lock");

        nlohmann::json manifest = readJson(orch.manifest().path());
        bool itemized = !manifest.is_discarded() && manifest["errors"].size() == 1 &&
                        manifest["errors"][0].value("kind", "") == "lock_contention";
        check(itemized, "manifest written with the contention error");
    }

    // ========================================================================
    // TEST 6: Cancellation
    // ========================================================================
    std::cout << "\nTEST 6: Cancellation marks the manifest interrupted\n";
    {
        std::string root = makeTempDir();
        SweepPlan plan = basePlan(root);
        plan.payloads = {20, 60, 120};
        plan.repeats = 1;

        FakeRunner runner;
        CancelToken cancel;
        runner.before_throughput = [&cancel](const client::ThroughputTrialParams& p) {
            if (p.payload_bytes == 60) {
                cancel.cancel();
                throw CancelledError();
            }
        };
        TrialOrchestrator orch(runner, cancel, plan);
        SweepResult result = orch.run();

        check(result.interrupted, "sweep reports the interruption");
        check(result.throughput.size() == 1 && runner.throughput_calls.size() == 2,
              "in-flight trial discarded, nothing after it started");
        check(countLines(orch.throughputTablePath()) == 2, "only the completed trial reached the table");

        nlohmann::json manifest = readJson(result.manifest_path);
        check(manifest.value("interrupted", false) && !manifest["ended_at"].is_null(),
              "manifest flagged interrupted and closed");

        AdapterLock again(plan.lock_dir, plan.adapter);
        check(again.tryAcquire(), "adapter lock released after the interruption");
    }

    // ========================================================================
    // TEST 7: Scenario presets
    // ========================================================================
    std::cout << "\nTEST 7: Scenario -> preset mapping\n";
    {
        SweepPlan plan = basePlan(makeTempDir());
        plan.scenario_presets["lab_bench"] = "worst";
        FakeRunner runner;
        CancelToken cancel;
        TrialOrchestrator orch(runner, cancel, plan);

        check(orch.presetForScenario("baseline") == "best", "baseline -> best");
        check(orch.presetForScenario("hand_behind_body") == "body_block", "hand_behind_body -> body_block");
        check(orch.presetForScenario("phone_in_backpack") == "worst", "phone_in_backpack -> worst");
        check(orch.presetForScenario("pocket") == "pocket", "preset names map to themselves");
        check(orch.presetForScenario("lab_bench") == "worst", "custom mapping wins");
        check(orch.presetForScenario("kitchen") == "typical", "unknown scenarios use typical");

        plan.apply_fault_profiles = false;
        TrialOrchestrator plain(runner, cancel, plan);
        plain.run();
        check(!runner.throughput_calls.empty() && !runner.throughput_calls.back().fault_profile,
              "fault injection can be switched off");
    }

    // ========================================================================
    // TEST 8: Result table round trip
    // ========================================================================
    std::cout << "\nTEST 8: Result table round trip\n";
    {
        std::string root = makeTempDir();
        std::string path = joinPath(root, "t.csv");
        ResultTable table(path, throughputColumns());

        TrialRecord r;
        r.scenario = "baseline";
        r.phy = "coded";
        r.payload_bytes = 120;
        r.repeat_index = 3;
        r.packets_received = 1234;
        r.estimated_lost = 5;
        r.throughput_kbps = 38.4;
        r.notes = "a,b\nc";
        r.status = TrialStatus::LINK_LOST;
        check(table.append(throughputRow(r)), "row appended");
        check(!table.append({"too", "few"}), "row with the wrong field count refused");

        std::vector<TrialRecord> rows = loadThroughputTable(path);
        bool same = rows.size() == 1 && rows[0].key() == r.key() && rows[0].packets_received == 1234 &&
                    rows[0].estimated_lost == 5 && rows[0].status == TrialStatus::LINK_LOST &&
                    rows[0].throughput_kbps == 38.4;
        check(same, "row parsed back");
        check(rows.size() == 1 && rows[0].notes == "a;b c", "separators in notes neutralized");

        check(throughputColumns().size() == throughputRow(r).size(), "row width matches the header");
        check(latencyColumns().size() == latencyRow(LatencyRecord{}).size(), "latency row width");
        check(rssiColumns().size() == rssiRow(RssiRecord{}).size(), "RSSI row width");

        std::vector<TrialRecord> records(3);
        records[0].throughput_kbps = 10.0;
        records[0].connection_attempts_used = 2;
        records[1].throughput_kbps = 20.0;
        records[1].command_errors = 1;
        records[2].status = TrialStatus::FAILED;
        records[2].throughput_kbps = 999.0;
        auto agg = summarizeThroughput(records);
        check(agg && agg->total_trials == 2 && agg->avg_throughput_kbps == 15.0, "aggregate excludes failed trials");
        check(agg && agg->retry_trials == 1 && agg->error_trials == 1, "retry / error trial counts");
        check(!summarizeThroughput(std::vector<TrialRecord>(1, records[2])), "nothing measurable -> no summary");
    }

    // ========================================================================
    // TEST 9: Link loss
    // ========================================================================
    std::cout << "\nTEST 9: Link loss is a trial status, not an abort\n";
    {
        std::string root = makeTempDir();
        SweepPlan plan = basePlan(root);
        FakeRunner runner;
        runner.throughput_status = TrialStatus::LINK_LOST;
        CancelToken cancel;
        TrialOrchestrator orch(runner, cancel, plan);
        SweepResult result = orch.run();

        check(result.throughput.size() == 2 && runner.throughput_calls.size() == 2, "both repeats still run");
        check(result.throughput.size() == 2 && result.throughput[0].status == TrialStatus::LINK_LOST &&
              result.throughput[0].packets_received == 100, "partial row kept with status link_lost");
        bool itemized = result.errors.size() == 2 && result.errors[0].kind == "link_lost" &&
                        result.errors[0].stage == "throughput" &&
                        result.errors[0].message.find("100 packets") != std::string::npos;
        check(itemized, "each link loss itemized with the packets received");

        nlohmann::json manifest = readJson(result.manifest_path);
        check(manifest.is_object() && manifest["trials"].size() == 2 &&
              manifest["trials"][0].value("status", "") == "link_lost", "manifest trial status link_lost");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All orchestrator tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
