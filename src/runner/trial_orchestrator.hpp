#pragma once

#include "adapter_lock.hpp"
#include "result_table.hpp"
#include "run_manifest.hpp"
#include "../client/trial_runner.hpp"
#include "../common/cancel_token.hpp"
#include "../peripheral/fault_profile.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace gattbench {
namespace runner {

struct SweepPlan {
    // Target
    std::string address = "SIM:00:00:00:00:00:01";
    std::string adapter = "hci0";

    // Matrix
    std::vector<std::string> scenarios = {"baseline"};
    std::vector<std::string> phys = {"auto"};
    std::vector<int> payloads = {20, 60, 120, 180, 244};
    int repeats = 1;
    double duration_s = 30.0;
    uint16_t packet_count = 0;

    bool skip_throughput = false;
    bool skip_latency = false;
    bool skip_rssi = false;
    bool resume = false;

    // Latency / RSSI runs, one per (scenario, PHY)
    std::string latency_mode = "start";
    int latency_iterations = 5;
    double latency_timeout_s = 5.0;
    int latency_payload_bytes = 0;          // 0 = last sweep payload, clamped to 20..244
    int rssi_samples = 20;
    double rssi_interval_s = 1.0;

    // Fault injection on simulated peers
    bool apply_fault_profiles = true;
    std::map<std::string, std::string> scenario_presets;   // Scenario -> preset, on top of the defaults
    peripheral::FaultOverrides overrides;

    // Locking
    LockMode lock_mode = LockMode::FAIL_FAST;
    double lock_timeout_s = 30.0;

    // Output
    std::string results_dir = "results";
    std::string manifest_dir = "results/manifests";
    std::string lock_dir = "/tmp/gattbench_locks";
    std::string run_id;                     // Empty = UTC stamp
    std::string note;
};

struct SweepResult {
    std::vector<TrialRecord> throughput;
    std::vector<LatencyRecord> latency;
    std::vector<RssiRecord> rssi;
    std::vector<ManifestError> errors;
    int skipped_trials = 0;
    bool interrupted = false;
    std::string manifest_path;
};

/**
 * TrialOrchestrator - Sweep scenarios x PHYs x payloads x repeats
 *
 * Each trial holds the adapter lock for its whole duration and is
 * recorded (aggregate CSV row + manifest rewrite) before the next one
 * starts. Per-trial failures become itemized errors and a "failed" row;
 * lock contention aborts the sweep; cancellation stops it and marks the
 * manifest interrupted.
 */
class TrialOrchestrator {
public:
    TrialOrchestrator(client::TrialRunner& runner, const CancelToken& cancel, const SweepPlan& plan);

    // Throws LockContentionError (manifest already flushed) or ConfigError
    // for a plan that cannot run at all
    SweepResult run();

    // Preset applied for a scenario name
    std::string presetForScenario(const std::string& scenario) const;

    const RunManifest& manifest() const { return *manifest_; }
    const SweepPlan& plan() const { return plan_; }

    std::string throughputTablePath() const;
    std::string latencyTablePath() const;
    std::string rssiTablePath() const;

private:
    void validatePlan() const;
    std::optional<peripheral::FaultProfile> profileFor(const std::string& scenario) const;

    void runThroughputTrial(const std::string& scenario, const std::string& phy, int payload, int trial,
                            SweepResult& result);
    void runLatencyTrial(const std::string& scenario, const std::string& phy, SweepResult& result);
    void runRssiTrial(const std::string& scenario, const std::string& phy, SweepResult& result);

    void recordError(ManifestError error, SweepResult& result);
    uint32_t lockTimeoutMs() const;

    client::TrialRunner& runner_;
    const CancelToken& cancel_;
    SweepPlan plan_;
    AdapterLock lock_;
    std::unique_ptr<RunManifest> manifest_;
    ResultTable throughput_table_;
    ResultTable latency_table_;
    ResultTable rssi_table_;
    CompletedTrialIndex completed_;
};

} // namespace runner
} // namespace gattbench
