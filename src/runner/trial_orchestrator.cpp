#include "trial_orchestrator.hpp"
#include "../client/run_log.hpp"
#include "../common/fs_util.hpp"
#include "gattbench/errors.hpp"
#include "gattbench/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace gattbench {
namespace runner {

namespace {

// Lab scenario names that map onto a preset of their own
const std::map<std::string, std::string>& defaultScenarioPresets() {
    static const std::map<std::string, std::string> presets = {
        {"baseline", "best"},
        {"clear_line_of_sight", "best"},
        {"phone_in_hand", "typical"},
        {"hand_behind_body", "body_block"},
        {"body_block", "body_block"},
        {"phone_in_pocket", "pocket"},
        {"pocket", "pocket"},
        {"phone_in_backpack", "worst"},
        {"far_range", "worst"},
    };
    return presets;
}

std::string makeRunId(const std::string& requested) {
    return requested.empty() ? client::utcStamp() : requested;
}

} // namespace

TrialOrchestrator::TrialOrchestrator(client::TrialRunner& runner, const CancelToken& cancel,
                                     const SweepPlan& plan)
    : runner_(runner), cancel_(cancel), plan_(plan),
      lock_(plan.lock_dir, plan.adapter),
      throughput_table_(joinPath(plan.results_dir, "sweep_throughput.csv"), throughputColumns()),
      latency_table_(joinPath(plan.results_dir, "sweep_latency.csv"), latencyColumns()),
      rssi_table_(joinPath(plan.results_dir, "sweep_rssi.csv"), rssiColumns()) {
    plan_.run_id = makeRunId(plan.run_id);
    manifest_ = std::make_unique<RunManifest>(plan_.manifest_dir, plan_.run_id, "full_matrix");
}

std::string TrialOrchestrator::throughputTablePath() const { return throughput_table_.path(); }
std::string TrialOrchestrator::latencyTablePath() const { return latency_table_.path(); }
std::string TrialOrchestrator::rssiTablePath() const { return rssi_table_.path(); }

uint32_t TrialOrchestrator::lockTimeoutMs() const {
    return static_cast<uint32_t>(std::max(0.0, std::round(plan_.lock_timeout_s * 1000.0)));
}

std::string TrialOrchestrator::presetForScenario(const std::string& scenario) const {
    auto custom = plan_.scenario_presets.find(scenario);
    if (custom != plan_.scenario_presets.end()) {
        return custom->second;
    }
    if (peripheral::isPresetName(scenario)) {
        return scenario;
    }
    const auto& defaults = defaultScenarioPresets();
    auto it = defaults.find(scenario);
    return it != defaults.end() ? it->second : "typical";
}

std::optional<peripheral::FaultProfile> TrialOrchestrator::profileFor(const std::string& scenario) const {
    if (!plan_.apply_fault_profiles) {
        return std::nullopt;
    }
    return peripheral::resolveFaultProfile(presetForScenario(scenario), plan_.overrides);
}

void TrialOrchestrator::validatePlan() const {
    if (plan_.scenarios.empty() || plan_.phys.empty()) {
        throw ConfigError("sweep needs at least one scenario and one PHY");
    }
    if (!plan_.skip_throughput && (plan_.payloads.empty() || plan_.repeats < 1)) {
        throw ConfigError("throughput sweep needs payloads and repeats >= 1");
    }
    for (const auto& phy : plan_.phys) {
        Phy parsed;
        if (!parsePhy(phy, parsed)) {
            throw ConfigError("unknown PHY '" + phy + "'");
        }
    }
}

void TrialOrchestrator::recordError(ManifestError error, SweepResult& result) {
    LOG_RUNNER(ERROR, "%s|%s %s trial=%d: [%s] %s", error.scenario.c_str(), error.phy.c_str(),
               error.stage.c_str(), error.trial, error.kind.c_str(), error.message.c_str());
    manifest_->addError(error);
    result.errors.push_back(std::move(error));
}

// ============================================================================
// Sweep
// ============================================================================

SweepResult TrialOrchestrator::run() {
    validatePlan();

    SweepResult result;
    result.manifest_path = manifest_->path();

    manifest_->setTarget(plan_.address, plan_.adapter);
    manifest_->setMatrix(plan_.scenarios, plan_.phys, plan_.payloads, plan_.repeats);
    manifest_->setOutput("throughput_csv", throughput_table_.path());
    manifest_->setOutput("latency_csv", latency_table_.path());
    manifest_->setOutput("rssi_csv", rssi_table_.path());
    manifest_->setArgs({
        {"note", plan_.note},
        {"duration_s", plan_.duration_s},
        {"packet_count", plan_.packet_count},
        {"resume", plan_.resume},
        {"lock_mode", lockModeToString(plan_.lock_mode)},
        {"lock_timeout_s", plan_.lock_timeout_s},
        {"latency_mode", plan_.latency_mode},
        {"latency_iterations", plan_.latency_iterations},
        {"rssi_samples", plan_.rssi_samples},
        {"rssi_interval_s", plan_.rssi_interval_s},
        {"fault_profiles", plan_.apply_fault_profiles},
    });
    manifest_->markStarted();

    if (plan_.resume) {
        completed_ = CompletedTrialIndex::load(throughput_table_.path());
    }

    int combo_total = static_cast<int>(plan_.scenarios.size() * plan_.phys.size());
    int combo = 0;

    try {
        for (const auto& scenario : plan_.scenarios) {
            for (const auto& phy : plan_.phys) {
                combo++;
                LOG_RUNNER(INFO, "=== [%d/%d] %s | PHY %s (preset %s) ===", combo, combo_total,
                           scenario.c_str(), phy.c_str(), presetForScenario(scenario).c_str());

                if (!plan_.skip_throughput) {
                    int trial_total = static_cast<int>(plan_.payloads.size()) * plan_.repeats;
                    int trial_no = 0;
                    for (int payload : plan_.payloads) {
                        for (int trial = 1; trial <= plan_.repeats; trial++) {
                            trial_no++;
                            if (completed_.contains(TrialKey{scenario, phy, payload, trial})) {
                                LOG_RUNNER(INFO, "  [%d/%d] payload=%d trial=%d skipped (resume)",
                                           trial_no, trial_total, payload, trial);
                                result.skipped_trials++;
                                continue;
                            }
                            LOG_RUNNER(INFO, "  [%d/%d] payload=%d trial=%d", trial_no, trial_total, payload, trial);
                            runThroughputTrial(scenario, phy, payload, trial, result);
                        }
                    }
                }
                if (!plan_.skip_latency) {
                    runLatencyTrial(scenario, phy, result);
                }
                if (!plan_.skip_rssi) {
                    runRssiTrial(scenario, phy, result);
                }

                std::vector<TrialRecord> combo_rows;
                for (const auto& r : result.throughput) {
                    if (r.scenario == scenario && r.phy == phy) combo_rows.push_back(r);
                }
                if (auto summary = summarizeThroughput(combo_rows)) {
                    manifest_->setSummary(scenario, phy, *summary);
                    LOG_RUNNER(INFO, "  Summary: %.2f kbps avg, %llu packets, %llu lost, retries %d/%d, cmd errors %d",
                               summary->avg_throughput_kbps,
                               static_cast<unsigned long long>(summary->total_packets),
                               static_cast<unsigned long long>(summary->total_loss),
                               summary->retry_trials, summary->total_trials, summary->error_trials);
                } else if (!plan_.skip_throughput) {
                    LOG_RUNNER(INFO, "  Summary: no throughput data recorded");
                }
                manifest_->flush();
            }
        }
    } catch (const CancelledError&) {
        LOG_RUNNER(WARN, "Sweep interrupted; partial trial discarded");
        result.interrupted = true;
        manifest_->setInterrupted(true);
    } catch (const LockContentionError& e) {
        ManifestError err;
        err.stage = "sweep";
        err.kind = e.kind();
        err.message = e.what();
        recordError(err, result);
        manifest_->markEnded();
        manifest_->flush();
        throw;
    }

    manifest_->markEnded();
    manifest_->flush();
    LOG_RUNNER(INFO, "Sweep %s: %zu throughput, %zu latency, %zu rssi trials, %d skipped, %zu errors",
               manifest_->status().c_str(), result.throughput.size(), result.latency.size(),
               result.rssi.size(), result.skipped_trials, result.errors.size());
    LOG_RUNNER(INFO, "Manifest: %s", manifest_->path().c_str());
    return result;
}

// ============================================================================
// Trials
// ============================================================================

void TrialOrchestrator::runThroughputTrial(const std::string& scenario, const std::string& phy,
                                           int payload, int trial, SweepResult& result) {
    if (cancel_.isCancelled()) {
        throw CancelledError();
    }

    TrialRecord record;
    ManifestError error;
    error.scenario = scenario;
    error.phy = phy;
    error.payload_bytes = payload;
    error.trial = trial;
    error.stage = "throughput";

    try {
        if (payload < static_cast<int>(MIN_SWEEP_PAYLOAD_BYTES) || payload > static_cast<int>(MAX_SWEEP_PAYLOAD_BYTES)) {
            char msg[96];
            snprintf(msg, sizeof(msg), "payload %d is outside %zu-%zu bytes", payload,
                     MIN_SWEEP_PAYLOAD_BYTES, MAX_SWEEP_PAYLOAD_BYTES);
            throw ConfigError(msg);
        }
        client::ThroughputTrialParams params;
        params.scenario = scenario;
        params.phy = phy;
        params.payload_bytes = payload;
        params.trial = trial;
        params.duration_s = plan_.duration_s;
        params.packet_count = plan_.packet_count;
        params.fault_profile = profileFor(scenario);

        ScopedAdapterLock hold(lock_, plan_.lock_mode, lockTimeoutMs(), cancel_);
        record = runner_.runThroughput(params);
    } catch (const LockContentionError&) {
        throw;
    } catch (const CancelledError&) {
        throw;
    } catch (const ConnectionExhaustedError& e) {
        record = TrialRecord{};
        record.status = TrialStatus::FAILED;
        record.connection_attempts_used = static_cast<int>(e.attempts().size());
        record.notes = e.what();
        error.kind = e.kind();
        error.message = e.what();
    } catch (const Error& e) {
        record = TrialRecord{};
        record.status = TrialStatus::FAILED;
        record.notes = e.what();
        error.kind = e.kind();
        error.message = e.what();
    } catch (const std::exception& e) {
        record = TrialRecord{};
        record.status = TrialStatus::FAILED;
        record.notes = e.what();
        error.kind = "runtime";
        error.message = e.what();
    }

    record.scenario = scenario;
    record.phy = phy;
    record.payload_bytes = payload;
    record.repeat_index = trial;
    if (!plan_.note.empty()) {
        record.notes = record.notes.empty() ? plan_.note : plan_.note + "; " + record.notes;
    }

    if (record.status == TrialStatus::LINK_LOST) {
        error.kind = "link_lost";
        error.message = "link lost mid-stream after " + std::to_string(record.packets_received) + " packets";
    }
    if (!error.kind.empty()) {
        recordError(error, result);
    }

    if (!throughput_table_.append(throughputRow(record))) {
        LOG_RUNNER(ERROR, "Trial row not persisted to %s", throughput_table_.path().c_str());
    }
    if (record.status != TrialStatus::FAILED) {
        completed_.add(record.key());
    }
    manifest_->addTrial(record);
    result.throughput.push_back(record);
    manifest_->flush();
}

void TrialOrchestrator::runLatencyTrial(const std::string& scenario, const std::string& phy,
                                        SweepResult& result) {
    if (cancel_.isCancelled()) {
        throw CancelledError();
    }
    LOG_RUNNER(INFO, "  Latency: %d iterations (%s)", plan_.latency_iterations, plan_.latency_mode.c_str());

    ManifestError error;
    error.scenario = scenario;
    error.phy = phy;
    error.trial = 1;
    error.stage = "latency";

    LatencyRecord record;
    try {
        client::LatencyTrialParams params;
        params.scenario = scenario;
        params.phy = phy;
        params.trial = 1;
        params.mode = plan_.latency_mode;
        params.iterations = plan_.latency_iterations;
        params.timeout_s = plan_.latency_timeout_s;
        int payload = plan_.latency_payload_bytes;
        if (payload <= 0) {
            payload = plan_.payloads.empty() ? static_cast<int>(MIN_SWEEP_PAYLOAD_BYTES) : plan_.payloads.back();
        }
        params.payload_bytes = std::clamp(payload, static_cast<int>(MIN_SWEEP_PAYLOAD_BYTES),
                                          static_cast<int>(MAX_SWEEP_PAYLOAD_BYTES));
        params.fault_profile = profileFor(scenario);

        ScopedAdapterLock hold(lock_, plan_.lock_mode, lockTimeoutMs(), cancel_);
        record = runner_.runLatency(params);
    } catch (const LockContentionError&) {
        throw;
    } catch (const CancelledError&) {
        throw;
    } catch (const Error& e) {
        error.kind = e.kind();
        error.message = e.what();
        recordError(error, result);
        manifest_->flush();
        return;
    } catch (const std::exception& e) {
        error.kind = "runtime";
        error.message = e.what();
        recordError(error, result);
        manifest_->flush();
        return;
    }

    if (!plan_.note.empty()) {
        record.notes = record.notes.empty() ? plan_.note : plan_.note + "; " + record.notes;
    }
    if (!latency_table_.append(latencyRow(record))) {
        LOG_RUNNER(ERROR, "Latency row not persisted to %s", latency_table_.path().c_str());
    }
    manifest_->addLatency(record);
    result.latency.push_back(record);
    manifest_->flush();
}

void TrialOrchestrator::runRssiTrial(const std::string& scenario, const std::string& phy,
                                     SweepResult& result) {
    if (cancel_.isCancelled()) {
        throw CancelledError();
    }
    LOG_RUNNER(INFO, "  RSSI: %d samples every %.2fs", plan_.rssi_samples, plan_.rssi_interval_s);

    ManifestError error;
    error.scenario = scenario;
    error.phy = phy;
    error.trial = 1;
    error.stage = "rssi";

    RssiRecord record;
    try {
        client::RssiTrialParams params;
        params.scenario = scenario;
        params.phy = phy;
        params.trial = 1;
        params.samples = plan_.rssi_samples;
        params.interval_s = plan_.rssi_interval_s;
        params.fault_profile = profileFor(scenario);

        ScopedAdapterLock hold(lock_, plan_.lock_mode, lockTimeoutMs(), cancel_);
        record = runner_.runRssi(params);
    } catch (const LockContentionError&) {
        throw;
    } catch (const CancelledError&) {
        throw;
    } catch (const Error& e) {
        error.kind = e.kind();
        error.message = e.what();
        recordError(error, result);
        manifest_->flush();
        return;
    } catch (const std::exception& e) {
        error.kind = "runtime";
        error.message = e.what();
        recordError(error, result);
        manifest_->flush();
        return;
    }

    if (!plan_.note.empty()) {
        record.notes = record.notes.empty() ? plan_.note : plan_.note + "; " + record.notes;
    }
    if (!rssi_table_.append(rssiRow(record))) {
        LOG_RUNNER(ERROR, "RSSI row not persisted to %s", rssi_table_.path().c_str());
    }
    manifest_->addRssi(record);
    result.rssi.push_back(record);
    manifest_->flush();
}

} // namespace runner
} // namespace gattbench
