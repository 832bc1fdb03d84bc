#include "run_manifest.hpp"
#include "../client/run_log.hpp"
#include "../common/fs_util.hpp"
#include "gattbench/logging.hpp"

namespace gattbench {
namespace runner {

using nlohmann::json;

RunManifest::RunManifest(std::string manifest_dir, std::string run_id, std::string type)
    : run_id_(std::move(run_id)), type_(std::move(type)) {
    path_ = joinPath(manifest_dir, run_id_ + "_manifest.json");
}

void RunManifest::setTarget(const std::string& address, const std::string& adapter) {
    address_ = address;
    adapter_ = adapter;
}

void RunManifest::setMatrix(const std::vector<std::string>& scenarios, const std::vector<std::string>& phys,
                            const std::vector<int>& payloads, int repeats) {
    scenarios_ = scenarios;
    phys_ = phys;
    payloads_ = payloads;
    repeats_ = repeats;
}

void RunManifest::markStarted() {
    started_at_ = client::utcNowIso();
}

void RunManifest::markEnded() {
    ended_at_ = client::utcNowIso();
}

void RunManifest::addTrial(const TrialRecord& r) {
    trials_.push_back({
        {"scenario", r.scenario},
        {"phy", r.phy},
        {"payload_bytes", r.payload_bytes},
        {"trial", r.repeat_index},
        {"status", trialStatusToString(r.status)},
        {"packets", r.packets_received},
        {"estimated_lost_packets", r.estimated_lost},
        {"throughput_kbps", r.throughput_kbps},
        {"connection_attempts_used", r.connection_attempts_used},
        {"command_errors", r.command_errors},
        {"log_json", r.log_paths.json},
    });
}

void RunManifest::addLatency(const LatencyRecord& r) {
    auto orNull = [](const std::optional<double>& v) { return v ? json(*v) : json(nullptr); };
    latency_.push_back({
        {"scenario", r.scenario},
        {"phy", r.phy},
        {"trial", r.trial},
        {"mode", r.mode},
        {"avg_latency_s", orNull(r.avg_latency_s)},
        {"min_latency_s", orNull(r.min_latency_s)},
        {"max_latency_s", orNull(r.max_latency_s)},
        {"samples", r.samples},
        {"timeouts", r.timeouts},
        {"log_json", r.log_paths.json},
    });
}

void RunManifest::addRssi(const RssiRecord& r) {
    rssi_.push_back({
        {"scenario", r.scenario},
        {"phy", r.phy},
        {"trial", r.trial},
        {"samples", r.samples_collected},
        {"rssi_available", r.rssi_available},
        {"log_json", r.log_paths.json},
    });
}

void RunManifest::setSummary(const std::string& scenario, const std::string& phy,
                             const ThroughputAggregate& summary) {
    summary_[scenario + "|" + phy] = summary;
}

std::string RunManifest::status() const {
    return errors_.empty() ? "completed" : "completed_with_errors";
}

json RunManifest::toJson() const {
    json errors = json::array();
    for (const auto& e : errors_) {
        json item = {
            {"scenario", e.scenario},
            {"phy", e.phy},
            {"trial", e.trial},
            {"stage", e.stage},
            {"kind", e.kind},
            {"message", e.message},
        };
        item["payload_bytes"] = e.payload_bytes ? json(*e.payload_bytes) : json(nullptr);
        errors.push_back(item);
    }

    json summary = json::object();
    for (const auto& [key, s] : summary_) {
        summary[key] = {
            {"avg_throughput_kbps", s.avg_throughput_kbps},
            {"total_packets", s.total_packets},
            {"total_loss", s.total_loss},
            {"total_trials", s.total_trials},
            {"retry_trials", s.retry_trials},
            {"error_trials", s.error_trials},
        };
    }

    return {
        {"run_id", run_id_},
        {"type", type_},
        {"address", address_},
        {"adapter", adapter_},
        {"scenarios", scenarios_},
        {"phys", phys_},
        {"payloads", payloads_},
        {"repeats", repeats_},
        {"started_at", started_at_},
        {"ended_at", ended_at_.empty() ? json(nullptr) : json(ended_at_)},
        {"status", status()},
        {"interrupted", interrupted_},
        {"errors", errors},
        {"outputs", outputs_},
        {"summary", summary},
        {"trials", trials_},
        {"latency", latency_},
        {"rssi", rssi_},
        {"args", args_},
    };
}

bool RunManifest::flush() const {
    if (!writeFileAtomic(path_, toJson().dump(2) + "\n")) {
        LOG_RUNNER(WARN, "Failed to write manifest %s", path_.c_str());
        return false;
    }
    LOG_RUNNER(DEBUG, "Manifest written to %s", path_.c_str());
    return true;
}

} // namespace runner
} // namespace gattbench
