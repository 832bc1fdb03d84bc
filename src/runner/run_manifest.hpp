#pragma once

#include "result_table.hpp"
#include "gattbench/records.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace gattbench {
namespace runner {

// One itemized failure of a sweep
struct ManifestError {
    std::string scenario;
    std::string phy;
    std::optional<int> payload_bytes;   // Throughput trials only
    int trial = 0;
    std::string stage;                  // "throughput", "latency", "rssi", "sweep"
    std::string kind;                   // Error::kind()
    std::string message;
};

/**
 * RunManifest - Machine-readable record of one sweep
 *
 * Rewritten atomically (temp file + rename) after every throughput, latency
 * and RSSI trial so an
 * interrupted sweep always leaves a readable manifest behind.
 */
class RunManifest {
public:
    RunManifest(std::string manifest_dir, std::string run_id, std::string type);

    void setTarget(const std::string& address, const std::string& adapter);
    void setMatrix(const std::vector<std::string>& scenarios, const std::vector<std::string>& phys,
                   const std::vector<int>& payloads, int repeats);
    void setArgs(const nlohmann::json& args) { args_ = args; }
    void setOutput(const std::string& name, const std::string& path) { outputs_[name] = path; }

    void markStarted();
    void markEnded();
    void setInterrupted(bool interrupted) { interrupted_ = interrupted; }

    void addError(const ManifestError& error) { errors_.push_back(error); }
    void addTrial(const TrialRecord& record);
    void addLatency(const LatencyRecord& record);
    void addRssi(const RssiRecord& record);
    void setSummary(const std::string& scenario, const std::string& phy, const ThroughputAggregate& summary);

    // "completed_with_errors" when any error was itemized
    std::string status() const;

    nlohmann::json toJson() const;

    // Atomic rewrite; false (and logged) on failure
    bool flush() const;

    const std::string& path() const { return path_; }
    const std::string& runId() const { return run_id_; }
    const std::vector<ManifestError>& errors() const { return errors_; }
    bool isInterrupted() const { return interrupted_; }

private:
    std::string run_id_;
    std::string type_;
    std::string path_;

    std::string address_;
    std::string adapter_;
    std::vector<std::string> scenarios_;
    std::vector<std::string> phys_;
    std::vector<int> payloads_;
    int repeats_ = 0;

    std::string started_at_;
    std::string ended_at_;
    bool interrupted_ = false;

    std::vector<ManifestError> errors_;
    std::map<std::string, std::string> outputs_;
    std::map<std::string, ThroughputAggregate> summary_;
    nlohmann::json trials_ = nlohmann::json::array();
    nlohmann::json latency_ = nlohmann::json::array();
    nlohmann::json rssi_ = nlohmann::json::array();
    nlohmann::json args_ = nlohmann::json::object();
};

} // namespace runner
} // namespace gattbench
