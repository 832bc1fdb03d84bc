#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace gattbench {

// ============================================================================
// Connection attempts
// ============================================================================

enum class AttemptOutcome {
    SUCCESS,
    TIMEOUT,
    ERROR,
};

inline const char* attemptOutcomeToString(AttemptOutcome outcome) {
    switch (outcome) {
        case AttemptOutcome::SUCCESS: return "success";
        case AttemptOutcome::TIMEOUT: return "timeout";
        case AttemptOutcome::ERROR:   return "error";
        default: return "unknown";
    }
}

struct ConnectionAttempt {
    int attempt_index = 0;          // 1-based
    double timeout_s = 0.0;
    AttemptOutcome outcome = AttemptOutcome::ERROR;
    double elapsed_s = 0.0;
    std::string error;              // Transport message for TIMEOUT / ERROR
};

// ============================================================================
// Trial identity and results
// ============================================================================

enum class TrialStatus {
    OK,          // Ran to duration / packet count
    LINK_LOST,   // Link dropped mid-stream, partial measurement
    FAILED,      // No measurement (config, connection or runtime failure)
};

inline const char* trialStatusToString(TrialStatus status) {
    switch (status) {
        case TrialStatus::OK:        return "ok";
        case TrialStatus::LINK_LOST: return "link_lost";
        case TrialStatus::FAILED:    return "failed";
        default: return "unknown";
    }
}

inline bool parseTrialStatus(const std::string& str, TrialStatus& out) {
    if (str == "ok" || str.empty()) { out = TrialStatus::OK; return true; }
    if (str == "link_lost") { out = TrialStatus::LINK_LOST; return true; }
    if (str == "failed") { out = TrialStatus::FAILED; return true; }
    return false;
}

// (scenario, phy, payload, repeat) - the resume key of a throughput trial
struct TrialKey {
    std::string scenario;
    std::string phy;
    int payload_bytes = 0;
    int repeat_index = 0;

    bool operator==(const TrialKey& other) const = default;
};

struct TrialKeyHash {
    size_t operator()(const TrialKey& key) const {
        size_t h = std::hash<std::string>{}(key.scenario);
        h = h * 31 + std::hash<std::string>{}(key.phy);
        h = h * 31 + std::hash<int>{}(key.payload_bytes);
        h = h * 31 + std::hash<int>{}(key.repeat_index);
        return h;
    }
};

// Raw per-run log files written by a trial
struct LogPaths {
    std::string json;
    std::string csv;
};

struct TrialRecord {
    std::string scenario;
    std::string phy;
    int payload_bytes = 0;
    int repeat_index = 0;                 // 1-based

    uint64_t packets_received = 0;
    uint64_t estimated_lost = 0;
    double duration_s = 0.0;
    double throughput_kbps = 0.0;
    double notification_rate_per_s = 0.0;
    int connection_attempts_used = 0;
    int command_errors = 0;
    LogPaths log_paths;
    std::string notes;

    TrialStatus status = TrialStatus::OK;
    uint64_t reordered_packets = 0;
    uint64_t malformed_packets = 0;
    double jitter_ms = 0.0;

    TrialKey key() const { return TrialKey{scenario, phy, payload_bytes, repeat_index}; }
};

struct LatencyRecord {
    std::string scenario;
    std::string phy;
    int trial = 0;
    std::string mode;                     // "start" or "trigger"
    std::optional<double> avg_latency_s;  // Empty when every iteration timed out
    std::optional<double> min_latency_s;
    std::optional<double> max_latency_s;
    int samples = 0;
    int timeouts = 0;
    LogPaths log_paths;
    std::string notes;
};

struct RssiRecord {
    std::string scenario;
    std::string phy;
    int trial = 0;
    int samples_collected = 0;
    bool rssi_available = false;
    LogPaths log_paths;
    std::string notes;
};

} // namespace gattbench
