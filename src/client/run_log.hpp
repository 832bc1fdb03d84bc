#pragma once

#include "connection_manager.hpp"
#include "metrics_engine.hpp"
#include "gattbench/records.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace gattbench {
namespace client {

// One control write as it went over the air (or failed to)
struct CommandLogEntry {
    double t_s = 0.0;            // Trial clock
    std::string name;            // "RESET", "START", "STOP"
    std::string payload_hex;
    bool ok = true;
    std::string error;
};

struct RssiSample {
    int index = 0;
    double t_s = 0.0;
    std::optional<int> rssi_dbm;
};

// UTC wall time, ISO-8601 with milliseconds
std::string utcNowIso();
// UTC wall time as YYYYmmdd_HHMMSS for file names and run ids
std::string utcStamp();

std::string toHex(const Bytes& data);

// Replace anything outside [A-Za-z0-9._-] with '_'
std::string sanitizeName(const std::string& name);

nlohmann::json linkReportToJson(const LinkReport& report);
nlohmann::json commandLogToJson(const std::vector<CommandLogEntry>& log);
nlohmann::json throughputSummaryToJson(const ThroughputSummary& summary);
nlohmann::json latencySummaryToJson(const LatencySummary& summary);

/**
 * Raw per-run artifacts: <dir>/<stamp>_ble_<kind>_<tag>.csv and .json.
 * The JSON holds {"metadata": ..., "<rows>": [...]}; the CSV holds the rows.
 * Returns the paths written; throws std::runtime_error if a file cannot be
 * created.
 */
class RunLogWriter {
public:
    RunLogWriter(std::string output_dir, std::string kind, std::string tag);

    LogPaths writeThroughput(const nlohmann::json& metadata, const std::vector<PacketRecord>& packets) const;
    LogPaths writeLatency(const nlohmann::json& metadata, const std::vector<LatencySample>& samples) const;
    LogPaths writeRssi(const nlohmann::json& metadata, const std::vector<RssiSample>& samples) const;

private:
    LogPaths paths() const;
    void writeJson(const std::string& path, const nlohmann::json& doc) const;

    std::string output_dir_;
    std::string base_name_;
};

} // namespace client
} // namespace gattbench
