#include "run_log.hpp"
#include "../common/fs_util.hpp"
#include "gattbench/logging.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <stdexcept>

namespace gattbench {
namespace client {

using nlohmann::json;

namespace {
json optionalToJson(const std::optional<double>& value) {
    return value ? json(*value) : json(nullptr);
}
}

std::string utcNowIso() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    int millis = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buf[40];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03d+00:00",
             tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
             tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec, millis);
    return buf;
}

std::string utcStamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buf[20];
    strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm_utc);
    return buf;
}

std::string toHex(const Bytes& data) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::string sanitizeName(const std::string& name) {
    std::string out = name;
    for (char& c : out) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!ok) c = '_';
    }
    return out.empty() ? "_" : out;
}

// ============================================================================
// JSON fragments
// ============================================================================

json linkReportToJson(const LinkReport& report) {
    json attempts = json::array();
    for (const auto& a : report.attempts) {
        attempts.push_back({
            {"attempt", a.attempt_index},
            {"timeout_s", a.timeout_s},
            {"outcome", attemptOutcomeToString(a.outcome)},
            {"elapsed_s", a.elapsed_s},
            {"error", a.error},
        });
    }

    json mtu = {{"requested", report.mtu.requested}, {"status", report.mtu.status}};
    if (report.mtu.negotiated) mtu["negotiated"] = *report.mtu.negotiated;
    if (!report.mtu.error.empty()) mtu["error"] = report.mtu.error;

    json phy = {{"requested", report.phy.requested}, {"status", report.phy.status}};
    if (report.phy.attempts_used > 0) phy["attempts_used"] = report.phy.attempts_used;
    if (report.phy.fallback_auto) phy["fallback"] = "auto_requested";
    if (!report.phy.error.empty()) phy["error"] = report.phy.error;

    return {
        {"attempts", attempts},
        {"attempts_used", report.attemptsUsed()},
        {"mtu_result", mtu},
        {"phy_result", phy},
        {"warnings", report.warnings},
    };
}

json commandLogToJson(const std::vector<CommandLogEntry>& log) {
    json out = json::array();
    for (const auto& e : log) {
        json entry = {{"t_s", e.t_s}, {"name", e.name}, {"payload_hex", e.payload_hex}, {"ok", e.ok}};
        if (!e.error.empty()) entry["error"] = e.error;
        out.push_back(entry);
    }
    return out;
}

json throughputSummaryToJson(const ThroughputSummary& s) {
    json out = {
        {"packets", s.packets},
        {"estimated_lost_packets", s.estimated_lost_packets},
        {"reordered_packets", s.reordered_packets},
        {"malformed_packets", s.malformed_packets},
        {"duration_s", s.duration_s},
        {"throughput_kbps", s.throughput_kbps},
        {"notification_rate_per_s", s.notification_rate_per_s},
        {"bytes_recorded", s.bytes_recorded},
        {"avg_interarrival_ms", s.avg_interarrival_ms},
        {"interarrival_stdev_ms", s.interarrival_stdev_ms},
        {"jitter_ms", s.jitter_ms},
        {"loss_percent", s.loss_percent},
    };
    out["first_sequence"] = s.first_sequence ? json(*s.first_sequence) : json(nullptr);
    out["highest_sequence"] = s.highest_sequence ? json(*s.highest_sequence) : json(nullptr);
    return out;
}

json latencySummaryToJson(const LatencySummary& s) {
    return {
        {"samples", s.samples},
        {"timeouts", s.timeouts},
        {"avg_latency_s", optionalToJson(s.avg_latency_s)},
        {"min_latency_s", optionalToJson(s.min_latency_s)},
        {"max_latency_s", optionalToJson(s.max_latency_s)},
    };
}

// ============================================================================
// Writer
// ============================================================================

RunLogWriter::RunLogWriter(std::string output_dir, std::string kind, std::string tag)
    : output_dir_(std::move(output_dir)) {
    base_name_ = utcStamp() + "_ble_" + kind;
    if (!tag.empty()) {
        base_name_ += "_" + sanitizeName(tag);
    }
}

LogPaths RunLogWriter::paths() const {
    LogPaths p;
    p.json = joinPath(output_dir_, base_name_ + ".json");
    p.csv = joinPath(output_dir_, base_name_ + ".csv");
    return p;
}

void RunLogWriter::writeJson(const std::string& path, const json& doc) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("cannot create " + path);
    }
    out << doc.dump(2) << "\n";
}

LogPaths RunLogWriter::writeThroughput(const json& metadata, const std::vector<PacketRecord>& packets) const {
    if (!ensureDirectory(output_dir_)) {
        throw std::runtime_error("cannot create log directory " + output_dir_);
    }
    LogPaths p = paths();

    std::ofstream csv(p.csv);
    if (!csv.is_open()) {
        throw std::runtime_error("cannot create " + p.csv);
    }
    csv << "seq,dut_ts,arrival_s,payload_len,raw_len,malformed,reordered\n";
    json rows = json::array();
    char arrival[32];
    for (const auto& r : packets) {
        snprintf(arrival, sizeof(arrival), "%.6f", r.arrival_us / 1e6);
        csv << r.seq << ',' << r.dut_ts << ',' << arrival << ',' << r.payload_len << ','
            << r.raw_len << ',' << (r.malformed ? 1 : 0) << ',' << (r.reordered ? 1 : 0) << '\n';
        rows.push_back({
            {"seq", r.seq}, {"dut_ts", r.dut_ts}, {"arrival_s", r.arrival_us / 1e6},
            {"payload_len", r.payload_len}, {"raw_len", r.raw_len},
            {"malformed", r.malformed}, {"reordered", r.reordered},
        });
    }

    json meta = metadata;
    meta["records_file"] = {{"csv", p.csv}, {"json", p.json}};
    writeJson(p.json, {{"metadata", meta}, {"packets", rows}});
    LOG_CLIENT(DEBUG, "Wrote %zu packet records to %s", packets.size(), p.csv.c_str());
    return p;
}

LogPaths RunLogWriter::writeLatency(const json& metadata, const std::vector<LatencySample>& samples) const {
    if (!ensureDirectory(output_dir_)) {
        throw std::runtime_error("cannot create log directory " + output_dir_);
    }
    LogPaths p = paths();

    std::ofstream csv(p.csv);
    if (!csv.is_open()) {
        throw std::runtime_error("cannot create " + p.csv);
    }
    csv << "iteration,mode,start_s,latency_s,seq,dut_ts\n";
    json rows = json::array();
    char buf[32];
    for (const auto& s : samples) {
        snprintf(buf, sizeof(buf), "%.6f", s.start_s);
        csv << s.iteration << ',' << s.mode << ',' << buf << ',';
        if (s.latency_s) {
            snprintf(buf, sizeof(buf), "%.6f", *s.latency_s);
            csv << buf;
        } else {
            csv << "timeout";
        }
        csv << ',' << s.seq << ',' << s.dut_ts << '\n';
        rows.push_back({
            {"iteration", s.iteration}, {"mode", s.mode}, {"start_s", s.start_s},
            {"latency_s", optionalToJson(s.latency_s)}, {"seq", s.seq}, {"dut_ts", s.dut_ts},
        });
    }

    json meta = metadata;
    meta["records_file"] = {{"csv", p.csv}, {"json", p.json}};
    writeJson(p.json, {{"metadata", meta}, {"samples", rows}});
    return p;
}

LogPaths RunLogWriter::writeRssi(const json& metadata, const std::vector<RssiSample>& samples) const {
    if (!ensureDirectory(output_dir_)) {
        throw std::runtime_error("cannot create log directory " + output_dir_);
    }
    LogPaths p = paths();

    std::ofstream csv(p.csv);
    if (!csv.is_open()) {
        throw std::runtime_error("cannot create " + p.csv);
    }
    csv << "index,t_s,rssi_dbm\n";
    json rows = json::array();
    for (const auto& s : samples) {
        csv << s.index << ',' << s.t_s << ',';
        if (s.rssi_dbm) csv << *s.rssi_dbm;
        csv << '\n';
        rows.push_back({
            {"index", s.index}, {"t_s", s.t_s},
            {"rssi_dbm", s.rssi_dbm ? json(*s.rssi_dbm) : json(nullptr)},
        });
    }

    json meta = metadata;
    meta["records_file"] = {{"csv", p.csv}, {"json", p.json}};
    writeJson(p.json, {{"metadata", meta}, {"samples", rows}});
    return p;
}

} // namespace client
} // namespace gattbench
