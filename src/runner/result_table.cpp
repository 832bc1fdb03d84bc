#include "result_table.hpp"
#include "../common/fs_util.hpp"
#include "gattbench/logging.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <map>
#include <sys/stat.h>
#include <unistd.h>

namespace gattbench {
namespace runner {

namespace {

std::string fmt(const char* format, double value) {
    char buf[48];
    snprintf(buf, sizeof(buf), format, value);
    return buf;
}

std::string fmtOptional(const std::optional<double>& value) {
    return value ? fmt("%.6f", *value) : std::string();
}

std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t comma = line.find(',', start);
        if (comma == std::string::npos) {
            out.push_back(line.substr(start));
            break;
        }
        out.push_back(line.substr(start, comma - start));
        start = comma + 1;
    }
    if (!out.empty() && !out.back().empty() && out.back().back() == '\r') {
        out.back().pop_back();
    }
    return out;
}

bool parseInt(const std::string& str, int& out) {
    if (str.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(str.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = static_cast<int>(v);
    return true;
}

uint64_t toU64(const std::string& str) {
    return str.empty() ? 0 : std::strtoull(str.c_str(), nullptr, 10);
}

double toDouble(const std::string& str) {
    return str.empty() ? 0.0 : std::strtod(str.c_str(), nullptr);
}

// Header name -> column position
class ColumnIndex {
public:
    explicit ColumnIndex(const std::vector<std::string>& header) {
        for (size_t i = 0; i < header.size(); i++) {
            pos_[header[i]] = i;
        }
    }

    bool has(const char* name) const { return pos_.count(name) != 0; }

    std::string get(const std::vector<std::string>& row, const char* name) const {
        auto it = pos_.find(name);
        if (it == pos_.end() || it->second >= row.size()) {
            return std::string();
        }
        return row[it->second];
    }

private:
    std::map<std::string, size_t> pos_;
};

// Parses the identity columns; false for a row that cannot be keyed
bool parseTrialRow(const ColumnIndex& idx, const std::vector<std::string>& row, TrialRecord& rec) {
    rec.scenario = idx.get(row, "scenario");
    rec.phy = idx.get(row, "phy");
    if (rec.scenario.empty() || rec.phy.empty()) return false;
    if (!parseInt(idx.get(row, "payload_bytes"), rec.payload_bytes)) return false;
    if (!parseInt(idx.get(row, "trial"), rec.repeat_index)) return false;
    return parseTrialStatus(idx.get(row, "status"), rec.status);
}

} // namespace

// ============================================================================
// Columns
// ============================================================================

const std::vector<std::string>& throughputColumns() {
    static const std::vector<std::string> columns = {
        "scenario", "phy", "payload_bytes", "trial", "packets", "estimated_lost_packets",
        "duration_s", "throughput_kbps", "notification_rate_per_s", "connection_attempts_used",
        "command_errors", "log_json", "log_csv", "notes",
        "status", "reordered_packets", "malformed_packets", "jitter_ms",
    };
    return columns;
}

const std::vector<std::string>& latencyColumns() {
    static const std::vector<std::string> columns = {
        "scenario", "phy", "trial", "mode", "avg_latency_s", "min_latency_s", "max_latency_s",
        "samples", "timeouts", "log_json", "log_csv", "notes",
    };
    return columns;
}

const std::vector<std::string>& rssiColumns() {
    static const std::vector<std::string> columns = {
        "scenario", "phy", "trial", "samples_collected", "rssi_available", "log_json", "log_csv", "notes",
    };
    return columns;
}

std::string csvField(const std::string& value) {
    std::string out = value;
    for (char& c : out) {
        if (c == ',') c = ';';
        else if (c == '\n' || c == '\r') c = ' ';
    }
    return out;
}

std::vector<std::string> throughputRow(const TrialRecord& r) {
    return {
        csvField(r.scenario),
        csvField(r.phy),
        std::to_string(r.payload_bytes),
        std::to_string(r.repeat_index),
        std::to_string(r.packets_received),
        std::to_string(r.estimated_lost),
        fmt("%.4f", r.duration_s),
        fmt("%.4f", r.throughput_kbps),
        fmt("%.4f", r.notification_rate_per_s),
        std::to_string(r.connection_attempts_used),
        std::to_string(r.command_errors),
        csvField(r.log_paths.json),
        csvField(r.log_paths.csv),
        csvField(r.notes),
        trialStatusToString(r.status),
        std::to_string(r.reordered_packets),
        std::to_string(r.malformed_packets),
        fmt("%.3f", r.jitter_ms),
    };
}

std::vector<std::string> latencyRow(const LatencyRecord& r) {
    return {
        csvField(r.scenario),
        csvField(r.phy),
        std::to_string(r.trial),
        csvField(r.mode),
        fmtOptional(r.avg_latency_s),
        fmtOptional(r.min_latency_s),
        fmtOptional(r.max_latency_s),
        std::to_string(r.samples),
        std::to_string(r.timeouts),
        csvField(r.log_paths.json),
        csvField(r.log_paths.csv),
        csvField(r.notes),
    };
}

std::vector<std::string> rssiRow(const RssiRecord& r) {
    return {
        csvField(r.scenario),
        csvField(r.phy),
        std::to_string(r.trial),
        std::to_string(r.samples_collected),
        r.rssi_available ? "true" : "false",
        csvField(r.log_paths.json),
        csvField(r.log_paths.csv),
        csvField(r.notes),
    };
}

// ============================================================================
// ResultTable
// ============================================================================

ResultTable::ResultTable(std::string path, std::vector<std::string> columns)
    : path_(std::move(path)), columns_(std::move(columns)) {
}

bool ResultTable::append(const std::vector<std::string>& fields) {
    if (fields.size() != columns_.size()) {
        LOG_RUNNER(ERROR, "Row for %s has %zu fields, expected %zu",
                   path_.c_str(), fields.size(), columns_.size());
        return false;
    }
    if (!ensureParentDirectory(path_)) {
        LOG_RUNNER(ERROR, "Cannot create directory for %s", path_.c_str());
        return false;
    }

    int fd = open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        LOG_RUNNER(ERROR, "open %s: %s", path_.c_str(), strerror(errno));
        return false;
    }

    std::string text;
    struct stat st;
    if (fstat(fd, &st) == 0 && st.st_size == 0) {
        for (size_t i = 0; i < columns_.size(); i++) {
            if (i) text += ',';
            text += columns_[i];
        }
        text += '\n';
    }
    for (size_t i = 0; i < fields.size(); i++) {
        if (i) text += ',';
        text += fields[i];
    }
    text += '\n';

    const char* data = text.data();
    size_t remaining = text.size();
    while (remaining > 0) {
        ssize_t n = write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_RUNNER(ERROR, "write %s: %s", path_.c_str(), strerror(errno));
            close(fd);
            return false;
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }

    bool durable = fsync(fd) == 0;
    if (!durable) {
        LOG_RUNNER(ERROR, "fsync %s: %s", path_.c_str(), strerror(errno));
    }
    close(fd);
    if (durable) {
        rows_written_++;
    }
    return durable;
}

// ============================================================================
// Reading back
// ============================================================================

std::vector<TrialRecord> loadThroughputTable(const std::string& path) {
    std::vector<TrialRecord> records;
    std::ifstream file(path);
    if (!file.is_open()) {
        return records;
    }

    std::string line;
    if (!std::getline(file, line)) {
        return records;
    }
    ColumnIndex idx(splitCsvLine(line));
    if (!idx.has("scenario") || !idx.has("payload_bytes") || !idx.has("trial")) {
        LOG_RUNNER(WARN, "%s has no throughput header, ignoring it", path.c_str());
        return records;
    }

    int skipped = 0;
    while (std::getline(file, line)) {
        if (line.empty()) continue;
        auto row = splitCsvLine(line);
        TrialRecord rec;
        if (!parseTrialRow(idx, row, rec)) {
            skipped++;
            continue;
        }
        rec.packets_received = toU64(idx.get(row, "packets"));
        rec.estimated_lost = toU64(idx.get(row, "estimated_lost_packets"));
        rec.duration_s = toDouble(idx.get(row, "duration_s"));
        rec.throughput_kbps = toDouble(idx.get(row, "throughput_kbps"));
        rec.notification_rate_per_s = toDouble(idx.get(row, "notification_rate_per_s"));
        rec.connection_attempts_used = static_cast<int>(toU64(idx.get(row, "connection_attempts_used")));
        rec.command_errors = static_cast<int>(toU64(idx.get(row, "command_errors")));
        rec.log_paths.json = idx.get(row, "log_json");
        rec.log_paths.csv = idx.get(row, "log_csv");
        rec.notes = idx.get(row, "notes");
        rec.reordered_packets = toU64(idx.get(row, "reordered_packets"));
        rec.malformed_packets = toU64(idx.get(row, "malformed_packets"));
        rec.jitter_ms = toDouble(idx.get(row, "jitter_ms"));
        records.push_back(rec);
    }
    if (skipped > 0) {
        LOG_RUNNER(WARN, "Skipped %d unreadable rows in %s", skipped, path.c_str());
    }
    return records;
}

CompletedTrialIndex CompletedTrialIndex::load(const std::string& throughput_csv) {
    CompletedTrialIndex index;
    for (const auto& rec : loadThroughputTable(throughput_csv)) {
        if (rec.status != TrialStatus::FAILED) {
            index.add(rec.key());
        }
    }
    if (index.size() > 0) {
        LOG_RUNNER(INFO, "Resume enabled; %zu trials already recorded in %s",
                   index.size(), throughput_csv.c_str());
    }
    return index;
}

std::optional<ThroughputAggregate> summarizeThroughput(const std::vector<TrialRecord>& records) {
    ThroughputAggregate agg;
    double sum = 0.0;
    for (const auto& r : records) {
        if (r.status == TrialStatus::FAILED) {
            continue;
        }
        agg.total_trials++;
        sum += r.throughput_kbps;
        agg.total_packets += r.packets_received;
        agg.total_loss += r.estimated_lost;
        if (r.connection_attempts_used > 1) agg.retry_trials++;
        if (r.command_errors > 0) agg.error_trials++;
    }
    if (agg.total_trials == 0) {
        return std::nullopt;
    }
    agg.avg_throughput_kbps = sum / agg.total_trials;
    return agg;
}

} // namespace runner
} // namespace gattbench
