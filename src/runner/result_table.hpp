#pragma once

#include "gattbench/records.hpp"
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace gattbench {
namespace runner {

// Column sets of the aggregate sweep tables
const std::vector<std::string>& throughputColumns();
const std::vector<std::string>& latencyColumns();
const std::vector<std::string>& rssiColumns();

std::vector<std::string> throughputRow(const TrialRecord& record);
std::vector<std::string> latencyRow(const LatencyRecord& record);
std::vector<std::string> rssiRow(const RssiRecord& record);

// Separators and line breaks inside a field become ';' / ' '
std::string csvField(const std::string& value);

/**
 * Append-only aggregate CSV. The header is written when the file is new or
 * empty; every appended row is fsync'd before append() returns, so a
 * crashed sweep loses at most the trial in flight.
 */
class ResultTable {
public:
    ResultTable(std::string path, std::vector<std::string> columns);

    // False (and logged) when the row could not be made durable
    bool append(const std::vector<std::string>& fields);

    const std::string& path() const { return path_; }
    const std::vector<std::string>& columns() const { return columns_; }
    size_t getRowsWritten() const { return rows_written_; }

private:
    std::string path_;
    std::vector<std::string> columns_;
    size_t rows_written_ = 0;
};

// Throughput rows parsed back from an aggregate table. Rows that do not
// parse are skipped.
std::vector<TrialRecord> loadThroughputTable(const std::string& path);

/**
 * Keys of throughput trials already recorded, loaded once at sweep start.
 * Rows with status "failed" are left out so the trial runs again.
 */
class CompletedTrialIndex {
public:
    CompletedTrialIndex() = default;

    static CompletedTrialIndex load(const std::string& throughput_csv);

    bool contains(const TrialKey& key) const { return keys_.count(key) != 0; }
    void add(const TrialKey& key) { keys_.insert(key); }
    size_t size() const { return keys_.size(); }

private:
    std::unordered_set<TrialKey, TrialKeyHash> keys_;
};

// Per (scenario, PHY) roll-up written to the manifest
struct ThroughputAggregate {
    double avg_throughput_kbps = 0.0;
    uint64_t total_packets = 0;
    uint64_t total_loss = 0;
    int total_trials = 0;
    int retry_trials = 0;        // Needed more than one connection attempt
    int error_trials = 0;        // At least one command error
};

// Failed trials are excluded; empty when nothing measurable remains
std::optional<ThroughputAggregate> summarizeThroughput(const std::vector<TrialRecord>& records);

} // namespace runner
} // namespace gattbench
