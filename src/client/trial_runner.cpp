#include "trial_runner.hpp"
#include "gattbench/errors.hpp"
#include "gattbench/logging.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace gattbench {
namespace client {

using nlohmann::json;

namespace {

uint32_t secondsToMs(double seconds) {
    return static_cast<uint32_t>(std::max(0.0, std::round(seconds * 1000.0)));
}

// Installs a link-lost hook for one trial and removes it on scope exit
class LinkLostHook {
public:
    LinkLostHook(RadioLink& link, bool& lost, std::string& reason) : link_(link) {
        link_.setLinkLostCallback([&lost, &reason](const std::string& why) {
            lost = true;
            reason = why;
        });
    }
    ~LinkLostHook() { link_.setLinkLostCallback(nullptr); }

    LinkLostHook(const LinkLostHook&) = delete;
    LinkLostHook& operator=(const LinkLostHook&) = delete;

private:
    RadioLink& link_;
};

void appendNote(std::string& notes, const std::string& note) {
    if (!notes.empty()) notes += "; ";
    notes += note;
}

std::string trialTag(const std::string& scenario, const std::string& phy, int trial) {
    char buf[32];
    snprintf(buf, sizeof(buf), "_t%d", trial);
    return scenario + "_" + phy + buf;
}

} // namespace

GattTrialRunner::GattTrialRunner(RadioLink& link, Clock& clock, const CancelToken& cancel,
                                 const TrialRunnerConfig& config)
    : link_(link), clock_(clock), cancel_(cancel), config_(config) {
}

// ============================================================================
// Shared steps
// ============================================================================

void GattTrialRunner::applyProfile(const std::optional<peripheral::FaultProfile>& profile) {
    if (!profile) {
        return;
    }
    peripheral::validateFaultProfile(*profile);
    if (!configurator_) {
        LOG_CLIENT(DEBUG, "No peer configurator, fault profile '%s' not applied", profile->name.c_str());
        return;
    }
    if (!configurator_(*profile)) {
        throw ConfigError("peer refused fault profile '" + profile->name + "'");
    }
    LOG_CLIENT(DEBUG, "Fault profile: %s", profile->describe().c_str());
}

void GattTrialRunner::openLink(ConnectionManager& manager, const std::string& phy) {
    last_report_ = LinkReport{};
    try {
        manager.connect(config_.connect);
    } catch (const ConnectionExhaustedError& e) {
        last_report_.attempts = e.attempts();
        throw;
    }

    NegotiationParams negotiation;
    negotiation.mtu = config_.mtu;
    negotiation.phy = phy;
    manager.negotiate(negotiation);
    last_report_ = manager.getReport();

    verifyService();
}

void GattTrialRunner::verifyService() {
    auto chars = link_.discoverCharacteristics(SERVICE_UUID);
    bool has_tx = std::find(chars.begin(), chars.end(), TX_CHAR_UUID) != chars.end();
    bool has_rx = std::find(chars.begin(), chars.end(), RX_CHAR_UUID) != chars.end();
    if (!has_tx || !has_rx) {
        throw Error(std::string("throughput service incomplete on peer (") +
                    (has_tx ? "" : "TX ") + (has_rx ? "" : "RX ") + "missing)");
    }
}

bool GattTrialRunner::sendCommand(const protocol::Command& cmd, std::vector<CommandLogEntry>& log) {
    Bytes raw = cmd.encode(config_.opcodes);
    CommandLogEntry entry;
    entry.t_s = trialSeconds();
    entry.name = opcodeToString(cmd.op);
    entry.payload_hex = toHex(raw);
    entry.ok = link_.writeCommand(raw);
    if (!entry.ok) {
        entry.error = link_.lastError();
        LOG_CLIENT(WARN, "%s write failed: %s", cmd.describe().c_str(), entry.error.c_str());
    } else {
        LOG_CLIENT(TRACE, "TX %s [%s]", cmd.describe().c_str(), entry.payload_hex.c_str());
    }
    log.push_back(entry);
    return entry.ok;
}

void GattTrialRunner::sleepOrThrow(uint32_t ms) {
    if (!clock_.sleepFor(ms, cancel_)) {
        throw CancelledError();
    }
}

double GattTrialRunner::trialSeconds() const {
    return (clock_.nowUs() - trial_origin_us_) / 1e6;
}

json GattTrialRunner::baseMetadata(const std::string& scenario, const std::string& phy,
                                   const std::optional<peripheral::FaultProfile>& profile) const {
    json meta = {
        {"generated_at", utcNowIso()},
        {"address", config_.connect.target},
        {"adapter", link_.adapterName()},
        {"backend", link_.backendName()},
        {"scenario", scenario},
        {"phy", phy},
        {"mtu_requested", config_.mtu},
        {"connection", linkReportToJson(last_report_)},
    };
    if (profile) {
        meta["fault_profile"] = profile->name;
        meta["fault_profile_detail"] = profile->describe();
    }
    return meta;
}

// ============================================================================
// Throughput
// ============================================================================

TrialRecord GattTrialRunner::runThroughput(const ThroughputTrialParams& params) {
    if (params.payload_bytes < 0 || params.payload_bytes > static_cast<int>(MAX_PAYLOAD_BYTES)) {
        throw ConfigError("payload_bytes " + std::to_string(params.payload_bytes) + " out of range");
    }
    if (params.duration_s < 0.0 || (params.duration_s == 0.0 && params.packet_count == 0)) {
        throw ConfigError("throughput trial needs a positive duration or a packet count");
    }
    applyProfile(params.fault_profile);

    TrialRecord record;
    record.scenario = params.scenario;
    record.phy = params.phy;
    record.payload_bytes = params.payload_bytes;
    record.repeat_index = params.trial;

    trial_origin_us_ = clock_.nowUs();
    std::vector<CommandLogEntry> commands;

    NotificationQueue queue(clock_, config_.queue_capacity);
    ConnectionManager manager(link_, clock_, cancel_);
    LinkGuard guard(manager);
    bool link_lost = false;
    std::string lost_reason;
    LinkLostHook hook(link_, link_lost, lost_reason);

    openLink(manager, params.phy);
    record.connection_attempts_used = last_report_.attemptsUsed();

    if (!link_.subscribe([&queue](const Bytes& data) { queue.push(data); })) {
        throw Error("notification subscribe failed: " + link_.lastError());
    }

    if (!sendCommand(protocol::Command::reset(), commands)) {
        throw CommandWriteError("reset write failed: " + link_.lastError());
    }
    sleepOrThrow(config_.reset_settle_ms);
    queue.clear();

    MetricsConfig metrics_config;
    metrics_config.expected_payload_bytes = static_cast<size_t>(params.payload_bytes);
    metrics_config.expect_sequence_origin = true;
    metrics_config.keep_records = config_.write_logs;
    MetricsEngine metrics(metrics_config);

    uint64_t start_us = clock_.nowUs();
    metrics.begin(start_us);
    auto start = protocol::Command::start(static_cast<uint8_t>(params.payload_bytes), params.packet_count);
    if (!sendCommand(start, commands)) {
        throw CommandWriteError("start write failed: " + link_.lastError());
    }
    LOG_CLIENT(INFO, "Streaming %s/%s payload=%d trial=%d", params.scenario.c_str(),
               params.phy.c_str(), params.payload_bytes, params.trial);

    uint64_t deadline_us = params.duration_s > 0.0
        ? start_us + static_cast<uint64_t>(std::llround(params.duration_s * 1e6))
        : 0;
    uint64_t idle_us = static_cast<uint64_t>(config_.idle_timeout_ms) * 1000;
    uint64_t last_arrival_us = start_us;
    bool went_idle = false;

    while (true) {
        while (auto n = queue.tryPop()) {
            metrics.onNotification(ByteSpan(n->data.data(), n->data.size()), n->arrival_us);
            last_arrival_us = n->arrival_us;
        }
        if (link_lost) {
            break;
        }
        uint64_t now = clock_.nowUs();
        if (params.packet_count > 0) {
            if (metrics.getPacketCount() >= params.packet_count) {
                break;
            }
            // Dropped packets never arrive; silence ends a count-bounded trial
            if (deadline_us == 0 && now - last_arrival_us >= idle_us) {
                went_idle = true;
                break;
            }
        }
        if (deadline_us != 0 && now >= deadline_us) {
            break;
        }
        sleepOrThrow(config_.poll_ms);
    }
    metrics.finish(went_idle ? last_arrival_us : clock_.nowUs());

    if (link_lost) {
        record.status = TrialStatus::LINK_LOST;
        appendNote(record.notes, "link lost: " + lost_reason);
        LOG_CLIENT(WARN, "Link lost after %llu packets: %s",
                   static_cast<unsigned long long>(metrics.getPacketCount()), lost_reason.c_str());
    } else {
        if (!sendCommand(protocol::Command::stop(), commands)) {
            record.command_errors++;
        }
        sleepOrThrow(config_.stop_settle_ms);
        queue.clear();
        if (!link_.unsubscribe()) {
            LOG_CLIENT(DEBUG, "unsubscribe failed: %s", link_.lastError().c_str());
        }
    }

    ThroughputSummary summary = metrics.summary();
    if (summary.origin_mismatch) {
        appendNote(record.notes, "sequence did not restart after reset");
    }
    if (queue.getOverflowCount() > 0) {
        appendNote(record.notes, std::to_string(queue.getOverflowCount()) + " notifications dropped by client queue");
    }
    for (const auto& w : last_report_.warnings) {
        appendNote(record.notes, w);
    }

    record.packets_received = summary.packets;
    record.estimated_lost = summary.estimated_lost_packets;
    record.duration_s = summary.duration_s;
    record.throughput_kbps = summary.throughput_kbps;
    record.notification_rate_per_s = summary.notification_rate_per_s;
    record.reordered_packets = summary.reordered_packets;
    record.malformed_packets = summary.malformed_packets;
    record.jitter_ms = summary.jitter_ms;

    if (config_.write_logs) {
        json meta = baseMetadata(params.scenario, params.phy, params.fault_profile);
        meta["type"] = "throughput";
        meta["payload_bytes"] = params.payload_bytes;
        meta["trial"] = params.trial;
        meta["duration_requested_s"] = params.duration_s;
        meta["packet_count_requested"] = params.packet_count;
        meta["status"] = trialStatusToString(record.status);
        meta["summary"] = throughputSummaryToJson(summary);
        meta["commands"] = commandLogToJson(commands);
        meta["command_errors"] = record.command_errors;
        meta["notes"] = record.notes;
        char tag[96];
        snprintf(tag, sizeof(tag), "%s_%s_%d_t%d", params.scenario.c_str(), params.phy.c_str(),
                 params.payload_bytes, params.trial);
        try {
            record.log_paths = RunLogWriter(config_.output_dir, "throughput", tag)
                .writeThroughput(meta, metrics.getRecords());
        } catch (const std::runtime_error& e) {
            LOG_CLIENT(WARN, "Raw log not written: %s", e.what());
            appendNote(record.notes, std::string("log write failed: ") + e.what());
        }
    }

    LOG_CLIENT(INFO, "Trial done: %llu packets, %llu lost, %.2f kbps over %.2fs (%s)",
               static_cast<unsigned long long>(record.packets_received),
               static_cast<unsigned long long>(record.estimated_lost),
               record.throughput_kbps, record.duration_s, trialStatusToString(record.status));
    return record;
}

// ============================================================================
// Latency
// ============================================================================

LatencyRecord GattTrialRunner::runLatency(const LatencyTrialParams& params) {
    if (params.mode != "start" && params.mode != "trigger") {
        throw ConfigError("latency mode must be 'start' or 'trigger', got '" + params.mode + "'");
    }
    if (params.iterations < 1 || params.timeout_s <= 0.0 || params.inter_delay_s < 0.0) {
        throw ConfigError("latency trial needs iterations >= 1 and a positive timeout");
    }
    if (params.payload_bytes < 0 || params.payload_bytes > static_cast<int>(MAX_PAYLOAD_BYTES)) {
        throw ConfigError("payload_bytes " + std::to_string(params.payload_bytes) + " out of range");
    }
    applyProfile(params.fault_profile);

    LatencyRecord record;
    record.scenario = params.scenario;
    record.phy = params.phy;
    record.trial = params.trial;
    record.mode = params.mode;

    trial_origin_us_ = clock_.nowUs();
    std::vector<CommandLogEntry> commands;
    std::vector<LatencySample> samples;

    NotificationQueue queue(clock_, config_.queue_capacity);
    ConnectionManager manager(link_, clock_, cancel_);
    LinkGuard guard(manager);
    bool link_lost = false;
    std::string lost_reason;
    LinkLostHook hook(link_, link_lost, lost_reason);

    openLink(manager, params.phy);
    if (!link_.subscribe([&queue](const Bytes& data) { queue.push(data); })) {
        throw Error("notification subscribe failed: " + link_.lastError());
    }

    uint16_t count = params.mode == "trigger" ? 1 : params.packet_count;
    uint64_t timeout_us = static_cast<uint64_t>(std::llround(params.timeout_s * 1e6));

    for (int i = 1; i <= params.iterations && !link_lost; i++) {
        if (!sendCommand(protocol::Command::reset(), commands)) {
            throw CommandWriteError("reset write failed: " + link_.lastError());
        }
        sleepOrThrow(config_.reset_settle_ms);
        queue.clear();

        LatencySample sample;
        sample.iteration = i;
        sample.mode = params.mode;
        uint64_t start_us = clock_.nowUs();
        sample.start_s = trialSeconds();
        auto start = protocol::Command::start(static_cast<uint8_t>(params.payload_bytes), count);
        if (!sendCommand(start, commands)) {
            throw CommandWriteError("start write failed: " + link_.lastError());
        }

        while (!link_lost) {
            if (auto n = queue.tryPop()) {
                auto header = protocol::decodeNotificationHeader(ByteSpan(n->data.data(), n->data.size()));
                sample.latency_s = (n->arrival_us - start_us) / 1e6;
                sample.seq = header.sequence ? *header.sequence : -1;
                sample.dut_ts = header.timestamp_ms ? *header.timestamp_ms : -1;
                break;
            }
            if (clock_.nowUs() - start_us >= timeout_us) {
                break;
            }
            sleepOrThrow(config_.poll_ms);
        }

        if (sample.latency_s) {
            LOG_CLIENT(DEBUG, "Latency iteration %d: %.1f ms", i, *sample.latency_s * 1000.0);
        } else {
            LOG_CLIENT(WARN, "Latency iteration %d: no notification within %.1fs", i, params.timeout_s);
        }
        samples.push_back(sample);

        if (link_lost) {
            break;
        }
        if (!sendCommand(protocol::Command::stop(), commands)) {
            appendNote(record.notes, "stop write failed in iteration " + std::to_string(i));
        }
        if (i < params.iterations) {
            sleepOrThrow(secondsToMs(params.inter_delay_s));
        }
    }

    if (link_lost) {
        appendNote(record.notes, "link lost: " + lost_reason);
    } else if (!link_.unsubscribe()) {
        LOG_CLIENT(DEBUG, "unsubscribe failed: %s", link_.lastError().c_str());
    }

    LatencySummary summary = summarizeLatency(samples);
    record.samples = summary.samples;
    record.timeouts = summary.timeouts;
    record.avg_latency_s = summary.avg_latency_s;
    record.min_latency_s = summary.min_latency_s;
    record.max_latency_s = summary.max_latency_s;

    if (config_.write_logs) {
        json meta = baseMetadata(params.scenario, params.phy, params.fault_profile);
        meta["type"] = "latency";
        meta["mode"] = params.mode;
        meta["trial"] = params.trial;
        meta["iterations"] = params.iterations;
        meta["timeout_s"] = params.timeout_s;
        meta["payload_bytes"] = params.payload_bytes;
        meta["summary"] = latencySummaryToJson(summary);
        meta["commands"] = commandLogToJson(commands);
        meta["notes"] = record.notes;
        try {
            record.log_paths = RunLogWriter(config_.output_dir, "latency",
                                            trialTag(params.scenario, params.phy, params.trial))
                .writeLatency(meta, samples);
        } catch (const std::runtime_error& e) {
            LOG_CLIENT(WARN, "Raw log not written: %s", e.what());
            appendNote(record.notes, std::string("log write failed: ") + e.what());
        }
    }

    if (record.avg_latency_s) {
        LOG_CLIENT(INFO, "Latency %s/%s: avg %.1f ms over %d samples, %d timeouts",
                   params.scenario.c_str(), params.phy.c_str(), *record.avg_latency_s * 1000.0,
                   record.samples, record.timeouts);
    } else {
        LOG_CLIENT(WARN, "Latency %s/%s: every iteration timed out", params.scenario.c_str(), params.phy.c_str());
    }
    return record;
}

// ============================================================================
// RSSI
// ============================================================================

RssiRecord GattTrialRunner::runRssi(const RssiTrialParams& params) {
    if (params.samples < 1 || params.interval_s < 0.0) {
        throw ConfigError("rssi trial needs samples >= 1 and a non-negative interval");
    }
    applyProfile(params.fault_profile);

    RssiRecord record;
    record.scenario = params.scenario;
    record.phy = params.phy;
    record.trial = params.trial;

    trial_origin_us_ = clock_.nowUs();
    std::vector<RssiSample> samples;

    ConnectionManager manager(link_, clock_, cancel_);
    LinkGuard guard(manager);
    bool link_lost = false;
    std::string lost_reason;
    LinkLostHook hook(link_, link_lost, lost_reason);

    openLink(manager, params.phy);
    uint32_t interval_ms = secondsToMs(params.interval_s);

    for (int i = 0; i < params.samples && !link_lost; i++) {
        RssiSample sample;
        sample.index = i;
        sample.t_s = trialSeconds();
        sample.rssi_dbm = link_.readRssi();
        if (sample.rssi_dbm) {
            record.rssi_available = true;
            LOG_CLIENT(TRACE, "RSSI[%d] = %d dBm", i, *sample.rssi_dbm);
        }
        samples.push_back(sample);
        if (i + 1 < params.samples) {
            sleepOrThrow(interval_ms);
        }
    }
    record.samples_collected = static_cast<int>(samples.size());

    if (link_lost) {
        appendNote(record.notes, "link lost: " + lost_reason);
    }
    if (!record.rssi_available) {
        appendNote(record.notes, std::string("RSSI not exposed by ") + link_.backendName() + " backend");
    }

    if (config_.write_logs) {
        json meta = baseMetadata(params.scenario, params.phy, params.fault_profile);
        meta["type"] = "rssi";
        meta["trial"] = params.trial;
        meta["interval_s"] = params.interval_s;
        meta["rssi_available"] = record.rssi_available;
        meta["notes"] = record.notes;
        try {
            record.log_paths = RunLogWriter(config_.output_dir, "rssi",
                                            trialTag(params.scenario, params.phy, params.trial))
                .writeRssi(meta, samples);
        } catch (const std::runtime_error& e) {
            LOG_CLIENT(WARN, "Raw log not written: %s", e.what());
            appendNote(record.notes, std::string("log write failed: ") + e.what());
        }
    }

    LOG_CLIENT(INFO, "RSSI %s/%s: %d samples%s", params.scenario.c_str(), params.phy.c_str(),
               record.samples_collected, record.rssi_available ? "" : " (unavailable)");
    return record;
}

} // namespace client
} // namespace gattbench
