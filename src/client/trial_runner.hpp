#pragma once

#include "connection_manager.hpp"
#include "metrics_engine.hpp"
#include "notification_queue.hpp"
#include "radio_link.hpp"
#include "run_log.hpp"
#include "../common/cancel_token.hpp"
#include "../common/clock.hpp"
#include "../peripheral/fault_profile.hpp"
#include "../protocol/wire_format.hpp"
#include "gattbench/records.hpp"
#include <functional>
#include <optional>
#include <string>

namespace gattbench {
namespace client {

struct ThroughputTrialParams {
    std::string scenario = "baseline";
    std::string phy = "auto";
    int payload_bytes = 20;
    int trial = 1;
    double duration_s = 30.0;           // 0 = until packet_count
    uint16_t packet_count = 0;          // 0 = until duration
    std::optional<peripheral::FaultProfile> fault_profile;
};

struct LatencyTrialParams {
    std::string scenario = "baseline";
    std::string phy = "auto";
    int trial = 1;
    std::string mode = "start";         // "start" or "trigger" (single-packet Start)
    int iterations = 5;
    double timeout_s = 5.0;
    double inter_delay_s = 0.5;
    int payload_bytes = 20;
    uint16_t packet_count = 0;          // "start" mode only
    std::optional<peripheral::FaultProfile> fault_profile;
};

struct RssiTrialParams {
    std::string scenario = "baseline";
    std::string phy = "auto";
    int trial = 1;
    int samples = 20;
    double interval_s = 1.0;
    std::optional<peripheral::FaultProfile> fault_profile;
};

// Trial execution seam used by the sweep orchestrator
class TrialRunner {
public:
    virtual ~TrialRunner() = default;

    virtual TrialRecord runThroughput(const ThroughputTrialParams& params) = 0;
    virtual LatencyRecord runLatency(const LatencyTrialParams& params) = 0;
    virtual RssiRecord runRssi(const RssiTrialParams& params) = 0;
};

struct TrialRunnerConfig {
    ConnectParams connect;                  // target, timeout, attempts, retry delay
    int mtu = 247;
    std::string output_dir = "logs";        // Raw per-run logs
    bool write_logs = true;
    protocol::CommandOpcodes opcodes;
    uint32_t reset_settle_ms = 100;
    uint32_t stop_settle_ms = 200;
    uint32_t poll_ms = 1;
    uint32_t idle_timeout_ms = 2000;        // Packet-count trials: end after this much silence
    size_t queue_capacity = 4096;
};

/**
 * GattTrialRunner - Throughput / latency / RSSI trials over a RadioLink
 *
 * Each call owns the link for its duration: connect with retries,
 * negotiate, subscribe, Reset + Start, collect, Stop, write raw logs. The
 * link is released on every exit path. A link loss mid-stream yields a
 * partial record with status link_lost; Stop / Reset write failures during
 * teardown only increment command_errors.
 */
class GattTrialRunner : public TrialRunner {
public:
    // Installs a fault profile on the peer before a trial (simulated peers)
    using PeerConfigurator = std::function<bool(const peripheral::FaultProfile& profile)>;

    GattTrialRunner(RadioLink& link, Clock& clock, const CancelToken& cancel,
                    const TrialRunnerConfig& config = TrialRunnerConfig{});

    void setPeerConfigurator(PeerConfigurator configurator) { configurator_ = std::move(configurator); }

    TrialRecord runThroughput(const ThroughputTrialParams& params) override;
    LatencyRecord runLatency(const LatencyTrialParams& params) override;
    RssiRecord runRssi(const RssiTrialParams& params) override;

    const TrialRunnerConfig& getConfig() const { return config_; }
    const LinkReport& getLastLinkReport() const { return last_report_; }

private:
    void applyProfile(const std::optional<peripheral::FaultProfile>& profile);
    void openLink(ConnectionManager& manager, const std::string& phy);
    void verifyService();
    bool sendCommand(const protocol::Command& cmd, std::vector<CommandLogEntry>& log);
    void sleepOrThrow(uint32_t ms);
    double trialSeconds() const;
    nlohmann::json baseMetadata(const std::string& scenario, const std::string& phy,
                                const std::optional<peripheral::FaultProfile>& profile) const;

    RadioLink& link_;
    Clock& clock_;
    const CancelToken& cancel_;
    TrialRunnerConfig config_;
    PeerConfigurator configurator_;
    LinkReport last_report_;
    uint64_t trial_origin_us_ = 0;
};

} // namespace client
} // namespace gattbench
