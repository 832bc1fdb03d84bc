#pragma once

#include "../client/simulated_link.hpp"
#include "../client/trial_runner.hpp"
#include "../peripheral/fault_profile.hpp"
#include "../peripheral/peripheral_session.hpp"
#include "../runner/trial_orchestrator.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace gattbench {
namespace config {

// Persistent sweep configuration, INI format
struct SweepSettings {
    bool save(const std::string& path = "") const;
    // False when the file does not exist; unknown keys are ignored
    bool load(const std::string& path = "");

    // GATTBENCH_CONFIG, else ~/.config/gattbench/sweep.ini
    static std::string getDefaultPath();

    // Throws ConfigError describing the first unusable value
    void validate() const;

    // [Target]
    std::string address = "SIM:00:00:00:00:00:01";
    std::string adapter = "hci0";

    // [Sweep]
    std::vector<std::string> scenarios = {"baseline", "hand_behind_body", "phone_in_pocket", "phone_in_backpack"};
    std::vector<std::string> phys = {"coded", "auto"};
    std::vector<int> payloads = {20, 60, 120, 180, 244};
    int repeats = 2;
    double duration_s = 30.0;
    int packet_count = 0;               // 0 = until duration
    bool resume = false;
    bool skip_throughput = false;
    bool skip_latency = false;
    bool skip_rssi = false;
    std::string note;

    // [Connection]
    double connect_timeout_s = 30.0;
    int connect_attempts = 5;
    double connect_retry_delay_s = 10.0;
    int mtu = 247;
    int start_opcode = 0x01;
    int stop_opcode = 0x02;
    int reset_opcode = 0x03;

    // [Latency]
    std::string latency_mode = "start";
    int latency_iterations = 5;
    double latency_timeout_s = 5.0;
    int latency_payload_bytes = 0;      // 0 = last sweep payload

    // [Rssi]
    int rssi_samples = 20;
    double rssi_interval_s = 1.0;

    // [Paths]
    std::string log_dir = "logs/ble";
    std::string results_dir = "results/tables";
    std::string manifest_dir = "results/manifests";
    std::string lock_dir = "/tmp/gattbench_locks";
    std::string lock_mode = "fail_fast";
    double lock_timeout_s = 30.0;

    // [Peripheral] - simulated device under test
    int notify_hz = 40;
    uint64_t seed = 0x5EED;
    double sim_speedup = 0.0;           // 0 = unpaced virtual time
    bool fault_profiles = true;
    std::string scenario_presets;       // "scenario:preset,..." on top of the built-in mapping
    double connect_failure_chance = 0.0;
    bool expose_rssi = true;
    std::string interval_curve_file;    // JSON arrays replayed per packet
    std::string drop_curve_file;
    std::string rssi_curve_file;
    peripheral::FaultOverrides overrides;

    // Derived configurations. Curve files are read here (ConfigError on failure).
    runner::SweepPlan toSweepPlan() const;
    client::TrialRunnerConfig toRunnerConfig() const;
    peripheral::PeripheralConfig toPeripheralConfig() const;
    client::SimLinkConfig toSimLinkConfig() const;
    peripheral::FaultOverrides resolvedOverrides() const;
};

// Comma-separated list, whitespace trimmed, empty items dropped
std::vector<std::string> splitList(const std::string& value);
// Throws ConfigError for a non-integer item
std::vector<int> parseIntList(const std::string& value);
std::string joinList(const std::vector<std::string>& items);
std::string joinList(const std::vector<int>& items);

// Applies one "key=value" setting by key name (the CLI's --set uses this).
// Returns false for an unknown key.
bool applySetting(SweepSettings& settings, const std::string& key, const std::string& value);

} // namespace config
} // namespace gattbench
