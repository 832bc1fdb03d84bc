#pragma once

#include <optional>
#include <string>
#include <vector>

namespace gattbench {
namespace peripheral {

// Interval shaping that mimics the host switching PHY mid-stream
enum class PhyProfile {
    FIXED,
    VARYING,    // every 100th interval x1.5, every 10th interval x0.8
};

const char* phyProfileToString(PhyProfile profile);
bool parsePhyProfile(const std::string& str, PhyProfile& out);

/**
 * Probabilistic impairments applied by the simulated peripheral.
 *
 * Every *_percent / *_chance field is a probability in percent [0, 100].
 * A profile is resolved once per trial and never changes while streaming.
 */
struct FaultProfile {
    std::string name = "best";

    // Loss
    double drop_percent = 0.0;
    double drop_burst_percent = 0.0;    // Chance that a packet opens a burst
    int drop_burst_len = 0;             // Packets dropped per burst (including the trigger)

    // Timing
    int interval_jitter_ms = 0;         // Uniform +/- perturbation of the interval
    int latency_spike_ms = 0;
    double latency_spike_chance = 0.0;
    PhyProfile phy_profile = PhyProfile::FIXED;

    // Integrity / lifecycle
    double malformed_chance = 0.0;
    double disconnect_chance = 0.0;     // Per scheduled packet
    double command_ignore_chance = 0.0; // Per inbound write

    // RSSI shaping
    double rssi_base_dbm = -55.0;
    double rssi_variation_dbm = 0.0;    // Uniform +/- noise
    double rssi_wave_amplitude = 0.0;
    double rssi_wave_period_s = 0.0;
    double rssi_drift_dbm = 0.0;        // Per second since the last Reset

    // Replay curves, consumed cyclically one entry per scheduled packet / read
    std::vector<int> interval_curve_ms;
    std::vector<double> drop_curve;     // Probabilities 0..1, replaces drop_percent
    std::vector<int> rssi_curve_dbm;

    bool hasImpairments() const;
    std::string describe() const;
};

// Explicit overrides. Unset fields keep the preset value.
struct FaultOverrides {
    std::optional<double> drop_percent;
    std::optional<double> drop_burst_percent;
    std::optional<int> drop_burst_len;
    std::optional<int> interval_jitter_ms;
    std::optional<int> latency_spike_ms;
    std::optional<double> latency_spike_chance;
    std::optional<PhyProfile> phy_profile;
    std::optional<double> malformed_chance;
    std::optional<double> disconnect_chance;
    std::optional<double> command_ignore_chance;
    std::optional<double> rssi_base_dbm;
    std::optional<double> rssi_variation_dbm;
    std::optional<double> rssi_wave_amplitude;
    std::optional<double> rssi_wave_period_s;
    std::optional<double> rssi_drift_dbm;
    std::optional<std::vector<int>> interval_curve_ms;
    std::optional<std::vector<double>> drop_curve;
    std::optional<std::vector<int>> rssi_curve_dbm;

    bool empty() const;
};

// Preset names in order of increasing severity
const std::vector<std::string>& presetNames();

bool isPresetName(const std::string& name);

// Throws ConfigError for an unknown preset name
FaultProfile presetProfile(const std::string& name);

// Preset + overrides, validated. Throws ConfigError on any out-of-range field.
FaultProfile resolveFaultProfile(const std::string& preset_name,
                                 const FaultOverrides& overrides = FaultOverrides{});

// Throws ConfigError describing the first invalid field
void validateFaultProfile(const FaultProfile& profile);

// JSON array of numbers, e.g. [25, 25, 40]. Throws ConfigError.
std::vector<double> loadCurveFile(const std::string& path);

} // namespace peripheral
} // namespace gattbench
