#include "fault_profile.hpp"
#include "gattbench/errors.hpp"
#include "gattbench/logging.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdio>
#include <fstream>

namespace gattbench {
namespace peripheral {

const char* phyProfileToString(PhyProfile profile) {
    switch (profile) {
        case PhyProfile::FIXED:   return "fixed";
        case PhyProfile::VARYING: return "varying";
        default: return "unknown";
    }
}

bool parsePhyProfile(const std::string& str, PhyProfile& out) {
    if (str == "fixed" || str == "none") { out = PhyProfile::FIXED; return true; }
    if (str == "varying") { out = PhyProfile::VARYING; return true; }
    return false;
}

bool FaultProfile::hasImpairments() const {
    return drop_percent > 0 || drop_burst_percent > 0 || interval_jitter_ms > 0 ||
           latency_spike_chance > 0 || malformed_chance > 0 || disconnect_chance > 0 ||
           command_ignore_chance > 0 || phy_profile != PhyProfile::FIXED ||
           !interval_curve_ms.empty() || !drop_curve.empty();
}

std::string FaultProfile::describe() const {
    char buf[256];
    snprintf(buf, sizeof(buf),
             "%s: drop=%.1f%% burst=%.1f%%x%d jitter=%dms spike=%dms@%.1f%% "
             "malformed=%.1f%% disconnect=%.2f%% ignore=%.1f%% rssi=%.0fdBm",
             name.c_str(), drop_percent, drop_burst_percent, drop_burst_len,
             interval_jitter_ms, latency_spike_ms, latency_spike_chance,
             malformed_chance, disconnect_chance, command_ignore_chance, rssi_base_dbm);
    return buf;
}

bool FaultOverrides::empty() const {
    return !drop_percent && !drop_burst_percent && !drop_burst_len && !interval_jitter_ms &&
           !latency_spike_ms && !latency_spike_chance && !phy_profile && !malformed_chance &&
           !disconnect_chance && !command_ignore_chance && !rssi_base_dbm &&
           !rssi_variation_dbm && !rssi_wave_amplitude && !rssi_wave_period_s &&
           !rssi_drift_dbm &&
           !interval_curve_ms && !drop_curve && !rssi_curve_dbm;
}

const std::vector<std::string>& presetNames() {
    static const std::vector<std::string> names = {"best", "typical", "body_block", "pocket", "worst"};
    return names;
}

bool isPresetName(const std::string& name) {
    for (const auto& preset : presetNames()) {
        if (preset == name) return true;
    }
    return false;
}

// ============================================================================
// Presets
// ============================================================================

namespace {

FaultProfile makePreset(const char* name, double drop, double burst, int burst_len,
                        int jitter, int spike_ms, double spike_chance,
                        double wave_amp, double wave_period_s, double disconnect) {
    FaultProfile p;
    p.name = name;
    p.drop_percent = drop;
    p.drop_burst_percent = burst;
    p.drop_burst_len = burst_len;
    p.interval_jitter_ms = jitter;
    p.latency_spike_ms = spike_ms;
    p.latency_spike_chance = spike_chance;
    p.rssi_wave_amplitude = wave_amp;
    p.rssi_wave_period_s = wave_period_s;
    p.disconnect_chance = disconnect;
    return p;
}

void checkPercent(const char* field, double value) {
    if (!std::isfinite(value) || value < 0.0 || value > 100.0) {
        char msg[128];
        snprintf(msg, sizeof(msg), "%s must be within [0, 100], got %g", field, value);
        throw ConfigError(msg);
    }
}

void checkNonNegative(const char* field, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        char msg[128];
        snprintf(msg, sizeof(msg), "%s must not be negative, got %g", field, value);
        throw ConfigError(msg);
    }
}

template <typename T, typename U>
void applyOverride(T& field, const std::optional<U>& value) {
    if (value) {
        field = *value;
    }
}

} // namespace

FaultProfile presetProfile(const std::string& name) {
    // name, drop%, burst%, burst_len, jitter, spike_ms, spike%, wave amp, wave period, disconnect%
    if (name == "best")       return makePreset("best", 0, 0, 0, 0, 0, 0, 0, 0, 0);
    if (name == "typical")    return makePreset("typical", 1, 1, 2, 3, 10, 2, 3, 1.25, 0);
    if (name == "body_block") return makePreset("body_block", 3, 5, 3, 5, 15, 5, 6, 1.0, 0);
    if (name == "pocket")     return makePreset("pocket", 2, 3, 2, 4, 12, 3, 4, 1.5, 0);
    if (name == "worst")      return makePreset("worst", 5, 10, 4, 8, 25, 8, 8, 0.75, 0.5);
    throw ConfigError("unknown fault preset '" + name + "'");
}

void validateFaultProfile(const FaultProfile& p) {
    checkPercent("drop_percent", p.drop_percent);
    checkPercent("drop_burst_percent", p.drop_burst_percent);
    checkPercent("latency_spike_chance", p.latency_spike_chance);
    checkPercent("malformed_chance", p.malformed_chance);
    checkPercent("disconnect_chance", p.disconnect_chance);
    checkPercent("command_ignore_chance", p.command_ignore_chance);

    checkNonNegative("drop_burst_len", p.drop_burst_len);
    checkNonNegative("interval_jitter_ms", p.interval_jitter_ms);
    checkNonNegative("latency_spike_ms", p.latency_spike_ms);
    checkNonNegative("rssi_variation_dbm", p.rssi_variation_dbm);
    checkNonNegative("rssi_wave_amplitude", p.rssi_wave_amplitude);
    checkNonNegative("rssi_wave_period_s", p.rssi_wave_period_s);

    if (!std::isfinite(p.rssi_base_dbm) || !std::isfinite(p.rssi_drift_dbm)) {
        throw ConfigError("RSSI shaping values must be finite");
    }
    for (int v : p.interval_curve_ms) {
        if (v <= 0) {
            throw ConfigError("interval_curve_ms entries must be positive");
        }
    }
    for (double v : p.drop_curve) {
        if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
            throw ConfigError("drop_curve entries must be probabilities within [0, 1]");
        }
    }
}

FaultProfile resolveFaultProfile(const std::string& preset_name, const FaultOverrides& o) {
    FaultProfile p = presetProfile(preset_name);

    applyOverride(p.drop_percent, o.drop_percent);
    applyOverride(p.drop_burst_percent, o.drop_burst_percent);
    applyOverride(p.drop_burst_len, o.drop_burst_len);
    applyOverride(p.interval_jitter_ms, o.interval_jitter_ms);
    applyOverride(p.latency_spike_ms, o.latency_spike_ms);
    applyOverride(p.latency_spike_chance, o.latency_spike_chance);
    applyOverride(p.phy_profile, o.phy_profile);
    applyOverride(p.malformed_chance, o.malformed_chance);
    applyOverride(p.disconnect_chance, o.disconnect_chance);
    applyOverride(p.command_ignore_chance, o.command_ignore_chance);
    applyOverride(p.rssi_base_dbm, o.rssi_base_dbm);
    applyOverride(p.rssi_variation_dbm, o.rssi_variation_dbm);
    applyOverride(p.rssi_wave_amplitude, o.rssi_wave_amplitude);
    applyOverride(p.rssi_wave_period_s, o.rssi_wave_period_s);
    applyOverride(p.rssi_drift_dbm, o.rssi_drift_dbm);
    applyOverride(p.interval_curve_ms, o.interval_curve_ms);
    applyOverride(p.drop_curve, o.drop_curve);
    applyOverride(p.rssi_curve_dbm, o.rssi_curve_dbm);

    if (!o.empty()) {
        p.name = preset_name + "+custom";
    }

    validateFaultProfile(p);
    LOG_PERIPH(DEBUG, "Resolved fault profile %s", p.describe().c_str());
    return p;
}

std::vector<double> loadCurveFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open curve file " + path);
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("curve file " + path + " is not valid JSON: " + e.what());
    }

    if (!doc.is_array() || doc.empty()) {
        throw ConfigError("curve file " + path + " must hold a non-empty JSON array");
    }

    std::vector<double> values;
    values.reserve(doc.size());
    for (const auto& entry : doc) {
        if (!entry.is_number()) {
            throw ConfigError("curve file " + path + " contains a non-numeric entry");
        }
        values.push_back(entry.get<double>());
    }
    LOG_PERIPH(INFO, "Loaded %zu curve points from %s", values.size(), path.c_str());
    return values;
}

} // namespace peripheral
} // namespace gattbench
