#include "sweep_settings.hpp"
#include "../common/fs_util.hpp"
#include "gattbench/errors.hpp"
#include "gattbench/logging.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>

namespace gattbench {
namespace config {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return std::string();
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

bool parseBool(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

int parseOpcode(const std::string& value) {
    // Accepts decimal or 0x-prefixed hex
    return static_cast<int>(std::strtol(value.c_str(), nullptr, 0));
}

std::vector<int> toIntCurve(const std::vector<double>& values) {
    std::vector<int> out;
    out.reserve(values.size());
    for (double v : values) {
        out.push_back(static_cast<int>(std::lround(v)));
    }
    return out;
}

// Fault override keys, named after the FaultProfile fields
bool applyFaultOverride(peripheral::FaultOverrides& o, const std::string& key, const std::string& value) {
    double v = std::strtod(value.c_str(), nullptr);
    int i = std::atoi(value.c_str());
    if (key == "drop_percent") o.drop_percent = v;
    else if (key == "drop_burst_percent") o.drop_burst_percent = v;
    else if (key == "drop_burst_len") o.drop_burst_len = i;
    else if (key == "interval_jitter_ms") o.interval_jitter_ms = i;
    else if (key == "latency_spike_ms") o.latency_spike_ms = i;
    else if (key == "latency_spike_chance") o.latency_spike_chance = v;
    else if (key == "malformed_chance") o.malformed_chance = v;
    else if (key == "disconnect_chance") o.disconnect_chance = v;
    else if (key == "command_ignore_chance") o.command_ignore_chance = v;
    else if (key == "rssi_base_dbm") o.rssi_base_dbm = v;
    else if (key == "rssi_variation_dbm") o.rssi_variation_dbm = v;
    else if (key == "rssi_wave_amplitude") o.rssi_wave_amplitude = v;
    else if (key == "rssi_wave_period_s") o.rssi_wave_period_s = v;
    else if (key == "rssi_drift_dbm") o.rssi_drift_dbm = v;
    else if (key == "phy_profile") {
        peripheral::PhyProfile profile;
        if (!peripheral::parsePhyProfile(value, profile)) {
            throw ConfigError("phy_profile must be 'fixed' or 'varying', got '" + value + "'");
        }
        o.phy_profile = profile;
    } else {
        return false;
    }
    return true;
}

template <typename T>
void writeOptional(std::ofstream& file, const char* key, const std::optional<T>& value) {
    if (value) {
        file << key << "=" << *value << "\n";
    }
}

} // namespace

// ============================================================================
// Lists
// ============================================================================

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        std::string item = trim(value.substr(start, comma - start));
        if (!item.empty()) out.push_back(item);
        start = comma + 1;
    }
    return out;
}

std::vector<int> parseIntList(const std::string& value) {
    std::vector<int> out;
    for (const auto& item : splitList(value)) {
        char* end = nullptr;
        long v = std::strtol(item.c_str(), &end, 10);
        if (*end != '\0') {
            throw ConfigError("'" + item + "' is not an integer");
        }
        out.push_back(static_cast<int>(v));
    }
    return out;
}

std::string joinList(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i) out += ",";
        out += items[i];
    }
    return out;
}

std::string joinList(const std::vector<int>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i) out += ",";
        out += std::to_string(items[i]);
    }
    return out;
}

// ============================================================================
// INI file
// ============================================================================

std::string SweepSettings::getDefaultPath() {
    const char* config_override = std::getenv("GATTBENCH_CONFIG");
    if (config_override && config_override[0] != '\0') {
        return std::string(config_override);
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/gattbench/sweep.ini";
    }
    return "sweep.ini";
}

bool applySetting(SweepSettings& s, const std::string& key, const std::string& value) {
    // Target
    if (key == "address") {
        s.address = value;
    } else if (key == "adapter") {
        s.adapter = value;
    }
    // Sweep
    else if (key == "scenarios") {
        s.scenarios = splitList(value);
    } else if (key == "phys") {
        s.phys = splitList(value);
    } else if (key == "payloads") {
        s.payloads = parseIntList(value);
    } else if (key == "repeats") {
        s.repeats = std::atoi(value.c_str());
    } else if (key == "duration_s") {
        s.duration_s = std::strtod(value.c_str(), nullptr);
    } else if (key == "packet_count") {
        s.packet_count = std::atoi(value.c_str());
    } else if (key == "resume") {
        s.resume = parseBool(value);
    } else if (key == "skip_throughput") {
        s.skip_throughput = parseBool(value);
    } else if (key == "skip_latency") {
        s.skip_latency = parseBool(value);
    } else if (key == "skip_rssi") {
        s.skip_rssi = parseBool(value);
    } else if (key == "note") {
        s.note = value;
    }
    // Connection
    else if (key == "connect_timeout_s") {
        s.connect_timeout_s = std::strtod(value.c_str(), nullptr);
    } else if (key == "connect_attempts") {
        s.connect_attempts = std::atoi(value.c_str());
    } else if (key == "connect_retry_delay_s") {
        s.connect_retry_delay_s = std::strtod(value.c_str(), nullptr);
    } else if (key == "mtu") {
        s.mtu = std::atoi(value.c_str());
    } else if (key == "start_cmd" || key == "start_opcode") {
        s.start_opcode = parseOpcode(value);
    } else if (key == "stop_cmd" || key == "stop_opcode") {
        s.stop_opcode = parseOpcode(value);
    } else if (key == "reset_cmd" || key == "reset_opcode") {
        s.reset_opcode = parseOpcode(value);
    }
    // Latency
    else if (key == "latency_mode") {
        s.latency_mode = value;
    } else if (key == "latency_iterations") {
        s.latency_iterations = std::atoi(value.c_str());
    } else if (key == "latency_timeout_s") {
        s.latency_timeout_s = std::strtod(value.c_str(), nullptr);
    } else if (key == "latency_payload_bytes") {
        s.latency_payload_bytes = std::atoi(value.c_str());
    }
    // Rssi
    else if (key == "rssi_samples") {
        s.rssi_samples = std::atoi(value.c_str());
    } else if (key == "rssi_interval_s") {
        s.rssi_interval_s = std::strtod(value.c_str(), nullptr);
    }
    // Paths
    else if (key == "log_dir") {
        s.log_dir = value;
    } else if (key == "results_dir") {
        s.results_dir = value;
    } else if (key == "manifest_dir") {
        s.manifest_dir = value;
    } else if (key == "lock_dir") {
        s.lock_dir = value;
    } else if (key == "lock_mode") {
        s.lock_mode = value;
    } else if (key == "lock_timeout_s") {
        s.lock_timeout_s = std::strtod(value.c_str(), nullptr);
    }
    // Peripheral
    else if (key == "notify_hz") {
        s.notify_hz = std::atoi(value.c_str());
    } else if (key == "seed") {
        s.seed = std::strtoull(value.c_str(), nullptr, 0);
    } else if (key == "sim_speedup") {
        s.sim_speedup = std::strtod(value.c_str(), nullptr);
    } else if (key == "fault_profiles") {
        s.fault_profiles = parseBool(value);
    } else if (key == "scenario_presets") {
        s.scenario_presets = value;
    } else if (key == "connect_failure_chance") {
        s.connect_failure_chance = std::strtod(value.c_str(), nullptr);
    } else if (key == "expose_rssi") {
        s.expose_rssi = parseBool(value);
    } else if (key == "interval_curve_file") {
        s.interval_curve_file = value;
    } else if (key == "drop_curve_file") {
        s.drop_curve_file = value;
    } else if (key == "rssi_curve_file") {
        s.rssi_curve_file = value;
    } else {
        return applyFaultOverride(s.overrides, key, value);
    }
    return true;
}

bool SweepSettings::load(const std::string& path) {
    std::string filepath = path.empty() ? getDefaultPath() : path;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        line = trim(line);
        // Skip empty lines, comments and section headers
        if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (!applySetting(*this, key, value)) {
            log(LogLevel::WARN, "CONFIG", "%s:%d: unknown key '%s'", filepath.c_str(), line_no, key.c_str());
        }
    }
    return true;
}

bool SweepSettings::save(const std::string& path) const {
    std::string filepath = path.empty() ? getDefaultPath() : path;
    ensureParentDirectory(filepath);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    file << "[Target]\n";
    file << "address=" << address << "\n";
    file << "adapter=" << adapter << "\n";

    file << "\n[Sweep]\n";
    file << "scenarios=" << joinList(scenarios) << "\n";
    file << "phys=" << joinList(phys) << "\n";
    file << "payloads=" << joinList(payloads) << "\n";
    file << "repeats=" << repeats << "\n";
    file << "duration_s=" << duration_s << "\n";
    file << "packet_count=" << packet_count << "\n";
    file << "resume=" << (resume ? "1" : "0") << "\n";
    file << "skip_throughput=" << (skip_throughput ? "1" : "0") << "\n";
    file << "skip_latency=" << (skip_latency ? "1" : "0") << "\n";
    file << "skip_rssi=" << (skip_rssi ? "1" : "0") << "\n";
    file << "note=" << note << "\n";

    file << "\n[Connection]\n";
    file << "connect_timeout_s=" << connect_timeout_s << "\n";
    file << "connect_attempts=" << connect_attempts << "\n";
    file << "connect_retry_delay_s=" << connect_retry_delay_s << "\n";
    file << "mtu=" << mtu << "\n";
    file << "start_opcode=" << start_opcode << "\n";
    file << "stop_opcode=" << stop_opcode << "\n";
    file << "reset_opcode=" << reset_opcode << "\n";

    file << "\n[Latency]\n";
    file << "latency_mode=" << latency_mode << "\n";
    file << "latency_iterations=" << latency_iterations << "\n";
    file << "latency_timeout_s=" << latency_timeout_s << "\n";
    file << "latency_payload_bytes=" << latency_payload_bytes << "\n";

    file << "\n[Rssi]\n";
    file << "rssi_samples=" << rssi_samples << "\n";
    file << "rssi_interval_s=" << rssi_interval_s << "\n";

    file << "\n[Paths]\n";
    file << "log_dir=" << log_dir << "\n";
    file << "results_dir=" << results_dir << "\n";
    file << "manifest_dir=" << manifest_dir << "\n";
    file << "lock_dir=" << lock_dir << "\n";
    file << "lock_mode=" << lock_mode << "\n";
    file << "lock_timeout_s=" << lock_timeout_s << "\n";

    file << "\n[Peripheral]\n";
    file << "notify_hz=" << notify_hz << "\n";
    file << "seed=" << seed << "\n";
    file << "sim_speedup=" << sim_speedup << "\n";
    file << "fault_profiles=" << (fault_profiles ? "1" : "0") << "\n";
    file << "scenario_presets=" << scenario_presets << "\n";
    file << "connect_failure_chance=" << connect_failure_chance << "\n";
    file << "expose_rssi=" << (expose_rssi ? "1" : "0") << "\n";
    file << "interval_curve_file=" << interval_curve_file << "\n";
    file << "drop_curve_file=" << drop_curve_file << "\n";
    file << "rssi_curve_file=" << rssi_curve_file << "\n";
    // Only explicit overrides; everything else comes from the scenario preset
    writeOptional(file, "drop_percent", overrides.drop_percent);
    writeOptional(file, "drop_burst_percent", overrides.drop_burst_percent);
    writeOptional(file, "drop_burst_len", overrides.drop_burst_len);
    writeOptional(file, "interval_jitter_ms", overrides.interval_jitter_ms);
    writeOptional(file, "latency_spike_ms", overrides.latency_spike_ms);
    writeOptional(file, "latency_spike_chance", overrides.latency_spike_chance);
    if (overrides.phy_profile) {
        file << "phy_profile=" << peripheral::phyProfileToString(*overrides.phy_profile) << "\n";
    }
    writeOptional(file, "malformed_chance", overrides.malformed_chance);
    writeOptional(file, "disconnect_chance", overrides.disconnect_chance);
    writeOptional(file, "command_ignore_chance", overrides.command_ignore_chance);
    writeOptional(file, "rssi_base_dbm", overrides.rssi_base_dbm);
    writeOptional(file, "rssi_variation_dbm", overrides.rssi_variation_dbm);
    writeOptional(file, "rssi_wave_amplitude", overrides.rssi_wave_amplitude);
    writeOptional(file, "rssi_wave_period_s", overrides.rssi_wave_period_s);
    writeOptional(file, "rssi_drift_dbm", overrides.rssi_drift_dbm);

    return file.good();
}

void SweepSettings::validate() const {
    if (address.empty()) {
        throw ConfigError("address is required");
    }
    for (int p : payloads) {
        if (p < static_cast<int>(MIN_SWEEP_PAYLOAD_BYTES) || p > static_cast<int>(MAX_SWEEP_PAYLOAD_BYTES)) {
            throw ConfigError("payload " + std::to_string(p) + " is outside 20-244 bytes (ATT constraints)");
        }
    }
    for (const auto& phy : phys) {
        Phy parsed;
        if (!parsePhy(phy, parsed)) {
            throw ConfigError("unknown PHY '" + phy + "'");
        }
    }
    if (repeats < 1) throw ConfigError("repeats must be at least 1");
    if (duration_s < 0.0 || (duration_s == 0.0 && packet_count <= 0)) {
        throw ConfigError("duration_s must be positive unless packet_count is set");
    }
    if (packet_count < 0 || packet_count > 0xFFFF) throw ConfigError("packet_count must be 0-65535");
    if (connect_attempts < 1) throw ConfigError("connect_attempts must be at least 1");
    if (connect_timeout_s <= 0.0) throw ConfigError("connect_timeout_s must be positive");
    if (connect_retry_delay_s < 0.0) throw ConfigError("connect_retry_delay_s must not be negative");
    if (mtu < 23 || mtu > 517) throw ConfigError("mtu must be 23-517");
    for (int op : {start_opcode, stop_opcode, reset_opcode}) {
        if (op < 0 || op > 0xFF) throw ConfigError("command opcodes must fit in one byte");
    }
    if (start_opcode == stop_opcode || start_opcode == reset_opcode || stop_opcode == reset_opcode) {
        throw ConfigError("start, stop and reset opcodes must differ");
    }
    if (latency_mode != "start" && latency_mode != "trigger") {
        throw ConfigError("latency_mode must be 'start' or 'trigger'");
    }
    if (latency_iterations < 1) throw ConfigError("latency_iterations must be at least 1");
    if (latency_timeout_s <= 0.0) throw ConfigError("latency_timeout_s must be positive");
    if (rssi_samples < 1) throw ConfigError("rssi_samples must be at least 1");
    if (rssi_interval_s < 0.0) throw ConfigError("rssi_interval_s must not be negative");
    runner::LockMode mode;
    if (!runner::parseLockMode(lock_mode, mode)) {
        throw ConfigError("lock_mode must be 'fail_fast' or 'blocking'");
    }
    if (notify_hz < 1 || notify_hz > 1000) throw ConfigError("notify_hz must be 1-1000");
    if (sim_speedup < 0.0) throw ConfigError("sim_speedup must not be negative");
    for (const auto& entry : splitList(scenario_presets)) {
        size_t colon = entry.find(':');
        if (colon == std::string::npos || !peripheral::isPresetName(entry.substr(colon + 1))) {
            throw ConfigError("scenario_presets entry '" + entry + "' is not scenario:preset");
        }
    }
    // Overrides must still produce a valid profile
    peripheral::resolveFaultProfile("best", overrides);
}

// ============================================================================
// Derived configurations
// ============================================================================

peripheral::FaultOverrides SweepSettings::resolvedOverrides() const {
    peripheral::FaultOverrides o = overrides;
    if (!interval_curve_file.empty()) {
        o.interval_curve_ms = toIntCurve(peripheral::loadCurveFile(expandHome(interval_curve_file)));
    }
    if (!drop_curve_file.empty()) {
        o.drop_curve = peripheral::loadCurveFile(expandHome(drop_curve_file));
    }
    if (!rssi_curve_file.empty()) {
        o.rssi_curve_dbm = toIntCurve(peripheral::loadCurveFile(expandHome(rssi_curve_file)));
    }
    return o;
}

runner::SweepPlan SweepSettings::toSweepPlan() const {
    runner::SweepPlan plan;
    plan.address = address;
    plan.adapter = adapter;
    plan.scenarios = scenarios;
    plan.phys = phys;
    plan.payloads = payloads;
    plan.repeats = repeats;
    plan.duration_s = duration_s;
    plan.packet_count = static_cast<uint16_t>(packet_count);
    plan.skip_throughput = skip_throughput;
    plan.skip_latency = skip_latency;
    plan.skip_rssi = skip_rssi;
    plan.resume = resume;
    plan.latency_mode = latency_mode;
    plan.latency_iterations = latency_iterations;
    plan.latency_timeout_s = latency_timeout_s;
    plan.latency_payload_bytes = latency_payload_bytes;
    plan.rssi_samples = rssi_samples;
    plan.rssi_interval_s = rssi_interval_s;
    plan.apply_fault_profiles = fault_profiles;
    for (const auto& entry : splitList(scenario_presets)) {
        size_t colon = entry.find(':');
        if (colon != std::string::npos) {
            plan.scenario_presets[entry.substr(0, colon)] = entry.substr(colon + 1);
        }
    }
    plan.overrides = resolvedOverrides();
    if (!runner::parseLockMode(lock_mode, plan.lock_mode)) {
        throw ConfigError("lock_mode must be 'fail_fast' or 'blocking'");
    }
    plan.lock_timeout_s = lock_timeout_s;
    plan.results_dir = expandHome(results_dir);
    plan.manifest_dir = expandHome(manifest_dir);
    plan.lock_dir = expandHome(lock_dir);
    plan.note = note;
    return plan;
}

client::TrialRunnerConfig SweepSettings::toRunnerConfig() const {
    client::TrialRunnerConfig cfg;
    cfg.connect.target = address;
    cfg.connect.timeout_s = connect_timeout_s;
    cfg.connect.max_attempts = connect_attempts;
    cfg.connect.retry_delay_s = connect_retry_delay_s;
    cfg.mtu = mtu;
    cfg.output_dir = expandHome(log_dir);
    cfg.opcodes.start = static_cast<uint8_t>(start_opcode);
    cfg.opcodes.stop = static_cast<uint8_t>(stop_opcode);
    cfg.opcodes.reset = static_cast<uint8_t>(reset_opcode);
    return cfg;
}

peripheral::PeripheralConfig SweepSettings::toPeripheralConfig() const {
    peripheral::PeripheralConfig cfg;
    cfg.scheduler.notify_hz = notify_hz;
    cfg.opcodes.start = static_cast<uint8_t>(start_opcode);
    cfg.opcodes.stop = static_cast<uint8_t>(stop_opcode);
    cfg.opcodes.reset = static_cast<uint8_t>(reset_opcode);
    cfg.seed = seed;
    cfg.expose_rssi = expose_rssi;
    return cfg;
}

client::SimLinkConfig SweepSettings::toSimLinkConfig() const {
    client::SimLinkConfig cfg;
    cfg.adapter = adapter;
    cfg.connect_failure_chance = connect_failure_chance;
    cfg.max_mtu = mtu;
    return cfg;
}

} // namespace config
} // namespace gattbench
