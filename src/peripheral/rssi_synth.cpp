#define _USE_MATH_DEFINES
#include "rssi_synth.hpp"
#include <algorithm>
#include <cmath>

namespace gattbench {
namespace peripheral {

namespace {
int clampRssi(double dbm) {
    return std::clamp(static_cast<int>(std::lround(dbm)), RSSI_MIN_DBM, RSSI_MAX_DBM);
}
}

RssiSynthesizer::RssiSynthesizer(RandomSource& rng)
    : rng_(rng) {
}

void RssiSynthesizer::setProfile(const FaultProfile& profile, uint64_t origin_ms) {
    profile_ = profile;
    restart(origin_ms);
}

void RssiSynthesizer::restart(uint64_t origin_ms) {
    origin_ms_ = origin_ms;
    curve_pos_ = 0;
}

int RssiSynthesizer::level(uint64_t device_ms) const {
    if (hardware_dbm_) {
        return clampRssi(*hardware_dbm_);
    }
    if (!profile_.rssi_curve_dbm.empty()) {
        return clampRssi(profile_.rssi_curve_dbm[curve_pos_ % profile_.rssi_curve_dbm.size()]);
    }

    uint64_t elapsed_ms = device_ms > origin_ms_ ? device_ms - origin_ms_ : 0;
    double t = elapsed_ms / 1000.0;
    double value = profile_.rssi_base_dbm + profile_.rssi_drift_dbm * t;
    if (profile_.rssi_wave_amplitude > 0.0 && profile_.rssi_wave_period_s > 0.0) {
        value += profile_.rssi_wave_amplitude * std::sin(2.0 * M_PI * t / profile_.rssi_wave_period_s);
    }
    return clampRssi(value);
}

int RssiSynthesizer::read(uint64_t device_ms) {
    int value = level(device_ms);
    if (hardware_dbm_) {
        return value;
    }
    if (!profile_.rssi_curve_dbm.empty()) {
        curve_pos_ = (curve_pos_ + 1) % profile_.rssi_curve_dbm.size();
        return value;
    }
    if (profile_.rssi_variation_dbm > 0.0) {
        int span = static_cast<int>(profile_.rssi_variation_dbm);
        value = clampRssi(value + rng_.uniformInt(-span, span));
    }
    return value;
}

} // namespace peripheral
} // namespace gattbench
