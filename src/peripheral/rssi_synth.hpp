#pragma once

#include "fault_profile.hpp"
#include "../common/random_source.hpp"
#include <cstdint>
#include <optional>

namespace gattbench {
namespace peripheral {

constexpr int RSSI_MIN_DBM = -127;
constexpr int RSSI_MAX_DBM = -1;

// Synthesized RSSI for the optional RSSI characteristic:
// base + sin wave + linear drift (+ uniform noise), or a replayed curve.
// Wave and drift run from an origin set by setProfile()/restart(), so every
// trial starts at the base level. A host-supplied hardware reading always
// wins. Informational only: nothing on the packet path reads it.
class RssiSynthesizer {
public:
    explicit RssiSynthesizer(RandomSource& rng);

    void setProfile(const FaultProfile& profile, uint64_t origin_ms = 0);

    // Real controller reading when the host can provide one
    void setHardwareReading(std::optional<int> dbm) { hardware_dbm_ = dbm; }

    // Noise-free level at the given device time. Does not consume curve
    // entries or random draws.
    int level(uint64_t device_ms) const;

    // Value served on a characteristic read; advances the curve
    int read(uint64_t device_ms);

    // New waveform origin, curve back to its first entry
    void restart(uint64_t origin_ms);
    uint64_t getOriginMs() const { return origin_ms_; }

private:
    RandomSource& rng_;
    FaultProfile profile_;
    std::optional<int> hardware_dbm_;
    size_t curve_pos_ = 0;
    uint64_t origin_ms_ = 0;
};

} // namespace peripheral
} // namespace gattbench
