#include "peripheral_session.hpp"
#include "gattbench/logging.hpp"

namespace gattbench {
namespace peripheral {

namespace {
std::unique_ptr<RandomSource> orDefault(std::unique_ptr<RandomSource> rng, uint64_t seed) {
    if (rng) {
        return rng;
    }
    return std::make_unique<MtRandomSource>(seed);
}
}

PeripheralSession::PeripheralSession(const PeripheralConfig& config, std::unique_ptr<RandomSource> rng)
    : config_(config),
      rng_(orDefault(std::move(rng), config.seed)),
      rssi_(*rng_),
      scheduler_(*rng_, config.scheduler),
      commands_(scheduler_, *rng_, config.opcodes) {
    scheduler_.setRssiSynthesizer(&rssi_);
    scheduler_.setPaused(true);
    LOG_PERIPH(DEBUG, "Peripheral session created (%d Hz, backlog %zu)",
               config_.scheduler.notify_hz, config_.scheduler.backlog_limit);
}

PeripheralSession::~PeripheralSession() {
    scheduler_.setTransmitCallback(nullptr);
    scheduler_.setLinkLostCallback(nullptr);
    scheduler_.stop();
}

bool PeripheralSession::configure(const FaultProfile& profile) {
    if (!scheduler_.setFaultProfile(profile)) {
        return false;
    }
    rssi_.setProfile(profile, scheduler_.getDeviceTimeMs());
    commands_.setIgnoreChance(profile.command_ignore_chance);
    LOG_PERIPH(INFO, "Fault profile: %s", profile.describe().c_str());
    return true;
}

void PeripheralSession::setNotifyEnabled(bool enabled) {
    notify_enabled_ = enabled;
    scheduler_.setPaused(!enabled);
    LOG_PERIPH(DEBUG, "Notifications %s", enabled ? "enabled" : "disabled");
}

std::optional<int> PeripheralSession::readRssi() {
    if (!config_.expose_rssi) {
        return std::nullopt;
    }
    return rssi_.read(scheduler_.getDeviceTimeMs());
}

void PeripheralSession::onCentralDisconnected() {
    setNotifyEnabled(false);
    scheduler_.stop();
}

} // namespace peripheral
} // namespace gattbench
