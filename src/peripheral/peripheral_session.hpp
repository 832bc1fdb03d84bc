#pragma once

#include "command_processor.hpp"
#include "fault_profile.hpp"
#include "notification_scheduler.hpp"
#include "rssi_synth.hpp"
#include "../common/random_source.hpp"
#include "../protocol/wire_format.hpp"
#include <memory>

namespace gattbench {
namespace peripheral {

struct PeripheralConfig {
    SchedulerConfig scheduler;
    protocol::CommandOpcodes opcodes;
    uint64_t seed = 0x5EED;          // Used when no random source is injected
    bool expose_rssi = true;         // Optional RSSI characteristic present
};

/**
 * The peripheral's whole streaming state in one owned object: fault
 * profile, random source, scheduler, command processor, RSSI synthesizer.
 *
 * Only one stream exists per session. Destroying the session stops it, so
 * nothing leaks from one logical test run into the next.
 */
class PeripheralSession {
public:
    explicit PeripheralSession(const PeripheralConfig& config = PeripheralConfig{},
                               std::unique_ptr<RandomSource> rng = nullptr);
    ~PeripheralSession();

    PeripheralSession(const PeripheralSession&) = delete;
    PeripheralSession& operator=(const PeripheralSession&) = delete;

    // Install the trial's fault profile. Refused (false) while streaming.
    bool configure(const FaultProfile& profile);
    const FaultProfile& getProfile() const { return scheduler_.getFaultProfile(); }

    // --- GATT surface ---

    // RX characteristic write
    void handleWrite(ByteSpan data) { commands_.handleWrite(data); }

    // TX characteristic CCCD
    void setNotifyEnabled(bool enabled);
    bool isNotifyEnabled() const { return notify_enabled_; }

    // RSSI characteristic read. Empty when the characteristic is not exposed.
    std::optional<int> readRssi();
    bool exposesRssi() const { return config_.expose_rssi; }

    // Central went away: stream stops, no link-lost callback
    void onCentralDisconnected();

    void tick(uint32_t elapsed_ms) { scheduler_.tick(elapsed_ms); }

    void setTransmitCallback(NotificationScheduler::TransmitCallback cb) {
        scheduler_.setTransmitCallback(std::move(cb));
    }
    void setLinkLostCallback(NotificationScheduler::LinkLostCallback cb) {
        scheduler_.setLinkLostCallback(std::move(cb));
    }

    NotificationScheduler& scheduler() { return scheduler_; }
    const NotificationScheduler& scheduler() const { return scheduler_; }
    CommandProcessor& commands() { return commands_; }
    RssiSynthesizer& rssi() { return rssi_; }
    RandomSource& random() { return *rng_; }

private:
    PeripheralConfig config_;
    std::unique_ptr<RandomSource> rng_;
    RssiSynthesizer rssi_;
    NotificationScheduler scheduler_;
    CommandProcessor commands_;
    bool notify_enabled_ = false;
};

} // namespace peripheral
} // namespace gattbench
