#pragma once

#include "radio_link.hpp"
#include "../common/clock.hpp"
#include "../common/random_source.hpp"
#include "../peripheral/peripheral_session.hpp"
#include <deque>

namespace gattbench {
namespace client {

struct SimLinkConfig {
    std::string adapter = "hci0";
    uint32_t connect_latency_ms = 50;
    double connect_failure_chance = 0.0;   // Percent per attempt, after the scripted outcomes
    bool supports_mtu = true;
    int max_mtu = 247;
    bool supports_phy = true;
    int phy_request_failures = 0;          // Fail this many PHY requests before accepting
};

/**
 * In-process link to a PeripheralSession, driven by a SimClock.
 *
 * Registers a clock ticker so the peripheral's pacing clock advances with
 * every simulated millisecond, and delivers TX notifications synchronously
 * to the subscriber. The peripheral's simulated disconnect surfaces as a
 * link-lost callback.
 */
class SimulatedLink : public RadioLink {
public:
    SimulatedLink(SimClock& clock, peripheral::PeripheralSession& peer,
                  const SimLinkConfig& config = SimLinkConfig{},
                  uint64_t seed = 0xB1E);
    ~SimulatedLink() override;

    SimulatedLink(const SimulatedLink&) = delete;
    SimulatedLink& operator=(const SimulatedLink&) = delete;

    // Outcomes for the next connect attempts, consumed in order
    void scriptConnectOutcomes(const std::vector<AttemptOutcome>& outcomes);

    // Make the next RX writes fail (transport rejects them)
    void failNextWrites(int count) { failing_writes_ = count; }

    // Drop the link as if the radio lost it
    void simulateLinkLoss(const std::string& reason);

    AttemptOutcome connect(const std::string& target, double timeout_s,
                           const CancelToken& cancel) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    std::vector<std::string> discoverCharacteristics(const std::string& service_uuid) override;

    bool supportsMtuRequest() const override { return config_.supports_mtu; }
    std::optional<int> requestMtu(int mtu) override;
    bool supportsPhyRequest() const override { return config_.supports_phy; }
    bool requestPhy(Phy phy) override;

    bool writeCommand(const Bytes& data) override;
    bool subscribe(NotificationCallback cb) override;
    bool unsubscribe() override;
    std::optional<int> readRssi() override;

    void setLinkLostCallback(LinkLostCallback cb) override { on_link_lost_ = std::move(cb); }

    std::string lastError() const override { return last_error_; }
    const char* backendName() const override { return "simulated"; }
    std::string adapterName() const override { return config_.adapter; }

    int getConnectCalls() const { return connect_calls_; }
    int getWritesDelivered() const { return writes_delivered_; }
    Phy getActivePhy() const { return active_phy_; }
    int getNegotiatedMtu() const { return mtu_; }

private:
    bool onPeerTransmit(const Bytes& packet);
    void onPeerLinkLost(const std::string& reason);

    SimClock& clock_;
    peripheral::PeripheralSession& peer_;
    SimLinkConfig config_;
    MtRandomSource rng_;
    int ticker_id_ = 0;

    std::deque<AttemptOutcome> scripted_outcomes_;
    bool connected_ = false;
    NotificationCallback on_notification_;
    LinkLostCallback on_link_lost_;
    std::string last_error_;

    int connect_calls_ = 0;
    int writes_delivered_ = 0;
    int failing_writes_ = 0;
    int phy_failures_left_ = 0;
    Phy active_phy_ = Phy::AUTO;
    int mtu_ = 23;
};

} // namespace client
} // namespace gattbench
