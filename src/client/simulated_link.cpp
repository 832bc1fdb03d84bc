#include "simulated_link.hpp"
#include "gattbench/logging.hpp"
#include <algorithm>
#include <cmath>

namespace gattbench {
namespace client {

SimulatedLink::SimulatedLink(SimClock& clock, peripheral::PeripheralSession& peer,
                             const SimLinkConfig& config, uint64_t seed)
    : clock_(clock), peer_(peer), config_(config), rng_(seed),
      phy_failures_left_(config.phy_request_failures) {
    ticker_id_ = clock_.addTicker([this](uint32_t elapsed_ms) { peer_.tick(elapsed_ms); });
    peer_.setTransmitCallback([this](const Bytes& packet) { return onPeerTransmit(packet); });
    peer_.setLinkLostCallback([this](const std::string& reason) { onPeerLinkLost(reason); });
}

SimulatedLink::~SimulatedLink() {
    clock_.removeTicker(ticker_id_);
    peer_.setTransmitCallback(nullptr);
    peer_.setLinkLostCallback(nullptr);
    if (connected_) {
        peer_.onCentralDisconnected();
    }
}

void SimulatedLink::scriptConnectOutcomes(const std::vector<AttemptOutcome>& outcomes) {
    scripted_outcomes_.insert(scripted_outcomes_.end(), outcomes.begin(), outcomes.end());
}

// ============================================================================
// Connection lifecycle
// ============================================================================

AttemptOutcome SimulatedLink::connect(const std::string& target, double timeout_s,
                                      const CancelToken& cancel) {
    connect_calls_++;
    last_error_.clear();
    if (connected_) {
        return AttemptOutcome::SUCCESS;
    }

    AttemptOutcome outcome = AttemptOutcome::SUCCESS;
    if (!scripted_outcomes_.empty()) {
        outcome = scripted_outcomes_.front();
        scripted_outcomes_.pop_front();
    } else if (rng_.chancePercent(config_.connect_failure_chance)) {
        outcome = AttemptOutcome::ERROR;
    }

    uint32_t timeout_ms = static_cast<uint32_t>(std::max(0.0, std::round(timeout_s * 1000.0)));
    uint32_t wait_ms = outcome == AttemptOutcome::TIMEOUT
        ? timeout_ms
        : std::min(config_.connect_latency_ms, timeout_ms);
    if (!clock_.sleepFor(wait_ms, cancel)) {
        last_error_ = "cancelled";
        return AttemptOutcome::ERROR;
    }

    switch (outcome) {
        case AttemptOutcome::SUCCESS:
            connected_ = true;
            mtu_ = 23;
            active_phy_ = Phy::AUTO;
            LOG_CLIENT(DEBUG, "[sim] Connected to %s via %s", target.c_str(), config_.adapter.c_str());
            break;
        case AttemptOutcome::TIMEOUT:
            last_error_ = "connection attempt timed out";
            break;
        case AttemptOutcome::ERROR:
            last_error_ = "le-connection-abort-by-local";
            break;
    }
    return outcome;
}

void SimulatedLink::disconnect() {
    if (!connected_) {
        return;
    }
    connected_ = false;
    on_notification_ = nullptr;
    peer_.onCentralDisconnected();
    LOG_CLIENT(DEBUG, "[sim] Disconnected");
}

void SimulatedLink::simulateLinkLoss(const std::string& reason) {
    if (!connected_) {
        return;
    }
    peer_.onCentralDisconnected();
    onPeerLinkLost(reason);
}

void SimulatedLink::onPeerLinkLost(const std::string& reason) {
    if (!connected_) {
        return;
    }
    connected_ = false;
    on_notification_ = nullptr;
    last_error_ = reason;
    LOG_CLIENT(WARN, "[sim] Link lost: %s", reason.c_str());
    if (on_link_lost_) {
        on_link_lost_(reason);
    }
}

// ============================================================================
// GATT operations
// ============================================================================

std::vector<std::string> SimulatedLink::discoverCharacteristics(const std::string& service_uuid) {
    if (!connected_ || service_uuid != SERVICE_UUID) {
        return {};
    }
    std::vector<std::string> chars = {TX_CHAR_UUID, RX_CHAR_UUID};
    if (peer_.exposesRssi()) {
        chars.push_back(RSSI_CHAR_UUID);
    }
    return chars;
}

std::optional<int> SimulatedLink::requestMtu(int mtu) {
    if (!connected_) {
        last_error_ = "not connected";
        return std::nullopt;
    }
    if (!config_.supports_mtu) {
        last_error_ = "MTU exchange not supported";
        return std::nullopt;
    }
    mtu_ = std::clamp(mtu, 23, config_.max_mtu);
    return mtu_;
}

bool SimulatedLink::requestPhy(Phy phy) {
    if (!connected_) {
        last_error_ = "not connected";
        return false;
    }
    if (!config_.supports_phy) {
        last_error_ = "PHY update not supported";
        return false;
    }
    if (phy_failures_left_ > 0) {
        phy_failures_left_--;
        last_error_ = "PHY update rejected by controller";
        return false;
    }
    active_phy_ = phy;
    return true;
}

bool SimulatedLink::writeCommand(const Bytes& data) {
    if (!connected_) {
        last_error_ = "not connected";
        return false;
    }
    if (failing_writes_ > 0) {
        failing_writes_--;
        last_error_ = "write rejected by transport";
        return false;
    }
    writes_delivered_++;
    peer_.handleWrite(data);
    return true;
}

bool SimulatedLink::subscribe(NotificationCallback cb) {
    if (!connected_) {
        last_error_ = "not connected";
        return false;
    }
    on_notification_ = std::move(cb);
    peer_.setNotifyEnabled(true);
    return true;
}

bool SimulatedLink::unsubscribe() {
    if (!connected_) {
        last_error_ = "not connected";
        return false;
    }
    on_notification_ = nullptr;
    peer_.setNotifyEnabled(false);
    return true;
}

std::optional<int> SimulatedLink::readRssi() {
    if (!connected_) {
        return std::nullopt;
    }
    return peer_.readRssi();
}

bool SimulatedLink::onPeerTransmit(const Bytes& packet) {
    if (connected_ && on_notification_) {
        on_notification_(packet);
    }
    return true;
}

} // namespace client
} // namespace gattbench
