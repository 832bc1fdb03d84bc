#pragma once

#include "radio_link.hpp"
#include "../common/cancel_token.hpp"
#include "../common/clock.hpp"
#include "gattbench/records.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gattbench {
namespace client {

struct ConnectParams {
    std::string target;
    double timeout_s = 30.0;
    int max_attempts = 5;
    double retry_delay_s = 10.0;
};

struct NegotiationParams {
    int mtu = 247;
    std::string phy = "auto";
    int phy_attempts = 3;
};

// Outcome of the best-effort MTU exchange
struct MtuResult {
    int requested = 0;
    std::string status;                 // "success", "failed", "unsupported"
    std::optional<int> negotiated;
    std::string error;
};

// Outcome of the best-effort PHY update
struct PhyResult {
    std::string requested;
    std::string status;                 // "skipped", "success", "failed", "unsupported"
    int attempts_used = 0;
    bool fallback_auto = false;         // Auto requested after the preferred PHY failed
    std::string error;
};

struct LinkReport {
    std::vector<ConnectionAttempt> attempts;
    MtuResult mtu;
    PhyResult phy;
    std::vector<std::string> warnings;

    int attemptsUsed() const { return static_cast<int>(attempts.size()); }
};

/**
 * ConnectionManager - Connect / retry / negotiate for one trial
 *
 * connect() runs attempts sequentially with a cancellable retry delay and
 * records every attempt. Exhaustion throws ConnectionExhaustedError with
 * the full history; a cancelled wait throws CancelledError. negotiate()
 * never fails the trial: problems become warnings in the report.
 */
class ConnectionManager {
public:
    ConnectionManager(RadioLink& link, Clock& clock, const CancelToken& cancel);

    void connect(const ConnectParams& params);
    void negotiate(const NegotiationParams& params);

    // Idempotent; safe on every exit path
    void disconnect();

    bool isConnected() const { return link_.isConnected(); }
    const LinkReport& getReport() const { return report_; }
    RadioLink& link() { return link_; }

private:
    void negotiateMtu(int mtu);
    void negotiatePhy(const std::string& phy, int attempts);

    RadioLink& link_;
    Clock& clock_;
    const CancelToken& cancel_;
    LinkReport report_;
};

// Scoped release: disconnects the link when the trial scope unwinds,
// whether it returns, throws or is cancelled.
class LinkGuard {
public:
    explicit LinkGuard(ConnectionManager& manager) : manager_(manager) {}
    ~LinkGuard() { manager_.disconnect(); }

    LinkGuard(const LinkGuard&) = delete;
    LinkGuard& operator=(const LinkGuard&) = delete;

private:
    ConnectionManager& manager_;
};

} // namespace client
} // namespace gattbench
