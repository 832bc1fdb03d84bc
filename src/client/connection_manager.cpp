#include "connection_manager.hpp"
#include "gattbench/errors.hpp"
#include "gattbench/logging.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace gattbench {
namespace client {

ConnectionManager::ConnectionManager(RadioLink& link, Clock& clock, const CancelToken& cancel)
    : link_(link), clock_(clock), cancel_(cancel) {
}

void ConnectionManager::connect(const ConnectParams& params) {
    if (params.max_attempts < 1) {
        throw ConfigError("max_attempts must be at least 1");
    }
    if (params.timeout_s <= 0.0 || params.retry_delay_s < 0.0) {
        throw ConfigError("connect timeout must be positive and retry delay non-negative");
    }

    report_ = LinkReport{};
    uint32_t retry_delay_ms = static_cast<uint32_t>(std::lround(params.retry_delay_s * 1000.0));

    for (int attempt = 1; attempt <= params.max_attempts; attempt++) {
        if (cancel_.isCancelled()) {
            throw CancelledError();
        }

        double started = clock_.nowSeconds();
        AttemptOutcome outcome = link_.connect(params.target, params.timeout_s, cancel_);
        double elapsed = clock_.nowSeconds() - started;

        if (cancel_.isCancelled()) {
            link_.disconnect();
            throw CancelledError();
        }

        ConnectionAttempt record;
        record.attempt_index = attempt;
        record.timeout_s = params.timeout_s;
        record.outcome = outcome;
        record.elapsed_s = elapsed;
        if (outcome != AttemptOutcome::SUCCESS) {
            record.error = link_.lastError();
        }
        report_.attempts.push_back(record);

        if (outcome == AttemptOutcome::SUCCESS) {
            LOG_CLIENT(INFO, "Connected to %s on attempt %d/%d (%.2fs)",
                       params.target.c_str(), attempt, params.max_attempts, elapsed);
            return;
        }

        // Release whatever half-open state the failed attempt left behind
        link_.disconnect();
        LOG_CLIENT(WARN, "Connection attempt %d/%d to %s failed: %s (%s)",
                   attempt, params.max_attempts, params.target.c_str(),
                   attemptOutcomeToString(outcome), record.error.c_str());

        if (attempt < params.max_attempts && !clock_.sleepFor(retry_delay_ms, cancel_)) {
            throw CancelledError();
        }
    }

    char msg[256];
    snprintf(msg, sizeof(msg), "could not reach %s after %d attempts (%s)",
             params.target.c_str(), params.max_attempts,
             report_.attempts.empty() ? "" : report_.attempts.back().error.c_str());
    throw ConnectionExhaustedError(msg, report_.attempts);
}

void ConnectionManager::negotiate(const NegotiationParams& params) {
    negotiateMtu(params.mtu);
    negotiatePhy(params.phy, params.phy_attempts);
}

void ConnectionManager::negotiateMtu(int mtu) {
    MtuResult& result = report_.mtu;
    result = MtuResult{};
    result.requested = mtu;

    if (!link_.supportsMtuRequest()) {
        result.status = "unsupported";
        report_.warnings.push_back("MTU request unsupported by backend");
        LOG_CLIENT(INFO, "MTU request unsupported by %s backend", link_.backendName());
        return;
    }

    auto negotiated = link_.requestMtu(mtu);
    if (negotiated) {
        result.status = "success";
        result.negotiated = negotiated;
        LOG_CLIENT(INFO, "MTU negotiated: %d (requested %d)", *negotiated, mtu);
    } else {
        result.status = "failed";
        result.error = link_.lastError();
        report_.warnings.push_back("MTU request failed: " + result.error);
        LOG_CLIENT(WARN, "MTU request failed: %s", result.error.c_str());
    }
}

void ConnectionManager::negotiatePhy(const std::string& phy_name, int attempts) {
    PhyResult& result = report_.phy;
    result = PhyResult{};
    result.requested = phy_name;

    Phy phy = Phy::AUTO;
    if (!parsePhy(phy_name, phy)) {
        result.status = "failed";
        result.error = "unknown PHY '" + phy_name + "'";
        report_.warnings.push_back(result.error);
        return;
    }
    if (phy == Phy::AUTO) {
        result.status = "skipped";
        return;
    }
    if (!link_.supportsPhyRequest()) {
        result.status = "unsupported";
        report_.warnings.push_back("PHY request unsupported by backend");
        return;
    }

    for (int attempt = 1; attempt <= std::max(1, attempts); attempt++) {
        result.attempts_used = attempt;
        if (link_.requestPhy(phy)) {
            result.status = "success";
            result.error.clear();
            LOG_CLIENT(INFO, "PHY %s accepted on attempt %d", phyToString(phy), attempt);
            return;
        }
        result.status = "failed";
        result.error = link_.lastError();
        LOG_CLIENT(DEBUG, "PHY %s attempt %d failed: %s", phyToString(phy), attempt, result.error.c_str());
    }

    report_.warnings.push_back("PHY " + phy_name + " request failed: " + result.error);
    LOG_CLIENT(WARN, "PHY %s not accepted after %d attempts, falling back to auto",
               phyToString(phy), result.attempts_used);
    if (link_.requestPhy(Phy::AUTO)) {
        result.fallback_auto = true;
    }
}

void ConnectionManager::disconnect() {
    if (link_.isConnected()) {
        link_.disconnect();
        LOG_CLIENT(DEBUG, "Link released");
    }
}

} // namespace client
} // namespace gattbench
