#include "clock.hpp"

#include <chrono>
#include <vector>

namespace gattbench {

bool SimClock::sleepFor(uint32_t ms, const CancelToken& cancel) {
    auto wall_start = std::chrono::steady_clock::now();
    for (uint32_t i = 0; i < ms; i++) {
        if (cancel.isCancelled()) {
            return false;
        }
        step();
    }
    if (max_speedup_ > 0.0 && ms > 0) {
        auto target = std::chrono::microseconds(static_cast<int64_t>(ms * 1000.0 / max_speedup_));
        auto spent = std::chrono::steady_clock::now() - wall_start;
        if (spent < target) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(target - spent);
            if (remaining.count() > 0 && !cancel.waitFor(static_cast<uint32_t>(remaining.count()))) {
                return false;
            }
        }
    }
    return !cancel.isCancelled();
}

void SimClock::advance(uint32_t ms) {
    for (uint32_t i = 0; i < ms; i++) {
        step();
    }
}

int SimClock::addTicker(Ticker ticker) {
    int id = next_ticker_id_++;
    tickers_[id] = std::move(ticker);
    return id;
}

void SimClock::removeTicker(int id) {
    tickers_.erase(id);
}

void SimClock::step() {
    now_us_ += 1000;
    // Snapshot so a ticker may unregister itself (or others) while running
    std::vector<Ticker> snapshot;
    snapshot.reserve(tickers_.size());
    for (const auto& [id, ticker] : tickers_) {
        snapshot.push_back(ticker);
    }
    for (auto& ticker : snapshot) {
        ticker(1);
    }
}

} // namespace gattbench
