#pragma once

#include "cancel_token.hpp"
#include <cstdint>
#include <functional>
#include <map>

namespace gattbench {

// Time source for every suspension point in a trial (connect waits, retry
// delays, notification polling). All sleeps are cancellable.
class Clock {
public:
    virtual ~Clock() = default;

    virtual uint64_t nowUs() const = 0;

    // Returns false if the token was cancelled before the full wait elapsed
    virtual bool sleepFor(uint32_t ms, const CancelToken& cancel) = 0;

    double nowSeconds() const { return nowUs() / 1e6; }
};

/**
 * Virtual time for in-process simulation.
 *
 * Time moves only inside sleepFor()/advance(), in 1 ms steps. Each step runs
 * every registered ticker with elapsed_ms = 1, which is how the simulated
 * peripheral gets its pacing clock. With a max speedup set, steps are also
 * paced against the wall clock (1.0 = real time, 10.0 = ten times faster).
 */
class SimClock : public Clock {
public:
    using Ticker = std::function<void(uint32_t elapsed_ms)>;

    SimClock() = default;

    uint64_t nowUs() const override { return now_us_; }
    bool sleepFor(uint32_t ms, const CancelToken& cancel) override;

    // Advance without a cancel check (tests)
    void advance(uint32_t ms);

    int addTicker(Ticker ticker);
    void removeTicker(int id);

    // 0 = run as fast as possible (default)
    void setMaxSpeedup(double speedup) { max_speedup_ = speedup; }
    double getMaxSpeedup() const { return max_speedup_; }

private:
    void step();

    uint64_t now_us_ = 0;
    double max_speedup_ = 0.0;
    int next_ticker_id_ = 1;
    std::map<int, Ticker> tickers_;
};

} // namespace gattbench
