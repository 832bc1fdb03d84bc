#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace gattbench {

/**
 * Single source of every probabilistic decision on the peripheral side.
 *
 * Helpers draw nothing when the decision is disabled (probability 0, empty
 * range), so a scripted source only has to supply values for the faults a
 * test actually enables.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform in [0, 1)
    virtual double uniform() = 0;

    // True with the given probability in percent [0, 100]
    bool chancePercent(double percent);

    // Uniform integer in [lo, hi]
    int uniformInt(int lo, int hi);

    // Uniform real in [lo, hi)
    double uniformRange(double lo, double hi);
};

// Seeded Mersenne Twister
class MtRandomSource : public RandomSource {
public:
    explicit MtRandomSource(uint64_t seed = 0x5EED);
    double uniform() override;
    void reseed(uint64_t seed) { rng_.seed(seed); }

private:
    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

// Replays a fixed list of draws, then the fallback, for exact-outcome tests
class ScriptedRandomSource : public RandomSource {
public:
    explicit ScriptedRandomSource(std::vector<double> values, double fallback = 0.999999);

    double uniform() override;

    // Start over once the script is exhausted instead of returning the fallback
    void setWrap(bool wrap) { wrap_ = wrap; }
    size_t drawCount() const { return draws_; }

private:
    std::vector<double> values_;
    double fallback_;
    bool wrap_ = false;
    size_t pos_ = 0;
    size_t draws_ = 0;
};

} // namespace gattbench
