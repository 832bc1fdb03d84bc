#include "random_source.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace gattbench {

bool RandomSource::chancePercent(double percent) {
    if (percent <= 0.0) {
        return false;
    }
    if (percent >= 100.0) {
        return true;
    }
    return uniform() * 100.0 < percent;
}

int RandomSource::uniformInt(int lo, int hi) {
    if (hi <= lo) {
        return lo;
    }
    int span = hi - lo + 1;
    int offset = static_cast<int>(std::floor(uniform() * span));
    return lo + std::clamp(offset, 0, span - 1);
}

double RandomSource::uniformRange(double lo, double hi) {
    if (hi <= lo) {
        return lo;
    }
    return lo + uniform() * (hi - lo);
}

MtRandomSource::MtRandomSource(uint64_t seed)
    : rng_(seed) {
}

double MtRandomSource::uniform() {
    return dist_(rng_);
}

ScriptedRandomSource::ScriptedRandomSource(std::vector<double> values, double fallback)
    : values_(std::move(values)), fallback_(fallback) {
}

double ScriptedRandomSource::uniform() {
    draws_++;
    if (values_.empty()) {
        return fallback_;
    }
    if (pos_ >= values_.size()) {
        if (!wrap_) {
            return fallback_;
        }
        pos_ = 0;
    }
    return values_[pos_++];
}

} // namespace gattbench
