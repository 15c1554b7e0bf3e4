#include "ff/random_source.h"
#include <stdexcept>

namespace ff {

// --- RandomGenerator ---

RandomGenerator::RandomGenerator(uint32_t seed) : rng_(seed) {}

RandomGenerator::RandomGenerator() : rng_(std::random_device{}()) {}

int RandomGenerator::uniformInt(int lo, int hi) {
    if (hi <= lo + 1) return lo;
    std::uniform_int_distribution<int> dist(lo, hi - 1);
    return dist(rng_);
}

double RandomGenerator::uniformReal(double lo, double hi) {
    if (hi <= lo) return lo;
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

// --- FixedRandomSource ---

FixedRandomSource::FixedRandomSource(std::vector<double> values)
    : values_(std::move(values)) {}

double FixedRandomSource::next() {
    if (index_ >= values_.size()) {
        throw std::out_of_range("FixedRandomSource: no more values");
    }
    return values_[index_++];
}

int FixedRandomSource::uniformInt(int, int) { return static_cast<int>(next()); }
double FixedRandomSource::uniformReal(double, double) { return next(); }

} // namespace ff
