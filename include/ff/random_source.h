#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace ff {

class RandomSource {
public:
    virtual ~RandomSource() = default;
    // Uniform integer in [lo, hi)
    virtual int uniformInt(int lo, int hi) = 0;
    // Uniform real in [lo, hi]
    virtual double uniformReal(double lo, double hi) = 0;
};

class RandomGenerator : public RandomSource {
    std::mt19937 rng_;
public:
    explicit RandomGenerator(uint32_t seed);
    RandomGenerator();  // uses random_device

    int uniformInt(int lo, int hi) override;
    double uniformReal(double lo, double hi) override;
};

// Replays a scripted sequence. uniformInt truncates the next value,
// uniformReal returns it unchanged; the requested bounds are ignored.
class FixedRandomSource : public RandomSource {
    std::vector<double> values_;
    size_t index_ = 0;

    double next();
public:
    explicit FixedRandomSource(std::vector<double> values);

    int uniformInt(int lo, int hi) override;
    double uniformReal(double lo, double hi) override;

    size_t remaining() const { return values_.size() - index_; }
};

} // namespace ff
