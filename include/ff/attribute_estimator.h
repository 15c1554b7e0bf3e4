#pragma once

#include "ff/config.h"
#include "ff/random_source.h"
#include "ff/records.h"
#include <cstdint>
#include <string>

namespace ff {

// experience = max(1, age - 22)
int experienceForAge(int age);

// 64-bit FNV-1a over "name|POS"; the identity key for stable sampling.
uint64_t playerIdentityHash(const std::string& playerName, PlayerPosition position);

// Synthetic age/experience for players without biographical data.
// The age is drawn from the position's [lo, hi) interval in the config.
class AttributeEstimator {
    AgeRangeTable ranges_;
    AgeSampling sampling_;
    RandomSource& rng_;  // used only when sampling_ == RESAMPLED

public:
    AttributeEstimator(const PipelineConfig& config, RandomSource& rng);
    AttributeEstimator(const AgeRangeTable& ranges, AgeSampling sampling, RandomSource& rng);

    AttributeEstimate estimate(const std::string& playerName, PlayerPosition position);

    AgeSampling sampling() const { return sampling_; }
};

} // namespace ff
