#include "ff/attribute_estimator.h"
#include <algorithm>

namespace ff {

int experienceForAge(int age) {
    return std::max(1, age - 22);
}

uint64_t playerIdentityHash(const std::string& playerName, PlayerPosition position) {
    const uint64_t FNV_OFFSET = 14695981039346656037ULL;
    const uint64_t FNV_PRIME = 1099511628211ULL;

    std::string key = playerName + "|" + positionName(position);
    uint64_t hash = FNV_OFFSET;
    for (unsigned char c : key) {
        hash ^= c;
        hash *= FNV_PRIME;
    }
    return hash;
}

AttributeEstimator::AttributeEstimator(const PipelineConfig& config, RandomSource& rng)
    : ranges_(config.ageRanges), sampling_(config.ageSampling), rng_(rng) {}

AttributeEstimator::AttributeEstimator(const AgeRangeTable& ranges, AgeSampling sampling,
                                       RandomSource& rng)
    : ranges_(ranges), sampling_(sampling), rng_(rng) {}

AttributeEstimate AttributeEstimator::estimate(const std::string& playerName,
                                               PlayerPosition position) {
    const AgeRange& range = ranges_[positionIndex(position)];
    int span = std::max(1, range.hi - range.lo);

    AttributeEstimate est;
    if (sampling_ == AgeSampling::RESAMPLED) {
        est.age = rng_.uniformInt(range.lo, range.lo + span);
    } else {
        uint64_t hash = playerIdentityHash(playerName, position);
        est.age = range.lo + static_cast<int>(hash % static_cast<uint64_t>(span));
    }
    est.experience = experienceForAge(est.age);
    return est;
}

} // namespace ff
