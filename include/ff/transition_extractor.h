#pragma once

#include "ff/feature_builder.h"
#include "ff/records.h"
#include <vector>

namespace ff {

// Parallel arrays: features[i] -> labels[i], provenance in transitions[i].
struct TrainingSet {
    FeatureSchema schema = FeatureSchema::EXTENDED;
    int epochYear = 2019;
    std::vector<FeatureVector> features;
    std::vector<double> labels;
    std::vector<TransitionInfo> transitions;

    int playersUsed = 0;
    int playersSkipped = 0;       // fewer than 2 seasons
    int nonConsecutivePairs = 0;  // gap or duplicate seasons

    size_t size() const { return labels.size(); }
    bool empty() const { return labels.empty(); }
    int width() const { return featureCount(schema); }
};

// Group by player, sort each history by year, and emit one example per
// consecutive season pair (year i features -> year i+1 points). Each player's
// attributes are estimated once, using the most recent recorded position.
TrainingSet extractTransitions(const std::vector<SeasonRecord>& history, FeatureBuilder& builder);

} // namespace ff
