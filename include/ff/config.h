#pragma once

#include "ff/enums.h"
#include <array>
#include <cstdint>
#include <string>

namespace ff {

// Half-open [lo, hi) age interval used by the attribute estimator.
struct AgeRange {
    int lo;
    int hi;
};

using AgeRangeTable = std::array<AgeRange, NUM_POSITIONS>;
using VarianceTable = std::array<double, NUM_POSITIONS>;

struct ForestParams {
    int numTrees = 200;
    int maxDepth = 12;
    int minSamplesSplit = 5;
    int minSamplesLeaf = 2;
    uint32_t seed = 42;
};

struct PipelineConfig {
    std::string dataDir = "data";    // historical feeds and predictions
    std::string modelDir = "models"; // model artifacts and latest pointer

    int epochYear = 2019;
    FeatureSchema featureSchema = FeatureSchema::EXTENDED;
    AgeSampling ageSampling = AgeSampling::IDENTITY_STABLE;

    // Indexed by PlayerPosition: QB, RB, WR, TE, OTHER
    AgeRangeTable ageRanges = {{{25, 35}, {22, 28}, {23, 30}, {23, 29}, {24, 29}}};
    VarianceTable positionVariance = {{0.15, 0.25, 0.20, 0.30, 0.20}};

    double confidenceMin = 70.0;
    double confidenceMax = 95.0;
    int topN = 50;

    ForestParams forest;
    double testFraction = 0.2;
    uint32_t splitSeed = 42;
    uint32_t predictionSeed = 0;  // 0 = random_device

    bool verbose = false;

    const AgeRange& ageRange(PlayerPosition p) const { return ageRanges[positionIndex(p)]; }
    double variance(PlayerPosition p) const { return positionVariance[positionIndex(p)]; }
};

// Throws std::invalid_argument describing the first bad field.
void validateConfig(const PipelineConfig& config);

// Absent keys keep their defaults. Throws std::invalid_argument on bad values.
PipelineConfig parsePipelineConfig(const std::string& json);

// Throws std::runtime_error if the file cannot be opened.
PipelineConfig loadPipelineConfig(const std::string& path);

} // namespace ff
