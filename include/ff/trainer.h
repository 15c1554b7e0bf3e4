#pragma once

#include "ff/config.h"
#include "ff/regressor.h"
#include "ff/transition_extractor.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ff {

constexpr int TRANSITION_SAMPLE_SIZE = 10;

struct FeatureImportance {
    std::string feature;
    double importance = 0.0;
};

struct TrainingMetrics {
    double mse = 0.0;
    double rmse = 0.0;
    double r2 = 0.0;
    std::vector<FeatureImportance> featureImportance;  // layout order
    int trainSamples = 0;
    int testSamples = 0;
    bool evaluatedOnTrainingData = false;  // held-out partition was empty

    std::vector<double> testLabels;
    std::vector<double> testPredictions;
};

struct ModelMetadata {
    std::string timestamp;  // YYYYmmdd_HHMMSS
    std::string modelType;
    int trainingSamples = 0;
    int featureCount = 0;
    FeatureSchema schema = FeatureSchema::EXTENDED;
    int epochYear = 2019;
    std::vector<std::string> featureNames;
    TrainingMetrics metrics;
    std::vector<TransitionInfo> transitionSample;  // first few, for provenance
};

// Immutable once trained; a newer model supersedes it rather than modifying it.
struct TrainedModel {
    ModelMetadata metadata;
    std::unique_ptr<Regressor> regressor;

    double predict(const FeatureVector& features) const;
};

struct TrainTestSplit {
    std::vector<int> train;
    std::vector<int> test;
};

// Seeded shuffle, then the first ceil(n * testFraction) rows are held out.
// If that leaves nothing to train on, everything goes to train.
TrainTestSplit splitTrainTest(size_t n, double testFraction, uint32_t seed);

double meanSquaredError(const std::vector<double>& truth, const std::vector<double>& predicted);

// 1 - SS_res / SS_tot. Constant truth gives 1 for a perfect fit, else 0.
double r2Score(const std::vector<double>& truth, const std::vector<double>& predicted);

// Local time, YYYYmmdd_HHMMSS
std::string currentTimestamp();

// Fits a RandomForestRegressor built from config.forest.
// Throws InsufficientDataError when data is empty.
TrainedModel trainModel(const TrainingSet& data, const PipelineConfig& config);

// Same, with a caller-supplied (unfitted) regressor.
TrainedModel trainModel(const TrainingSet& data, std::unique_ptr<Regressor> regressor,
                        const PipelineConfig& config);

} // namespace ff
