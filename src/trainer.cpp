#include "ff/trainer.h"
#include "ff/errors.h"
#include "ff/random_source.h"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <iostream>
#include <numeric>
#include <stdexcept>

namespace ff {

double TrainedModel::predict(const FeatureVector& features) const {
    if (!regressor) {
        throw ArtifactUnavailableError("predict", "model has no fitted regressor");
    }
    return regressor->predict(features.data(), static_cast<int>(features.size()));
}

TrainTestSplit splitTrainTest(size_t n, double testFraction, uint32_t seed) {
    std::vector<int> order(n);
    std::iota(order.begin(), order.end(), 0);

    // Fisher-Yates
    RandomGenerator rng(seed);
    for (int i = static_cast<int>(n) - 1; i > 0; --i) {
        int j = rng.uniformInt(0, i + 1);
        std::swap(order[i], order[j]);
    }

    size_t testCount = 0;
    if (testFraction > 0.0 && testFraction < 1.0) {
        testCount = static_cast<size_t>(std::ceil(static_cast<double>(n) * testFraction));
    }
    if (testCount >= n) testCount = 0;

    TrainTestSplit split;
    split.test.assign(order.begin(), order.begin() + testCount);
    split.train.assign(order.begin() + testCount, order.end());
    return split;
}

double meanSquaredError(const std::vector<double>& truth, const std::vector<double>& predicted) {
    if (truth.empty()) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < truth.size(); ++i) {
        double d = truth[i] - predicted[i];
        sum += d * d;
    }
    return sum / static_cast<double>(truth.size());
}

double r2Score(const std::vector<double>& truth, const std::vector<double>& predicted) {
    if (truth.empty()) return 0.0;
    double mean = std::accumulate(truth.begin(), truth.end(), 0.0) / truth.size();
    double ssRes = 0.0;
    double ssTot = 0.0;
    for (size_t i = 0; i < truth.size(); ++i) {
        ssRes += (truth[i] - predicted[i]) * (truth[i] - predicted[i]);
        ssTot += (truth[i] - mean) * (truth[i] - mean);
    }
    if (ssTot == 0.0) {
        return ssRes == 0.0 ? 1.0 : 0.0;
    }
    return 1.0 - ssRes / ssTot;
}

std::string currentTimestamp() {
    std::time_t now = std::time(nullptr);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", std::localtime(&now));
    return buf;
}

TrainedModel trainModel(const TrainingSet& data, const PipelineConfig& config) {
    return trainModel(data, std::make_unique<RandomForestRegressor>(config.forest), config);
}

TrainedModel trainModel(const TrainingSet& data, std::unique_ptr<Regressor> regressor,
                        const PipelineConfig& config) {
    if (data.empty()) {
        throw InsufficientDataError("train", "no training examples: every player has fewer than "
                                             "two consecutive seasons");
    }
    if (!regressor) {
        throw std::invalid_argument("trainModel: regressor must not be null");
    }

    TrainTestSplit split = splitTrainTest(data.size(), config.testFraction, config.splitSeed);

    std::vector<FeatureVector> trainX;
    std::vector<double> trainY;
    for (int idx : split.train) {
        trainX.push_back(data.features[idx]);
        trainY.push_back(data.labels[idx]);
    }

    if (config.verbose) {
        std::cerr << "[train] fitting " << regressor->typeName() << " on "
                  << trainX.size() << " samples (" << split.test.size() << " held out)\n";
    }
    regressor->fit(trainX, trainY);

    TrainedModel model;
    ModelMetadata& meta = model.metadata;
    meta.timestamp = currentTimestamp();
    meta.modelType = regressor->typeName();
    meta.trainingSamples = static_cast<int>(data.size());
    meta.featureCount = data.width();
    meta.schema = data.schema;
    meta.epochYear = data.epochYear;
    meta.featureNames = featureNames(data.schema);

    size_t sampleSize = std::min(data.transitions.size(), static_cast<size_t>(TRANSITION_SAMPLE_SIZE));
    meta.transitionSample.assign(data.transitions.begin(), data.transitions.begin() + sampleSize);

    TrainingMetrics& metrics = meta.metrics;
    metrics.trainSamples = static_cast<int>(split.train.size());
    metrics.testSamples = static_cast<int>(split.test.size());
    metrics.evaluatedOnTrainingData = split.test.empty();

    const std::vector<int>& evalRows = split.test.empty() ? split.train : split.test;
    for (int idx : evalRows) {
        metrics.testLabels.push_back(data.labels[idx]);
        metrics.testPredictions.push_back(
            regressor->predict(data.features[idx].data(), data.width()));
    }
    metrics.mse = meanSquaredError(metrics.testLabels, metrics.testPredictions);
    metrics.rmse = std::sqrt(metrics.mse);
    metrics.r2 = r2Score(metrics.testLabels, metrics.testPredictions);

    std::vector<double> importances = regressor->featureImportances();
    for (size_t f = 0; f < meta.featureNames.size(); ++f) {
        double v = f < importances.size() ? importances[f] : 0.0;
        metrics.featureImportance.push_back({meta.featureNames[f], v});
    }

    if (config.verbose) {
        std::cerr << "[train] mse=" << metrics.mse << " rmse=" << metrics.rmse
                  << " r2=" << metrics.r2 << "\n";
    }

    model.regressor = std::move(regressor);
    return model;
}

} // namespace ff
