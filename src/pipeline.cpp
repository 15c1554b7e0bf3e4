#include "ff/pipeline.h"
#include "ff/attribute_estimator.h"
#include "ff/feature_builder.h"
#include "ff/model_registry.h"
#include "ff/predictor.h"
#include "ff/record_io.h"
#include "ff/transition_extractor.h"
#include <iostream>
#include <stdexcept>

namespace ff {

namespace {

// Entry points may be reached without the CLI, so the config is checked here.
void checkConfig(const PipelineConfig& config) {
    try {
        validateConfig(config);
    } catch (const std::invalid_argument& e) {
        throw InvalidConfigError("config", e.what());
    }
}

} // anonymous namespace

StageError toStageError(const PipelineError& e) {
    StageError err;
    err.stage = e.stage();
    err.kind = e.kind();
    err.message = e.what();
    err.retryable = e.retryable();
    return err;
}

TrainingOutcome runTraining(const std::vector<SeasonRecord>& history,
                            const PipelineConfig& config, BlobStore& store) {
    TrainingOutcome outcome;
    try {
        checkConfig(config);
        if (history.empty()) {
            throw DataUnavailableError("ingest", "no historical season records");
        }

        // Only consulted under RESAMPLED age sampling.
        RandomGenerator ageRng(config.forest.seed);
        AttributeEstimator estimator(config, ageRng);
        FeatureBuilder builder(estimator, config.featureSchema, config.epochYear);

        TrainingSet data = extractTransitions(history, builder);
        outcome.examples = static_cast<int>(data.size());
        outcome.playersSkipped = data.playersSkipped;
        outcome.nonConsecutivePairs = data.nonConsecutivePairs;
        if (config.verbose) {
            std::cerr << "[train] " << data.size() << " examples from " << data.playersUsed
                      << " players (" << data.playersSkipped << " skipped, "
                      << data.nonConsecutivePairs << " non-consecutive pairs)\n";
        }

        TrainedModel model = trainModel(data, config);

        ModelRegistry registry(store);
        outcome.artifactId = registry.save(model);
        outcome.metadata = model.metadata;
        outcome.ok = true;

        if (config.verbose) {
            std::cerr << "[train] saved " << outcome.artifactId << "\n";
        }
    } catch (const PipelineError& e) {
        outcome.ok = false;
        outcome.error = toStageError(e);
    }
    return outcome;
}

PredictionOutcome runPrediction(const std::vector<SeasonRecord>& current,
                                const PipelineConfig& config, BlobStore& modelStore,
                                BlobStore& dataStore, RandomSource& noise) {
    PredictionOutcome outcome;
    try {
        checkConfig(config);
        if (current.empty()) {
            throw DataUnavailableError("ingest", "no current-season records to score");
        }
        outcome.seasonYear = latestSeasonYear(current);

        ModelRegistry registry(modelStore);
        LatestModelRef ref;
        if (!registry.latest(ref)) {
            throw ArtifactUnavailableError("load_model", "no latest model reference; train a model first");
        }
        TrainedModel model = registry.load(ref.modelKey);
        outcome.modelKey = ref.modelKey;

        AttributeEstimator estimator(config, noise);
        FeatureBuilder builder(estimator, config.featureSchema, config.epochYear);
        outcome.predictions = predictNextSeason(current, model, builder, config, noise, config.topN);

        outcome.predictionsKey = predictionsKey(outcome.seasonYear);
        dataStore.put(outcome.predictionsKey, serializePredictions(outcome.predictions));
        outcome.ok = true;

        if (config.verbose) {
            std::cerr << "[predict] saved " << outcome.predictions.size() << " predictions to "
                      << outcome.predictionsKey << "\n";
        }
    } catch (const PipelineError& e) {
        outcome.ok = false;
        outcome.error = toStageError(e);
    }
    return outcome;
}

bool loadLatestPredictions(const BlobStore& store, PredictionSet& out, std::string* key) {
    std::vector<std::string> keys = store.list("predictions/fantasy_predictions_");
    if (keys.empty()) return false;

    std::string payload;
    if (!store.get(keys.back(), payload)) return false;
    out = parsePredictions(payload);
    if (key) *key = keys.back();
    return true;
}

bool loadLatestHistory(const BlobStore& store, std::vector<SeasonRecord>& out, std::string* key) {
    std::vector<std::string> keys = store.list("raw_data/fantasy_stats_");
    if (keys.empty()) return false;

    std::string payload;
    if (!store.get(keys.back(), payload)) return false;
    out = parseSeasonRecords(payload);
    if (key) *key = keys.back();
    return true;
}

} // namespace ff
