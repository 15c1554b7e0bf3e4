#pragma once

#include "ff/blob_store.h"
#include "ff/config.h"
#include "ff/errors.h"
#include "ff/random_source.h"
#include "ff/records.h"
#include "ff/trainer.h"
#include <string>
#include <vector>

namespace ff {

// A stage failure as a value, for hosts that must not see exceptions.
struct StageError {
    std::string stage;
    ErrorKind kind = ErrorKind::DATA_UNAVAILABLE;
    std::string message;
    bool retryable = false;
};

StageError toStageError(const PipelineError& e);

struct TrainingOutcome {
    bool ok = false;
    StageError error;          // set when !ok
    std::string artifactId;
    ModelMetadata metadata;
    int examples = 0;
    int playersSkipped = 0;
    int nonConsecutivePairs = 0;
};

struct PredictionOutcome {
    bool ok = false;
    StageError error;          // set when !ok
    PredictionSet predictions; // ranked, truncated to config.topN
    std::string modelKey;
    std::string predictionsKey;
    int seasonYear = 0;
};

// history -> training examples -> fitted model -> registry.
// Nothing is written when no example can be built.
TrainingOutcome runTraining(const std::vector<SeasonRecord>& history,
                            const PipelineConfig& config, BlobStore& store);

// Scores current-season records with the latest model in modelStore and
// writes the ranked set to dataStore under
// predictions/fantasy_predictions_<season year>.json. The two stores may be
// the same object.
PredictionOutcome runPrediction(const std::vector<SeasonRecord>& current,
                                const PipelineConfig& config, BlobStore& modelStore,
                                BlobStore& dataStore, RandomSource& noise);

// Reads the newest predictions/ entry. False when none has been written.
bool loadLatestPredictions(const BlobStore& store, PredictionSet& out,
                           std::string* key = nullptr);

// Reads the newest raw_data/ snapshot. False when none has been written.
bool loadLatestHistory(const BlobStore& store, std::vector<SeasonRecord>& out,
                       std::string* key = nullptr);

} // namespace ff
