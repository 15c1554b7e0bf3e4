#pragma once

#include "ff/config.h"
#include "ff/feature_builder.h"
#include "ff/random_source.h"
#include "ff/records.h"
#include "ff/trainer.h"
#include <vector>

namespace ff {

// Round half away from zero to one decimal place.
double roundToTenth(double value);

// (predicted - current) / current * 100, rounded to one decimal.
// Returns false and leaves out at 0 when current is 0 (or not finite).
bool computePercentChange(double currentPoints, double predicted, double& out);

// Stable sort by predictedNextYear descending, then keep the first topN (0 = all).
void rankPredictions(PredictionSet& predictions, int topN);

// Throws SchemaMismatchError unless the builder produces exactly the layout
// the model was trained on (schema version, epoch year, width).
void checkFeatureParity(const TrainedModel& model, const FeatureBuilder& builder);

// Scores each current-season record with the model, scales each raw
// prediction by uniform[1 - v, 1 + v] (v from config.positionVariance) and
// assigns a uniform[confidenceMin, confidenceMax] confidence. Team
// consistency is assumed at inference since next season's team is unknown.
// Empty input yields an empty set.
PredictionSet predictNextSeason(const std::vector<SeasonRecord>& current,
                                const TrainedModel& model, FeatureBuilder& builder,
                                const PipelineConfig& config, RandomSource& noise,
                                int topN = 0);

} // namespace ff
