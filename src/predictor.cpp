#include "ff/predictor.h"
#include "ff/errors.h"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace ff {

double roundToTenth(double value) {
    return std::round(value * 10.0) / 10.0;
}

bool computePercentChange(double currentPoints, double predicted, double& out) {
    out = 0.0;
    if (currentPoints == 0.0 || !std::isfinite(currentPoints) || !std::isfinite(predicted)) {
        return false;
    }
    out = roundToTenth((predicted - currentPoints) / currentPoints * 100.0);
    return true;
}

void rankPredictions(PredictionSet& predictions, int topN) {
    std::stable_sort(predictions.begin(), predictions.end(),
                     [](const PredictionRecord& a, const PredictionRecord& b) {
                         return a.predictedNextYear > b.predictedNextYear;
                     });
    if (topN > 0 && predictions.size() > static_cast<size_t>(topN)) {
        predictions.resize(topN);
    }
}

void checkFeatureParity(const TrainedModel& model, const FeatureBuilder& builder) {
    const ModelMetadata& meta = model.metadata;
    if (meta.schema != builder.schema()) {
        throw SchemaMismatchError("predict", "model trained on feature schema v" +
                                             std::to_string(schemaVersion(meta.schema)) +
                                             ", inference builds v" +
                                             std::to_string(schemaVersion(builder.schema())));
    }
    if (meta.schema == FeatureSchema::EXTENDED && meta.epochYear != builder.epochYear()) {
        throw SchemaMismatchError("predict", "model epoch year " + std::to_string(meta.epochYear) +
                                             " differs from configured " +
                                             std::to_string(builder.epochYear()));
    }
    if (!model.regressor || model.regressor->numFeatures() != builder.width()) {
        throw SchemaMismatchError("predict", "model expects " + std::to_string(meta.featureCount) +
                                             " features, builder produces " +
                                             std::to_string(builder.width()));
    }
}

PredictionSet predictNextSeason(const std::vector<SeasonRecord>& current,
                                const TrainedModel& model, FeatureBuilder& builder,
                                const PipelineConfig& config, RandomSource& noise,
                                int topN) {
    PredictionSet predictions;
    if (current.empty()) return predictions;

    checkFeatureParity(model, builder);

    predictions.reserve(current.size());
    for (auto& season : current) {
        AttributeEstimate attrs;
        FeatureVector features = builder.build(season, season.position, true, &attrs);
        double raw = model.predict(features);

        double v = config.variance(season.position);
        double predicted = raw * noise.uniformReal(1.0 - v, 1.0 + v);

        PredictionRecord rec;
        rec.player = season.playerName;
        rec.position = season.position;
        rec.team = season.team;
        rec.currentPoints = season.fantasyPoints;
        rec.predictedNextYear = roundToTenth(predicted);
        rec.hasPercentChange = computePercentChange(rec.currentPoints, rec.predictedNextYear,
                                                    rec.percentChange);
        rec.confidence = roundToTenth(noise.uniformReal(config.confidenceMin, config.confidenceMax));
        rec.age = attrs.age;
        rec.experience = attrs.experience;
        predictions.push_back(rec);
    }

    rankPredictions(predictions, topN);

    if (config.verbose) {
        std::cerr << "[predict] scored " << current.size() << " players, kept "
                  << predictions.size() << "\n";
    }
    return predictions;
}

} // namespace ff
