#pragma once

#include "ff/attribute_estimator.h"
#include "ff/enums.h"
#include "ff/records.h"
#include <string>
#include <vector>

namespace ff {

constexpr int NUM_BASE_FEATURES = 10;
constexpr int NUM_EXTENDED_FEATURES = 12;
constexpr int MAX_FEATURES = NUM_EXTENDED_FEATURES;

constexpr double WEIGHTED_POINTS_FACTOR = 0.8;
constexpr int PEAK_AGE = 27;

using FeatureVector = std::vector<double>;

int featureCount(FeatureSchema schema);
int schemaVersion(FeatureSchema schema);

// Ordered names matching the encoded layout.
const std::vector<std::string>& featureNames(FeatureSchema schema);

// max(0, 1 - |27 - age| * 0.05)
double ageFactor(int age);

// min(1, experience * 0.2)
double experienceFactor(int experience);

// Encode one season into the fixed layout:
//   [0] current_points      [1] weighted_points   [2..5] is_qb/rb/wr/te
//   [6] age_factor          [7] experience_factor
//   [8] rb_age_risk         [9] wr_age_peak
//   EXTENDED only: [10] years_since_epoch  [11] team_consistency
// out must point to at least featureCount(schema) doubles.
void encodeFeatures(const SeasonRecord& season, PlayerPosition position,
                    const AttributeEstimate& attrs, bool sameTeamNextSeason,
                    FeatureSchema schema, int epochYear, double* out);

// Shared by training and inference so both produce the same layout.
class FeatureBuilder {
    AttributeEstimator& estimator_;
    FeatureSchema schema_;
    int epochYear_;

public:
    FeatureBuilder(AttributeEstimator& estimator, FeatureSchema schema, int epochYear);

    // Estimates attributes for (season.playerName, position) and encodes.
    // attrsOut, if given, receives the estimate that was used.
    FeatureVector build(const SeasonRecord& season, PlayerPosition position,
                        bool sameTeamNextSeason, AttributeEstimate* attrsOut = nullptr);

    FeatureVector build(const SeasonRecord& season, PlayerPosition position,
                        const AttributeEstimate& attrs, bool sameTeamNextSeason) const;

    AttributeEstimator& estimator() { return estimator_; }
    FeatureSchema schema() const { return schema_; }
    int epochYear() const { return epochYear_; }
    int width() const { return featureCount(schema_); }
};

} // namespace ff
