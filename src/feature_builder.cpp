#include "ff/feature_builder.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace ff {

namespace {

inline double oneHot(bool v) {
    return v ? 1.0 : 0.0;
}

// Unparsable upstream values must not leak NaN into the model.
inline double sanitizePoints(double points) {
    if (!std::isfinite(points) || points < 0.0) return 0.0;
    return points;
}

} // anonymous namespace

int featureCount(FeatureSchema schema) {
    return schema == FeatureSchema::EXTENDED ? NUM_EXTENDED_FEATURES : NUM_BASE_FEATURES;
}

int schemaVersion(FeatureSchema schema) {
    return static_cast<int>(schema);
}

const std::vector<std::string>& featureNames(FeatureSchema schema) {
    static const std::vector<std::string> base = {
        "current_points", "weighted_points", "qb", "rb", "wr", "te",
        "age_factor", "experience_factor", "rb_age_risk", "wr_age_peak"
    };
    static const std::vector<std::string> extended = {
        "current_points", "weighted_points", "qb", "rb", "wr", "te",
        "age_factor", "experience_factor", "rb_age_risk", "wr_age_peak",
        "years_since_epoch", "team_consistency"
    };
    return schema == FeatureSchema::EXTENDED ? extended : base;
}

double ageFactor(int age) {
    return std::max(0.0, 1.0 - std::abs(PEAK_AGE - age) * 0.05);
}

double experienceFactor(int experience) {
    return std::min(1.0, experience * 0.2);
}

void encodeFeatures(const SeasonRecord& season, PlayerPosition position,
                    const AttributeEstimate& attrs, bool sameTeamNextSeason,
                    FeatureSchema schema, int epochYear, double* out) {
    double points = sanitizePoints(season.fantasyPoints);

    // [0-1] Scoring
    out[0] = points;
    out[1] = points * WEIGHTED_POINTS_FACTOR;

    // [2-5] Position one-hot; OTHER stays all zeros
    out[2] = oneHot(position == PlayerPosition::QB);
    out[3] = oneHot(position == PlayerPosition::RB);
    out[4] = oneHot(position == PlayerPosition::WR);
    out[5] = oneHot(position == PlayerPosition::TE);

    // [6-7] Age and experience
    out[6] = ageFactor(attrs.age);
    out[7] = experienceFactor(attrs.experience);

    // [8-9] Position-specific age windows
    out[8] = oneHot(position == PlayerPosition::RB && attrs.age > 28);
    out[9] = oneHot(position == PlayerPosition::WR && attrs.age >= 26 && attrs.age <= 32);

    if (schema == FeatureSchema::EXTENDED) {
        out[10] = static_cast<double>(season.year - epochYear);
        out[11] = oneHot(sameTeamNextSeason);
    }
}

// --- FeatureBuilder ---

FeatureBuilder::FeatureBuilder(AttributeEstimator& estimator, FeatureSchema schema, int epochYear)
    : estimator_(estimator), schema_(schema), epochYear_(epochYear) {}

FeatureVector FeatureBuilder::build(const SeasonRecord& season, PlayerPosition position,
                                    bool sameTeamNextSeason, AttributeEstimate* attrsOut) {
    AttributeEstimate attrs = estimator_.estimate(season.playerName, position);
    if (attrsOut) *attrsOut = attrs;
    return build(season, position, attrs, sameTeamNextSeason);
}

FeatureVector FeatureBuilder::build(const SeasonRecord& season, PlayerPosition position,
                                    const AttributeEstimate& attrs, bool sameTeamNextSeason) const {
    FeatureVector features(width(), 0.0);
    encodeFeatures(season, position, attrs, sameTeamNextSeason, schema_, epochYear_, features.data());
    return features;
}

} // namespace ff
