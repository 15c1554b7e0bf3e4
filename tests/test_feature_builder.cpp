#include <gtest/gtest.h>
#include "ff/feature_builder.h"
#include "ff/transition_extractor.h"
#include <cmath>
#include <limits>

using namespace ff;

namespace {

SeasonRecord season(const std::string& name, PlayerPosition pos, const std::string& team,
                    double points, int year) {
    SeasonRecord r;
    r.playerName = name;
    r.position = pos;
    r.team = team;
    r.fantasyPoints = points;
    r.year = year;
    return r;
}

} // anonymous namespace

TEST(FeatureBuilder, AgeFactorPeaksAt27) {
    EXPECT_DOUBLE_EQ(ageFactor(27), 1.0);
    EXPECT_NEAR(ageFactor(26), 0.95, 1e-12);
    EXPECT_NEAR(ageFactor(28), 0.95, 1e-12);
    EXPECT_NEAR(ageFactor(17), 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(ageFactor(50), 0.0);

    for (int age = 0; age <= 60; ++age) {
        EXPECT_GE(ageFactor(age), 0.0);
        EXPECT_LE(ageFactor(age), 1.0);
        EXPECT_LE(ageFactor(age), ageFactor(PEAK_AGE));
    }
}

TEST(FeatureBuilder, ExperienceFactorSaturates) {
    EXPECT_NEAR(experienceFactor(1), 0.2, 1e-12);
    EXPECT_NEAR(experienceFactor(3), 0.6, 1e-12);
    EXPECT_DOUBLE_EQ(experienceFactor(5), 1.0);
    EXPECT_DOUBLE_EQ(experienceFactor(12), 1.0);
}

TEST(FeatureBuilder, SchemaWidths) {
    EXPECT_EQ(featureCount(FeatureSchema::BASE), 10);
    EXPECT_EQ(featureCount(FeatureSchema::EXTENDED), 12);
    EXPECT_EQ(featureNames(FeatureSchema::BASE).size(), 10u);
    EXPECT_EQ(featureNames(FeatureSchema::EXTENDED).size(), 12u);
    EXPECT_EQ(featureNames(FeatureSchema::EXTENDED)[10], "years_since_epoch");
    EXPECT_EQ(featureNames(FeatureSchema::EXTENDED)[11], "team_consistency");
}

TEST(FeatureBuilder, EncodeExtendedLayout) {
    SeasonRecord s = season("Derrick Henry", PlayerPosition::RB, "TEN", 200.0, 2021);
    AttributeEstimate attrs;
    attrs.age = 29;
    attrs.experience = 7;

    double out[MAX_FEATURES];
    encodeFeatures(s, s.position, attrs, true, FeatureSchema::EXTENDED, 2019, out);

    EXPECT_DOUBLE_EQ(out[0], 200.0);
    EXPECT_DOUBLE_EQ(out[1], 160.0);
    EXPECT_DOUBLE_EQ(out[2], 0.0);
    EXPECT_DOUBLE_EQ(out[3], 1.0);
    EXPECT_DOUBLE_EQ(out[4], 0.0);
    EXPECT_DOUBLE_EQ(out[5], 0.0);
    EXPECT_NEAR(out[6], 0.9, 1e-12);
    EXPECT_DOUBLE_EQ(out[7], 1.0);
    EXPECT_DOUBLE_EQ(out[8], 1.0);   // RB over 28
    EXPECT_DOUBLE_EQ(out[9], 0.0);
    EXPECT_DOUBLE_EQ(out[10], 2.0);  // 2021 - 2019
    EXPECT_DOUBLE_EQ(out[11], 1.0);
}

TEST(FeatureBuilder, WideReceiverPeakWindow) {
    AttributeEstimate attrs;
    double out[MAX_FEATURES];
    SeasonRecord s = season("W", PlayerPosition::WR, "MIA", 100.0, 2020);

    attrs.age = 26;
    encodeFeatures(s, s.position, attrs, true, FeatureSchema::BASE, 2019, out);
    EXPECT_DOUBLE_EQ(out[9], 1.0);

    attrs.age = 32;
    encodeFeatures(s, s.position, attrs, true, FeatureSchema::BASE, 2019, out);
    EXPECT_DOUBLE_EQ(out[9], 1.0);

    attrs.age = 25;
    encodeFeatures(s, s.position, attrs, true, FeatureSchema::BASE, 2019, out);
    EXPECT_DOUBLE_EQ(out[9], 0.0);
    EXPECT_DOUBLE_EQ(out[8], 0.0);
}

TEST(FeatureBuilder, OtherPositionHasNoOneHot) {
    AttributeEstimate attrs;
    attrs.age = 26;
    attrs.experience = 4;
    double out[MAX_FEATURES];
    SeasonRecord s = season("Kicker", PlayerPosition::OTHER, "BAL", 150.0, 2022);
    encodeFeatures(s, s.position, attrs, false, FeatureSchema::EXTENDED, 2019, out);

    for (int i = 2; i <= 5; ++i) EXPECT_DOUBLE_EQ(out[i], 0.0);
    EXPECT_DOUBLE_EQ(out[11], 0.0);
}

TEST(FeatureBuilder, NonFinitePointsBecomeZero) {
    AttributeEstimate attrs;
    attrs.age = 27;
    attrs.experience = 5;
    double out[MAX_FEATURES];
    SeasonRecord s = season("N", PlayerPosition::QB, "BUF",
                            std::numeric_limits<double>::quiet_NaN(), 2020);
    encodeFeatures(s, s.position, attrs, true, FeatureSchema::EXTENDED, 2019, out);

    for (int i = 0; i < NUM_EXTENDED_FEATURES; ++i) EXPECT_TRUE(std::isfinite(out[i]));
    EXPECT_DOUBLE_EQ(out[0], 0.0);
    EXPECT_DOUBLE_EQ(out[1], 0.0);
}

TEST(FeatureBuilder, BuildReportsAttributesUsed) {
    PipelineConfig config;
    RandomGenerator rng(3);
    AttributeEstimator estimator(config, rng);
    FeatureBuilder builder(estimator, FeatureSchema::EXTENDED, 2019);

    AttributeEstimate attrs;
    FeatureVector v = builder.build(season("Q", PlayerPosition::QB, "KC", 300.0, 2022),
                                    PlayerPosition::QB, true, &attrs);
    ASSERT_EQ(static_cast<int>(v.size()), builder.width());
    EXPECT_DOUBLE_EQ(v[6], ageFactor(attrs.age));
    EXPECT_DOUBLE_EQ(v[7], experienceFactor(attrs.experience));
}

TEST(FeatureBuilder, TrainingAndInferenceWidthsMatch) {
    for (FeatureSchema schema : {FeatureSchema::BASE, FeatureSchema::EXTENDED}) {
        PipelineConfig config;
        RandomGenerator rng(5);
        AttributeEstimator estimator(config, rng);
        FeatureBuilder builder(estimator, schema, 2019);

        std::vector<SeasonRecord> history = {
            season("A", PlayerPosition::WR, "LAR", 120.0, 2021),
            season("A", PlayerPosition::WR, "LAR", 180.0, 2022),
        };
        TrainingSet data = extractTransitions(history, builder);
        ASSERT_EQ(data.size(), 1u);

        FeatureVector inference = builder.build(history.back(), PlayerPosition::WR, true);
        EXPECT_EQ(data.features[0].size(), inference.size());
        EXPECT_EQ(static_cast<int>(inference.size()), featureCount(schema));
    }
}
