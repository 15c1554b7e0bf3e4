#include <gtest/gtest.h>
#include "ff/analyzer.h"
#include <nlohmann/json.hpp>
#include <algorithm>

using namespace ff;

namespace {

PredictionRecord prediction(const std::string& player, PlayerPosition pos, double change,
                            bool hasChange, int age, double confidence) {
    PredictionRecord p;
    p.player = player;
    p.position = pos;
    p.team = "CIN";
    p.currentPoints = hasChange ? 100.0 : 0.0;
    p.predictedNextYear = 100.0 + change;
    p.percentChange = change;
    p.hasPercentChange = hasChange;
    p.confidence = confidence;
    p.age = age;
    p.experience = std::max(1, age - 22);
    return p;
}

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

PredictionSet samplePredictions() {
    return {
        prediction("Riser", PlayerPosition::RB, 50.0, true, 24, 90.0),
        prediction("Faller", PlayerPosition::RB, -30.0, true, 29, 70.0),
        prediction("Steady", PlayerPosition::WR, 5.0, true, 27, 80.0),
        prediction("Unknown", PlayerPosition::TE, 0.0, false, 26, 75.0),
    };
}

std::vector<SeasonRecord> sampleHistory() {
    std::vector<SeasonRecord> h;
    h.push_back(season("A", PlayerPosition::QB, "KC", 300.0, 2021));
    h.push_back(season("B", PlayerPosition::RB, "KC", 100.0, 2021));
    h.push_back(season("A", PlayerPosition::QB, "KC", 320.0, 2022));
    h.push_back(season("B", PlayerPosition::RB, "SF", 140.0, 2022));
    h.push_back(season("A", PlayerPosition::QB, "KC", 340.0, 2023));
    h.push_back(season("B", PlayerPosition::RB, "SF", 160.0, 2023));
    for (int i = 0; i < 6; ++i) {
        h.push_back(season("WR " + std::to_string(i), PlayerPosition::WR, "MIA", 50.0 + i, 2023));
    }
    return h;
}

} // anonymous namespace

TEST(Analyzer, EmptyInputsYieldEmptyResults) {
    EXPECT_TRUE(analyzePredictions({}).empty);
    EXPECT_TRUE(analyzeHistorical({}).empty);
    EXPECT_TRUE(generateInsights({}, {}).empty());

    nlohmann::json report = nlohmann::json::parse(
        analysisReportToJson(analyzePredictions({}), analyzeHistorical({}), {}));
    EXPECT_TRUE(report["predictions_analysis"].empty());
    EXPECT_TRUE(report["historical_analysis"].empty());
    EXPECT_TRUE(report["insights"].empty());
}

TEST(Analyzer, BreakoutAndRiskCandidates) {
    PredictionAnalysis a = analyzePredictions(samplePredictions(), 2);
    ASSERT_FALSE(a.empty);

    ASSERT_EQ(a.breakoutCandidates.size(), 2u);
    EXPECT_EQ(a.breakoutCandidates[0].player, "Riser");
    EXPECT_EQ(a.breakoutCandidates[1].player, "Steady");

    ASSERT_EQ(a.riskCandidates.size(), 2u);
    EXPECT_EQ(a.riskCandidates[0].player, "Faller");
    EXPECT_EQ(a.riskCandidates[1].player, "Steady");

    // Records without a defined change are never candidates
    for (auto& p : a.breakoutCandidates) EXPECT_TRUE(p.hasPercentChange);
    for (auto& p : a.riskCandidates) EXPECT_TRUE(p.hasPercentChange);
}

TEST(Analyzer, PositionMeans) {
    PredictionAnalysis a = analyzePredictions(samplePredictions());

    EXPECT_EQ(a.positionBreakdown[positionIndex(PlayerPosition::RB)], 2);
    EXPECT_EQ(a.positionBreakdown[positionIndex(PlayerPosition::QB)], 0);

    const PositionMean& rbChange = a.avgChangeByPosition[positionIndex(PlayerPosition::RB)];
    EXPECT_EQ(rbChange.count, 2);
    EXPECT_DOUBLE_EQ(rbChange.mean, 10.0);
    EXPECT_EQ(a.avgChangeByPosition[positionIndex(PlayerPosition::TE)].count, 0);

    EXPECT_DOUBLE_EQ(a.avgAgeByPosition[positionIndex(PlayerPosition::RB)].mean, 26.5);
    EXPECT_DOUBLE_EQ(a.avgConfidence, 78.8);  // 315 / 4 = 78.75
    EXPECT_DOUBLE_EQ(a.confidenceByPosition[positionIndex(PlayerPosition::RB)].mean, 80.0);
}

TEST(Analyzer, HistoricalOverview) {
    HistoricalAnalysis a = analyzeHistorical(sampleHistory());
    ASSERT_FALSE(a.empty);

    EXPECT_EQ(a.totalRecords, 12);
    EXPECT_EQ(a.yearsCovered, (std::vector<int>{2021, 2022, 2023}));
    EXPECT_EQ(a.positionCounts[positionIndex(PlayerPosition::WR)], 6);

    ASSERT_FALSE(a.topTeams.empty());
    EXPECT_EQ(a.topTeams[0].first, "MIA");
    EXPECT_EQ(a.topTeams[0].second, 6);

    EXPECT_DOUBLE_EQ(a.avgPointsByYear.at(2021), 200.0);
    EXPECT_DOUBLE_EQ(a.avgPointsByPosition[positionIndex(PlayerPosition::QB)].mean, 320.0);

    ASSERT_EQ(a.topScorersByYear.at(2023).size(), 5u);
    EXPECT_EQ(a.topScorersByYear.at(2023)[0].playerName, "A");
    EXPECT_EQ(a.topScorersByYear.at(2021).size(), 2u);

    const auto& rbTrend = a.pointsTrendByPosition[positionIndex(PlayerPosition::RB)];
    ASSERT_EQ(rbTrend.size(), 3u);
    EXPECT_DOUBLE_EQ(rbTrend.at(2022), 140.0);
    EXPECT_TRUE(a.pointsTrendByPosition[positionIndex(PlayerPosition::TE)].empty());
}

TEST(Analyzer, InsightLines) {
    std::vector<SeasonRecord> history = {
        season("A", PlayerPosition::QB, "KC", 100.0, 2021),
        season("A", PlayerPosition::QB, "KC", 150.0, 2022),
        season("A", PlayerPosition::QB, "KC", 200.0, 2023),
    };
    std::vector<std::string> insights = generateInsights(samplePredictions(), history);

    ASSERT_EQ(insights.size(), 5u);
    EXPECT_EQ(insights[0], "Top predictions are dominated by RBs (2 players)");
    EXPECT_EQ(insights[1], "Biggest breakout candidate: Riser (RB) with 50.0% increase");
    EXPECT_EQ(insights[2], "Highest risk player: Faller (RB) with -30.0% decrease");
    EXPECT_EQ(insights[3], "Average age of top predicted players: 26.5 years");
    EXPECT_EQ(insights[4], "Fantasy points trend is increasing over the last 3 years");
}

TEST(Analyzer, TrendUsesOnlyRecentYears) {
    std::vector<SeasonRecord> history = {
        season("A", PlayerPosition::QB, "KC", 500.0, 2019),
        season("A", PlayerPosition::QB, "KC", 300.0, 2021),
        season("A", PlayerPosition::QB, "KC", 250.0, 2022),
        season("A", PlayerPosition::QB, "KC", 200.0, 2023),
    };
    std::vector<std::string> insights = generateInsights({}, history, 2);
    ASSERT_EQ(insights.size(), 1u);
    EXPECT_EQ(insights[0], "Fantasy points trend is decreasing over the last 2 years");

    // A single season gives no trend
    EXPECT_TRUE(generateInsights({}, {history[0]}).empty());
}

TEST(Analyzer, ReportJson) {
    PredictionSet predictions = samplePredictions();
    std::vector<SeasonRecord> history = sampleHistory();
    nlohmann::json report = nlohmann::json::parse(analysisReportToJson(
        analyzePredictions(predictions), analyzeHistorical(history),
        generateInsights(predictions, history)));

    const nlohmann::json& pa = report["predictions_analysis"];
    EXPECT_EQ(pa["position_breakdown"]["RB"], 2);
    EXPECT_EQ(pa["top_10_breakout_candidates"].size(), 3u);
    EXPECT_EQ(pa["risk_candidates"][0]["Player"], "Faller");
    EXPECT_TRUE(pa["age_analysis"].contains("avg_age_by_position"));
    EXPECT_TRUE(pa["confidence_analysis"].contains("avg_confidence"));

    const nlohmann::json& ha = report["historical_analysis"];
    EXPECT_EQ(ha["data_overview"]["total_records"], 12);
    EXPECT_EQ(ha["data_overview"]["teams"]["MIA"], 6);
    EXPECT_EQ(ha["points_analysis"]["top_scorers_by_year"]["2023"].size(), 5u);
    EXPECT_TRUE(ha["trends"]["points_trend_by_position"].contains("QB"));

    EXPECT_FALSE(report["insights"].empty());
}

TEST(Analyzer, ParseAnalysisType) {
    AnalysisType type = AnalysisType::ALL;
    ASSERT_TRUE(parseAnalysisType("historical", type));
    EXPECT_EQ(type, AnalysisType::HISTORICAL);
    ASSERT_TRUE(parseAnalysisType("insights", type));
    EXPECT_EQ(type, AnalysisType::INSIGHTS);
    EXPECT_FALSE(parseAnalysisType("everything", type));
    EXPECT_EQ(type, AnalysisType::INSIGHTS);
}

TEST(Analyzer, ReportSectionsFollowType) {
    PredictionSet predictions = samplePredictions();
    std::vector<SeasonRecord> history = sampleHistory();
    PredictionAnalysis pa = analyzePredictions(predictions);
    HistoricalAnalysis ha = analyzeHistorical(history);
    std::vector<std::string> insights = generateInsights(predictions, history);

    nlohmann::json onlyPredictions = nlohmann::json::parse(
        analysisReportToJson(pa, ha, insights, AnalysisType::PREDICTIONS, "2024-09-01T12:00:00"));
    EXPECT_TRUE(onlyPredictions.contains("predictions_analysis"));
    EXPECT_FALSE(onlyPredictions.contains("historical_analysis"));
    EXPECT_FALSE(onlyPredictions.contains("insights"));
    EXPECT_EQ(onlyPredictions["metadata"]["analysis_type"], "predictions");
    EXPECT_EQ(onlyPredictions["metadata"]["analysis_timestamp"], "2024-09-01T12:00:00");

    nlohmann::json onlyHistory = nlohmann::json::parse(
        analysisReportToJson(pa, ha, insights, AnalysisType::HISTORICAL));
    EXPECT_FALSE(onlyHistory.contains("predictions_analysis"));
    EXPECT_TRUE(onlyHistory.contains("historical_analysis"));
    EXPECT_FALSE(onlyHistory.contains("insights"));

    nlohmann::json withInsights = nlohmann::json::parse(
        analysisReportToJson(pa, ha, insights, AnalysisType::INSIGHTS));
    EXPECT_TRUE(withInsights.contains("predictions_analysis"));
    EXPECT_TRUE(withInsights.contains("historical_analysis"));
    EXPECT_EQ(withInsights["insights"].size(), insights.size());
    EXPECT_EQ(withInsights["metadata"]["analysis_type"], "insights");
}
