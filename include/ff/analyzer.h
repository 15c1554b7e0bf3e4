#pragma once

#include "ff/records.h"
#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ff {

// Which report sections to produce. INSIGHTS also carries both analyses
// the insight lines were drawn from.
enum class AnalysisType : uint8_t { ALL, PREDICTIONS, HISTORICAL, INSIGHTS };

const char* analysisTypeName(AnalysisType type);

// "all", "predictions", "historical" or "insights". False for anything else.
bool parseAnalysisType(const std::string& name, AnalysisType& out);

bool includesPredictions(AnalysisType type);
bool includesHistorical(AnalysisType type);
bool includesInsights(AnalysisType type);

// Per-position mean; count == 0 means the position is absent.
struct PositionMean {
    int count = 0;
    double mean = 0.0;
};

using PositionMeans = std::array<PositionMean, NUM_POSITIONS>;

struct PredictionAnalysis {
    bool empty = true;
    std::array<int, NUM_POSITIONS> positionBreakdown{};
    PositionMeans avgChangeByPosition{};   // records with a defined change only
    PredictionSet breakoutCandidates;      // largest percent change first
    PredictionSet riskCandidates;          // smallest percent change first
    PositionMeans avgAgeByPosition{};
    PositionMeans avgExperienceByPosition{};
    double avgConfidence = 0.0;
    PositionMeans confidenceByPosition{};
};

struct HistoricalAnalysis {
    bool empty = true;
    int totalRecords = 0;
    std::vector<int> yearsCovered;                      // ascending
    std::array<int, NUM_POSITIONS> positionCounts{};
    std::vector<std::pair<std::string, int>> topTeams;  // by record count, at most 10
    std::map<int, double> avgPointsByYear;
    PositionMeans avgPointsByPosition{};
    std::map<int, std::vector<SeasonRecord>> topScorersByYear;  // at most 5 per year
    std::array<std::map<int, double>, NUM_POSITIONS> pointsTrendByPosition;
};

// Means are rounded to one decimal.
PredictionAnalysis analyzePredictions(const PredictionSet& predictions, int topK = 10);

HistoricalAnalysis analyzeHistorical(const std::vector<SeasonRecord>& records);

// Human-readable one-liners; empty inputs contribute none.
std::vector<std::string> generateInsights(const PredictionSet& predictions,
                                          const std::vector<SeasonRecord>& history,
                                          int trendYears = 3);

std::string predictionAnalysisToJson(const PredictionAnalysis& analysis);
std::string historicalAnalysisToJson(const HistoricalAnalysis& analysis);

// {"predictions_analysis": ..., "historical_analysis": ..., "insights": [...],
//  "metadata": {"analysis_timestamp": ..., "analysis_type": ...}}
// Sections not selected by type are left out.
std::string analysisReportToJson(const PredictionAnalysis& predictions,
                                 const HistoricalAnalysis& history,
                                 const std::vector<std::string>& insights,
                                 AnalysisType type = AnalysisType::ALL,
                                 const std::string& timestamp = "");

} // namespace ff
