#include "ff/analyzer.h"
#include "ff/predictor.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace ff {

namespace {

// Running sums per position, finished into rounded means.
struct PositionAccumulator {
    std::array<double, NUM_POSITIONS> sum{};
    std::array<int, NUM_POSITIONS> count{};

    void add(PlayerPosition p, double value) {
        sum[positionIndex(p)] += value;
        count[positionIndex(p)]++;
    }

    PositionMeans finish() const {
        PositionMeans out{};
        for (int i = 0; i < NUM_POSITIONS; ++i) {
            out[i].count = count[i];
            if (count[i] > 0) out[i].mean = roundToTenth(sum[i] / count[i]);
        }
        return out;
    }
};

std::string formatTenth(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value;
    return ss.str();
}

nlohmann::json positionMeansJson(const PositionMeans& means) {
    nlohmann::json j = nlohmann::json::object();
    for (int i = 0; i < NUM_POSITIONS; ++i) {
        if (means[i].count > 0) j[positionName(static_cast<PlayerPosition>(i))] = means[i].mean;
    }
    return j;
}

nlohmann::json positionCountsJson(const std::array<int, NUM_POSITIONS>& counts) {
    nlohmann::json j = nlohmann::json::object();
    for (int i = 0; i < NUM_POSITIONS; ++i) {
        if (counts[i] > 0) j[positionName(static_cast<PlayerPosition>(i))] = counts[i];
    }
    return j;
}

nlohmann::json candidatesJson(const PredictionSet& set) {
    nlohmann::json rows = nlohmann::json::array();
    for (auto& p : set) {
        nlohmann::json row = {
            {"Player", p.player},
            {"Position", positionName(p.position)},
            {"Current_Points", p.currentPoints},
            {"Predicted_Next_Year", p.predictedNextYear},
            {"Percent_Change", p.percentChange},
            {"Confidence", p.confidence}
        };
        rows.push_back(std::move(row));
    }
    return rows;
}

nlohmann::json yearMapJson(const std::map<int, double>& byYear) {
    nlohmann::json j = nlohmann::json::object();
    for (auto& entry : byYear) {
        j[std::to_string(entry.first)] = entry.second;
    }
    return j;
}

nlohmann::json predictionAnalysisJson(const PredictionAnalysis& a) {
    if (a.empty) return nlohmann::json::object();

    nlohmann::json j;
    j["position_breakdown"] = positionCountsJson(a.positionBreakdown);
    j["avg_predicted_change_by_position"] = positionMeansJson(a.avgChangeByPosition);
    j["top_10_breakout_candidates"] = candidatesJson(a.breakoutCandidates);
    j["risk_candidates"] = candidatesJson(a.riskCandidates);
    j["age_analysis"] = {
        {"avg_age_by_position", positionMeansJson(a.avgAgeByPosition)},
        {"experience_by_position", positionMeansJson(a.avgExperienceByPosition)}
    };
    j["confidence_analysis"] = {
        {"avg_confidence", a.avgConfidence},
        {"confidence_by_position", positionMeansJson(a.confidenceByPosition)}
    };
    return j;
}

nlohmann::json historicalAnalysisJson(const HistoricalAnalysis& a) {
    if (a.empty) return nlohmann::json::object();

    nlohmann::json teams = nlohmann::json::object();
    for (auto& t : a.topTeams) {
        teams[t.first] = t.second;
    }

    nlohmann::json scorers = nlohmann::json::object();
    for (auto& entry : a.topScorersByYear) {
        nlohmann::json rows = nlohmann::json::array();
        for (auto& r : entry.second) {
            nlohmann::json row = {
                {"Player", r.playerName},
                {"Position", positionName(r.position)},
                {"Team", r.team},
                {"Fantasy_Points", r.fantasyPoints}
            };
            rows.push_back(std::move(row));
        }
        scorers[std::to_string(entry.first)] = std::move(rows);
    }

    nlohmann::json trends = nlohmann::json::object();
    for (int i = 0; i < NUM_POSITIONS; ++i) {
        if (a.pointsTrendByPosition[i].empty()) continue;
        trends[positionName(static_cast<PlayerPosition>(i))] = yearMapJson(a.pointsTrendByPosition[i]);
    }

    nlohmann::json j;
    j["data_overview"] = {
        {"total_records", a.totalRecords},
        {"years_covered", a.yearsCovered},
        {"positions", positionCountsJson(a.positionCounts)},
        {"teams", std::move(teams)}
    };
    j["points_analysis"] = {
        {"avg_points_by_year", yearMapJson(a.avgPointsByYear)},
        {"avg_points_by_position", positionMeansJson(a.avgPointsByPosition)},
        {"top_scorers_by_year", std::move(scorers)}
    };
    j["trends"] = {{"points_trend_by_position", std::move(trends)}};
    return j;
}

} // anonymous namespace

// --- AnalysisType ---

const char* analysisTypeName(AnalysisType type) {
    switch (type) {
        case AnalysisType::ALL: return "all";
        case AnalysisType::PREDICTIONS: return "predictions";
        case AnalysisType::HISTORICAL: return "historical";
        case AnalysisType::INSIGHTS: return "insights";
    }
    return "all";
}

bool parseAnalysisType(const std::string& name, AnalysisType& out) {
    const AnalysisType all[] = {AnalysisType::ALL, AnalysisType::PREDICTIONS,
                                AnalysisType::HISTORICAL, AnalysisType::INSIGHTS};
    for (AnalysisType t : all) {
        if (name == analysisTypeName(t)) {
            out = t;
            return true;
        }
    }
    return false;
}

bool includesPredictions(AnalysisType type) {
    return type != AnalysisType::HISTORICAL;
}

bool includesHistorical(AnalysisType type) {
    return type != AnalysisType::PREDICTIONS;
}

bool includesInsights(AnalysisType type) {
    return type == AnalysisType::ALL || type == AnalysisType::INSIGHTS;
}

// --- Analysis ---

PredictionAnalysis analyzePredictions(const PredictionSet& predictions, int topK) {
    PredictionAnalysis a;
    if (predictions.empty()) return a;
    a.empty = false;

    PositionAccumulator change, age, experience, confidence;
    double confidenceSum = 0.0;
    PredictionSet withChange;
    for (auto& p : predictions) {
        a.positionBreakdown[positionIndex(p.position)]++;
        age.add(p.position, p.age);
        experience.add(p.position, p.experience);
        confidence.add(p.position, p.confidence);
        confidenceSum += p.confidence;
        if (p.hasPercentChange) {
            change.add(p.position, p.percentChange);
            withChange.push_back(p);
        }
    }

    a.avgChangeByPosition = change.finish();
    a.avgAgeByPosition = age.finish();
    a.avgExperienceByPosition = experience.finish();
    a.confidenceByPosition = confidence.finish();
    a.avgConfidence = roundToTenth(confidenceSum / predictions.size());

    size_t k = topK > 0 ? static_cast<size_t>(topK) : 0;

    a.breakoutCandidates = withChange;
    std::stable_sort(a.breakoutCandidates.begin(), a.breakoutCandidates.end(),
                     [](const PredictionRecord& x, const PredictionRecord& y) {
                         return x.percentChange > y.percentChange;
                     });
    if (a.breakoutCandidates.size() > k) a.breakoutCandidates.resize(k);

    a.riskCandidates = std::move(withChange);
    std::stable_sort(a.riskCandidates.begin(), a.riskCandidates.end(),
                     [](const PredictionRecord& x, const PredictionRecord& y) {
                         return x.percentChange < y.percentChange;
                     });
    if (a.riskCandidates.size() > k) a.riskCandidates.resize(k);

    return a;
}

HistoricalAnalysis analyzeHistorical(const std::vector<SeasonRecord>& records) {
    HistoricalAnalysis a;
    if (records.empty()) return a;
    a.empty = false;
    a.totalRecords = static_cast<int>(records.size());

    std::map<int, std::pair<double, int>> yearSums;
    std::array<std::map<int, std::pair<double, int>>, NUM_POSITIONS> trendSums;
    std::map<std::string, int> teamCounts;
    std::map<int, std::vector<SeasonRecord>> byYear;
    PositionAccumulator points;

    for (auto& r : records) {
        int idx = positionIndex(r.position);
        a.positionCounts[idx]++;
        points.add(r.position, r.fantasyPoints);

        auto& ys = yearSums[r.year];
        ys.first += r.fantasyPoints;
        ys.second++;

        auto& ts = trendSums[idx][r.year];
        ts.first += r.fantasyPoints;
        ts.second++;

        if (!r.team.empty()) teamCounts[r.team]++;
        byYear[r.year].push_back(r);
    }

    for (auto& entry : yearSums) {
        a.yearsCovered.push_back(entry.first);
        a.avgPointsByYear[entry.first] = roundToTenth(entry.second.first / entry.second.second);
    }
    a.avgPointsByPosition = points.finish();

    for (int i = 0; i < NUM_POSITIONS; ++i) {
        for (auto& entry : trendSums[i]) {
            a.pointsTrendByPosition[i][entry.first] = roundToTenth(entry.second.first / entry.second.second);
        }
    }

    a.topTeams.assign(teamCounts.begin(), teamCounts.end());
    std::stable_sort(a.topTeams.begin(), a.topTeams.end(),
                     [](const std::pair<std::string, int>& x, const std::pair<std::string, int>& y) {
                         return x.second > y.second;
                     });
    if (a.topTeams.size() > 10) a.topTeams.resize(10);

    for (auto& entry : byYear) {
        std::vector<SeasonRecord> season = entry.second;
        std::stable_sort(season.begin(), season.end(),
                         [](const SeasonRecord& x, const SeasonRecord& y) {
                             return x.fantasyPoints > y.fantasyPoints;
                         });
        if (season.size() > 5) season.resize(5);
        a.topScorersByYear[entry.first] = std::move(season);
    }
    return a;
}

std::vector<std::string> generateInsights(const PredictionSet& predictions,
                                          const std::vector<SeasonRecord>& history,
                                          int trendYears) {
    std::vector<std::string> insights;

    if (!predictions.empty()) {
        PredictionAnalysis a = analyzePredictions(predictions, 1);

        int dominant = 0;
        for (int i = 1; i < NUM_POSITIONS; ++i) {
            if (a.positionBreakdown[i] > a.positionBreakdown[dominant]) dominant = i;
        }
        insights.push_back(std::string("Top predictions are dominated by ") +
                           positionName(static_cast<PlayerPosition>(dominant)) + "s (" +
                           std::to_string(a.positionBreakdown[dominant]) + " players)");

        if (!a.breakoutCandidates.empty()) {
            const PredictionRecord& top = a.breakoutCandidates.front();
            insights.push_back("Biggest breakout candidate: " + top.player + " (" +
                               positionName(top.position) + ") with " +
                               formatTenth(top.percentChange) + "% increase");
        }
        if (!a.riskCandidates.empty()) {
            const PredictionRecord& risk = a.riskCandidates.front();
            insights.push_back("Highest risk player: " + risk.player + " (" +
                               positionName(risk.position) + ") with " +
                               formatTenth(risk.percentChange) + "% decrease");
        }

        double ageSum = 0.0;
        for (auto& p : predictions) ageSum += p.age;
        insights.push_back("Average age of top predicted players: " +
                           formatTenth(ageSum / predictions.size()) + " years");
    }

    if (!history.empty() && trendYears >= 2) {
        std::map<int, std::pair<double, int>> yearSums;
        for (auto& r : history) {
            auto& ys = yearSums[r.year];
            ys.first += r.fantasyPoints;
            ys.second++;
        }

        std::vector<double> means;
        for (auto& entry : yearSums) {
            means.push_back(entry.second.first / entry.second.second);
        }
        if (means.size() > static_cast<size_t>(trendYears)) {
            means.erase(means.begin(), means.end() - trendYears);
        }
        if (means.size() >= 2) {
            const char* direction = means.back() > means.front() ? "increasing" : "decreasing";
            insights.push_back(std::string("Fantasy points trend is ") + direction +
                               " over the last " + std::to_string(means.size()) + " years");
        }
    }
    return insights;
}

std::string predictionAnalysisToJson(const PredictionAnalysis& analysis) {
    return predictionAnalysisJson(analysis).dump(2);
}

std::string historicalAnalysisToJson(const HistoricalAnalysis& analysis) {
    return historicalAnalysisJson(analysis).dump(2);
}

std::string analysisReportToJson(const PredictionAnalysis& predictions,
                                 const HistoricalAnalysis& history,
                                 const std::vector<std::string>& insights,
                                 AnalysisType type, const std::string& timestamp) {
    nlohmann::json j;
    if (includesPredictions(type)) j["predictions_analysis"] = predictionAnalysisJson(predictions);
    if (includesHistorical(type)) j["historical_analysis"] = historicalAnalysisJson(history);
    if (includesInsights(type)) j["insights"] = insights;
    j["metadata"] = {
        {"analysis_timestamp", timestamp},
        {"analysis_type", analysisTypeName(type)}
    };
    return j.dump(2);
}

} // namespace ff
