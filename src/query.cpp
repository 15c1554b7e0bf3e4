#include "ff/query.h"
#include "ff/predictor.h"
#include <nlohmann/json.hpp>
#include <cctype>

namespace ff {

namespace {

std::string normalizePosition(const std::string& raw) {
    std::string out;
    for (char c : raw) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

nlohmann::json predictionJson(const PredictionRecord& p) {
    nlohmann::json row = {
        {"Player", p.player},
        {"Position", positionName(p.position)},
        {"Team", p.team.empty() ? std::string("N/A") : p.team},
        {"Current_Points", p.currentPoints},
        {"Predicted_Next_Year", p.predictedNextYear},
        {"Confidence", p.confidence},
        {"Age", p.age},
        {"Experience", p.experience}
    };
    if (p.hasPercentChange) row["Percent_Change"] = p.percentChange;
    else row["Percent_Change"] = nullptr;
    return row;
}

} // anonymous namespace

const char* queryStatusName(QueryStatus status) {
    switch (status) {
        case QueryStatus::OK: return "OK";
        case QueryStatus::NOT_FOUND: return "NOT_FOUND";
        case QueryStatus::INVALID: return "INVALID";
    }
    return "INVALID";
}

int queryStatusCode(QueryStatus status) {
    switch (status) {
        case QueryStatus::OK: return 200;
        case QueryStatus::NOT_FOUND: return 404;
        case QueryStatus::INVALID: return 400;
    }
    return 400;
}

QueryResult queryPredictions(const PredictionSet& predictions, const PredictionQuery& query) {
    QueryResult result;

    if (query.topN <= 0) {
        result.status = QueryStatus::INVALID;
        result.message = "top_n must be positive, got " + std::to_string(query.topN);
        return result;
    }
    if (predictions.empty()) {
        result.status = QueryStatus::NOT_FOUND;
        result.message = "No predictions found. Run training and prediction first.";
        return result;
    }

    std::string wanted = normalizePosition(query.position);
    PredictionSet selected;
    for (auto& p : predictions) {
        if (wanted.empty() || wanted == positionName(p.position)) selected.push_back(p);
    }
    if (selected.empty()) {
        result.status = QueryStatus::NOT_FOUND;
        result.message = "No players found for position " + query.position;
        return result;
    }

    rankPredictions(selected, query.topN);

    QuerySummary& s = result.summary;
    s.totalPredictions = static_cast<int>(selected.size());
    double changeSum = 0.0;
    int changeCount = 0;
    for (auto& p : selected) {
        s.positionBreakdown[positionIndex(p.position)]++;
        if (p.hasPercentChange) {
            changeSum += p.percentChange;
            changeCount++;
        }
    }
    if (changeCount > 0) {
        s.avgPredictedChange = changeSum / changeCount;
        s.hasAvgPredictedChange = true;
    }
    s.topPredictedPlayer = selected.front().player;
    s.topPredictedPoints = selected.front().predictedNextYear;

    result.status = QueryStatus::OK;
    result.predictions = std::move(selected);
    return result;
}

std::string queryResultToJson(const QueryResult& result) {
    if (result.status != QueryStatus::OK) {
        nlohmann::json err = {{"error", result.message}};
        return err.dump();
    }

    nlohmann::json rows = nlohmann::json::array();
    for (auto& p : result.predictions) {
        rows.push_back(predictionJson(p));
    }

    const QuerySummary& s = result.summary;
    nlohmann::json breakdown = nlohmann::json::object();
    for (int i = 0; i < NUM_POSITIONS; ++i) {
        if (s.positionBreakdown[i] > 0) {
            breakdown[positionName(static_cast<PlayerPosition>(i))] = s.positionBreakdown[i];
        }
    }

    nlohmann::json summary;
    summary["total_predictions"] = s.totalPredictions;
    summary["position_breakdown"] = std::move(breakdown);
    if (s.hasAvgPredictedChange) summary["avg_predicted_change"] = s.avgPredictedChange;
    else summary["avg_predicted_change"] = nullptr;
    summary["top_predicted_player"] = s.topPredictedPlayer;
    summary["top_predicted_points"] = s.topPredictedPoints;

    nlohmann::json body;
    body["predictions"] = std::move(rows);
    body["summary"] = std::move(summary);
    return body.dump();
}

} // namespace ff
