#pragma once

#include "ff/records.h"
#include <array>
#include <string>

namespace ff {

enum class QueryStatus : uint8_t {
    OK,
    NOT_FOUND,  // no predictions, or none match the position filter
    INVALID     // malformed request (topN <= 0)
};

const char* queryStatusName(QueryStatus status);

// HTTP-style status code the query surface maps to (200, 404, 400).
int queryStatusCode(QueryStatus status);

struct PredictionQuery {
    int topN = 50;
    std::string position;  // empty = all positions; case-insensitive exact code
};

struct QuerySummary {
    int totalPredictions = 0;
    std::array<int, NUM_POSITIONS> positionBreakdown{};
    double avgPredictedChange = 0.0;  // over records with a defined change
    bool hasAvgPredictedChange = false;
    std::string topPredictedPlayer;
    double topPredictedPoints = 0.0;
};

struct QueryResult {
    QueryStatus status = QueryStatus::NOT_FOUND;
    std::string message;
    PredictionSet predictions;
    QuerySummary summary;
};

QueryResult queryPredictions(const PredictionSet& predictions, const PredictionQuery& query);

// Response body: {"predictions": [...], "summary": {...}} on OK,
// {"error": message} otherwise.
std::string queryResultToJson(const QueryResult& result);

} // namespace ff
