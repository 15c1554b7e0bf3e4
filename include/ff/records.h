#pragma once

#include "ff/enums.h"
#include <string>
#include <vector>

namespace ff {

struct SeasonRecord {
    std::string playerName;
    PlayerPosition position = PlayerPosition::OTHER;
    std::string team;
    double fantasyPoints = 0.0;
    int year = 0;
};

struct AttributeEstimate {
    int age = 0;
    int experience = 1;
};

// Provenance of one training example: features from currentYear, label from nextYear.
struct TransitionInfo {
    std::string player;
    PlayerPosition position = PlayerPosition::OTHER;
    int currentYear = 0;
    int nextYear = 0;
};

struct PredictionRecord {
    std::string player;
    PlayerPosition position = PlayerPosition::OTHER;
    std::string team;
    double currentPoints = 0.0;
    double predictedNextYear = 0.0;
    double percentChange = 0.0;    // meaningful only when hasPercentChange
    bool hasPercentChange = false; // false when currentPoints == 0
    double confidence = 0.0;
    int age = 0;
    int experience = 1;
};

using PredictionSet = std::vector<PredictionRecord>;

// Most recent year present, or 0 when records is empty.
int latestSeasonYear(const std::vector<SeasonRecord>& records);

// All records of the given season, input order preserved.
std::vector<SeasonRecord> selectSeason(const std::vector<SeasonRecord>& records, int year);

} // namespace ff
