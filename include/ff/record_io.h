#pragma once

#include "ff/records.h"
#include <string>
#include <vector>

namespace ff {

// What ingestion repaired or dropped.
struct IngestReport {
    int accepted = 0;
    int skipped = 0;          // no player name or no usable year
    int repairedPoints = 0;   // missing/unparsable/negative points replaced with 0
    std::vector<std::string> issues;
};

// Parses a JSON array of {Player, Position, Team, Fantasy_Points, Year}
// objects; a single object is read as one record. Numbers may arrive as
// strings. Bad rows are repaired or skipped, never fatal. Throws
// PipelineError (MALFORMED_RECORD) only when the document itself is not JSON
// or not an array/object.
std::vector<SeasonRecord> parseSeasonRecords(const std::string& json, IngestReport* report = nullptr);

// Throws DataUnavailableError when the file cannot be read.
std::vector<SeasonRecord> loadSeasonRecords(const std::string& path, IngestReport* report = nullptr);

std::string serializeSeasonRecords(const std::vector<SeasonRecord>& records);

// Flat records with the field names Player, Position, Team, Current_Points,
// Predicted_Next_Year, Percent_Change, Confidence, Age, Experience.
// An undefined percent change is written as null.
std::string serializePredictions(const PredictionSet& predictions);

// Missing Team reads as "N/A", Age as 27, Experience as 5.
PredictionSet parsePredictions(const std::string& json);

// predictions/fantasy_predictions_<year>.json
std::string predictionsKey(int year);

// raw_data/fantasy_stats_<stamp>.json
std::string historicalDataKey(const std::string& stamp);

} // namespace ff
