#include "ff/record_io.h"
#include "ff/errors.h"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace ff {

namespace {

// Accepts JSON numbers and numeric strings; anything else fails.
bool readNumber(const nlohmann::json& j, double& out) {
    if (j.is_number()) {
        out = j.get<double>();
        return std::isfinite(out);
    }
    if (j.is_string()) {
        const std::string& s = j.get_ref<const std::string&>();
        const char* begin = s.c_str();
        char* end = nullptr;
        double v = std::strtod(begin, &end);
        if (end == begin) return false;
        while (*end == ' ' || *end == '\t') ++end;
        if (*end != '\0' || !std::isfinite(v)) return false;
        out = v;
        return true;
    }
    return false;
}

// A whole number that fits in int; 2023.0 and "2023" qualify, 1e20 and 26.5 do not.
bool readInt(const nlohmann::json& j, int& out) {
    double v = 0.0;
    if (!readNumber(j, v)) return false;
    if (v < static_cast<double>(std::numeric_limits<int>::min()) ||
        v > static_cast<double>(std::numeric_limits<int>::max()) || v != std::floor(v)) {
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

std::string readString(const nlohmann::json& row, const char* key, const std::string& fallback) {
    if (!row.contains(key) || !row[key].is_string()) return fallback;
    return row[key].get<std::string>();
}

const nlohmann::json& asRows(const nlohmann::json& doc, nlohmann::json& holder) {
    if (doc.is_array()) return doc;
    if (doc.is_object()) {
        holder = nlohmann::json::array({doc});
        return holder;
    }
    throw PipelineError(ErrorKind::MALFORMED_RECORD, "ingest",
                        "expected a JSON array of records");
}

nlohmann::json parseDocument(const std::string& json, const char* stage) {
    try {
        return nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        throw PipelineError(ErrorKind::MALFORMED_RECORD, stage,
                            std::string("invalid JSON: ") + e.what());
    }
}

void note(IngestReport* report, const std::string& issue) {
    if (report && report->issues.size() < 50) report->issues.push_back(issue);
}

} // anonymous namespace

std::vector<SeasonRecord> parseSeasonRecords(const std::string& json, IngestReport* report) {
    nlohmann::json doc = parseDocument(json, "ingest");
    nlohmann::json holder;
    const nlohmann::json& rows = asRows(doc, holder);

    std::vector<SeasonRecord> records;
    int index = 0;
    for (auto& row : rows) {
        int rowIndex = index++;
        if (!row.is_object()) {
            if (report) report->skipped++;
            note(report, "row " + std::to_string(rowIndex) + ": not an object");
            continue;
        }

        SeasonRecord rec;
        rec.playerName = readString(row, "Player", "");
        if (rec.playerName.empty()) {
            if (report) report->skipped++;
            note(report, "row " + std::to_string(rowIndex) + ": missing Player");
            continue;
        }

        if (!row.contains("Year") || !readInt(row["Year"], rec.year)) {
            if (report) report->skipped++;
            note(report, "row " + std::to_string(rowIndex) + ": missing or invalid Year");
            continue;
        }

        rec.position = parsePosition(readString(row, "Position", ""));
        rec.team = readString(row, "Team", "");

        double points = 0.0;
        if (!row.contains("Fantasy_Points") || !readNumber(row["Fantasy_Points"], points) || points < 0.0) {
            points = 0.0;
            if (report) report->repairedPoints++;
            note(report, "row " + std::to_string(rowIndex) + ": Fantasy_Points defaulted to 0");
        }
        rec.fantasyPoints = points;

        records.push_back(rec);
        if (report) report->accepted++;
    }
    return records;
}

std::vector<SeasonRecord> loadSeasonRecords(const std::string& path, IngestReport* report) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw DataUnavailableError("ingest", "cannot open season records: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return parseSeasonRecords(content, report);
}

std::string serializeSeasonRecords(const std::vector<SeasonRecord>& records) {
    nlohmann::json rows = nlohmann::json::array();
    for (auto& r : records) {
        nlohmann::json row = {
            {"Player", r.playerName},
            {"Position", positionName(r.position)},
            {"Team", r.team},
            {"Fantasy_Points", r.fantasyPoints},
            {"Year", r.year}
        };
        rows.push_back(std::move(row));
    }
    return rows.dump();
}

std::string serializePredictions(const PredictionSet& predictions) {
    nlohmann::json rows = nlohmann::json::array();
    for (auto& p : predictions) {
        nlohmann::json row = {
            {"Player", p.player},
            {"Position", positionName(p.position)},
            {"Team", p.team},
            {"Current_Points", p.currentPoints},
            {"Predicted_Next_Year", p.predictedNextYear},
            {"Confidence", p.confidence},
            {"Age", p.age},
            {"Experience", p.experience}
        };
        if (p.hasPercentChange) row["Percent_Change"] = p.percentChange;
        else row["Percent_Change"] = nullptr;
        rows.push_back(std::move(row));
    }
    return rows.dump();
}

PredictionSet parsePredictions(const std::string& json) {
    nlohmann::json doc = parseDocument(json, "load_predictions");
    nlohmann::json holder;
    const nlohmann::json& rows = asRows(doc, holder);

    PredictionSet predictions;
    for (auto& row : rows) {
        if (!row.is_object()) continue;

        PredictionRecord p;
        p.player = readString(row, "Player", "");
        if (p.player.empty()) continue;
        p.position = parsePosition(readString(row, "Position", ""));
        p.team = readString(row, "Team", "N/A");

        double v = 0.0;
        if (row.contains("Current_Points") && readNumber(row["Current_Points"], v)) p.currentPoints = v;
        if (row.contains("Predicted_Next_Year") && readNumber(row["Predicted_Next_Year"], v)) p.predictedNextYear = v;
        if (row.contains("Percent_Change") && readNumber(row["Percent_Change"], v)) {
            p.percentChange = v;
            p.hasPercentChange = true;
        }
        if (row.contains("Confidence") && readNumber(row["Confidence"], v)) p.confidence = v;

        p.age = 27;
        if (row.contains("Age") && !readInt(row["Age"], p.age)) p.age = 27;
        p.experience = 5;
        if (row.contains("Experience") && !readInt(row["Experience"], p.experience)) p.experience = 5;

        predictions.push_back(p);
    }
    return predictions;
}

std::string predictionsKey(int year) {
    return "predictions/fantasy_predictions_" + std::to_string(year) + ".json";
}

std::string historicalDataKey(const std::string& stamp) {
    return "raw_data/fantasy_stats_" + stamp + ".json";
}

} // namespace ff
