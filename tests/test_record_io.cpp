#include <gtest/gtest.h>
#include "ff/errors.h"
#include "ff/record_io.h"
#include <nlohmann/json.hpp>

using namespace ff;

TEST(RecordIO, ParsesSeasonRecords) {
    IngestReport report;
    std::vector<SeasonRecord> records = parseSeasonRecords(R"([
        {"Player": "Josh Allen", "Position": "QB", "Team": "BUF", "Fantasy_Points": 392.6, "Year": 2023},
        {"Player": "Puka Nacua", "Position": "wr", "Team": "LAR", "Fantasy_Points": "262.4", "Year": "2023"}
    ])", &report);

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(report.accepted, 2);
    EXPECT_EQ(report.skipped, 0);
    EXPECT_EQ(records[0].playerName, "Josh Allen");
    EXPECT_EQ(records[0].position, PlayerPosition::QB);
    EXPECT_EQ(records[0].team, "BUF");
    EXPECT_DOUBLE_EQ(records[0].fantasyPoints, 392.6);
    EXPECT_EQ(records[0].year, 2023);
    EXPECT_EQ(records[1].position, PlayerPosition::WR);
    EXPECT_DOUBLE_EQ(records[1].fantasyPoints, 262.4);
    EXPECT_EQ(records[1].year, 2023);
}

TEST(RecordIO, RepairsBadPoints) {
    IngestReport report;
    std::vector<SeasonRecord> records = parseSeasonRecords(R"([
        {"Player": "A", "Position": "RB", "Team": "X", "Fantasy_Points": "N/A", "Year": 2022},
        {"Player": "B", "Position": "RB", "Team": "X", "Fantasy_Points": -4, "Year": 2022},
        {"Player": "C", "Position": "RB", "Team": "X", "Year": 2022},
        {"Player": "D", "Position": "RB", "Team": "X", "Fantasy_Points": null, "Year": 2022}
    ])", &report);

    ASSERT_EQ(records.size(), 4u);
    for (auto& r : records) EXPECT_DOUBLE_EQ(r.fantasyPoints, 0.0);
    EXPECT_EQ(report.repairedPoints, 4);
    EXPECT_EQ(report.accepted, 4);
}

TEST(RecordIO, SkipsRowsWithoutIdentity) {
    IngestReport report;
    std::vector<SeasonRecord> records = parseSeasonRecords(R"([
        {"Position": "RB", "Fantasy_Points": 10, "Year": 2022},
        {"Player": "", "Fantasy_Points": 10, "Year": 2022},
        {"Player": "NoYear", "Fantasy_Points": 10},
        {"Player": "BadYear", "Fantasy_Points": 10, "Year": "twenty"},
        42,
        {"Player": "Kicker", "Position": "K", "Fantasy_Points": 140, "Year": 2022}
    ])", &report);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].playerName, "Kicker");
    EXPECT_EQ(records[0].position, PlayerPosition::OTHER);
    EXPECT_EQ(records[0].team, "");
    EXPECT_EQ(report.skipped, 5);
    EXPECT_EQ(report.accepted, 1);
    EXPECT_FALSE(report.issues.empty());
}

TEST(RecordIO, OutOfRangeYearIsSkipped) {
    IngestReport report;
    std::vector<SeasonRecord> records = parseSeasonRecords(R"([
        {"Player": "Far Future", "Position": "QB", "Fantasy_Points": 100, "Year": 1e20},
        {"Player": "Far Past", "Position": "QB", "Fantasy_Points": 100, "Year": -1e20},
        {"Player": "Half Season", "Position": "QB", "Fantasy_Points": 100, "Year": 2022.5},
        {"Player": "Whole Float", "Position": "QB", "Fantasy_Points": 100, "Year": 2022.0}
    ])", &report);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].playerName, "Whole Float");
    EXPECT_EQ(records[0].year, 2022);
    EXPECT_EQ(report.skipped, 3);
    EXPECT_EQ(report.accepted, 1);
}

TEST(RecordIO, SingleObjectIsOneRecord) {
    std::vector<SeasonRecord> records = parseSeasonRecords(
        R"({"Player": "Solo", "Position": "TE", "Team": "KC", "Fantasy_Points": 150, "Year": 2021})");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].position, PlayerPosition::TE);
}

TEST(RecordIO, MalformedDocumentThrows) {
    try {
        parseSeasonRecords("[{\"Player\": ");
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MALFORMED_RECORD);
        EXPECT_FALSE(e.retryable());
    }
    EXPECT_THROW(parseSeasonRecords("42"), PipelineError);
}

TEST(RecordIO, MissingFileIsDataUnavailable) {
    EXPECT_THROW(loadSeasonRecords("/nonexistent/fantasy_stats.json"), DataUnavailableError);
}

TEST(RecordIO, SeasonRecordsSurviveSerialization) {
    SeasonRecord r;
    r.playerName = "Tyreek Hill";
    r.position = PlayerPosition::WR;
    r.team = "MIA";
    r.fantasyPoints = 376.4;
    r.year = 2023;

    std::vector<SeasonRecord> back = parseSeasonRecords(serializeSeasonRecords({r}));
    ASSERT_EQ(back.size(), 1u);
    EXPECT_EQ(back[0].playerName, r.playerName);
    EXPECT_EQ(back[0].position, r.position);
    EXPECT_EQ(back[0].team, r.team);
    EXPECT_DOUBLE_EQ(back[0].fantasyPoints, r.fantasyPoints);
    EXPECT_EQ(back[0].year, r.year);
}

TEST(RecordIO, PredictionFieldNames) {
    PredictionRecord p;
    p.player = "Bijan Robinson";
    p.position = PlayerPosition::RB;
    p.team = "ATL";
    p.currentPoints = 0.0;
    p.predictedNextYear = 210.5;
    p.hasPercentChange = false;
    p.confidence = 81.2;
    p.age = 22;
    p.experience = 1;

    nlohmann::json doc = nlohmann::json::parse(serializePredictions({p}));
    ASSERT_TRUE(doc.is_array());
    ASSERT_EQ(doc.size(), 1u);
    const nlohmann::json& row = doc[0];
    EXPECT_EQ(row["Player"], "Bijan Robinson");
    EXPECT_EQ(row["Position"], "RB");
    EXPECT_EQ(row["Team"], "ATL");
    EXPECT_EQ(row["Current_Points"], 0.0);
    EXPECT_EQ(row["Predicted_Next_Year"], 210.5);
    EXPECT_TRUE(row["Percent_Change"].is_null());
    EXPECT_EQ(row["Confidence"], 81.2);
    EXPECT_EQ(row["Age"], 22);
    EXPECT_EQ(row["Experience"], 1);
}

TEST(RecordIO, ParsePredictionsAppliesDefaults) {
    PredictionSet set = parsePredictions(R"([
        {"Player": "Old Format", "Position": "WR", "Current_Points": 100,
         "Predicted_Next_Year": 120, "Percent_Change": 20.0, "Confidence": 88.8},
        {"Player": "Zero Start", "Position": "QB", "Team": "NYG", "Current_Points": 0,
         "Predicted_Next_Year": 50, "Percent_Change": null, "Confidence": 71.0,
         "Age": 24, "Experience": 2}
    ])");

    ASSERT_EQ(set.size(), 2u);
    EXPECT_EQ(set[0].team, "N/A");
    EXPECT_EQ(set[0].age, 27);
    EXPECT_EQ(set[0].experience, 5);
    EXPECT_TRUE(set[0].hasPercentChange);
    EXPECT_DOUBLE_EQ(set[0].percentChange, 20.0);

    EXPECT_EQ(set[1].team, "NYG");
    EXPECT_EQ(set[1].age, 24);
    EXPECT_EQ(set[1].experience, 2);
    EXPECT_FALSE(set[1].hasPercentChange);
}

TEST(RecordIO, OutOfRangeAttributesFallBackToDefaults) {
    PredictionSet set = parsePredictions(R"([
        {"Player": "Huge", "Position": "RB", "Predicted_Next_Year": 150,
         "Age": 1e30, "Experience": -1e30},
        {"Player": "Fractional", "Position": "RB", "Predicted_Next_Year": 140,
         "Age": 24.5, "Experience": "3"}
    ])");

    ASSERT_EQ(set.size(), 2u);
    EXPECT_EQ(set[0].age, 27);
    EXPECT_EQ(set[0].experience, 5);
    EXPECT_EQ(set[1].age, 27);
    EXPECT_EQ(set[1].experience, 3);
}

TEST(RecordIO, StorageKeys) {
    EXPECT_EQ(predictionsKey(2024), "predictions/fantasy_predictions_2024.json");
    EXPECT_EQ(historicalDataKey("20240901_120000"), "raw_data/fantasy_stats_20240901_120000.json");
}
