#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include "ff/analyzer.h"
#include "ff/attribute_estimator.h"
#include "ff/blob_store.h"
#include "ff/config.h"
#include "ff/enums.h"
#include "ff/errors.h"
#include "ff/feature_builder.h"
#include "ff/pipeline.h"
#include "ff/query.h"
#include "ff/random_source.h"
#include "ff/record_io.h"
#include "ff/records.h"
#include "ff/trainer.h"

namespace py = pybind11;

PYBIND11_MODULE(ff_engine, m) {
    m.doc() = "Fantasy Forecast C++ Engine - Python bindings";

    // --- Enums ---
    py::enum_<ff::PlayerPosition>(m, "PlayerPosition")
        .value("QB", ff::PlayerPosition::QB)
        .value("RB", ff::PlayerPosition::RB)
        .value("WR", ff::PlayerPosition::WR)
        .value("TE", ff::PlayerPosition::TE)
        .value("OTHER", ff::PlayerPosition::OTHER);

    py::enum_<ff::FeatureSchema>(m, "FeatureSchema")
        .value("BASE", ff::FeatureSchema::BASE)
        .value("EXTENDED", ff::FeatureSchema::EXTENDED);

    py::enum_<ff::AgeSampling>(m, "AgeSampling")
        .value("IDENTITY_STABLE", ff::AgeSampling::IDENTITY_STABLE)
        .value("RESAMPLED", ff::AgeSampling::RESAMPLED);

    py::enum_<ff::ErrorKind>(m, "ErrorKind")
        .value("DATA_UNAVAILABLE", ff::ErrorKind::DATA_UNAVAILABLE)
        .value("INSUFFICIENT_DATA", ff::ErrorKind::INSUFFICIENT_DATA)
        .value("MALFORMED_RECORD", ff::ErrorKind::MALFORMED_RECORD)
        .value("ARTIFACT_UNAVAILABLE", ff::ErrorKind::ARTIFACT_UNAVAILABLE)
        .value("SCHEMA_MISMATCH", ff::ErrorKind::SCHEMA_MISMATCH)
        .value("INVALID_CONFIG", ff::ErrorKind::INVALID_CONFIG)
        .value("STORAGE", ff::ErrorKind::STORAGE);

    m.def("parse_position", &ff::parsePosition);
    m.def("position_name", &ff::positionName);

    // --- Records ---
    py::class_<ff::SeasonRecord>(m, "SeasonRecord")
        .def(py::init<>())
        .def_readwrite("player_name", &ff::SeasonRecord::playerName)
        .def_readwrite("position", &ff::SeasonRecord::position)
        .def_readwrite("team", &ff::SeasonRecord::team)
        .def_readwrite("fantasy_points", &ff::SeasonRecord::fantasyPoints)
        .def_readwrite("year", &ff::SeasonRecord::year)
        .def("__repr__", [](const ff::SeasonRecord& r) {
            return "SeasonRecord(" + r.playerName + ", " + ff::positionName(r.position) +
                   ", " + std::to_string(r.year) + ")";
        });

    py::class_<ff::AttributeEstimate>(m, "AttributeEstimate")
        .def(py::init<>())
        .def_readwrite("age", &ff::AttributeEstimate::age)
        .def_readwrite("experience", &ff::AttributeEstimate::experience);

    py::class_<ff::PredictionRecord>(m, "PredictionRecord")
        .def(py::init<>())
        .def_readonly("player", &ff::PredictionRecord::player)
        .def_readonly("position", &ff::PredictionRecord::position)
        .def_readonly("team", &ff::PredictionRecord::team)
        .def_readonly("current_points", &ff::PredictionRecord::currentPoints)
        .def_readonly("predicted_next_year", &ff::PredictionRecord::predictedNextYear)
        .def_property_readonly("percent_change", [](const ff::PredictionRecord& p) -> py::object {
            if (!p.hasPercentChange) return py::none();
            return py::float_(p.percentChange);
        })
        .def_readonly("confidence", &ff::PredictionRecord::confidence)
        .def_readonly("age", &ff::PredictionRecord::age)
        .def_readonly("experience", &ff::PredictionRecord::experience);

    m.def("parse_season_records", [](const std::string& json) {
        return ff::parseSeasonRecords(json);
    });
    m.def("load_season_records", [](const std::string& path) {
        return ff::loadSeasonRecords(path);
    });
    m.def("serialize_predictions", &ff::serializePredictions);
    m.def("parse_predictions", &ff::parsePredictions);

    // --- Config ---
    py::class_<ff::ForestParams>(m, "ForestParams")
        .def(py::init<>())
        .def_readwrite("num_trees", &ff::ForestParams::numTrees)
        .def_readwrite("max_depth", &ff::ForestParams::maxDepth)
        .def_readwrite("min_samples_split", &ff::ForestParams::minSamplesSplit)
        .def_readwrite("min_samples_leaf", &ff::ForestParams::minSamplesLeaf)
        .def_readwrite("seed", &ff::ForestParams::seed);

    py::class_<ff::PipelineConfig>(m, "PipelineConfig")
        .def(py::init<>())
        .def_readwrite("data_dir", &ff::PipelineConfig::dataDir)
        .def_readwrite("model_dir", &ff::PipelineConfig::modelDir)
        .def_readwrite("epoch_year", &ff::PipelineConfig::epochYear)
        .def_readwrite("feature_schema", &ff::PipelineConfig::featureSchema)
        .def_readwrite("age_sampling", &ff::PipelineConfig::ageSampling)
        .def_readwrite("confidence_min", &ff::PipelineConfig::confidenceMin)
        .def_readwrite("confidence_max", &ff::PipelineConfig::confidenceMax)
        .def_readwrite("top_n", &ff::PipelineConfig::topN)
        .def_readwrite("forest", &ff::PipelineConfig::forest)
        .def_readwrite("test_fraction", &ff::PipelineConfig::testFraction)
        .def_readwrite("split_seed", &ff::PipelineConfig::splitSeed)
        .def_readwrite("prediction_seed", &ff::PipelineConfig::predictionSeed)
        .def_readwrite("verbose", &ff::PipelineConfig::verbose);

    m.def("parse_config", &ff::parsePipelineConfig);
    m.def("load_config", &ff::loadPipelineConfig);

    // --- Features ---
    m.def("feature_names", &ff::featureNames, py::arg("schema") = ff::FeatureSchema::EXTENDED);
    m.def("age_factor", &ff::ageFactor);
    m.def("experience_factor", &ff::experienceFactor);

    m.def("encode_features", [](const ff::SeasonRecord& season, const ff::AttributeEstimate& attrs,
                                bool sameTeam, ff::FeatureSchema schema, int epochYear) {
        double features[ff::MAX_FEATURES] = {};
        ff::encodeFeatures(season, season.position, attrs, sameTeam, schema, epochYear, features);
        return py::array_t<double>(ff::featureCount(schema), features);
    }, py::arg("season"), py::arg("attrs"), py::arg("same_team") = true,
       py::arg("schema") = ff::FeatureSchema::EXTENDED, py::arg("epoch_year") = 2019);

    m.def("estimate_attributes", [](const std::string& name, ff::PlayerPosition pos,
                                    const ff::PipelineConfig& config) {
        ff::RandomGenerator rng;
        ff::AttributeEstimator estimator(config, rng);
        return estimator.estimate(name, pos);
    }, py::arg("name"), py::arg("position"), py::arg("config") = ff::PipelineConfig());

    // --- Storage ---
    py::class_<ff::BlobStore>(m, "BlobStore")
        .def("put", &ff::BlobStore::put)
        .def("contains", &ff::BlobStore::contains)
        .def("list", &ff::BlobStore::list, py::arg("prefix") = "")
        .def("get", [](const ff::BlobStore& s, const std::string& key) -> py::object {
            std::string out;
            if (!s.get(key, out)) return py::none();
            return py::str(out);
        });

    py::class_<ff::MemoryBlobStore, ff::BlobStore>(m, "MemoryBlobStore")
        .def(py::init<>());

    py::class_<ff::DirectoryBlobStore, ff::BlobStore>(m, "DirectoryBlobStore")
        .def(py::init([](const std::string& root) {
            return new ff::DirectoryBlobStore(root);
        }));

    // --- Pipeline ---
    py::class_<ff::StageError>(m, "StageError")
        .def_readonly("stage", &ff::StageError::stage)
        .def_readonly("kind", &ff::StageError::kind)
        .def_readonly("message", &ff::StageError::message)
        .def_readonly("retryable", &ff::StageError::retryable);

    py::class_<ff::TrainingOutcome>(m, "TrainingOutcome")
        .def_readonly("ok", &ff::TrainingOutcome::ok)
        .def_readonly("error", &ff::TrainingOutcome::error)
        .def_readonly("artifact_id", &ff::TrainingOutcome::artifactId)
        .def_readonly("examples", &ff::TrainingOutcome::examples)
        .def_property_readonly("r2", [](const ff::TrainingOutcome& o) {
            return o.metadata.metrics.r2;
        })
        .def_property_readonly("rmse", [](const ff::TrainingOutcome& o) {
            return o.metadata.metrics.rmse;
        })
        .def_property_readonly("feature_importance", [](const ff::TrainingOutcome& o) {
            py::dict d;
            for (auto& fi : o.metadata.metrics.featureImportance) {
                d[py::str(fi.feature)] = fi.importance;
            }
            return d;
        });

    py::class_<ff::PredictionOutcome>(m, "PredictionOutcome")
        .def_readonly("ok", &ff::PredictionOutcome::ok)
        .def_readonly("error", &ff::PredictionOutcome::error)
        .def_readonly("predictions", &ff::PredictionOutcome::predictions)
        .def_readonly("model_key", &ff::PredictionOutcome::modelKey)
        .def_readonly("predictions_key", &ff::PredictionOutcome::predictionsKey)
        .def_readonly("season_year", &ff::PredictionOutcome::seasonYear);

    m.def("train", &ff::runTraining, py::arg("history"), py::arg("config"), py::arg("store"));

    m.def("predict", [](const std::vector<ff::SeasonRecord>& current, const ff::PipelineConfig& config,
                        ff::BlobStore& store, uint32_t seed) {
        ff::RandomGenerator noise(seed);
        return ff::runPrediction(current, config, store, store, noise);
    }, py::arg("current"), py::arg("config"), py::arg("store"), py::arg("seed") = 42);

    // --- Query & analysis (JSON documents) ---
    m.def("query", [](const ff::PredictionSet& predictions, int topN, const std::string& position) {
        ff::PredictionQuery query;
        query.topN = topN;
        query.position = position;
        ff::QueryResult result = ff::queryPredictions(predictions, query);
        return py::make_tuple(ff::queryStatusCode(result.status), ff::queryResultToJson(result));
    }, py::arg("predictions"), py::arg("top_n") = 50, py::arg("position") = "");

    py::enum_<ff::AnalysisType>(m, "AnalysisType")
        .value("ALL", ff::AnalysisType::ALL)
        .value("PREDICTIONS", ff::AnalysisType::PREDICTIONS)
        .value("HISTORICAL", ff::AnalysisType::HISTORICAL)
        .value("INSIGHTS", ff::AnalysisType::INSIGHTS);

    m.def("analyze", [](const ff::PredictionSet& predictions,
                        const std::vector<ff::SeasonRecord>& history, ff::AnalysisType type) {
        std::vector<std::string> insights;
        if (ff::includesInsights(type)) insights = ff::generateInsights(predictions, history);
        return ff::analysisReportToJson(ff::analyzePredictions(predictions),
                                        ff::analyzeHistorical(history),
                                        insights, type, ff::currentTimestamp());
    }, py::arg("predictions"), py::arg("history"), py::arg("type") = ff::AnalysisType::ALL);

    m.def("generate_insights", &ff::generateInsights,
          py::arg("predictions"), py::arg("history"), py::arg("trend_years") = 3);

    m.attr("NUM_BASE_FEATURES") = ff::NUM_BASE_FEATURES;
    m.attr("NUM_EXTENDED_FEATURES") = ff::NUM_EXTENDED_FEATURES;
}
