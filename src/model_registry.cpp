#include "ff/model_registry.h"
#include "ff/errors.h"
#include <nlohmann/json.hpp>

namespace ff {

namespace {

nlohmann::json metadataJson(const ModelMetadata& meta) {
    nlohmann::json importance = nlohmann::json::object();
    for (auto& fi : meta.metrics.featureImportance) {
        importance[fi.feature] = fi.importance;
    }

    nlohmann::json sample = nlohmann::json::array();
    for (auto& t : meta.transitionSample) {
        nlohmann::json entry = {
            {"player", t.player},
            {"position", positionName(t.position)},
            {"current_year", t.currentYear},
            {"next_year", t.nextYear}
        };
        sample.push_back(std::move(entry));
    }

    nlohmann::json j;
    j["timestamp"] = meta.timestamp;
    j["model_type"] = meta.modelType;
    j["training_samples"] = meta.trainingSamples;
    j["features"] = meta.featureCount;
    j["schema_version"] = schemaVersion(meta.schema);
    j["epoch_year"] = meta.epochYear;
    j["feature_names"] = meta.featureNames;
    j["metrics"] = {
        {"mse", meta.metrics.mse},
        {"rmse", meta.metrics.rmse},
        {"r2", meta.metrics.r2},
        {"feature_importance", importance},
        {"train_samples", meta.metrics.trainSamples},
        {"test_samples", meta.metrics.testSamples},
        {"evaluated_on_training_data", meta.metrics.evaluatedOnTrainingData}
    };
    j["test_predictions"] = {
        {"y_test", meta.metrics.testLabels},
        {"y_pred", meta.metrics.testPredictions}
    };
    j["player_info_sample"] = std::move(sample);
    return j;
}

ModelMetadata parseMetadata(const nlohmann::json& j) {
    ModelMetadata meta;
    meta.timestamp = j.at("timestamp").get<std::string>();
    meta.modelType = j.at("model_type").get<std::string>();
    meta.trainingSamples = j.at("training_samples").get<int>();
    meta.featureCount = j.at("features").get<int>();

    int version = j.at("schema_version").get<int>();
    if (version == 1) meta.schema = FeatureSchema::BASE;
    else if (version == 2) meta.schema = FeatureSchema::EXTENDED;
    else throw std::runtime_error("unknown feature schema version " + std::to_string(version));

    meta.epochYear = j.at("epoch_year").get<int>();
    meta.featureNames = j.at("feature_names").get<std::vector<std::string>>();

    const nlohmann::json& m = j.at("metrics");
    meta.metrics.mse = m.at("mse").get<double>();
    meta.metrics.rmse = m.at("rmse").get<double>();
    meta.metrics.r2 = m.at("r2").get<double>();
    meta.metrics.trainSamples = m.value("train_samples", 0);
    meta.metrics.testSamples = m.value("test_samples", 0);
    meta.metrics.evaluatedOnTrainingData = m.value("evaluated_on_training_data", false);

    // Object keys come back sorted; restore layout order from feature_names.
    const nlohmann::json& importance = m.at("feature_importance");
    for (auto& name : meta.featureNames) {
        meta.metrics.featureImportance.push_back({name, importance.value(name, 0.0)});
    }

    if (j.contains("test_predictions")) {
        auto& tp = j["test_predictions"];
        meta.metrics.testLabels = tp.value("y_test", std::vector<double>());
        meta.metrics.testPredictions = tp.value("y_pred", std::vector<double>());
    }

    if (j.contains("player_info_sample")) {
        for (auto& s : j["player_info_sample"]) {
            meta.transitionSample.push_back({
                s.at("player").get<std::string>(),
                parsePosition(s.at("position").get<std::string>()),
                s.at("current_year").get<int>(),
                s.at("next_year").get<int>()
            });
        }
    }
    return meta;
}

std::string modelKeyFor(const std::string& stamp) {
    return "models/fantasy_predictor_" + stamp + ".json";
}

std::string metadataKeyFor(const std::string& stamp) {
    return "metadata/model_metadata_" + stamp + ".json";
}

} // anonymous namespace

std::string metadataToJson(const ModelMetadata& meta) {
    return metadataJson(meta).dump(2);
}

std::string serializeModel(const TrainedModel& model) {
    if (!model.regressor) {
        throw ArtifactUnavailableError("save_model", "model has no fitted regressor");
    }
    nlohmann::json j;
    j["metadata"] = metadataJson(model.metadata);
    j["regressor"] = nlohmann::json::parse(model.regressor->serialize());
    return j.dump();
}

TrainedModel deserializeModel(const std::string& json) {
    TrainedModel model;
    try {
        auto j = nlohmann::json::parse(json);
        model.metadata = parseMetadata(j.at("metadata"));
        model.regressor = loadRegressorFromString(j.at("regressor").dump());
    } catch (const std::exception& e) {
        throw ArtifactUnavailableError("load_model", std::string("unreadable model artifact: ") + e.what());
    }

    if (!model.regressor) {
        throw ArtifactUnavailableError("load_model", "unsupported or corrupt regressor in model artifact");
    }
    if (model.regressor->numFeatures() != model.metadata.featureCount ||
        model.metadata.featureCount != featureCount(model.metadata.schema)) {
        throw ArtifactUnavailableError("load_model", "model artifact feature count is inconsistent");
    }
    return model;
}

// --- ModelRegistry ---

ModelRegistry::ModelRegistry(BlobStore& store) : store_(store) {}

std::string ModelRegistry::save(const TrainedModel& model) {
    std::string payload = serializeModel(model);

    std::string stamp = model.metadata.timestamp;
    int suffix = 0;
    while (store_.contains(modelKeyFor(stamp)) || store_.contains(metadataKeyFor(stamp))) {
        stamp = model.metadata.timestamp + "_" + std::to_string(++suffix);
    }

    std::string modelKey = modelKeyFor(stamp);
    std::string metadataKey = metadataKeyFor(stamp);
    store_.put(modelKey, payload);
    store_.put(metadataKey, metadataToJson(model.metadata));

    nlohmann::json latestRef = {
        {"latest_model_key", modelKey},
        {"latest_metadata_key", metadataKey},
        {"last_updated", model.metadata.timestamp}
    };
    store_.put(LATEST_MODEL_KEY, latestRef.dump(2));
    return modelKey;
}

TrainedModel ModelRegistry::load(const std::string& artifactId) const {
    std::string payload;
    if (!store_.get(artifactId, payload)) {
        throw ArtifactUnavailableError("load_model", "model artifact not found: " + artifactId);
    }
    return deserializeModel(payload);
}

bool ModelRegistry::latest(LatestModelRef& out) const {
    std::string payload;
    if (!store_.get(LATEST_MODEL_KEY, payload)) return false;

    try {
        auto j = nlohmann::json::parse(payload);
        out.modelKey = j.at("latest_model_key").get<std::string>();
        out.metadataKey = j.value("latest_metadata_key", std::string());
        out.lastUpdated = j.value("last_updated", std::string());
    } catch (const nlohmann::json::exception& e) {
        throw ArtifactUnavailableError("load_model", std::string("unreadable latest model reference: ") + e.what());
    }
    return true;
}

TrainedModel ModelRegistry::loadLatest() const {
    LatestModelRef ref;
    if (!latest(ref)) {
        throw ArtifactUnavailableError("load_model", "no latest model reference; train a model first");
    }
    return load(ref.modelKey);
}

} // namespace ff
