#pragma once

#include "ff/blob_store.h"
#include "ff/trainer.h"
#include <string>

namespace ff {

constexpr const char* LATEST_MODEL_KEY = "latest_model.json";

struct LatestModelRef {
    std::string modelKey;
    std::string metadataKey;
    std::string lastUpdated;
};

std::string metadataToJson(const ModelMetadata& meta);

// Full artifact: metadata plus the serialized regressor.
std::string serializeModel(const TrainedModel& model);

// Throws ArtifactUnavailableError if the document is not a readable model.
TrainedModel deserializeModel(const std::string& json);

// Versioned model artifacts keyed by training timestamp, plus a mutable
// pointer to the newest one.
class ModelRegistry {
    BlobStore& store_;
public:
    explicit ModelRegistry(BlobStore& store);

    // Writes models/fantasy_predictor_<ts>.json and metadata/model_metadata_<ts>.json,
    // then repoints latest_model.json. Returns the model key (the artifact id).
    // An existing key is never overwritten; a numeric suffix is appended instead.
    std::string save(const TrainedModel& model);

    // Throw ArtifactUnavailableError when the artifact or pointer is missing or unreadable.
    TrainedModel load(const std::string& artifactId) const;
    TrainedModel loadLatest() const;

    // False when no model has been saved yet.
    bool latest(LatestModelRef& out) const;
};

} // namespace ff
