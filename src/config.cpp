#include "ff/config.h"
#include <nlohmann/json.hpp>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace ff {

namespace {

FeatureSchema parseSchema(const nlohmann::json& j) {
    if (j.is_number_integer()) {
        int version = j.get<int>();
        if (version == 1) return FeatureSchema::BASE;
        if (version == 2) return FeatureSchema::EXTENDED;
        throw std::invalid_argument("feature_schema: unknown version " + std::to_string(version));
    }
    std::string name = j.get<std::string>();
    if (name == "base") return FeatureSchema::BASE;
    if (name == "extended") return FeatureSchema::EXTENDED;
    throw std::invalid_argument("feature_schema: expected \"base\" or \"extended\", got " + name);
}

AgeSampling parseSampling(const std::string& name) {
    if (name == "identity_stable") return AgeSampling::IDENTITY_STABLE;
    if (name == "resampled") return AgeSampling::RESAMPLED;
    throw std::invalid_argument("age_sampling: expected \"identity_stable\" or \"resampled\", got " + name);
}

// Position codes (any case), plus "default" as an alias for the OTHER slot.
PlayerPosition tableKey(const std::string& table, const std::string& key) {
    if (key == "default") return PlayerPosition::OTHER;
    std::string upper;
    for (char c : key) upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    for (int i = 0; i < NUM_POSITIONS; ++i) {
        PlayerPosition p = static_cast<PlayerPosition>(i);
        if (upper == positionName(p)) return p;
    }
    throw std::invalid_argument(table + ": unknown position key \"" + key +
                                "\" (expected QB, RB, WR, TE, OTHER or default)");
}

void applyForest(const nlohmann::json& j, ForestParams& forest) {
    if (j.contains("num_trees")) forest.numTrees = j["num_trees"].get<int>();
    if (j.contains("max_depth")) forest.maxDepth = j["max_depth"].get<int>();
    if (j.contains("min_samples_split")) forest.minSamplesSplit = j["min_samples_split"].get<int>();
    if (j.contains("min_samples_leaf")) forest.minSamplesLeaf = j["min_samples_leaf"].get<int>();
    if (j.contains("seed")) forest.seed = j["seed"].get<uint32_t>();
}

void applyJson(const nlohmann::json& j, PipelineConfig& config) {
    if (!j.is_object()) {
        throw std::invalid_argument("config: top-level value must be an object");
    }

    if (j.contains("data_dir")) config.dataDir = j["data_dir"].get<std::string>();
    if (j.contains("model_dir")) config.modelDir = j["model_dir"].get<std::string>();
    if (j.contains("epoch_year")) config.epochYear = j["epoch_year"].get<int>();
    if (j.contains("feature_schema")) config.featureSchema = parseSchema(j["feature_schema"]);
    if (j.contains("age_sampling")) config.ageSampling = parseSampling(j["age_sampling"].get<std::string>());

    if (j.contains("age_ranges")) {
        for (auto& item : j["age_ranges"].items()) {
            const std::string& key = item.key();
            const nlohmann::json& value = item.value();
            if (!value.is_array() || value.size() != 2) {
                throw std::invalid_argument("age_ranges." + key + ": expected [lo, hi]");
            }
            config.ageRanges[positionIndex(tableKey("age_ranges", key))] = {value[0].get<int>(), value[1].get<int>()};
        }
    }

    if (j.contains("position_variance")) {
        for (auto& item : j["position_variance"].items()) {
            config.positionVariance[positionIndex(tableKey("position_variance", item.key()))] = item.value().get<double>();
        }
    }

    if (j.contains("confidence_min")) config.confidenceMin = j["confidence_min"].get<double>();
    if (j.contains("confidence_max")) config.confidenceMax = j["confidence_max"].get<double>();
    if (j.contains("top_n")) config.topN = j["top_n"].get<int>();
    if (j.contains("forest")) applyForest(j["forest"], config.forest);
    if (j.contains("test_fraction")) config.testFraction = j["test_fraction"].get<double>();
    if (j.contains("split_seed")) config.splitSeed = j["split_seed"].get<uint32_t>();
    if (j.contains("prediction_seed")) config.predictionSeed = j["prediction_seed"].get<uint32_t>();
    if (j.contains("verbose")) config.verbose = j["verbose"].get<bool>();
}

} // anonymous namespace

void validateConfig(const PipelineConfig& config) {
    for (int i = 0; i < NUM_POSITIONS; ++i) {
        const char* name = positionName(static_cast<PlayerPosition>(i));
        const AgeRange& r = config.ageRanges[i];
        if (r.hi <= r.lo) {
            throw std::invalid_argument(std::string("age_ranges.") + name + ": empty interval");
        }
        double v = config.positionVariance[i];
        if (v < 0.0 || v >= 1.0) {
            throw std::invalid_argument(std::string("position_variance.") + name + ": must be in [0, 1)");
        }
    }
    if (config.confidenceMin > config.confidenceMax) {
        throw std::invalid_argument("confidence_min exceeds confidence_max");
    }
    if (config.topN < 0) {
        throw std::invalid_argument("top_n must not be negative");
    }
    if (config.forest.numTrees <= 0 || config.forest.maxDepth <= 0) {
        throw std::invalid_argument("forest: num_trees and max_depth must be positive");
    }
    if (config.forest.minSamplesSplit < 2 || config.forest.minSamplesLeaf < 1) {
        throw std::invalid_argument("forest: min_samples_split >= 2 and min_samples_leaf >= 1 required");
    }
    if (config.testFraction < 0.0 || config.testFraction >= 1.0) {
        throw std::invalid_argument("test_fraction must be in [0, 1)");
    }
}

PipelineConfig parsePipelineConfig(const std::string& json) {
    PipelineConfig config;
    try {
        applyJson(nlohmann::json::parse(json), config);
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("config: ") + e.what());
    }
    validateConfig(config);
    return config;
}

PipelineConfig loadPipelineConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("unable to open config file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return parsePipelineConfig(content);
}

} // namespace ff
