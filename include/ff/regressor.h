#pragma once

#include "ff/config.h"
#include "ff/feature_builder.h"
#include <memory>
#include <string>
#include <vector>

namespace ff {

class Regressor {
public:
    virtual ~Regressor() = default;

    // Throws std::invalid_argument on empty or ragged input.
    virtual void fit(const std::vector<FeatureVector>& X, const std::vector<double>& y) = 0;
    virtual double predict(const double* features, int numFeatures) const = 0;

    // One entry per input feature; sums to 1 unless the model never split.
    virtual std::vector<double> featureImportances() const = 0;
    virtual int numFeatures() const = 0;
    virtual const char* typeName() const = 0;

    // JSON document readable by loadRegressorFromString.
    virtual std::string serialize() const = 0;

    std::vector<double> predictBatch(const std::vector<FeatureVector>& X) const;
};

// Preorder node storage; children always have larger indices than their parent.
struct TreeNode {
    int feature = -1;        // -1 marks a leaf
    double threshold = 0.0;  // go left when x[feature] <= threshold
    int left = -1;
    int right = -1;
    double value = 0.0;      // mean label of the node's samples
};

class RegressionTree {
    std::vector<TreeNode> nodes_;
public:
    RegressionTree() = default;
    explicit RegressionTree(std::vector<TreeNode> nodes);

    // Grows a CART tree over rows[] (duplicates allowed, e.g. a bootstrap).
    // Adds each split's squared-error decrease to importance[feature].
    void grow(const std::vector<FeatureVector>& X, const std::vector<double>& y,
              const std::vector<int>& rows, const ForestParams& params,
              std::vector<double>& importance);

    double predict(const double* features) const;

    const std::vector<TreeNode>& nodes() const { return nodes_; }
    int depth() const;

private:
    int growNode(const std::vector<FeatureVector>& X, const std::vector<double>& y,
                 std::vector<int>& rows, int depth, const ForestParams& params,
                 std::vector<double>& importance);
};

// Bootstrap-aggregated regression trees; prediction is the mean over trees.
class RandomForestRegressor : public Regressor {
    ForestParams params_;
    int numFeatures_ = 0;
    std::vector<RegressionTree> trees_;
    std::vector<double> importances_;

public:
    explicit RandomForestRegressor(ForestParams params = ForestParams());
    RandomForestRegressor(ForestParams params, int numFeatures,
                          std::vector<RegressionTree> trees,
                          std::vector<double> importances);

    void fit(const std::vector<FeatureVector>& X, const std::vector<double>& y) override;
    double predict(const double* features, int numFeatures) const override;
    std::vector<double> featureImportances() const override { return importances_; }
    int numFeatures() const override { return numFeatures_; }
    const char* typeName() const override { return "RandomForestRegressor"; }
    std::string serialize() const override;

    const ForestParams& params() const { return params_; }
    const std::vector<RegressionTree>& trees() const { return trees_; }
};

// Dispatches on the document's "type". Returns nullptr for unknown types or
// structurally invalid trees; throws nlohmann::json::exception on bad JSON.
std::unique_ptr<Regressor> loadRegressorFromString(const std::string& json);

} // namespace ff
