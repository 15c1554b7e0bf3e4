#include "ff/regressor.h"
#include "ff/random_source.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ff {

namespace {

struct NodeStats {
    double sum = 0.0;
    double sumSq = 0.0;
    int count = 0;

    void add(double v) { sum += v; sumSq += v * v; ++count; }
    double mean() const { return count > 0 ? sum / count : 0.0; }
    // Sum of squared deviations from the mean
    double sse() const {
        if (count == 0) return 0.0;
        return std::max(0.0, sumSq - sum * sum / count);
    }
};

void checkTrainingInput(const std::vector<FeatureVector>& X, const std::vector<double>& y) {
    if (X.empty()) {
        throw std::invalid_argument("Regressor::fit: no samples");
    }
    if (X.size() != y.size()) {
        throw std::invalid_argument("Regressor::fit: feature/label count mismatch");
    }
    size_t width = X[0].size();
    if (width == 0) {
        throw std::invalid_argument("Regressor::fit: zero-width feature vectors");
    }
    for (auto& row : X) {
        if (row.size() != width) {
            throw std::invalid_argument("Regressor::fit: ragged feature matrix");
        }
    }
}

void normalize(std::vector<double>& v) {
    double total = 0.0;
    for (double x : v) total += x;
    if (total > 0.0) {
        for (double& x : v) x /= total;
    }
}

} // anonymous namespace

// --- Regressor ---

std::vector<double> Regressor::predictBatch(const std::vector<FeatureVector>& X) const {
    std::vector<double> out;
    out.reserve(X.size());
    for (auto& row : X) {
        out.push_back(predict(row.data(), static_cast<int>(row.size())));
    }
    return out;
}

// --- RegressionTree ---

RegressionTree::RegressionTree(std::vector<TreeNode> nodes) : nodes_(std::move(nodes)) {}

void RegressionTree::grow(const std::vector<FeatureVector>& X, const std::vector<double>& y,
                          const std::vector<int>& rows, const ForestParams& params,
                          std::vector<double>& importance) {
    nodes_.clear();
    if (rows.empty()) return;
    std::vector<int> work = rows;
    growNode(X, y, work, 0, params, importance);
}

int RegressionTree::growNode(const std::vector<FeatureVector>& X, const std::vector<double>& y,
                             std::vector<int>& rows, int depth, const ForestParams& params,
                             std::vector<double>& importance) {
    NodeStats total;
    for (int r : rows) total.add(y[r]);

    int nodeIdx = static_cast<int>(nodes_.size());
    TreeNode node;
    node.value = total.mean();
    nodes_.push_back(node);

    const int n = total.count;
    const double nodeSse = total.sse();
    if (depth >= params.maxDepth || n < params.minSamplesSplit ||
        n < 2 * params.minSamplesLeaf || nodeSse <= 1e-12) {
        return nodeIdx;
    }

    // Exhaustive search: every feature, every boundary between distinct values.
    const int numFeatures = static_cast<int>(X[rows[0]].size());
    int bestFeature = -1;
    double bestThreshold = 0.0;
    double bestSse = nodeSse;

    std::vector<int> sorted = rows;
    for (int f = 0; f < numFeatures; ++f) {
        std::sort(sorted.begin(), sorted.end(),
                  [&X, f](int a, int b) { return X[a][f] < X[b][f]; });

        NodeStats left;
        for (int i = 0; i + 1 < n; ++i) {
            left.add(y[sorted[i]]);
            double xi = X[sorted[i]][f];
            double xNext = X[sorted[i + 1]][f];
            if (xi == xNext) continue;

            int rightCount = n - left.count;
            if (left.count < params.minSamplesLeaf || rightCount < params.minSamplesLeaf) continue;

            NodeStats right;
            right.sum = total.sum - left.sum;
            right.sumSq = total.sumSq - left.sumSq;
            right.count = rightCount;

            double sse = left.sse() + right.sse();
            if (sse < bestSse - 1e-12) {
                bestSse = sse;
                bestFeature = f;
                bestThreshold = xi + (xNext - xi) / 2.0;
            }
        }
    }

    if (bestFeature < 0) return nodeIdx;

    std::vector<int> leftRows;
    std::vector<int> rightRows;
    leftRows.reserve(rows.size());
    rightRows.reserve(rows.size());
    for (int r : rows) {
        if (X[r][bestFeature] <= bestThreshold) leftRows.push_back(r);
        else rightRows.push_back(r);
    }

    importance[bestFeature] += nodeSse - bestSse;

    // Recursion grows nodes_, so write through the index, not a reference.
    int leftIdx = growNode(X, y, leftRows, depth + 1, params, importance);
    int rightIdx = growNode(X, y, rightRows, depth + 1, params, importance);
    nodes_[nodeIdx].feature = bestFeature;
    nodes_[nodeIdx].threshold = bestThreshold;
    nodes_[nodeIdx].left = leftIdx;
    nodes_[nodeIdx].right = rightIdx;
    return nodeIdx;
}

double RegressionTree::predict(const double* features) const {
    if (nodes_.empty()) return 0.0;
    int idx = 0;
    while (nodes_[idx].feature >= 0) {
        const TreeNode& node = nodes_[idx];
        idx = (features[node.feature] <= node.threshold) ? node.left : node.right;
    }
    return nodes_[idx].value;
}

int RegressionTree::depth() const {
    if (nodes_.empty()) return 0;
    // Children follow parents in preorder, so one forward pass suffices.
    std::vector<int> level(nodes_.size(), 0);
    int deepest = 0;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        const TreeNode& node = nodes_[i];
        if (node.feature < 0) continue;
        level[node.left] = level[i] + 1;
        level[node.right] = level[i] + 1;
        deepest = std::max(deepest, level[i] + 1);
    }
    return deepest;
}

// --- RandomForestRegressor ---

RandomForestRegressor::RandomForestRegressor(ForestParams params) : params_(params) {}

RandomForestRegressor::RandomForestRegressor(ForestParams params, int numFeatures,
                                             std::vector<RegressionTree> trees,
                                             std::vector<double> importances)
    : params_(params), numFeatures_(numFeatures),
      trees_(std::move(trees)), importances_(std::move(importances)) {
    if (static_cast<int>(importances_.size()) != numFeatures_) {
        importances_.resize(numFeatures_, 0.0);
    }
}

void RandomForestRegressor::fit(const std::vector<FeatureVector>& X, const std::vector<double>& y) {
    checkTrainingInput(X, y);

    numFeatures_ = static_cast<int>(X[0].size());
    trees_.clear();
    trees_.reserve(params_.numTrees);
    importances_.assign(numFeatures_, 0.0);

    RandomGenerator rng(params_.seed);
    const int n = static_cast<int>(X.size());
    int splitTrees = 0;

    for (int t = 0; t < params_.numTrees; ++t) {
        std::vector<int> bootstrap(n);
        for (int i = 0; i < n; ++i) {
            bootstrap[i] = rng.uniformInt(0, n);
        }

        std::vector<double> treeImportance(numFeatures_, 0.0);
        RegressionTree tree;
        tree.grow(X, y, bootstrap, params_, treeImportance);

        // Stumps contribute nothing; average only over trees that split.
        if (tree.nodes().size() > 1) {
            normalize(treeImportance);
            for (int f = 0; f < numFeatures_; ++f) {
                importances_[f] += treeImportance[f];
            }
            splitTrees++;
        }
        trees_.push_back(std::move(tree));
    }

    if (splitTrees > 0) {
        for (double& v : importances_) v /= splitTrees;
        normalize(importances_);
    }
}

double RandomForestRegressor::predict(const double* features, int numFeatures) const {
    if (trees_.empty()) return 0.0;
    if (numFeatures < numFeatures_) {
        throw std::invalid_argument("RandomForestRegressor::predict: expected " +
                                    std::to_string(numFeatures_) + " features, got " +
                                    std::to_string(numFeatures));
    }
    double sum = 0.0;
    for (auto& tree : trees_) {
        sum += tree.predict(features);
    }
    return sum / static_cast<double>(trees_.size());
}

std::string RandomForestRegressor::serialize() const {
    nlohmann::json j;
    j["type"] = "random_forest";
    j["num_features"] = numFeatures_;
    j["params"] = {
        {"num_trees", params_.numTrees},
        {"max_depth", params_.maxDepth},
        {"min_samples_split", params_.minSamplesSplit},
        {"min_samples_leaf", params_.minSamplesLeaf},
        {"seed", params_.seed}
    };
    j["importances"] = importances_;

    nlohmann::json trees = nlohmann::json::array();
    for (auto& tree : trees_) {
        std::vector<int> feature, left, right;
        std::vector<double> threshold, value;
        for (auto& node : tree.nodes()) {
            feature.push_back(node.feature);
            threshold.push_back(node.threshold);
            left.push_back(node.left);
            right.push_back(node.right);
            value.push_back(node.value);
        }
        nlohmann::json entry = {
            {"feature", feature},
            {"threshold", threshold},
            {"left", left},
            {"right", right},
            {"value", value}
        };
        trees.push_back(std::move(entry));
    }
    j["trees"] = std::move(trees);
    return j.dump();
}

// --- JSON Loading ---

namespace {

bool parseTree(const nlohmann::json& j, int numFeatures, RegressionTree& out) {
    auto feature = j.at("feature").get<std::vector<int>>();
    auto threshold = j.at("threshold").get<std::vector<double>>();
    auto left = j.at("left").get<std::vector<int>>();
    auto right = j.at("right").get<std::vector<int>>();
    auto value = j.at("value").get<std::vector<double>>();

    const size_t n = feature.size();
    if (threshold.size() != n || left.size() != n || right.size() != n || value.size() != n) {
        return false;
    }

    std::vector<TreeNode> nodes(n);
    for (size_t i = 0; i < n; ++i) {
        TreeNode& node = nodes[i];
        node.feature = feature[i];
        node.threshold = threshold[i];
        node.left = left[i];
        node.right = right[i];
        node.value = value[i];

        if (node.feature >= numFeatures) return false;
        if (node.feature >= 0) {
            // Children must point forward, which also rules out cycles.
            int self = static_cast<int>(i);
            int count = static_cast<int>(n);
            if (node.left <= self || node.left >= count) return false;
            if (node.right <= self || node.right >= count) return false;
        }
    }
    out = RegressionTree(std::move(nodes));
    return true;
}

std::unique_ptr<Regressor> parseForest(const nlohmann::json& j) {
    ForestParams params;
    if (j.contains("params")) {
        auto& p = j["params"];
        params.numTrees = p.value("num_trees", params.numTrees);
        params.maxDepth = p.value("max_depth", params.maxDepth);
        params.minSamplesSplit = p.value("min_samples_split", params.minSamplesSplit);
        params.minSamplesLeaf = p.value("min_samples_leaf", params.minSamplesLeaf);
        params.seed = p.value("seed", params.seed);
    }

    int numFeatures = j.at("num_features").get<int>();
    if (numFeatures <= 0) return nullptr;

    std::vector<RegressionTree> trees;
    for (auto& t : j.at("trees")) {
        RegressionTree tree;
        if (!parseTree(t, numFeatures, tree)) return nullptr;
        trees.push_back(std::move(tree));
    }

    std::vector<double> importances;
    if (j.contains("importances")) {
        importances = j["importances"].get<std::vector<double>>();
    }

    return std::make_unique<RandomForestRegressor>(params, numFeatures,
                                                   std::move(trees), std::move(importances));
}

} // anonymous namespace

std::unique_ptr<Regressor> loadRegressorFromString(const std::string& json) {
    auto j = nlohmann::json::parse(json);
    if (!j.is_object() || !j.contains("type")) return nullptr;

    std::string type = j["type"].get<std::string>();
    if (type == "random_forest") {
        return parseForest(j);
    }
    return nullptr;
}

} // namespace ff
