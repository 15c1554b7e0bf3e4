#include "ff/analyzer.h"
#include "ff/blob_store.h"
#include "ff/config.h"
#include "ff/errors.h"
#include "ff/pipeline.h"
#include "ff/query.h"
#include "ff/random_source.h"
#include "ff/record_io.h"
#include "ff/trainer.h"
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace ff;

namespace {

struct Options {
    std::string mode;
    std::string historyPath;
    std::string currentPath;
    std::string storeDir;        // overrides both config dirs when set
    std::string predictionsPath;
    std::string outPath;
    std::string configPath;
    std::string position;
    std::string analysisType = "all";
    int top = -1;                // -1 = config.topN
    long long seed = -1;         // -1 = config.predictionSeed
    bool verbose = false;
};

void printUsage() {
    std::cout << "Usage: ff_cli --mode=MODE [options]\n"
              << "\nModes:\n"
              << "  train             Fit a model on --history and register it\n"
              << "  predict           Score --current (or the latest season of --history)\n"
              << "  query             Filter and rank stored predictions\n"
              << "  analyze           Prediction, historical and insight report\n"
              << "\nOptions:\n"
              << "  --history=PATH    Historical season records (JSON array)\n"
              << "  --current=PATH    Current-season records (JSON array)\n"
              << "  --store=DIR       Artifact directory for models and data\n"
              << "                    (default: config data_dir / model_dir)\n"
              << "  --predictions=PATH  Read predictions from a file instead of the store\n"
              << "  --out=PATH        Write output to a file instead of stdout\n"
              << "  --top=N           Number of predictions to keep (default: 50)\n"
              << "  --position=POS    Query position filter: QB, RB, WR, TE\n"
              << "  --type=TYPE       Analyze sections: all, predictions, historical, insights\n"
              << "  --config=PATH     Pipeline config JSON\n"
              << "  --seed=N          Prediction noise seed (default: random)\n"
              << "  --verbose         Print stage progress to stderr\n"
              << "  --help            Show this help\n";
}

Options parseArgs(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.find("--mode=") == 0) opts.mode = arg.substr(7);
        else if (arg.find("--history=") == 0) opts.historyPath = arg.substr(10);
        else if (arg.find("--current=") == 0) opts.currentPath = arg.substr(10);
        else if (arg.find("--store=") == 0) opts.storeDir = arg.substr(8);
        else if (arg.find("--predictions=") == 0) opts.predictionsPath = arg.substr(14);
        else if (arg.find("--out=") == 0) opts.outPath = arg.substr(6);
        else if (arg.find("--top=") == 0) opts.top = std::stoi(arg.substr(6));
        else if (arg.find("--position=") == 0) opts.position = arg.substr(11);
        else if (arg.find("--type=") == 0) opts.analysisType = arg.substr(7);
        else if (arg.find("--config=") == 0) opts.configPath = arg.substr(9);
        else if (arg.find("--seed=") == 0) opts.seed = std::stoll(arg.substr(7));
        else if (arg == "--verbose") opts.verbose = true;
        else if (arg == "--help") { printUsage(); exit(0); }
        else { std::cerr << "Unknown option: " << arg << "\n"; printUsage(); exit(1); }
    }
    return opts;
}

void reportError(const StageError& err) {
    std::cerr << "Error in " << err.stage << " (" << errorKindName(err.kind) << "): "
              << err.message;
    if (err.retryable) std::cerr << " [retryable]";
    std::cerr << "\n";
}

bool writeOutput(const Options& opts, const std::string& text) {
    if (opts.outPath.empty()) {
        std::cout << text << "\n";
        return true;
    }
    std::ofstream file(opts.outPath);
    if (!file.is_open()) {
        std::cerr << "Cannot write output to: " << opts.outPath << "\n";
        return false;
    }
    file << text << "\n";
    std::cout << "Wrote " << opts.outPath << "\n";
    return true;
}

std::vector<SeasonRecord> readRecords(const std::string& path, const char* label) {
    IngestReport report;
    std::vector<SeasonRecord> records = loadSeasonRecords(path, &report);
    std::cout << "Loaded " << report.accepted << " " << label << " records from " << path;
    if (report.skipped > 0 || report.repairedPoints > 0) {
        std::cout << " (" << report.skipped << " skipped, " << report.repairedPoints
                  << " points repaired)";
    }
    std::cout << "\n";
    return records;
}

bool readPredictions(const Options& opts, const BlobStore& dataStore, PredictionSet& out) {
    if (!opts.predictionsPath.empty()) {
        std::ifstream file(opts.predictionsPath);
        if (!file.is_open()) return false;
        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
        out = parsePredictions(content);
        return true;
    }
    return loadLatestPredictions(dataStore, out);
}

void printPredictions(const PredictionSet& predictions) {
    std::cout << std::left << std::setw(4) << "#" << std::setw(26) << "Player"
              << std::setw(6) << "Pos" << std::setw(6) << "Team"
              << std::right << std::setw(9) << "Current" << std::setw(11) << "Predicted"
              << std::setw(9) << "Change" << std::setw(7) << "Conf" << "\n";
    std::cout << std::fixed << std::setprecision(1);
    int rank = 0;
    for (auto& p : predictions) {
        std::cout << std::left << std::setw(4) << ++rank << std::setw(26) << p.player
                  << std::setw(6) << positionName(p.position) << std::setw(6) << p.team
                  << std::right << std::setw(9) << p.currentPoints
                  << std::setw(11) << p.predictedNextYear;
        if (p.hasPercentChange) std::cout << std::setw(8) << p.percentChange << "%";
        else std::cout << std::setw(9) << "n/a";
        std::cout << std::setw(7) << p.confidence << "\n";
    }
    std::cout.unsetf(std::ios::floatfield);
}

int runTrainMode(const Options& opts, const PipelineConfig& config,
                 BlobStore& modelStore, BlobStore& dataStore) {
    if (opts.historyPath.empty()) {
        std::cerr << "train requires --history=PATH\n";
        return 1;
    }
    std::vector<SeasonRecord> history = readRecords(opts.historyPath, "historical");
    if (!history.empty()) {
        dataStore.put(historicalDataKey(currentTimestamp()), serializeSeasonRecords(history));
    }

    TrainingOutcome outcome = runTraining(history, config, modelStore);
    if (!outcome.ok) {
        reportError(outcome.error);
        return 1;
    }

    const TrainingMetrics& m = outcome.metadata.metrics;
    std::cout << "Trained " << outcome.metadata.modelType << " on " << outcome.examples
              << " examples (" << outcome.playersSkipped << " players skipped)\n";
    std::cout << "Artifact: " << outcome.artifactId << "\n";
    std::cout << "MSE: " << m.mse << "  RMSE: " << m.rmse << "  R2: " << m.r2;
    if (m.evaluatedOnTrainingData) std::cout << "  (evaluated on training data)";
    std::cout << "\n\nFeature importance:\n";
    for (auto& fi : m.featureImportance) {
        std::cout << "  " << std::left << std::setw(20) << fi.feature << std::right
                  << std::fixed << std::setprecision(4) << fi.importance << "\n";
    }
    std::cout.unsetf(std::ios::floatfield);
    return 0;
}

int runPredictMode(const Options& opts, const PipelineConfig& config,
                   BlobStore& modelStore, BlobStore& dataStore) {
    std::vector<SeasonRecord> current;
    if (!opts.currentPath.empty()) {
        current = readRecords(opts.currentPath, "current-season");
    } else if (!opts.historyPath.empty()) {
        std::vector<SeasonRecord> history = readRecords(opts.historyPath, "historical");
        int year = latestSeasonYear(history);
        current = selectSeason(history, year);
        std::cout << "Using season " << year << " (" << current.size() << " players)\n";
    } else {
        std::cerr << "predict requires --current=PATH or --history=PATH\n";
        return 1;
    }

    std::unique_ptr<RandomSource> noise;
    if (config.predictionSeed != 0) noise = std::make_unique<RandomGenerator>(config.predictionSeed);
    else noise = std::make_unique<RandomGenerator>();

    PredictionOutcome outcome = runPrediction(current, config, modelStore, dataStore, *noise);
    if (!outcome.ok) {
        reportError(outcome.error);
        return 1;
    }

    std::cout << "Model: " << outcome.modelKey << "\n";
    std::cout << "Saved " << outcome.predictions.size() << " predictions to "
              << outcome.predictionsKey << "\n\n";
    if (!opts.outPath.empty()) {
        return writeOutput(opts, serializePredictions(outcome.predictions)) ? 0 : 1;
    }
    printPredictions(outcome.predictions);
    return 0;
}

int runQueryMode(const Options& opts, const PipelineConfig& config, const BlobStore& dataStore) {
    PredictionSet predictions;
    if (!readPredictions(opts, dataStore, predictions)) predictions.clear();

    PredictionQuery query;
    query.topN = opts.top >= 0 ? opts.top : config.topN;
    query.position = opts.position;

    QueryResult result = queryPredictions(predictions, query);
    if (!writeOutput(opts, queryResultToJson(result))) return 1;
    if (result.status != QueryStatus::OK) {
        std::cerr << "Query returned " << queryStatusCode(result.status) << " ("
                  << queryStatusName(result.status) << ")\n";
        return 1;
    }
    return 0;
}

int runAnalyzeMode(const Options& opts, const BlobStore& dataStore) {
    AnalysisType type = AnalysisType::ALL;
    if (!parseAnalysisType(opts.analysisType, type)) {
        std::cerr << "Unknown analysis type: " << opts.analysisType << "\n";
        return 1;
    }

    PredictionSet predictions;
    if (includesPredictions(type) && !readPredictions(opts, dataStore, predictions)) {
        std::cerr << "No predictions data found\n";
    }

    std::vector<SeasonRecord> history;
    if (includesHistorical(type)) {
        if (!opts.historyPath.empty()) {
            history = readRecords(opts.historyPath, "historical");
        } else if (!loadLatestHistory(dataStore, history)) {
            std::cerr << "No historical data found\n";
        }
    }

    PredictionAnalysis predictionAnalysis = analyzePredictions(predictions);
    HistoricalAnalysis historicalAnalysis = analyzeHistorical(history);
    std::vector<std::string> insights;
    if (includesInsights(type)) insights = generateInsights(predictions, history);

    return writeOutput(opts, analysisReportToJson(predictionAnalysis, historicalAnalysis, insights,
                                                  type, currentTimestamp())) ? 0 : 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Options opts = parseArgs(argc, argv);
    if (opts.mode.empty()) {
        printUsage();
        return 1;
    }

    PipelineConfig config;
    try {
        if (!opts.configPath.empty()) config = loadPipelineConfig(opts.configPath);
        if (opts.top >= 0) config.topN = opts.top;
        if (opts.seed >= 0) config.predictionSeed = static_cast<uint32_t>(opts.seed);
        if (opts.verbose) config.verbose = true;
        validateConfig(config);
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    std::string modelDir = opts.storeDir.empty() ? config.modelDir : opts.storeDir;
    std::string dataDir = opts.storeDir.empty() ? config.dataDir : opts.storeDir;
    DirectoryBlobStore modelStore(modelDir);
    DirectoryBlobStore dataStore(dataDir);

    try {
        if (opts.mode == "train") return runTrainMode(opts, config, modelStore, dataStore);
        if (opts.mode == "predict") return runPredictMode(opts, config, modelStore, dataStore);
        if (opts.mode == "query") return runQueryMode(opts, config, dataStore);
        if (opts.mode == "analyze") return runAnalyzeMode(opts, dataStore);
    } catch (const PipelineError& e) {
        reportError(toStageError(e));
        return 1;
    }

    std::cerr << "Unknown mode: " << opts.mode << "\n";
    printUsage();
    return 1;
}
