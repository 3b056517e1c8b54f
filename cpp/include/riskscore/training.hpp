#ifndef RISKSCORE_TRAINING_HPP
#define RISKSCORE_TRAINING_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "riskscore/artifact.hpp"
#include "riskscore/config.hpp"
#include "riskscore/dataset.hpp"
#include "riskscore/logging.hpp"
#include "riskscore/metrics.hpp"
#include "riskscore/ml_model.hpp"

namespace riskscore {

struct DataSplit {
    std::vector<LabeledExample> train;
    std::vector<LabeledExample> test;
};

struct CrossValidationResult {
    std::vector<double> fold_auc;
    double mean = 0.0;
    double stddev = 0.0;
};

enum class QualityVerdict {
    kBelowMinimum,
    kAcceptable,
    kMeetsTarget,
};

struct TrainingResult {
    LogisticRegressionModel model;
    ModelMetrics metrics;
    CrossValidationResult cross_validation;
    ConfusionMatrix confusion;
    QualityVerdict quality = QualityVerdict::kAcceptable;
    std::size_t train_size = 0;
    std::size_t test_size = 0;
};

struct TrainingRun {
    TrainingResult result;
    ModelArtifact artifact;
    ArtifactPaths paths;
};

// Per-class shuffle with a fixed seed; both partitions keep at least one
// example of each class.
DataSplit stratified_split(const Dataset& dataset, double test_fraction, unsigned int seed);

// Stratified k-fold AUC without shuffling.
CrossValidationResult cross_validate(const std::vector<LabeledExample>& examples, int folds,
                                     const LogisticFitOptions& options);

// Advisory only: never blocks export.
QualityVerdict assess_quality(double auc, double min_auc = 0.75, double target_auc = 0.85);
std::string to_string(QualityVerdict verdict);

TrainingResult train_risk_model(const Dataset& dataset, const TrainingConfig& config = {},
                                const Logger& logger = get_logger("TrainingPipeline"));

// Scales coefficients by kWeightScale and fixes the threshold at 0.5.
ModelArtifact export_artifact(const TrainingResult& result, std::uint64_t version);

// Features ordered by |weight|, largest first.
std::vector<std::pair<std::string, double>> top_features(const FeatureValues& weights, std::size_t count = 5);

std::string format_summary(const TrainingResult& result);

// Load, train, gate and write both documents under `output_dir`.
TrainingRun run_training(const std::string& data_path, const std::string& output_dir,
                         const TrainingConfig& config = {},
                         const Logger& logger = get_logger("TrainingPipeline"));

}  // namespace riskscore

#endif  // RISKSCORE_TRAINING_HPP
