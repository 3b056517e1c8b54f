#include "riskscore/training.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

#include "riskscore/common.hpp"
#include "riskscore/errors.hpp"

namespace riskscore {

namespace {

std::string format_number(double value, int precision = 4) {
    std::ostringstream output;
    output << std::fixed << std::setprecision(precision) << value;
    return output.str();
}

std::vector<int> labels_of(const std::vector<LabeledExample>& examples) {
    std::vector<int> labels;
    labels.reserve(examples.size());
    for (const auto& example : examples) {
        labels.push_back(example.label);
    }
    return labels;
}

LogisticFitOptions fit_options(const TrainingConfig& config) {
    LogisticFitOptions options;
    options.inverse_regularization = config.inverse_regularization;
    options.max_iterations = config.max_iterations;
    options.tolerance = config.tolerance;
    return options;
}

}  // namespace

DataSplit stratified_split(const Dataset& dataset, double test_fraction, unsigned int seed) {
    if (!(test_fraction > 0.0 && test_fraction < 1.0)) {
        throw std::invalid_argument("test_fraction must be in (0, 1), got " + std::to_string(test_fraction));
    }

    std::array<std::vector<size_t>, 2> by_class;
    for (size_t i = 0; i < dataset.examples.size(); ++i) {
        by_class[dataset.examples[i].label == 1 ? 1 : 0].push_back(i);
    }

    std::mt19937 rng(seed);
    std::vector<size_t> train_indices;
    std::vector<size_t> test_indices;
    for (auto& indices : by_class) {
        if (indices.size() < 2) {
            throw SchemaError("each class needs at least two examples to split", {kLabelColumn});
        }
        std::shuffle(indices.begin(), indices.end(), rng);
        auto test_count = static_cast<size_t>(std::llround(test_fraction * static_cast<double>(indices.size())));
        test_count = std::clamp<size_t>(test_count, 1, indices.size() - 1);
        test_indices.insert(test_indices.end(), indices.begin(), indices.begin() + static_cast<long>(test_count));
        train_indices.insert(train_indices.end(), indices.begin() + static_cast<long>(test_count), indices.end());
    }
    std::sort(train_indices.begin(), train_indices.end());
    std::sort(test_indices.begin(), test_indices.end());

    DataSplit split;
    for (size_t index : train_indices) {
        split.train.push_back(dataset.examples[index]);
    }
    for (size_t index : test_indices) {
        split.test.push_back(dataset.examples[index]);
    }
    return split;
}

CrossValidationResult cross_validate(const std::vector<LabeledExample>& examples, int folds,
                                     const LogisticFitOptions& options) {
    if (folds < 2) {
        throw std::invalid_argument("cross-validation needs at least 2 folds");
    }

    std::vector<int> fold_of(examples.size(), 0);
    std::array<size_t, 2> seen{0, 0};
    for (size_t i = 0; i < examples.size(); ++i) {
        auto& count = seen[examples[i].label == 1 ? 1 : 0];
        fold_of[i] = static_cast<int>(count % static_cast<size_t>(folds));
        ++count;
    }
    if (seen[0] < static_cast<size_t>(folds) || seen[1] < static_cast<size_t>(folds)) {
        throw SchemaError("need at least " + std::to_string(folds) + " training examples per class for " +
                              std::to_string(folds) + "-fold cross-validation",
                          {kLabelColumn});
    }

    CrossValidationResult result;
    for (int fold = 0; fold < folds; ++fold) {
        std::vector<LabeledExample> train;
        std::vector<LabeledExample> held_out;
        for (size_t i = 0; i < examples.size(); ++i) {
            (fold_of[i] == fold ? held_out : train).push_back(examples[i]);
        }
        LogisticRegressionModel model;
        model.fit(train, options);
        result.fold_auc.push_back(auc_roc(labels_of(held_out), model.predict_probabilities(held_out)));
    }
    result.mean = mean(result.fold_auc);
    result.stddev = population_stddev(result.fold_auc);
    return result;
}

QualityVerdict assess_quality(double auc, double min_auc, double target_auc) {
    if (auc < min_auc) {
        return QualityVerdict::kBelowMinimum;
    }
    if (auc >= target_auc) {
        return QualityVerdict::kMeetsTarget;
    }
    return QualityVerdict::kAcceptable;
}

std::string to_string(QualityVerdict verdict) {
    switch (verdict) {
        case QualityVerdict::kBelowMinimum:
            return "below_minimum";
        case QualityVerdict::kAcceptable:
            return "acceptable";
        case QualityVerdict::kMeetsTarget:
            return "meets_target";
    }
    return "acceptable";
}

TrainingResult train_risk_model(const Dataset& dataset, const TrainingConfig& config, const Logger& logger) {
    const auto positives = dataset.positives();
    logger.info("training_started", {{"examples", std::to_string(dataset.size())},
                                     {"rug_pulls", std::to_string(positives)},
                                     {"legitimate", std::to_string(dataset.negatives())}});
    if (positives == 0 || positives == dataset.size()) {
        throw SchemaError("dataset must contain both rug pulls and legitimate tokens", {kLabelColumn});
    }

    const auto split = stratified_split(dataset, config.test_fraction, config.seed);
    const auto options = fit_options(config);

    TrainingResult result;
    result.train_size = split.train.size();
    result.test_size = split.test.size();
    result.cross_validation = cross_validate(split.train, config.cv_folds, options);

    result.model.fit(split.train, options);
    if (!result.model.converged) {
        logger.warn("model_not_converged", {{"iterations", std::to_string(result.model.iterations)}});
    }
    logger.info("model_fitted", {{"iterations", std::to_string(result.model.iterations)},
                                 {"train_size", std::to_string(result.train_size)},
                                 {"test_size", std::to_string(result.test_size)}});

    const auto labels = labels_of(split.test);
    const auto probabilities = result.model.predict_probabilities(split.test);

    auto& metrics = result.metrics;
    metrics.auc_roc = auc_roc(labels, probabilities);
    metrics.cv_mean = result.cross_validation.mean;
    metrics.cv_std = result.cross_validation.stddev;
    metrics.precision_at_90_recall = precision_at_recall(labels, probabilities, 0.9);
    metrics.training_date = iso8601_utc();
    for (size_t i = 0; i < kFeatureCount; ++i) {
        metrics.feature_importance[i] = std::abs(result.model.weights[i]);
    }
    result.confusion = confusion_matrix(labels, probabilities, kDefaultThreshold);

    result.quality = assess_quality(metrics.auc_roc, config.min_auc, config.target_auc);
    if (result.quality == QualityVerdict::kBelowMinimum) {
        logger.warn("quality_below_minimum",
                    {{"auc_roc", format_number(metrics.auc_roc)}, {"min_auc", format_number(config.min_auc)}});
    } else if (result.quality == QualityVerdict::kMeetsTarget) {
        logger.info("quality_target_met",
                    {{"auc_roc", format_number(metrics.auc_roc)}, {"target_auc", format_number(config.target_auc)}});
    }
    return result;
}

ModelArtifact export_artifact(const TrainingResult& result, std::uint64_t version) {
    ModelArtifact artifact;
    for (size_t i = 0; i < kFeatureCount; ++i) {
        artifact.weights[i] = result.model.weights[i] * kWeightScale;
    }
    artifact.intercept = result.model.intercept * kWeightScale;
    artifact.threshold = kDefaultThreshold;
    artifact.version = version;
    artifact.training_timestamp = result.metrics.training_date;
    artifact.metrics = result.metrics;
    return artifact;
}

std::vector<std::pair<std::string, double>> top_features(const FeatureValues& weights, std::size_t count) {
    std::vector<std::pair<std::string, double>> ranked;
    for (Feature feature : all_features()) {
        ranked.emplace_back(feature_name(feature), std::abs(weights[feature_index(feature)]));
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (ranked.size() > count) {
        ranked.resize(count);
    }
    return ranked;
}

std::string format_summary(const TrainingResult& result) {
    const auto& metrics = result.metrics;
    const auto& confusion = result.confusion;
    std::ostringstream output;
    output << "Model Performance:\n"
           << "  AUC-ROC: " << format_number(metrics.auc_roc) << "\n"
           << "  Cross-validation AUC: " << format_number(metrics.cv_mean) << " (+/- "
           << format_number(metrics.cv_std * 2.0) << ")\n"
           << "  Precision at 90% recall: " << format_number(metrics.precision_at_90_recall) << "\n\n"
           << "Confusion Matrix (test set, threshold " << format_number(kDefaultThreshold, 2) << "):\n"
           << "  legitimate: TN=" << confusion.true_negative << " FP=" << confusion.false_positive << "\n"
           << "  rug pull:   FN=" << confusion.false_negative << " TP=" << confusion.true_positive << "\n"
           << "  rug pull precision=" << format_number(confusion.precision())
           << " recall=" << format_number(confusion.recall()) << "\n\n"
           << "Top 5 Most Important Features:\n";
    for (const auto& [name, importance] : top_features(metrics.feature_importance, 5)) {
        output << "  " << name << ": " << format_number(importance) << "\n";
    }
    output << "\n";
    switch (result.quality) {
        case QualityVerdict::kBelowMinimum:
            output << "WARNING: Model AUC-ROC is below the recommended threshold.\n"
                   << "Consider collecting more training data or adjusting features.\n";
            break;
        case QualityVerdict::kMeetsTarget:
            output << "Model meets performance requirements.\n";
            break;
        case QualityVerdict::kAcceptable:
            output << "Model is above the minimum AUC-ROC but below the target.\n";
            break;
    }
    return output.str();
}

TrainingRun run_training(const std::string& data_path, const std::string& output_dir,
                         const TrainingConfig& config, const Logger& logger) {
    const auto dataset = load_dataset_csv(data_path);
    logger.info("dataset_loaded", {{"path", data_path}, {"examples", std::to_string(dataset.size())}});

    TrainingRun run;
    run.result = train_risk_model(dataset, config, logger);
    run.artifact = export_artifact(run.result, milliseconds_since_epoch());
    run.paths = write_artifact(run.artifact, output_dir);
    logger.info("artifact_written", {{"weights", run.paths.weights},
                                     {"metrics", run.paths.metrics},
                                     {"version", std::to_string(run.artifact.version)}});
    return run;
}

}  // namespace riskscore
