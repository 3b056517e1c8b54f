#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "riskscore/api.hpp"
#include "riskscore/artifact.hpp"
#include "riskscore/common.hpp"
#include "riskscore/config.hpp"
#include "riskscore/daemon.hpp"
#include "riskscore/dataset.hpp"
#include "riskscore/errors.hpp"
#include "riskscore/feature_schema.hpp"
#include "riskscore/metrics.hpp"
#include "riskscore/ml_model.hpp"
#include "riskscore/observability.hpp"
#include "riskscore/scoring_engine.hpp"
#include "riskscore/training.hpp"

namespace {

using riskscore::Feature;
using riskscore::feature_index;

int failures = 0;

void expect_true(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << "\n";
        failures += 1;
    }
}

void expect_near(double value, double expected, double tolerance, const std::string& message) {
    if (std::fabs(value - expected) > tolerance) {
        std::cerr << "FAIL: " << message << " (got " << value << ", expected " << expected << ")\n";
        failures += 1;
    }
}

template <typename Exception, typename Fn>
void expect_throws(Fn&& fn, const std::string& message) {
    try {
        fn();
    } catch (const Exception&) {
        return;
    } catch (const std::exception& exc) {
        std::cerr << "FAIL: " << message << " (unexpected exception: " << exc.what() << ")\n";
        failures += 1;
        return;
    }
    std::cerr << "FAIL: " << message << " (no exception)\n";
    failures += 1;
}

std::filesystem::path make_temp_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() /
               ("riskscore_" + name + "_" + std::to_string(riskscore::milliseconds_since_epoch()));
    std::filesystem::create_directories(dir);
    return dir;
}

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream file(path, std::ios::trunc);
    file << text;
}

riskscore::ModelArtifact make_artifact(double intercept, double liquidity_weight, std::uint64_t version) {
    riskscore::ModelArtifact artifact;
    artifact.weights.fill(0.0);
    artifact.weights[feature_index(Feature::kLiquidityUsd)] = liquidity_weight;
    artifact.weights[feature_index(Feature::kHasMintAuthority)] = 40.0;
    artifact.intercept = intercept;
    artifact.version = version;
    return artifact;
}

riskscore::FeatureVector make_features(double liquidity_usd, double mint_authority = 0.0) {
    riskscore::FeatureValues values{};
    values.fill(0.0);
    values[feature_index(Feature::kGiniCoefficient)] = 0.4;
    values[feature_index(Feature::kTotalHolders)] = 1200.0;
    values[feature_index(Feature::kLiquidityUsd)] = liquidity_usd;
    values[feature_index(Feature::kHasMintAuthority)] = mint_authority;
    return riskscore::to_feature_vector(values);
}

// 80 legitimate tokens and 20 rug pulls; total_holders separates the classes.
riskscore::Dataset scenario_dataset() {
    riskscore::Dataset dataset;
    for (int i = 0; i < 100; ++i) {
        riskscore::LabeledExample example;
        example.features.fill(0.0);
        const bool rug_pull = i % 5 == 0;
        example.label = rug_pull ? 1 : 0;
        example.features[feature_index(Feature::kTotalHolders)] = rug_pull ? 20.0 + 0.2 * i : 500.0 + 10.0 * i;
        example.features[feature_index(Feature::kGiniCoefficient)] = 0.3 + 0.05 * ((i * 7) % 10);
        example.features[feature_index(Feature::kSentimentScore)] = ((i * 3) % 10) / 10.0 - 0.5;
        example.features[feature_index(Feature::kPriceVolatility)] = 10.0 + (i * 13) % 17;
        dataset.examples.push_back(example);
    }
    return dataset;
}

std::string csv_header(const std::vector<std::string>& skip = {}) {
    std::vector<std::string> columns;
    for (auto feature : riskscore::all_features()) {
        const auto& name = riskscore::feature_name(feature);
        if (std::find(skip.begin(), skip.end(), name) == skip.end()) {
            columns.push_back(name);
        }
    }
    if (std::find(skip.begin(), skip.end(), riskscore::kLabelColumn) == skip.end()) {
        columns.push_back(riskscore::kLabelColumn);
    }
    return riskscore::join(columns, ",");
}

std::string dataset_to_csv(const riskscore::Dataset& dataset) {
    std::ostringstream output;
    output.precision(17);
    output << csv_header() << "\n";
    for (const auto& example : dataset.examples) {
        for (double value : example.features) {
            output << value << ",";
        }
        output << example.label << "\n";
    }
    return output.str();
}

void test_feature_schema() {
    expect_true(riskscore::all_features().size() == 13, "schema has 13 features");
    expect_true(riskscore::feature_name(Feature::kGiniCoefficient) == "gini_coefficient", "first feature name");
    expect_true(riskscore::feature_name(Feature::kPriceVolatility) == "price_volatility", "last feature name");
    expect_true(riskscore::feature_from_name("volume_24h") == Feature::kVolume24h, "lookup by name");
    expect_true(!riskscore::feature_from_name("holder_count_inverse").has_value(), "unknown name lookup");
    expect_true(riskscore::is_boolean_feature(Feature::kAudited), "audited is boolean");
    expect_true(!riskscore::is_boolean_feature(Feature::kLiquidityUsd), "liquidity is numeric");

    auto features = make_features(5000.0);
    features["not_in_schema"] = 42.0;
    auto values = riskscore::to_feature_values(features);
    expect_near(values[feature_index(Feature::kLiquidityUsd)], 5000.0, 0.0, "extra names are ignored");

    features.erase("liquidity_usd");
    features.erase("audited");
    try {
        riskscore::to_feature_values(features);
        expect_true(false, "missing features must throw");
    } catch (const riskscore::FeatureError& exc) {
        expect_true(exc.features() == std::vector<std::string>{"liquidity_usd", "audited"},
                    "missing features listed in schema order");
    }

    auto non_boolean = make_features(1.0, 0.5);
    expect_throws<riskscore::FeatureError>([&] { riskscore::to_feature_values(non_boolean); },
                                           "boolean feature must be 0 or 1");
    auto non_finite = make_features(std::nan(""));
    expect_throws<riskscore::FeatureError>([&] { riskscore::to_feature_values(non_finite); },
                                           "non-finite feature rejected");
}

void test_dataset_parsing() {
    std::istringstream valid(csv_header() + ",source\n" +
                             "0.5,40,1000,25000,true,FALSE,1,0,0.7,0.1,90,5000,12,0,dex\n"
                             "\n"
                             "0.9,95,12,50,1,1,0,0,0.1,-0.8,1,200,80,1,dex\n");
    auto dataset = riskscore::parse_dataset_csv(valid);
    expect_true(dataset.size() == 2, "blank lines skipped");
    expect_true(dataset.positives() == 1 && dataset.negatives() == 1, "label counts");
    expect_near(dataset.examples[0].features[feature_index(Feature::kHasMintAuthority)], 1.0, 0.0,
                "true parses as 1");
    expect_near(dataset.examples[0].features[feature_index(Feature::kHasFreezeAuthority)], 0.0, 0.0,
                "FALSE parses as 0");
    expect_near(dataset.examples[1].features[feature_index(Feature::kSentimentScore)], -0.8, 1e-12,
                "negative values parse");

    std::istringstream missing(csv_header({"audited", riskscore::kLabelColumn}) + "\n");
    try {
        riskscore::parse_dataset_csv(missing);
        expect_true(false, "missing columns must throw");
    } catch (const riskscore::SchemaError& exc) {
        expect_true(exc.columns() == std::vector<std::string>{"audited", "is_rug_pull"},
                    "schema error names missing columns");
    }

    std::istringstream bad_label(csv_header() + "\n0.5,40,1000,25000,1,0,1,0,0.7,0.1,90,5000,12,2\n");
    expect_throws<riskscore::SchemaError>([&] { riskscore::parse_dataset_csv(bad_label); },
                                          "label must be 0 or 1");

    std::istringstream bad_cell(csv_header() + "\n0.5,abc,1000,25000,1,0,1,0,0.7,0.1,90,5000,12,0\n");
    expect_throws<riskscore::SchemaError>([&] { riskscore::parse_dataset_csv(bad_cell); },
                                          "non-numeric cell rejected");

    std::istringstream short_row(csv_header() + "\n0.5,40,1000\n");
    expect_throws<riskscore::SchemaError>([&] { riskscore::parse_dataset_csv(short_row); },
                                          "short row rejected");

    std::istringstream empty(csv_header() + "\n");
    expect_throws<riskscore::SchemaError>([&] { riskscore::parse_dataset_csv(empty); }, "empty dataset rejected");
}

void test_metrics() {
    expect_near(riskscore::auc_roc({0, 0, 1, 1}, {0.1, 0.2, 0.8, 0.9}), 1.0, 1e-12, "perfect ranking");
    expect_near(riskscore::auc_roc({1, 1, 0, 0}, {0.1, 0.2, 0.8, 0.9}), 0.0, 1e-12, "inverted ranking");
    expect_near(riskscore::auc_roc({1, 0, 1, 0}, {0.5, 0.5, 0.5, 0.5}), 0.5, 1e-12, "ties count half");
    expect_near(riskscore::auc_roc({0, 1, 0, 1, 0}, {0.3, 0.7, 0.6, 0.4, 0.1}),
                riskscore::auc_roc({1, 0, 0, 0, 1}, {0.7, 0.3, 0.1, 0.6, 0.4}), 1e-12,
                "auc independent of example order");
    expect_throws<std::runtime_error>([] { riskscore::auc_roc({1, 1}, {0.2, 0.4}); }, "auc needs both classes");

    expect_near(riskscore::precision_at_recall({1, 0, 1, 0, 1}, {0.9, 0.8, 0.7, 0.6, 0.3}), 0.6, 1e-12,
                "precision at 90% recall");
    expect_near(riskscore::precision_at_recall({1, 1, 0, 0}, {0.9, 0.8, 0.3, 0.1}), 1.0, 1e-12,
                "curve starts at the first full-recall threshold");
    auto curve = riskscore::precision_recall_curve({1, 0, 1, 0, 1}, {0.9, 0.8, 0.7, 0.6, 0.3});
    expect_true(curve.size() == 5 && curve.front().recall == 1.0, "curve ascends in threshold");

    auto confusion = riskscore::confusion_matrix({1, 0, 1, 0}, {0.9, 0.6, 0.4, 0.1}, 0.5);
    expect_true(confusion.true_positive == 1 && confusion.false_positive == 1 && confusion.false_negative == 1 &&
                    confusion.true_negative == 1,
                "confusion matrix cells");
    expect_near(confusion.precision(), 0.5, 1e-12, "confusion precision");

    expect_near(riskscore::mean({1.0, 3.0}), 2.0, 1e-12, "mean");
    expect_near(riskscore::population_stddev({1.0, 3.0}), 1.0, 1e-12, "population stddev");
}

void test_logistic_fit() {
    std::vector<riskscore::LabeledExample> examples;
    for (int i = 0; i < 20; ++i) {
        riskscore::LabeledExample rug;
        rug.label = 1;
        rug.features[feature_index(Feature::kGiniCoefficient)] = 0.6 + 0.01 * i;
        examples.push_back(rug);

        riskscore::LabeledExample legit;
        legit.label = 0;
        legit.features[feature_index(Feature::kGiniCoefficient)] = 0.3 + 0.02 * i;
        examples.push_back(legit);
    }

    riskscore::LogisticRegressionModel model;
    model.fit(examples);
    expect_true(model.converged, "newton solver converges");
    expect_true(model.weights[feature_index(Feature::kGiniCoefficient)] > 0.0, "concentration raises risk");
    expect_near(model.weights[feature_index(Feature::kAudited)], 0.0, 1e-12, "constant zero column has no weight");

    riskscore::FeatureValues concentrated{};
    concentrated[feature_index(Feature::kGiniCoefficient)] = 0.9;
    riskscore::FeatureValues spread{};
    spread[feature_index(Feature::kGiniCoefficient)] = 0.2;
    expect_true(model.predict_probability(concentrated) > model.predict_probability(spread),
                "probability increases with gini");

    std::vector<riskscore::LabeledExample> one_class(examples.begin(), examples.begin() + 1);
    expect_throws<std::runtime_error>([&] { riskscore::LogisticRegressionModel().fit(one_class); },
                                      "fit needs both classes");
}

void test_training_scenario() {
    const auto dataset = scenario_dataset();
    riskscore::TrainingConfig config;

    const auto split = riskscore::stratified_split(dataset, config.test_fraction, config.seed);
    size_t test_positives = 0;
    for (const auto& example : split.test) {
        test_positives += example.label == 1 ? 1 : 0;
    }
    expect_true(split.train.size() == 80 && split.test.size() == 20, "80/20 split");
    expect_true(test_positives == 4, "split preserves positive ratio");
    const auto again = riskscore::stratified_split(dataset, config.test_fraction, config.seed);
    expect_true(again.test.size() == split.test.size() &&
                    again.test.front().features == split.test.front().features,
                "split is reproducible");
    expect_throws<std::invalid_argument>([&] { riskscore::stratified_split(dataset, 1.0, 42); },
                                         "test fraction must be below 1");

    const auto result = riskscore::train_risk_model(dataset, config);
    expect_true(result.metrics.auc_roc > 0.5, "scenario auc above chance");
    expect_true(result.cross_validation.fold_auc.size() == 5, "five cv folds");
    expect_true(result.metrics.cv_std >= 0.0, "cv stddev non-negative");
    expect_true(result.metrics.precision_at_90_recall > 0.0, "precision at recall computed");

    const auto top = riskscore::top_features(result.model.weights, 5);
    const bool holders_ranked = std::any_of(top.begin(), top.end(), [](const auto& entry) {
        return entry.first == "total_holders";
    });
    expect_true(holders_ranked, "total_holders among top weighted features");
    expect_true(result.model.weights[feature_index(Feature::kTotalHolders)] < 0.0, "more holders lowers risk");

    const auto artifact = riskscore::export_artifact(result, 7);
    expect_true(artifact.version == 7, "export keeps version");
    expect_near(artifact.threshold, 0.5, 0.0, "exported threshold fixed at 0.5");
    expect_near(artifact.intercept, result.model.intercept * riskscore::kWeightScale, 1e-9, "intercept scaled");
    const auto document = riskscore::weights_to_json(artifact);
    expect_true(document["weights"].getMemberNames().size() == riskscore::kFeatureCount,
                "weights key set has one entry per feature");
    for (auto feature : riskscore::all_features()) {
        expect_true(document["weights"].isMember(riskscore::feature_name(feature)),
                    "weights document has " + riskscore::feature_name(feature));
    }

    const auto repeat = riskscore::train_risk_model(dataset, config);
    expect_true(repeat.model.weights == result.model.weights && repeat.model.intercept == result.model.intercept,
                "training is deterministic");

    riskscore::Dataset single_class;
    for (const auto& example : dataset.examples) {
        if (example.label == 0) {
            single_class.examples.push_back(example);
        }
    }
    expect_throws<riskscore::SchemaError>([&] { riskscore::train_risk_model(single_class, config); },
                                          "single-class dataset rejected");
}

void test_quality_gate() {
    expect_true(riskscore::assess_quality(0.70) == riskscore::QualityVerdict::kBelowMinimum, "weak model warned");
    expect_true(riskscore::assess_quality(0.80) == riskscore::QualityVerdict::kAcceptable, "middle band");
    expect_true(riskscore::assess_quality(0.85) == riskscore::QualityVerdict::kMeetsTarget, "target inclusive");
    expect_true(riskscore::assess_quality(0.60, 0.5, 0.7) == riskscore::QualityVerdict::kAcceptable,
                "custom gate thresholds");

    riskscore::TrainingResult weak;
    weak.quality = riskscore::QualityVerdict::kBelowMinimum;
    expect_true(riskscore::format_summary(weak).find("WARNING") != std::string::npos,
                "summary carries the quality warning");
}

void test_run_training_writes_documents() {
    const auto dir = make_temp_dir("train");
    const auto csv_path = dir / "training.csv";
    write_text(csv_path, dataset_to_csv(scenario_dataset()));

    const auto output = dir / "model_output";
    const auto run = riskscore::run_training(csv_path.string(), output.string());
    expect_true(std::filesystem::exists(output / riskscore::kWeightsFileName), "weights document written");
    expect_true(std::filesystem::exists(output / riskscore::kMetricsFileName), "metrics document written");
    expect_true(!std::filesystem::exists(output / "model_weights.json.tmp"), "no temporary file left");

    const auto loaded = riskscore::load_weights_file(run.paths.weights);
    expect_true(loaded.version == run.artifact.version, "version round trips");
    const auto metrics = riskscore::load_metrics_file(run.paths.metrics);
    expect_near(metrics.auc_roc, run.result.metrics.auc_roc, 1e-12, "metrics document round trips");

    const auto bad_csv = dir / "bad.csv";
    write_text(bad_csv, csv_header({"liquidity_usd"}) + "\n");
    const auto bad_output = dir / "bad_output";
    expect_throws<riskscore::SchemaError>(
        [&] { riskscore::run_training(bad_csv.string(), bad_output.string()); },
        "missing column aborts training");
    expect_true(!std::filesystem::exists(bad_output / riskscore::kWeightsFileName), "no partial artifact written");

    std::filesystem::remove_all(dir);
}

void test_artifact_round_trip() {
    auto artifact = make_artifact(-123.456789012345, 1.0 / 3000.0, 11);
    artifact.weights[feature_index(Feature::kSentimentScore)] = -17.0 / 7.0;
    artifact.weights[feature_index(Feature::kTokenAgeDays)] = 0.1 + 0.2;
    artifact.metrics = riskscore::ModelMetrics{};
    artifact.metrics->auc_roc = 0.91;
    artifact.metrics->training_date = riskscore::iso8601_utc();

    const auto dir = make_temp_dir("artifact");
    const auto paths = riskscore::write_artifact(artifact, dir.string());
    const auto loaded = riskscore::load_weights_file(paths.weights);

    riskscore::ScoringEngine before(artifact);
    riskscore::ScoringEngine after(loaded);
    const std::vector<riskscore::FeatureVector> inputs = {make_features(0.0), make_features(25000.0, 1.0),
                                                          make_features(1e9, 1.0)};
    for (const auto& input : inputs) {
        expect_near(after.score(input).score, before.score(input).score, 1e-9, "round trip preserves scores");
        expect_true(after.score(input).risk_class == before.score(input).risk_class, "round trip risk class");
    }
    expect_true(loaded.version == 11, "round trip version");

    auto no_metrics = make_artifact(0.0, 0.0, 1);
    expect_throws<std::invalid_argument>([&] { riskscore::write_artifact(no_metrics, dir.string()); },
                                         "export requires metrics");
    std::filesystem::remove_all(dir);
}

void test_artifact_validation() {
    const auto valid = riskscore::weights_to_json(make_artifact(-50.0, 0.001, 3));

    auto missing = valid;
    missing["weights"].removeMember("liquidity_usd");
    try {
        riskscore::weights_from_json(missing);
        expect_true(false, "missing weight must throw");
    } catch (const riskscore::ArtifactError& exc) {
        expect_true(std::string(exc.what()).find("liquidity_usd") != std::string::npos,
                    "artifact error names the missing weight");
    }

    auto extra = valid;
    extra["weights"]["holder_count_inverse"] = 15.0;
    expect_throws<riskscore::ArtifactError>([&] { riskscore::weights_from_json(extra); }, "extra weight rejected");

    auto bad_threshold = valid;
    bad_threshold["threshold"] = 1.5;
    expect_throws<riskscore::ArtifactError>([&] { riskscore::weights_from_json(bad_threshold); },
                                            "threshold outside [0,1] rejected");

    auto no_intercept = valid;
    no_intercept.removeMember("intercept");
    expect_throws<riskscore::ArtifactError>([&] { riskscore::weights_from_json(no_intercept); },
                                            "intercept required");

    auto text_weight = valid;
    text_weight["weights"]["verified"] = "high";
    expect_throws<riskscore::ArtifactError>([&] { riskscore::weights_from_json(text_weight); },
                                            "weights must be numbers");

    expect_throws<riskscore::ArtifactError>([] { riskscore::parse_weights_document("{not json"); },
                                            "syntax errors are artifact errors");

    auto non_finite = make_artifact(std::numeric_limits<double>::infinity(), 0.0, 1);
    expect_throws<riskscore::ArtifactError>([&] { riskscore::validate_artifact(non_finite); },
                                            "non-finite intercept rejected");

    auto unversioned = valid;
    unversioned.removeMember("version");
    expect_true(riskscore::weights_from_json(unversioned).version == 0, "version is optional");
}

void test_engine_scoring() {
    riskscore::ScoringEngine engine(make_artifact(-100.0, 0.002, 1));

    auto high = engine.score(make_features(100000.0));
    expect_near(high.raw, 100.0, 1e-9, "raw score uses scaled weights");
    expect_near(high.probability, 1.0 / (1.0 + std::exp(-1.0)), 1e-12, "probability divides by weight scale");
    expect_near(high.score, 100.0 * high.probability, 1e-12, "display score is probability x 100");
    expect_true(high.risk_class == riskscore::RiskClass::kHigh, "probability above threshold is high risk");
    expect_true(high.risk_level == riskscore::RiskLevel::kHigh, "73 falls in the high band");
    expect_true(!high.factors.empty() && high.factors.front().feature == "liquidity_usd" &&
                    high.factors.front().severity == "high",
                "largest contribution reported first");

    auto low = engine.score(make_features(0.0));
    expect_true(low.risk_class == riskscore::RiskClass::kLow, "probability below threshold is low risk");
    expect_true(low.risk_level == riskscore::RiskLevel::kLow, "27 falls in the low band");
    expect_true(low.factors.empty(), "no factor above the reporting floor");

    auto missing = make_features(1000.0);
    missing.erase("liquidity_usd");
    try {
        engine.score(missing);
        expect_true(false, "missing liquidity_usd must throw");
    } catch (const riskscore::FeatureError& exc) {
        expect_true(exc.features() == std::vector<std::string>{"liquidity_usd"}, "feature error names liquidity_usd");
    }
    expect_true(engine.active_version() == 1, "failed score leaves engine untouched");
    expect_near(engine.score(make_features(100000.0)).score, high.score, 0.0, "subsequent call succeeds");

    expect_true(riskscore::risk_level_for(85.0) == riskscore::RiskLevel::kCritical, "critical band");
    expect_true(riskscore::risk_level_for(45.0) == riskscore::RiskLevel::kMedium, "medium band");

    auto json = riskscore::score_result_to_json(high);
    expect_true(json["risk_class"].asString() == "high" && json["model_version"].asUInt64() == 1,
                "score result serialises");

    expect_throws<riskscore::ArtifactError>(
        [] {
            auto invalid = make_artifact(0.0, 0.0, 1);
            invalid.threshold = -0.1;
            riskscore::ScoringEngine rejected(invalid);
        },
        "engine refuses an invalid bootstrap artifact");
}

void test_engine_reload_rejection() {
    riskscore::ScoringEngine engine(make_artifact(-100.0, 0.002, 1));
    const auto before = engine.active();
    const auto before_json = riskscore::to_json_string(riskscore::weights_to_json(*before));
    const double before_score = engine.score(make_features(5000.0)).score;

    auto document = riskscore::weights_to_json(make_artifact(50.0, -0.5, 2));
    document["weights"].removeMember("liquidity_usd");
    expect_throws<riskscore::ArtifactError>(
        [&] { engine.reload_document(riskscore::to_json_string(document)); }, "reload rejects missing weight");

    auto invalid = make_artifact(0.0, 0.0, 3);
    invalid.threshold = 2.0;
    expect_throws<riskscore::ArtifactError>([&] { engine.reload(invalid); }, "reload rejects bad threshold");

    expect_true(engine.active().get() == before.get(), "active artifact unchanged");
    expect_true(riskscore::to_json_string(riskscore::weights_to_json(*engine.active())) == before_json,
                "active artifact byte-for-byte unchanged");
    expect_near(engine.score(make_features(5000.0)).score, before_score, 0.0, "scores unchanged after rejection");
    expect_true(!engine.has_previous(), "rejected reload fills no rollback slot");
}

void test_engine_rollback() {
    riskscore::ScoringEngine engine(make_artifact(-100.0, 0.002, 1));
    expect_throws<riskscore::NoPriorVersionError>([&] { engine.rollback(); }, "no rollback at startup");

    const std::vector<riskscore::FeatureVector> inputs = {make_features(0.0), make_features(40000.0, 1.0)};
    std::vector<double> original;
    for (const auto& input : inputs) {
        original.push_back(engine.score(input).score);
    }

    expect_true(engine.reload(make_artifact(60.0, -0.001, 2)) == 2, "reload returns new version");
    expect_true(engine.score(inputs[1]).score != original[1], "reloaded model scores differently");
    expect_true(engine.has_previous(), "previous version retained");

    expect_true(engine.rollback() == 1, "rollback returns restored version");
    for (size_t i = 0; i < inputs.size(); ++i) {
        expect_near(engine.score(inputs[i]).score, original[i], 0.0, "rollback restores pre-reload scores");
    }
    expect_throws<riskscore::NoPriorVersionError>([&] { engine.rollback(); }, "second rollback fails");
}

void test_engine_reload_atomicity() {
    riskscore::ModelArtifact first;
    first.weights.fill(10.0);
    first.intercept = 10.0;
    first.version = 1;
    riskscore::ModelArtifact second;
    second.weights.fill(-10.0);
    second.intercept = -10.0;
    second.version = 2;

    riskscore::ScoringEngine engine(first);
    riskscore::FeatureValues ones{};
    ones.fill(1.0);

    std::atomic<bool> done{false};
    std::atomic<int> inconsistent{0};
    std::atomic<long> completed{0};
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            while (!done.load()) {
                const auto result = engine.score(ones);
                const bool consistent = (result.model_version == 1 && result.raw == 140.0) ||
                                        (result.model_version == 2 && result.raw == -140.0);
                if (!consistent) {
                    inconsistent.fetch_add(1);
                }
                completed.fetch_add(1);
            }
        });
    }

    for (int i = 0; i < 200; ++i) {
        engine.reload(second);
        engine.rollback();
    }
    done = true;
    for (auto& reader : readers) {
        reader.join();
    }

    expect_true(inconsistent.load() == 0, "no score mixes two artifacts");
    expect_true(completed.load() > 0, "readers made progress during reloads");
    expect_true(engine.active_version() == 1, "final rollback restored the first artifact");
}

void test_config_from_toml() {
    const auto dir = make_temp_dir("config");
    const auto path = dir / "riskscore.toml";
    write_text(path,
               "# service config\n"
               "[logging]\n"
               "level = \"DEBUG\"\n"
               "json = false\n"
               "log_file = none\n"
               "\n"
               "[metrics]\n"
               "enabled = false\n"
               "port = 9100   # scrape port\n"
               "\n"
               "[training]\n"
               "test_fraction = 0.25\n"
               "cv_folds = 3\n"
               "min_auc = 0.7\n"
               "\n"
               "[engine]\n"
               "weights_path = \"/srv/models/model_weights.json\"\n"
               "poll_interval_s = 1.5\n"
               "watch_file = false\n");

    const auto settings = riskscore::RiskScoreSettings::from_toml(path.string());
    expect_true(settings.logging.level == "DEBUG" && !settings.logging.json, "logging section");
    expect_true(!settings.logging.log_file.has_value(), "none clears log file");
    expect_true(!settings.metrics.enabled && settings.metrics.port == 9100, "metrics section");
    expect_near(settings.training.test_fraction, 0.25, 1e-12, "training test fraction");
    expect_true(settings.training.cv_folds == 3 && settings.training.seed == 42, "training folds and default seed");
    expect_near(settings.training.min_auc, 0.7, 1e-12, "training gate");
    expect_true(settings.engine.weights_path == "/srv/models/model_weights.json", "engine weights path");
    expect_near(settings.engine.poll_interval_s, 1.5, 1e-12, "engine poll interval");
    expect_true(!settings.engine.watch_file, "engine watch flag");

    write_text(path, "[metrics]\nenabled = maybe\n");
    expect_throws<std::runtime_error>([&] { riskscore::RiskScoreSettings::from_toml(path.string()); },
                                      "invalid boolean rejected");
    write_text(path, "[training]\ntest_fraction = lots\n");
    expect_throws<std::runtime_error>([&] { riskscore::RiskScoreSettings::from_toml(path.string()); },
                                      "invalid number rejected");
    expect_throws<std::runtime_error>(
        [&] { riskscore::RiskScoreSettings::from_toml((dir / "absent.toml").string()); }, "missing file rejected");
    std::filesystem::remove_all(dir);
}

void test_metrics_and_health() {
    riskscore::ScoringMetrics metrics(2);
    riskscore::ScoreResult result;
    for (double score : {10.0, 20.0, 30.0}) {
        result.score = score;
        metrics.record_score(result);
    }
    metrics.record_failure();
    metrics.record_reload(false);

    double requests = -1.0;
    double failures_seen = -1.0;
    double recent_mean = -1.0;
    double reload_failures = -1.0;
    for (const auto& [key, value] : metrics.metrics()) {
        if (key == "riskscore_score_requests_total") {
            requests = value;
        } else if (key == "riskscore_score_failures_total") {
            failures_seen = value;
        } else if (key == "riskscore_recent_score_mean") {
            recent_mean = value;
        } else if (key == "riskscore_reload_failures_total") {
            reload_failures = value;
        }
    }
    expect_near(requests, 4.0, 0.0, "requests counted");
    expect_near(failures_seen, 1.0, 0.0, "failures counted");
    expect_near(recent_mean, 25.0, 1e-12, "rolling mean over window");
    expect_near(reload_failures, 1.0, 0.0, "reload failures counted");

    riskscore::HealthMonitor health;
    expect_true(health.status().ok, "healthy at start");
    health.mark_reload_failure("bad document");
    expect_true(!health.status().ok && health.status().last_reload_error == std::string("bad document"),
                "reload failure recorded");
    health.mark_reload();
    expect_true(health.status().ok && health.status().last_reload.has_value(), "successful reload clears error");
}

void test_exporter_endpoints() {
    riskscore::ScoringEngine engine(make_artifact(-100.0, 0.002, 5));
    riskscore::ScoringMetrics metrics;
    riskscore::HealthMonitor health;
    riskscore::MetricsExporter exporter(engine, metrics, health);

    Json::Value request(Json::objectValue);
    Json::Value features(Json::objectValue);
    for (const auto& [name, value] : make_features(100000.0)) {
        features[name] = value;
    }
    features["has_mint_authority"] = false;
    request["features"] = features;

    auto response = exporter.handle("POST", "/score", riskscore::to_json_string(request, false));
    expect_true(response.status == 200, "score endpoint succeeds");
    auto body = riskscore::parse_json(response.body);
    expect_true(body["risk_class"].asString() == "high" && body["model_version"].asUInt64() == 5,
                "score endpoint returns result");

    features.removeMember("liquidity_usd");
    response = exporter.handle("POST", "/score", riskscore::to_json_string(features, false));
    expect_true(response.status == 400, "missing feature is a bad request");
    body = riskscore::parse_json(response.body);
    expect_true(body["features"].size() == 1 && body["features"][0].asString() == "liquidity_usd",
                "bad request names the missing feature");

    expect_true(exporter.handle("POST", "/score", "{oops").status == 400, "malformed body rejected");
    expect_true(exporter.handle("GET", "/score", "").status == 405, "score requires POST");
    expect_true(exporter.handle("GET", "/health", "").status == 200, "health endpoint");
    expect_true(exporter.handle("GET", "/model", "").body.find("liquidity_usd") != std::string::npos,
                "model endpoint returns weights");
    auto scraped = exporter.handle("GET", "/metrics", "").body;
    expect_true(scraped.find("riskscore_model_version 5") != std::string::npos, "metrics expose model version");
    expect_true(exporter.handle("GET", "/missing", "").status == 404, "unknown path");

    expect_true(exporter.handle("POST", "/rollback", "").status == 409, "nothing to roll back at startup");
    engine.reload(make_artifact(0.0, 0.001, 6));
    response = exporter.handle("POST", "/rollback", "");
    expect_true(response.status == 200 && riskscore::parse_json(response.body)["model_version"].asUInt64() == 5,
                "rollback endpoint restores previous version");
    scraped = exporter.handle("GET", "/metrics", "").body;
    expect_true(scraped.find("riskscore_rollbacks_total 1") != std::string::npos, "rollbacks counted");
}

void test_daemon_reload() {
    const auto dir = make_temp_dir("daemon");
    const auto weights_path = dir / riskscore::kWeightsFileName;
    write_text(weights_path, riskscore::to_json_string(riskscore::weights_to_json(make_artifact(-100.0, 0.002, 1))));

    auto settings = std::make_shared<riskscore::RiskScoreSettings>();
    settings->metrics.enabled = false;
    settings->logging.level = "ERROR";
    settings->logging.json = false;
    settings->engine.weights_path = weights_path.string();
    auto runtime = riskscore::build_scoring_runtime_from_settings(settings);
    expect_true(runtime.engine->active_version() == 1, "bootstrap artifact loaded from disk");

    riskscore::DaemonConfig config;
    config.weights_path = weights_path.string();
    config.poll_interval_s = 0.05;
    riskscore::ScoringDaemon daemon(runtime, config);

    write_text(weights_path, riskscore::to_json_string(riskscore::weights_to_json(make_artifact(10.0, 0.001, 2))));
    expect_true(daemon.reload_from_disk(), "valid file reloads");
    expect_true(runtime.engine->active_version() == 2, "engine serves reloaded version");

    write_text(weights_path, "{\"weights\": {}, \"intercept\": 0, \"threshold\": 0.5}");
    expect_true(!daemon.reload_from_disk(), "invalid file rejected");
    expect_true(runtime.engine->active_version() == 2, "engine keeps last good version");
    expect_true(!runtime.health->status().ok, "health reports failed reload");

    std::thread loop([&] { daemon.run(); });
    auto wait_for_version = [&](std::uint64_t version) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (runtime.engine->active_version() != version && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return runtime.engine->active_version() == version;
    };

    write_text(weights_path, riskscore::to_json_string(riskscore::weights_to_json(make_artifact(5.0, 0.001, 3))));
    daemon.request_reload();
    expect_true(wait_for_version(3), "requested reload applied by the daemon loop");

    const auto stamp = std::filesystem::last_write_time(weights_path);
    write_text(weights_path, riskscore::to_json_string(riskscore::weights_to_json(make_artifact(6.0, 0.001, 4))));
    std::filesystem::last_write_time(weights_path, stamp + std::chrono::seconds(5));
    expect_true(wait_for_version(4), "changed file picked up by the watcher");

    daemon.stop();
    loop.join();
    expect_true(runtime.health->status().ok, "healthy after a good reload");
    std::filesystem::remove_all(dir);
}

}  // namespace

int main() {
    riskscore::LoggingConfig quiet;
    quiet.level = "ERROR";
    quiet.json = false;
    riskscore::configure_logging(quiet);

    try {
        test_feature_schema();
        test_dataset_parsing();
        test_metrics();
        test_logistic_fit();
        test_training_scenario();
        test_quality_gate();
        test_run_training_writes_documents();
        test_artifact_round_trip();
        test_artifact_validation();
        test_engine_scoring();
        test_engine_reload_rejection();
        test_engine_rollback();
        test_engine_reload_atomicity();
        test_config_from_toml();
        test_metrics_and_health();
        test_exporter_endpoints();
        test_daemon_reload();
    } catch (const std::exception& exc) {
        std::cerr << "Unhandled exception: " << exc.what() << "\n";
        return 1;
    }

    if (failures > 0) {
        std::cerr << failures << " test(s) failed.\n";
        return 1;
    }

    std::cout << "All tests passed.\n";
    return 0;
}
