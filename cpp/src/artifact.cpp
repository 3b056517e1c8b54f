#include "riskscore/artifact.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "riskscore/common.hpp"
#include "riskscore/errors.hpp"

namespace riskscore {

namespace {

double require_number(const Json::Value& document, const std::string& key) {
    if (!document.isMember(key)) {
        throw ArtifactError("missing key '" + key + "'");
    }
    const auto& value = document[key];
    if (!value.isNumeric()) {
        throw ArtifactError("key '" + key + "' must be a number");
    }
    return value.asDouble();
}

void require_finite(double value, const std::string& what) {
    if (!std::isfinite(value)) {
        throw ArtifactError(what + " is not finite");
    }
}

FeatureValues read_feature_map(const Json::Value& document, const std::string& key) {
    if (!document.isMember(key) || !document[key].isObject()) {
        throw ArtifactError("key '" + key + "' must be an object of feature values");
    }
    const auto& map = document[key];

    std::vector<std::string> unexpected;
    for (const auto& name : map.getMemberNames()) {
        if (!feature_from_name(name).has_value()) {
            unexpected.push_back(name);
        }
    }
    std::vector<std::string> missing;
    for (Feature feature : all_features()) {
        if (!map.isMember(feature_name(feature))) {
            missing.push_back(feature_name(feature));
        }
    }
    if (!missing.empty() || !unexpected.empty()) {
        std::string message = "'" + key + "' does not match the feature schema";
        if (!missing.empty()) {
            message += "; missing: " + join(missing, ", ");
        }
        if (!unexpected.empty()) {
            message += "; unexpected: " + join(unexpected, ", ");
        }
        throw ArtifactError(message);
    }

    FeatureValues values{};
    for (Feature feature : all_features()) {
        const auto& name = feature_name(feature);
        const auto& value = map[name];
        if (!value.isNumeric()) {
            throw ArtifactError(key + "." + name + " must be a number");
        }
        values[feature_index(feature)] = value.asDouble();
    }
    return values;
}

Json::Value write_feature_map(const FeatureValues& values) {
    Json::Value map(Json::objectValue);
    for (Feature feature : all_features()) {
        map[feature_name(feature)] = values[feature_index(feature)];
    }
    return map;
}

void write_file(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("unable to open " + path.string() + " for writing");
    }
    file << contents << '\n';
    file.close();
    if (!file) {
        throw std::runtime_error("failed writing " + path.string());
    }
}

}  // namespace

void validate_artifact(const ModelArtifact& artifact) {
    for (Feature feature : all_features()) {
        require_finite(artifact.weight(feature), "weight for " + feature_name(feature));
    }
    require_finite(artifact.intercept, "intercept");
    require_finite(artifact.threshold, "threshold");
    if (artifact.threshold < 0.0 || artifact.threshold > 1.0) {
        throw ArtifactError("threshold " + std::to_string(artifact.threshold) + " is outside [0, 1]");
    }
}

Json::Value weights_to_json(const ModelArtifact& artifact) {
    Json::Value document(Json::objectValue);
    document["weights"] = write_feature_map(artifact.weights);
    document["intercept"] = artifact.intercept;
    document["threshold"] = artifact.threshold;
    document["version"] = static_cast<Json::UInt64>(artifact.version);
    if (!artifact.training_timestamp.empty()) {
        document["training_timestamp"] = artifact.training_timestamp;
    }
    return document;
}

Json::Value metrics_to_json(const ModelMetrics& metrics) {
    Json::Value document(Json::objectValue);
    document["auc_roc"] = metrics.auc_roc;
    document["cv_mean"] = metrics.cv_mean;
    document["cv_std"] = metrics.cv_std;
    document["precision_at_90_recall"] = metrics.precision_at_90_recall;
    document["training_date"] = metrics.training_date;
    document["feature_importance"] = write_feature_map(metrics.feature_importance);
    return document;
}

ModelArtifact weights_from_json(const Json::Value& document) {
    if (!document.isObject()) {
        throw ArtifactError("weights document must be a JSON object");
    }
    ModelArtifact artifact;
    artifact.weights = read_feature_map(document, "weights");
    artifact.intercept = require_number(document, "intercept");
    artifact.threshold = require_number(document, "threshold");
    if (document.isMember("version")) {
        if (!document["version"].isUInt64()) {
            throw ArtifactError("key 'version' must be a non-negative integer");
        }
        artifact.version = document["version"].asUInt64();
    }
    if (document.isMember("training_timestamp")) {
        if (!document["training_timestamp"].isString()) {
            throw ArtifactError("key 'training_timestamp' must be a string");
        }
        artifact.training_timestamp = document["training_timestamp"].asString();
    }
    validate_artifact(artifact);
    return artifact;
}

ModelMetrics metrics_from_json(const Json::Value& document) {
    if (!document.isObject()) {
        throw ArtifactError("metrics document must be a JSON object");
    }
    ModelMetrics metrics;
    metrics.auc_roc = require_number(document, "auc_roc");
    metrics.cv_mean = require_number(document, "cv_mean");
    metrics.cv_std = require_number(document, "cv_std");
    metrics.precision_at_90_recall = require_number(document, "precision_at_90_recall");
    if (!document.isMember("training_date") || !document["training_date"].isString()) {
        throw ArtifactError("key 'training_date' must be a string");
    }
    metrics.training_date = document["training_date"].asString();
    metrics.feature_importance = read_feature_map(document, "feature_importance");
    return metrics;
}

Json::Value parse_json(const std::string& text, const std::string& source) {
    Json::CharReaderBuilder builder;
    builder["rejectDupKeys"] = true;
    Json::Value root;
    std::string errors;
    std::istringstream stream(text);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        throw ArtifactError("invalid JSON in " + source + ": " + trim(errors));
    }
    return root;
}

std::string to_json_string(const Json::Value& value, bool pretty) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    builder["precision"] = 17;
    return Json::writeString(builder, value);
}

ModelArtifact parse_weights_document(const std::string& text) {
    return weights_from_json(parse_json(text, "weights document"));
}

ModelMetrics parse_metrics_document(const std::string& text) {
    return metrics_from_json(parse_json(text, "metrics document"));
}

std::string read_text_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("unable to open " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

ModelArtifact load_weights_file(const std::string& path) {
    return parse_weights_document(read_text_file(path));
}

ModelMetrics load_metrics_file(const std::string& path) {
    return parse_metrics_document(read_text_file(path));
}

ArtifactPaths write_artifact(const ModelArtifact& artifact, const std::string& output_dir) {
    if (!artifact.metrics.has_value()) {
        throw std::invalid_argument("artifact has no metrics to export");
    }
    validate_artifact(artifact);
    const auto weights_text = to_json_string(weights_to_json(artifact));
    const auto metrics_text = to_json_string(metrics_to_json(*artifact.metrics));

    const std::filesystem::path directory(output_dir);
    std::filesystem::create_directories(directory);
    const auto weights_path = directory / kWeightsFileName;
    const auto metrics_path = directory / kMetricsFileName;
    auto weights_tmp = weights_path;
    weights_tmp += ".tmp";
    auto metrics_tmp = metrics_path;
    metrics_tmp += ".tmp";

    try {
        write_file(weights_tmp, weights_text);
        write_file(metrics_tmp, metrics_text);
        std::filesystem::rename(weights_tmp, weights_path);
        std::filesystem::rename(metrics_tmp, metrics_path);
    } catch (const std::exception&) {
        std::error_code ec;
        std::filesystem::remove(weights_tmp, ec);
        std::filesystem::remove(metrics_tmp, ec);
        throw;
    }
    return ArtifactPaths{weights_path.string(), metrics_path.string()};
}

}  // namespace riskscore
