#ifndef RISKSCORE_ARTIFACT_HPP
#define RISKSCORE_ARTIFACT_HPP

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>

#include "riskscore/feature_schema.hpp"

namespace riskscore {

// Exported weights and intercept are multiplied by this factor. The scoring
// engine divides by it before the logistic function.
constexpr double kWeightScale = 100.0;
constexpr double kDefaultThreshold = 0.5;

constexpr const char* kWeightsFileName = "model_weights.json";
constexpr const char* kMetricsFileName = "model_metrics.json";

struct ModelMetrics {
    double auc_roc = 0.0;
    double cv_mean = 0.0;
    double cv_std = 0.0;
    double precision_at_90_recall = 0.0;
    std::string training_date;
    FeatureValues feature_importance{};
};

struct ModelArtifact {
    FeatureValues weights{};
    double intercept = 0.0;
    double threshold = kDefaultThreshold;
    std::uint64_t version = 0;
    std::string training_timestamp;
    std::optional<ModelMetrics> metrics;

    double weight(Feature feature) const { return weights[feature_index(feature)]; }
};

// Throws ArtifactError for non-finite weights/intercept or a threshold
// outside [0, 1].
void validate_artifact(const ModelArtifact& artifact);

Json::Value weights_to_json(const ModelArtifact& artifact);
Json::Value metrics_to_json(const ModelMetrics& metrics);

// Both throw ArtifactError; the weights key set must match the schema exactly.
ModelArtifact weights_from_json(const Json::Value& document);
ModelMetrics metrics_from_json(const Json::Value& document);

Json::Value parse_json(const std::string& text, const std::string& source = "<document>");
std::string to_json_string(const Json::Value& value, bool pretty = true);

ModelArtifact parse_weights_document(const std::string& text);
ModelMetrics parse_metrics_document(const std::string& text);

std::string read_text_file(const std::string& path);
ModelArtifact load_weights_file(const std::string& path);
ModelMetrics load_metrics_file(const std::string& path);

struct ArtifactPaths {
    std::string weights;
    std::string metrics;
};

// Writes both documents or neither. Requires `artifact.metrics`.
ArtifactPaths write_artifact(const ModelArtifact& artifact, const std::string& output_dir);

}  // namespace riskscore

#endif  // RISKSCORE_ARTIFACT_HPP
