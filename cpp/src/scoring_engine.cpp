#include "riskscore/scoring_engine.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>

#include "riskscore/errors.hpp"
#include "riskscore/ml_model.hpp"

namespace riskscore {

namespace {

constexpr size_t kMaxFactors = 5;
constexpr double kMinFactorContribution = 1.0;

std::string severity_for(double magnitude) {
    if (magnitude > 15.0) {
        return "high";
    }
    if (magnitude > 8.0) {
        return "medium";
    }
    return "low";
}

}  // namespace

std::string to_string(RiskClass risk_class) {
    return risk_class == RiskClass::kHigh ? "high" : "low";
}

std::string to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::kLow:
            return "low";
        case RiskLevel::kMedium:
            return "medium";
        case RiskLevel::kHigh:
            return "high";
        case RiskLevel::kCritical:
            return "critical";
    }
    return "low";
}

RiskLevel risk_level_for(double score) {
    if (score < 30.0) {
        return RiskLevel::kLow;
    }
    if (score < 60.0) {
        return RiskLevel::kMedium;
    }
    if (score < 80.0) {
        return RiskLevel::kHigh;
    }
    return RiskLevel::kCritical;
}

ScoreResult score_with(const ModelArtifact& artifact, const FeatureValues& features) {
    ScoreResult result;
    result.raw = artifact.intercept;

    std::vector<ContributingFactor> contributions;
    for (Feature feature : all_features()) {
        const double contribution = artifact.weight(feature) * features[feature_index(feature)];
        result.raw += contribution;
        if (std::abs(contribution) > kMinFactorContribution) {
            contributions.push_back({feature_name(feature), contribution, severity_for(std::abs(contribution))});
        }
    }
    std::stable_sort(contributions.begin(), contributions.end(), [](const auto& a, const auto& b) {
        return std::abs(a.contribution) > std::abs(b.contribution);
    });
    if (contributions.size() > kMaxFactors) {
        contributions.resize(kMaxFactors);
    }

    result.probability = sigmoid(result.raw / kWeightScale);
    result.score = 100.0 * result.probability;
    result.risk_class = result.probability > artifact.threshold ? RiskClass::kHigh : RiskClass::kLow;
    result.risk_level = risk_level_for(result.score);
    result.model_version = artifact.version;
    result.factors = std::move(contributions);
    return result;
}

Json::Value score_result_to_json(const ScoreResult& result) {
    Json::Value document(Json::objectValue);
    document["score"] = result.score;
    document["probability"] = result.probability;
    document["raw"] = result.raw;
    document["risk_class"] = to_string(result.risk_class);
    document["risk_level"] = to_string(result.risk_level);
    document["model_version"] = static_cast<Json::UInt64>(result.model_version);
    Json::Value factors(Json::arrayValue);
    for (const auto& factor : result.factors) {
        Json::Value entry(Json::objectValue);
        entry["feature"] = factor.feature;
        entry["contribution"] = factor.contribution;
        entry["severity"] = factor.severity;
        factors.append(entry);
    }
    document["factors"] = factors;
    return document;
}

ScoringEngine::ScoringEngine(ModelArtifact bootstrap, Logger logger) : logger_(std::move(logger)) {
    validate_artifact(bootstrap);
    active_ = std::make_shared<const ModelArtifact>(std::move(bootstrap));
    logger_.info("model_loaded", {{"version", std::to_string(active_->version)}});
}

ScoreResult ScoringEngine::score(const FeatureVector& features) const {
    return score(to_feature_values(features));
}

ScoreResult ScoringEngine::score(const FeatureValues& features) const {
    const auto snapshot = std::atomic_load(&active_);
    return score_with(*snapshot, features);
}

std::uint64_t ScoringEngine::reload(ModelArtifact artifact) {
    try {
        validate_artifact(artifact);
    } catch (const ArtifactError& exc) {
        logger_.warn("model_reload_rejected", {{"error", exc.what()}});
        throw;
    }
    auto replacement = std::make_shared<const ModelArtifact>(std::move(artifact));

    std::lock_guard<std::mutex> guard(writer_mutex_);
    auto current = std::atomic_load(&active_);
    if (replacement->version <= current->version) {
        logger_.warn("model_version_not_increasing", {{"active", std::to_string(current->version)},
                                                      {"incoming", std::to_string(replacement->version)}});
    }
    std::atomic_store(&active_, replacement);
    previous_ = std::move(current);
    logger_.info("model_reloaded", {{"version", std::to_string(replacement->version)},
                                    {"previous", std::to_string(previous_->version)}});
    return replacement->version;
}

std::uint64_t ScoringEngine::reload_document(const std::string& weights_json) {
    ModelArtifact artifact;
    try {
        artifact = parse_weights_document(weights_json);
    } catch (const ArtifactError& exc) {
        logger_.warn("model_reload_rejected", {{"error", exc.what()}});
        throw;
    }
    return reload(std::move(artifact));
}

std::uint64_t ScoringEngine::rollback() {
    std::lock_guard<std::mutex> guard(writer_mutex_);
    if (!previous_) {
        throw NoPriorVersionError("no previous model version to roll back to");
    }
    const auto restored = std::move(previous_);
    const auto replaced = std::atomic_load(&active_);
    std::atomic_store(&active_, restored);
    logger_.info("model_rolled_back", {{"version", std::to_string(restored->version)},
                                       {"replaced", std::to_string(replaced->version)}});
    return restored->version;
}

std::shared_ptr<const ModelArtifact> ScoringEngine::active() const {
    return std::atomic_load(&active_);
}

std::uint64_t ScoringEngine::active_version() const {
    return active()->version;
}

bool ScoringEngine::has_previous() const {
    std::lock_guard<std::mutex> guard(writer_mutex_);
    return previous_ != nullptr;
}

}  // namespace riskscore
