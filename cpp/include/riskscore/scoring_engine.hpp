#ifndef RISKSCORE_SCORING_ENGINE_HPP
#define RISKSCORE_SCORING_ENGINE_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "riskscore/artifact.hpp"
#include "riskscore/feature_schema.hpp"
#include "riskscore/logging.hpp"

namespace riskscore {

enum class RiskClass {
    kLow,
    kHigh,
};

enum class RiskLevel {
    kLow,
    kMedium,
    kHigh,
    kCritical,
};

std::string to_string(RiskClass risk_class);
std::string to_string(RiskLevel level);
RiskLevel risk_level_for(double score);

struct ContributingFactor {
    std::string feature;
    double contribution = 0.0;
    std::string severity;
};

struct ScoreResult {
    double raw = 0.0;
    double probability = 0.0;
    double score = 0.0;
    RiskClass risk_class = RiskClass::kLow;
    RiskLevel risk_level = RiskLevel::kLow;
    std::uint64_t model_version = 0;
    std::vector<ContributingFactor> factors;
};

// Pure function of one artifact snapshot and one input.
ScoreResult score_with(const ModelArtifact& artifact, const FeatureValues& features);

Json::Value score_result_to_json(const ScoreResult& result);

// Holds the active artifact behind an atomically swapped shared_ptr. Scoring
// never locks; reload and rollback serialise on a writer mutex.
class ScoringEngine {
public:
    explicit ScoringEngine(ModelArtifact bootstrap, Logger logger = get_logger("ScoringEngine"));

    ScoringEngine(const ScoringEngine&) = delete;
    ScoringEngine& operator=(const ScoringEngine&) = delete;

    ScoreResult score(const FeatureVector& features) const;
    ScoreResult score(const FeatureValues& features) const;

    // Throws ArtifactError and leaves the active artifact untouched on failure.
    std::uint64_t reload(ModelArtifact artifact);
    std::uint64_t reload_document(const std::string& weights_json);

    // Throws NoPriorVersionError when the rollback slot is empty.
    std::uint64_t rollback();

    std::shared_ptr<const ModelArtifact> active() const;
    std::uint64_t active_version() const;
    bool has_previous() const;

private:
    std::shared_ptr<const ModelArtifact> active_;
    std::shared_ptr<const ModelArtifact> previous_;
    mutable std::mutex writer_mutex_;
    Logger logger_;
};

}  // namespace riskscore

#endif  // RISKSCORE_SCORING_ENGINE_HPP
