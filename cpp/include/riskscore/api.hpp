#ifndef RISKSCORE_API_HPP
#define RISKSCORE_API_HPP

#include <memory>

#include "riskscore/artifact.hpp"
#include "riskscore/config.hpp"
#include "riskscore/logging.hpp"
#include "riskscore/observability.hpp"
#include "riskscore/scoring_engine.hpp"

namespace riskscore {

struct ScoringRuntime {
    std::shared_ptr<ScoringEngine> engine;
    std::shared_ptr<HealthMonitor> health;
    std::shared_ptr<ScoringMetrics> metrics;
    std::shared_ptr<MetricsExporter> exporter;
    std::shared_ptr<RiskScoreSettings> settings;
};

// Configures logging, creates the engine from `bootstrap` and starts the HTTP
// exporter when metrics are enabled.
ScoringRuntime build_scoring_runtime(ModelArtifact bootstrap,
                                     std::shared_ptr<RiskScoreSettings> settings = nullptr,
                                     Logger logger = get_logger("riskscore"));

// Same, loading the bootstrap artifact from `settings->engine.weights_path`.
ScoringRuntime build_scoring_runtime_from_settings(std::shared_ptr<RiskScoreSettings> settings);

}  // namespace riskscore

#endif  // RISKSCORE_API_HPP
