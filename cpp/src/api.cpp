#include "riskscore/api.hpp"

namespace riskscore {

ScoringRuntime build_scoring_runtime(ModelArtifact bootstrap, std::shared_ptr<RiskScoreSettings> settings,
                                     Logger logger) {
    auto effective_settings = settings ? std::move(settings) : std::make_shared<RiskScoreSettings>();
    configure_logging(effective_settings->logging);

    auto engine = std::make_shared<ScoringEngine>(std::move(bootstrap), get_logger("ScoringEngine"));
    auto health = std::make_shared<HealthMonitor>();
    auto metrics = std::make_shared<ScoringMetrics>(effective_settings->metrics.window_size);
    auto exporter = std::make_shared<MetricsExporter>(*engine, *metrics, *health);
    if (effective_settings->metrics.enabled) {
        exporter->start(effective_settings->metrics.host, effective_settings->metrics.port);
    }
    logger.info("runtime_ready", {{"model_version", std::to_string(engine->active_version())},
                                  {"metrics_enabled", effective_settings->metrics.enabled ? "true" : "false"}});

    return ScoringRuntime{engine, health, metrics, exporter, effective_settings};
}

ScoringRuntime build_scoring_runtime_from_settings(std::shared_ptr<RiskScoreSettings> settings) {
    auto effective_settings = settings ? std::move(settings) : std::make_shared<RiskScoreSettings>();
    auto bootstrap = load_weights_file(effective_settings->engine.weights_path);
    return build_scoring_runtime(std::move(bootstrap), effective_settings);
}

}  // namespace riskscore
