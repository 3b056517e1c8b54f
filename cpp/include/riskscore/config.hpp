#ifndef RISKSCORE_CONFIG_HPP
#define RISKSCORE_CONFIG_HPP

#include <optional>
#include <string>

namespace riskscore {

struct LoggingConfig {
    std::string level = "INFO";
    bool json = true;
    std::optional<std::string> log_file = std::nullopt;
    int max_bytes = 1'000'000;
    int backup_count = 3;
};

struct MetricsConfig {
    bool enabled = true;
    std::string host = "127.0.0.1";
    int port = 8000;
    int window_size = 100;
};

struct TrainingConfig {
    double test_fraction = 0.2;
    unsigned int seed = 42;
    int cv_folds = 5;
    double inverse_regularization = 1.0;
    int max_iterations = 100;
    double tolerance = 1e-8;
    double min_auc = 0.75;
    double target_auc = 0.85;
    std::string output_dir = "./model_output/";
};

struct EngineConfig {
    std::string weights_path = "./model_output/model_weights.json";
    double poll_interval_s = 5.0;
    bool watch_file = true;
};

struct RiskScoreSettings {
    LoggingConfig logging{};
    MetricsConfig metrics{};
    TrainingConfig training{};
    EngineConfig engine{};

    static RiskScoreSettings from_toml(const std::string& path);
};

}  // namespace riskscore

#endif  // RISKSCORE_CONFIG_HPP
