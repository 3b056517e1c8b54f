#include "riskscore/config.hpp"
#include "riskscore/logging.hpp"
#include "riskscore/training.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " --data <csv> [--output <dir>] [--test-size <fraction>] [--config <path>]\n";
}

}  // namespace

int main(int argc, char** argv) {
    std::string data_path;
    std::string output_dir;
    std::string config_path;
    std::string test_size;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string* target = nullptr;
        if (arg == "--data") {
            target = &data_path;
        } else if (arg == "--output") {
            target = &output_dir;
        } else if (arg == "--test-size") {
            target = &test_size;
        } else if (arg == "--config") {
            target = &config_path;
        } else {
            print_usage(argv[0]);
            return 1;
        }
        if (i + 1 >= argc) {
            print_usage(argv[0]);
            return 1;
        }
        *target = argv[++i];
    }

    if (data_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        riskscore::RiskScoreSettings settings;
        if (!config_path.empty()) {
            settings = riskscore::RiskScoreSettings::from_toml(config_path);
        } else {
            settings.logging.json = false;
        }
        if (!output_dir.empty()) {
            settings.training.output_dir = output_dir;
        }
        if (!test_size.empty()) {
            settings.training.test_fraction = std::stod(test_size);
        }
        riskscore::configure_logging(settings.logging);

        std::cout << "Loading data from " << data_path << "...\n";
        const auto run = riskscore::run_training(data_path, settings.training.output_dir, settings.training);

        std::cout << "\n" << riskscore::format_summary(run.result) << "\n"
                  << "Model weights saved to " << run.paths.weights << "\n"
                  << "Model metrics saved to " << run.paths.metrics << "\n"
                  << "Model version " << run.artifact.version << "\n\n"
                  << "Training complete. Copy " << run.paths.weights
                  << " to the scoring service's engine.weights_path to hot-reload it.\n";
    } catch (const std::exception& exc) {
        std::cerr << "riskscore-train error: " << exc.what() << "\n";
        return 1;
    }

    return 0;
}
