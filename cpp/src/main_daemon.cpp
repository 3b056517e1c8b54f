#include "riskscore/api.hpp"
#include "riskscore/config.hpp"
#include "riskscore/daemon.hpp"
#include "riskscore/logging.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

riskscore::ScoringDaemon* g_daemon = nullptr;

void handle_stop(int) {
    if (g_daemon) {
        g_daemon->stop();
    }
}

void handle_reload(int) {
    if (g_daemon) {
        g_daemon->request_reload();
    }
}

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " --config <path> [--weights <path>] [--no-metrics]\n";
}

}  // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string weights_path;
    bool metrics_enabled = true;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--weights") {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return 1;
            }
            (arg == "--config" ? config_path : weights_path) = argv[++i];
        } else if (arg == "--no-metrics") {
            metrics_enabled = false;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto settings = std::make_shared<riskscore::RiskScoreSettings>(
            riskscore::RiskScoreSettings::from_toml(config_path));
        if (!weights_path.empty()) {
            settings->engine.weights_path = weights_path;
        }
        if (!metrics_enabled) {
            settings->metrics.enabled = false;
        }
        auto runtime = riskscore::build_scoring_runtime_from_settings(settings);

        riskscore::DaemonConfig config;
        config.weights_path = settings->engine.weights_path;
        config.poll_interval_s = settings->engine.poll_interval_s;
        config.watch_file = settings->engine.watch_file;

        riskscore::ScoringDaemon daemon(runtime, config);
        g_daemon = &daemon;
        std::signal(SIGINT, handle_stop);
        std::signal(SIGTERM, handle_stop);
        std::signal(SIGHUP, handle_reload);

        daemon.run();
        g_daemon = nullptr;
        runtime.exporter->stop();
    } catch (const std::exception& exc) {
        std::cerr << "riskscored error: " << exc.what() << "\n";
        return 1;
    }

    return 0;
}
