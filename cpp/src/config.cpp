#include "riskscore/config.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include "riskscore/common.hpp"

namespace riskscore {

namespace {

bool parse_bool(const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    throw std::runtime_error("invalid boolean: " + value);
}

double parse_double(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::runtime_error("invalid number for " + key + ": " + value);
    }
}

int parse_int(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::runtime_error("invalid integer for " + key + ": " + value);
    }
}

std::optional<std::string> parse_optional_string(const std::string& value) {
    auto stripped = strip_quotes(trim(value));
    if (stripped == "null" || stripped == "none") {
        return std::nullopt;
    }
    return stripped;
}

}  // namespace

RiskScoreSettings RiskScoreSettings::from_toml(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("unable to open config file: " + path);
    }

    RiskScoreSettings settings;
    std::string current_section;
    std::string line;

    while (std::getline(file, line)) {
        auto hash_pos = line.find('#');
        if (hash_pos != std::string::npos) {
            line = line.substr(0, hash_pos);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        auto key = trim(line.substr(0, eq_pos));
        auto value = trim(line.substr(eq_pos + 1));

        if (current_section == "logging") {
            if (key == "level") {
                settings.logging.level = strip_quotes(value);
            } else if (key == "json") {
                settings.logging.json = parse_bool(value);
            } else if (key == "log_file") {
                settings.logging.log_file = parse_optional_string(value);
            } else if (key == "max_bytes") {
                settings.logging.max_bytes = parse_int(key, value);
            } else if (key == "backup_count") {
                settings.logging.backup_count = parse_int(key, value);
            }
        } else if (current_section == "metrics") {
            if (key == "enabled") {
                settings.metrics.enabled = parse_bool(value);
            } else if (key == "host") {
                settings.metrics.host = strip_quotes(value);
            } else if (key == "port") {
                settings.metrics.port = parse_int(key, value);
            } else if (key == "window_size") {
                settings.metrics.window_size = parse_int(key, value);
            }
        } else if (current_section == "training") {
            if (key == "test_fraction") {
                settings.training.test_fraction = parse_double(key, value);
            } else if (key == "seed") {
                settings.training.seed = static_cast<unsigned int>(parse_int(key, value));
            } else if (key == "cv_folds") {
                settings.training.cv_folds = parse_int(key, value);
            } else if (key == "inverse_regularization") {
                settings.training.inverse_regularization = parse_double(key, value);
            } else if (key == "max_iterations") {
                settings.training.max_iterations = parse_int(key, value);
            } else if (key == "tolerance") {
                settings.training.tolerance = parse_double(key, value);
            } else if (key == "min_auc") {
                settings.training.min_auc = parse_double(key, value);
            } else if (key == "target_auc") {
                settings.training.target_auc = parse_double(key, value);
            } else if (key == "output_dir") {
                settings.training.output_dir = strip_quotes(value);
            }
        } else if (current_section == "engine") {
            if (key == "weights_path") {
                settings.engine.weights_path = strip_quotes(value);
            } else if (key == "poll_interval_s") {
                settings.engine.poll_interval_s = parse_double(key, value);
            } else if (key == "watch_file") {
                settings.engine.watch_file = parse_bool(value);
            }
        }
    }

    return settings;
}

}  // namespace riskscore
