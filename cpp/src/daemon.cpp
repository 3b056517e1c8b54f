#include "riskscore/daemon.hpp"

#include <chrono>
#include <thread>

#include "riskscore/errors.hpp"

namespace riskscore {

namespace {

constexpr auto kSleepSlice = std::chrono::milliseconds(100);

std::optional<std::filesystem::file_time_type> modification_time(const std::string& path) {
    std::error_code ec;
    auto stamp = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return stamp;
}

}  // namespace

ScoringDaemon::ScoringDaemon(ScoringRuntime runtime, DaemonConfig config)
    : runtime_(std::move(runtime)), config_(std::move(config)), logger_(get_logger("ScoringDaemon")) {
    last_write_ = modification_time(config_.weights_path);
}

void ScoringDaemon::run() {
    running_ = true;
    logger_.info("daemon_started", {{"weights_path", config_.weights_path},
                                    {"poll_interval_s", std::to_string(config_.poll_interval_s)}});
    const auto interval = std::chrono::duration<double>(config_.poll_interval_s);
    auto next_poll = std::chrono::steady_clock::now();
    while (running_) {
        const auto now = std::chrono::steady_clock::now();
        bool reload = reload_requested_.exchange(false);
        if (now >= next_poll) {
            next_poll = now + std::chrono::duration_cast<std::chrono::steady_clock::duration>(interval);
            if (config_.watch_file && file_changed()) {
                reload = true;
            }
        }
        if (reload) {
            reload_from_disk();
        }
        std::this_thread::sleep_for(kSleepSlice);
    }
    logger_.info("daemon_stopped");
}

void ScoringDaemon::stop() {
    running_ = false;
}

void ScoringDaemon::request_reload() {
    reload_requested_ = true;
}

bool ScoringDaemon::file_changed() {
    auto stamp = modification_time(config_.weights_path);
    if (!stamp.has_value() || stamp == last_write_) {
        return false;
    }
    last_write_ = stamp;
    return true;
}

bool ScoringDaemon::reload_from_disk() {
    try {
        const auto text = read_text_file(config_.weights_path);
        const auto version = runtime_.engine->reload_document(text);
        runtime_.health->mark_reload();
        runtime_.metrics->record_reload(true);
        logger_.info("weights_file_reloaded", {{"path", config_.weights_path}, {"version", std::to_string(version)}});
        return true;
    } catch (const ArtifactError& exc) {
        runtime_.health->mark_reload_failure(exc.what());
        runtime_.metrics->record_reload(false);
        logger_.error("weights_file_rejected", {{"path", config_.weights_path}, {"error", exc.what()}});
    } catch (const std::runtime_error& exc) {
        runtime_.health->mark_reload_failure(exc.what());
        runtime_.metrics->record_reload(false);
        logger_.error("weights_file_unreadable", {{"path", config_.weights_path}, {"error", exc.what()}});
    }
    return false;
}

}  // namespace riskscore
