#ifndef RISKSCORE_DAEMON_HPP
#define RISKSCORE_DAEMON_HPP

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>

#include "riskscore/api.hpp"

namespace riskscore {

struct DaemonConfig {
    std::string weights_path;
    double poll_interval_s = 5.0;
    bool watch_file = true;
};

// Hot-reloads the weights file when it changes on disk or when a reload is
// requested (SIGHUP). A failed reload keeps the previous model active.
class ScoringDaemon {
public:
    ScoringDaemon(ScoringRuntime runtime, DaemonConfig config);

    void run();
    void stop();
    void request_reload();

    // Reads the weights file and swaps it in. Returns false on any failure.
    bool reload_from_disk();

    const ScoringRuntime& runtime() const { return runtime_; }

private:
    bool file_changed();

    ScoringRuntime runtime_;
    DaemonConfig config_;
    Logger logger_;
    std::atomic<bool> running_{false};
    std::atomic<bool> reload_requested_{false};
    std::optional<std::filesystem::file_time_type> last_write_;
};

}  // namespace riskscore

#endif  // RISKSCORE_DAEMON_HPP
