#ifndef RISKSCORE_OBSERVABILITY_HPP
#define RISKSCORE_OBSERVABILITY_HPP

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "riskscore/logging.hpp"
#include "riskscore/scoring_engine.hpp"

namespace riskscore {

struct HealthStatus {
    bool ok = true;
    std::optional<double> last_reload = std::nullopt;
    std::optional<std::string> last_reload_error = std::nullopt;
};

// `ok` turns false after a failed reload and back to true on the next
// successful one. The engine keeps serving either way.
class HealthMonitor {
public:
    void mark_reload();
    void mark_reload_failure(const std::string& error);
    HealthStatus status() const;

private:
    mutable std::mutex mutex_;
    std::optional<double> last_reload_;
    std::optional<std::string> last_reload_error_;
};

class ScoringMetrics {
public:
    explicit ScoringMetrics(int window_size = 100);

    void record_score(const ScoreResult& result);
    void record_failure();
    void record_reload(bool success);
    void record_rollback();
    std::vector<std::pair<std::string, double>> metrics() const;

private:
    int window_size_ = 100;
    mutable std::mutex mutex_;
    std::uint64_t requests_ = 0;
    std::uint64_t failures_ = 0;
    std::uint64_t high_ = 0;
    std::uint64_t low_ = 0;
    std::uint64_t reloads_ = 0;
    std::uint64_t reload_failures_ = 0;
    std::uint64_t rollbacks_ = 0;
    std::deque<double> recent_scores_;
};

struct HttpResponse {
    int status = 200;
    std::string reason = "OK";
    std::string content_type = "text/plain";
    std::string body;
};

class MetricsExporter {
public:
    MetricsExporter(ScoringEngine& engine, ScoringMetrics& metrics, HealthMonitor& health,
                    Logger logger = get_logger("MetricsExporter"));
    ~MetricsExporter();

    void start(const std::string& host, int port);
    void stop();

    HttpResponse handle(const std::string& method, const std::string& path, const std::string& body);

private:
    void serve(const std::string& host, int port);
    HttpResponse handle_score(const std::string& body);

    ScoringEngine& engine_;
    ScoringMetrics& metrics_;
    HealthMonitor& health_;
    Logger logger_;
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::atomic<int> server_fd_{-1};
};

}  // namespace riskscore

#endif  // RISKSCORE_OBSERVABILITY_HPP
