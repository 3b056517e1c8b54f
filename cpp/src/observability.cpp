#include "riskscore/observability.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <numeric>
#include <sstream>

#include "riskscore/common.hpp"
#include "riskscore/errors.hpp"

namespace riskscore {

namespace {

constexpr size_t kMaxRequestBytes = 64 * 1024;

HttpResponse json_response(int status, const std::string& reason, const Json::Value& document) {
    return HttpResponse{status, reason, "application/json", to_json_string(document, false)};
}

HttpResponse error_response(int status, const std::string& reason, const std::string& message) {
    Json::Value document(Json::objectValue);
    document["error"] = message;
    return json_response(status, reason, document);
}

std::optional<size_t> content_length(const std::string& headers) {
    for (const auto& line : split(headers, '\n')) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (to_lower(trim(line.substr(0, colon))) == "content-length") {
            try {
                return static_cast<size_t>(std::stoul(trim(line.substr(colon + 1))));
            } catch (const std::logic_error&) {
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}

// Reads the header block and as much body as Content-Length announces.
std::string read_request(int client_fd) {
    std::string request;
    char buffer[4096];
    size_t header_end = std::string::npos;
    size_t expected = 0;
    while (request.size() < kMaxRequestBytes) {
        const ssize_t read_bytes = ::read(client_fd, buffer, sizeof(buffer));
        if (read_bytes <= 0) {
            break;
        }
        request.append(buffer, static_cast<size_t>(read_bytes));
        if (header_end == std::string::npos) {
            header_end = request.find("\r\n\r\n");
            if (header_end == std::string::npos) {
                continue;
            }
            expected = header_end + 4 + content_length(request.substr(0, header_end)).value_or(0);
        }
        if (request.size() >= expected) {
            break;
        }
    }
    return request;
}

}  // namespace

void HealthMonitor::mark_reload() {
    std::lock_guard<std::mutex> guard(mutex_);
    last_reload_ = seconds_since_epoch();
    last_reload_error_ = std::nullopt;
}

void HealthMonitor::mark_reload_failure(const std::string& error) {
    std::lock_guard<std::mutex> guard(mutex_);
    last_reload_error_ = error;
}

HealthStatus HealthMonitor::status() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return HealthStatus{!last_reload_error_.has_value(), last_reload_, last_reload_error_};
}

ScoringMetrics::ScoringMetrics(int window_size) : window_size_(window_size > 0 ? window_size : 1) {}

void ScoringMetrics::record_score(const ScoreResult& result) {
    std::lock_guard<std::mutex> guard(mutex_);
    requests_ += 1;
    if (result.risk_class == RiskClass::kHigh) {
        high_ += 1;
    } else {
        low_ += 1;
    }
    recent_scores_.push_back(result.score);
    if (static_cast<int>(recent_scores_.size()) > window_size_) {
        recent_scores_.pop_front();
    }
}

void ScoringMetrics::record_failure() {
    std::lock_guard<std::mutex> guard(mutex_);
    requests_ += 1;
    failures_ += 1;
}

void ScoringMetrics::record_reload(bool success) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (success) {
        reloads_ += 1;
    } else {
        reload_failures_ += 1;
    }
}

void ScoringMetrics::record_rollback() {
    std::lock_guard<std::mutex> guard(mutex_);
    rollbacks_ += 1;
}

std::vector<std::pair<std::string, double>> ScoringMetrics::metrics() const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<std::pair<std::string, double>> output;
    output.emplace_back("riskscore_score_requests_total", static_cast<double>(requests_));
    output.emplace_back("riskscore_score_failures_total", static_cast<double>(failures_));
    output.emplace_back("riskscore_high_risk_total", static_cast<double>(high_));
    output.emplace_back("riskscore_low_risk_total", static_cast<double>(low_));
    output.emplace_back("riskscore_reloads_total", static_cast<double>(reloads_));
    output.emplace_back("riskscore_reload_failures_total", static_cast<double>(reload_failures_));
    output.emplace_back("riskscore_rollbacks_total", static_cast<double>(rollbacks_));
    if (!recent_scores_.empty()) {
        const double sum = std::accumulate(recent_scores_.begin(), recent_scores_.end(), 0.0);
        output.emplace_back("riskscore_recent_score_mean", sum / static_cast<double>(recent_scores_.size()));
    }
    return output;
}

MetricsExporter::MetricsExporter(ScoringEngine& engine, ScoringMetrics& metrics, HealthMonitor& health,
                                 Logger logger)
    : engine_(engine), metrics_(metrics), health_(health), logger_(std::move(logger)) {}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start(const std::string& host, int port) {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&MetricsExporter::serve, this, host, port);
}

void MetricsExporter::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    const int fd = server_fd_.load();
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

HttpResponse MetricsExporter::handle(const std::string& method, const std::string& path, const std::string& body) {
    if (path == "/metrics" && method == "GET") {
        std::ostringstream response;
        for (const auto& [key, value] : metrics_.metrics()) {
            response << key << " " << value << "\n";
        }
        response << "riskscore_model_version " << engine_.active_version() << "\n";
        return HttpResponse{200, "OK", "text/plain", response.str()};
    }
    if (path == "/health" && method == "GET") {
        const auto status = health_.status();
        Json::Value document(Json::objectValue);
        document["ok"] = status.ok;
        document["model_version"] = static_cast<Json::UInt64>(engine_.active_version());
        document["rollback_available"] = engine_.has_previous();
        if (status.last_reload.has_value()) {
            document["last_reload"] = *status.last_reload;
        }
        if (status.last_reload_error.has_value()) {
            document["last_reload_error"] = *status.last_reload_error;
        }
        return json_response(200, "OK", document);
    }
    if (path == "/model" && method == "GET") {
        return json_response(200, "OK", weights_to_json(*engine_.active()));
    }
    if (path == "/score") {
        if (method != "POST") {
            return error_response(405, "Method Not Allowed", "use POST for /score");
        }
        return handle_score(body);
    }
    if (path == "/rollback") {
        if (method != "POST") {
            return error_response(405, "Method Not Allowed", "use POST for /rollback");
        }
        try {
            const auto version = engine_.rollback();
            metrics_.record_rollback();
            Json::Value document(Json::objectValue);
            document["model_version"] = static_cast<Json::UInt64>(version);
            return json_response(200, "OK", document);
        } catch (const NoPriorVersionError& exc) {
            return error_response(409, "Conflict", exc.what());
        }
    }
    return HttpResponse{404, "Not Found", "text/plain", ""};
}

HttpResponse MetricsExporter::handle_score(const std::string& body) {
    FeatureVector features;
    try {
        const auto document = parse_json(body, "request body");
        if (!document.isObject()) {
            throw ArtifactError("request body must be a JSON object");
        }
        const auto& source = document.isMember("features") ? document["features"] : document;
        if (!source.isObject()) {
            throw ArtifactError("'features' must be a JSON object");
        }
        for (const auto& name : source.getMemberNames()) {
            const auto& value = source[name];
            if (value.isBool()) {
                features[name] = value.asBool() ? 1.0 : 0.0;
            } else if (value.isNumeric()) {
                features[name] = value.asDouble();
            } else if (feature_from_name(name).has_value()) {
                throw ArtifactError("feature " + name + " must be a number or boolean");
            }
        }
    } catch (const ArtifactError& exc) {
        metrics_.record_failure();
        return error_response(400, "Bad Request", exc.what());
    }

    try {
        const auto result = engine_.score(features);
        metrics_.record_score(result);
        return json_response(200, "OK", score_result_to_json(result));
    } catch (const FeatureError& exc) {
        metrics_.record_failure();
        Json::Value document(Json::objectValue);
        document["error"] = exc.what();
        Json::Value names(Json::arrayValue);
        for (const auto& name : exc.features()) {
            names.append(name);
        }
        document["features"] = names;
        return json_response(400, "Bad Request", document);
    }
}

void MetricsExporter::serve(const std::string& host, int port) {
    const int server_fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd < 0) {
        logger_.error("exporter_socket_failed", {{"port", std::to_string(port)}});
        return;
    }
    server_fd_ = server_fd;

    int opt = 1;
    ::setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1 ||
        ::bind(server_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(server_fd, 16) < 0) {
        logger_.error("exporter_bind_failed", {{"host", host}, {"port", std::to_string(port)}});
        server_fd_ = -1;
        ::close(server_fd);
        return;
    }
    logger_.info("exporter_started", {{"host", host}, {"port", std::to_string(port)}});

    while (running_) {
        sockaddr_in client{};
        socklen_t len = sizeof(client);
        int client_fd = ::accept(server_fd, reinterpret_cast<sockaddr*>(&client), &len);
        if (client_fd < 0) {
            continue;
        }

        const std::string request = read_request(client_fd);
        if (request.empty()) {
            ::close(client_fd);
            continue;
        }

        auto first_line_end = request.find("\r\n");
        std::string first_line = first_line_end == std::string::npos ? request : request.substr(0, first_line_end);
        auto parts = split(first_line, ' ');
        const std::string method = parts.empty() ? "GET" : parts[0];
        const std::string path = parts.size() >= 2 ? parts[1] : "/";
        auto body_start = request.find("\r\n\r\n");
        const std::string body = body_start == std::string::npos ? "" : request.substr(body_start + 4);

        const auto response = handle(method, path, body);

        std::ostringstream header;
        header << "HTTP/1.1 " << response.status << " " << response.reason << "\r\n"
               << "Content-Type: " << response.content_type << "\r\n"
               << "Content-Length: " << response.body.size() << "\r\n"
               << "Connection: close\r\n\r\n";

        const std::string payload = header.str() + response.body;
        ::send(client_fd, payload.c_str(), payload.size(), MSG_NOSIGNAL);
        ::close(client_fd);
    }

    server_fd_ = -1;
    ::close(server_fd);
}

}  // namespace riskscore
