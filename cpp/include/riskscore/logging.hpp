#ifndef RISKSCORE_LOGGING_HPP
#define RISKSCORE_LOGGING_HPP

#include <map>
#include <string>

#include "riskscore/config.hpp"

namespace riskscore {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError,
};

class Logger {
public:
    explicit Logger(std::string name);

    void log(LogLevel level, const std::string& message,
             const std::map<std::string, std::string>& extra = {}) const;

    void debug(const std::string& message,
               const std::map<std::string, std::string>& extra = {}) const;
    void info(const std::string& message,
              const std::map<std::string, std::string>& extra = {}) const;
    void warn(const std::string& message,
              const std::map<std::string, std::string>& extra = {}) const;
    void error(const std::string& message,
               const std::map<std::string, std::string>& extra = {}) const;

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

void configure_logging(const LoggingConfig& config);
Logger get_logger(const std::string& name);

}  // namespace riskscore

#endif  // RISKSCORE_LOGGING_HPP
