#pragma once
#include <memory>
#include <mutex>
#include <string>
#include "result.h"
#include "logging_def.hpp"
#include "logger_backend.hpp"
#include <yaml-cpp/yaml.h>

namespace logging {

// Process-wide logger. Until init() succeeds every log call is a no-op,
// so library code may log unconditionally.
class Logger {
public:
    static Logger& instance();

    // backend only, no YAML configuration
    Result<void> init(logging::Type type);
    Result<void> init(std::shared_ptr<LoggerBackend> backend);
    // backend + YAML configuration file (see config/logging.yaml)
    Result<void> init(logging::Type type, const std::string& filename);
    Result<void> apply();
    // flushes and detaches the backend; later log calls are no-ops
    Result<void> shutdown();
    void log(const std::string& tag, Level level, const std::string& msg);

    Result<void> setLevel(const std::string& tag, Level level);
    Result<void> enableTag(const std::string& tag);
    Result<void> disableTag(const std::string& tag);

    static logging::Level toLevel(const std::string& s);

private:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<LoggerBackend> backend() const;
    Result<void> configureSink(const std::string& tag, const YAML::Node& sink);

    mutable std::mutex mutex_;
    YAML::Node config_;
    std::shared_ptr<LoggerBackend> logger_;
};

} // namespace logging
