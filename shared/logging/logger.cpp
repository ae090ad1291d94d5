#include "logger.hpp"
#include "logger_spdlog.hpp"
#include "logger_console.hpp"
#include <iostream>

namespace logging {

// Never destroyed: backends may still be in use by other static destructors.
Logger& Logger::instance() {
    static Logger* instance = new Logger();
    return *instance;
}

Logger::Logger() = default;

Result<void> Logger::shutdown() {
    std::shared_ptr<LoggerBackend> b;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        b = std::move(logger_);
    }
    if (!b) return OK();
    return b->shutdown();
}

std::shared_ptr<LoggerBackend> Logger::backend() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_;
}

Result<void> Logger::init(logging::Type type) {
    std::shared_ptr<LoggerBackend> created;
    switch (type)
    {
    case logging::Type::SpdLog:
        created = std::make_shared<SpdlogBackend>();
        break;
    case logging::Type::Console:
        created = std::make_shared<ConsoleBackend>();
        break;
    default:
        return Error(ResultCode::NotSupported, "unknown logger type");
    }
    return init(std::move(created));
}

Result<void> Logger::init(std::shared_ptr<LoggerBackend> backend) {
    if (!backend) return Error(ResultCode::InvalidArgument, "no logger backend");

    auto r = backend->init();
    if (!r) return r;

    std::lock_guard<std::mutex> lock(mutex_);
    logger_ = std::move(backend);
    return OK();
}

Result<void> Logger::init(logging::Type type, const std::string& filename) {
    try {
        config_ = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        std::cerr << "YAML load error: " << e.what() << std::endl;
        return Error(ResultCode::InvalidArgument, std::string("cannot load ") + filename + ": " + e.what());
    }
    return init(type);
}

void Logger::log(const std::string& tag, Level level, const std::string& msg) {
    auto b = backend();
    if (b) b->log(tag, level, msg);
}

Result<void> Logger::setLevel(const std::string& tag, Level level) {
    auto b = backend();
    if (!b) return Error(ResultCode::InvalidState, "logger not initialised");
    return b->setLevel(tag, level);
}

Result<void> Logger::enableTag(const std::string& tag) {
    auto b = backend();
    if (!b) return Error(ResultCode::InvalidState, "logger not initialised");
    return b->enableTag(tag);
}

Result<void> Logger::disableTag(const std::string& tag) {
    auto b = backend();
    if (!b) return Error(ResultCode::InvalidState, "logger not initialised");
    return b->disableTag(tag);
}

logging::Level Logger::toLevel(const std::string& s) {
    if (s == "trace") return logging::Level::Trace;
    if (s == "debug") return logging::Level::Debug;
    if (s == "info")  return logging::Level::Info;
    if (s == "warn")  return logging::Level::Warn;
    if (s == "error") return logging::Level::Error;
    if (s == "fatal") return logging::Level::Fatal;
    return logging::Level::Off;
}

// log:
//   "*":            { level: info, sinks: [ { type: console } ] }
//   CommandRegistry: { level: debug }
Result<void> Logger::apply() {
    auto b = backend();
    if (!b) return Error(ResultCode::InvalidState, "logger not initialised");
    if (!config_["log"]) return OK();

    try {
        auto g_tag = std::string(GLOBAL_TAG);
        if (config_["log"][g_tag]) {
            auto node = config_["log"][g_tag];

            if (node["level"]) {
                auto r = b->setLevel(g_tag, toLevel(node["level"].as<std::string>()));
                if (!r) return r;
            }

            if (node["sinks"]) {
                for (auto sink : node["sinks"]) {
                    auto r = configureSink(g_tag, sink);
                    if (!r) return r;
                }
            }
        }

        for (auto it : config_["log"]) {
            std::string tag = it.first.as<std::string>();
            if (tag == GLOBAL_TAG) continue;
            auto node = it.second;

            if (node["sinks"]) {
                for (auto sink : node["sinks"]) {
                    auto r = configureSink(tag, sink);
                    if (!r) return r;
                }
            }

            if (node["level"]) {
                auto r = b->setLevel(tag, toLevel(node["level"].as<std::string>()));
                if (!r) return r;
            }

            if (node["enabled"] && !node["enabled"].as<bool>()) {
                auto r = b->disableTag(tag);
                if (!r) return r;
            }
        }
    } catch (const YAML::Exception& e) {
        return Error(ResultCode::InvalidArgument, std::string("invalid logging configuration: ") + e.what());
    }
    return OK();
}

Result<void> Logger::configureSink(const std::string& tag, const YAML::Node& sink) {
    auto b = backend();
    if (!b) return Error(ResultCode::InvalidState, "logger not initialised");

    std::string type = sink["type"].as<std::string>();

    if (type == "console") {
        return b->setConsoleSink(tag);
    } else if (type == "file") {
        return b->setFileSink(tag, sink["filename"].as<std::string>());
    } else if (type == "rotating_file") {
        return b->setRotatingFileSink(tag,
            sink["filename"].as<std::string>(),
            sink["max_size"].as<size_t>(),
            sink["max_files"].as<size_t>());
    } else if (type == "syslog") {
        return b->setSyslogSink(tag,
            sink["ident"] ? sink["ident"].as<std::string>() : tag);
    }
    return Error(ResultCode::NotSupported, "unknown sink type: " + type);
}

} // namespace logging
