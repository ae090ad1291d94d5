#pragma once
#include "result.h"
#include "logger_backend.hpp"
#include <iostream>
#include <map>
#include <mutex>
#include <set>

namespace logging {

// Plain text backend without spdlog. Writes "[Tag] LEVEL: message" lines to one
// stream, stderr by default so the console bot's replies on stdout stay clean.
class ConsoleBackend : public LoggerBackend {
public:
    explicit ConsoleBackend(std::ostream& out = std::cerr) : out_(out) {}

    Result<void> init() override { return OK(); }
    Result<void> shutdown() override {
        std::lock_guard<std::mutex> lock(mutex_);
        out_.flush();
        return OK();
    }

    Result<void> setLevel(const std::string& tag, Level level) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tag == GLOBAL_TAG) global_level_ = level;
        else levels_[tag] = level;
        return OK();
    }

    Result<void> enableTag(const std::string& tag) override {
        std::lock_guard<std::mutex> lock(mutex_);
        muted_.erase(tag);
        return OK();
    }
    Result<void> disableTag(const std::string& tag) override {
        std::lock_guard<std::mutex> lock(mutex_);
        muted_.insert(tag);
        return OK();
    }

    // there is only the one stream; a console sink just unmutes the tag
    Result<void> setConsoleSink(const std::string& tag) override { return enableTag(tag); }
    Result<void> setFileSink(const std::string&, const std::string&) override {
        return Error(ResultCode::NotSupported, "console backend has no file sink");
    }
    Result<void> setRotatingFileSink(const std::string&, const std::string&, size_t, size_t) override {
        return Error(ResultCode::NotSupported, "console backend has no rotating file sink");
    }
    Result<void> setSyslogSink(const std::string&, const std::string&) override {
        return Error(ResultCode::NotSupported, "console backend has no syslog sink");
    }

    void log(const std::string& tag, Level level, const std::string& msg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level == Level::Off || muted_.count(tag)) return;

        auto it = levels_.find(tag);
        if (level < (it != levels_.end() ? it->second : global_level_)) return;

        out_ << "[" << tag << "] " << levelName(level) << ": " << msg << '\n';
        if (level >= Level::Error) out_.flush();
    }

private:
    static const char* levelName(Level level) {
        switch (level) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
            default:           return "OFF";
        }
    }

    std::ostream& out_;
    std::mutex mutex_;
    Level global_level_ = Level::Info;
    std::map<std::string, Level> levels_;
    std::set<std::string> muted_;
};

} // namespace logging
