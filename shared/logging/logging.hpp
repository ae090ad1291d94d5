#pragma once
#include "logging_def.hpp"
#include "logger.hpp"
#include "result.h"
#include <string>
#include <fmt/core.h>
#include <fmt/format.h>
#include <string_view>
#include <type_traits>
#include <utility>



namespace logging {


inline Result<void> init(logging::Type logger_type, const std::string& filename) {
    auto r = Logger::instance().init(logger_type, filename);
    if (!r) return r;
    return Logger::instance().apply();
}

inline Result<void> init(logging::Type logger_type) {
    return Logger::instance().init(logger_type);
}

inline Result<void> apply() {
    return Logger::instance().apply();
}

inline Result<void> shutdown() {
    return Logger::instance().shutdown();
}


template <typename... Args>
inline void log(const char* tag, logging::Level level,
                        std::string_view fmt_str, Args&&... args) {
    Logger::instance().log(tag, level,
        fmt::vformat(fmt::string_view(fmt_str.data(), fmt_str.size()), fmt::make_format_args(args...)));
}


} // namespace logging


template <typename... Args>
inline void LOG_TRACE(const char* tag, std::string_view fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Trace, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LOG_DEBUG(const char* tag, std::string_view fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Debug, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LOG_INFO(const char* tag, std::string_view fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Info, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LOG_WARN(const char* tag, std::string_view fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Warn, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LOG_ERROR(const char* tag, std::string_view fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Error, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LOG_FATAL(const char* tag, std::string_view fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Fatal, fmt_str, std::forward<Args>(args)...);
}


// class scope: requires `static constexpr const char* LOG_TAG`
#define LOGT(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Trace, __VA_ARGS__)
#define LOGD(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Debug, __VA_ARGS__)
#define LOGI(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Info, __VA_ARGS__)
#define LOGW(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Warn, __VA_ARGS__)
#define LOGE(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Error, __VA_ARGS__)
#define LOGF(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Fatal, __VA_ARGS__)
