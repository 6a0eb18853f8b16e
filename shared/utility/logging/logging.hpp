#pragma once
#include "common/logging_def.hpp"
#include "logger.hpp"
#include <string>
#include <fmt/core.h>
#include <fmt/format.h>
#include <type_traits>
#include <utility>



namespace logging {


// YAML 파일의 log: 섹션으로 Logger 를 초기화하고 설정을 적용한다.
inline Result<void> init(logging::Type logger_type, const std::string& filename) {
    auto r = Logger::instance().init(logger_type, filename);
    if (!r) return r;
    return Logger::instance().apply();
}

inline Result<void> init(logging::Type logger_type, const YAML::Node& config) {
    auto r = Logger::instance().init(logger_type, config);
    if (!r) return r;
    return Logger::instance().apply();
}

inline Result<void> apply() {
    return Logger::instance().apply();
}

inline void shutdown() {
    Logger::instance().shutdown();
}


template <typename... Args>
inline void log(const char* tag, logging::Level level,
                        fmt::format_string<Args...> fmt_str, Args&&... args) {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), fmt_str, std::forward<Args>(args)...);
    Logger::instance().log(tag, level, std::string(buf.data(), buf.size()));
}


} // namespace logging


template <typename... Args>
inline void LOG_TRACE(const char* tag, fmt::format_string<Args...> fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Trace, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LOG_DEBUG(const char* tag, fmt::format_string<Args...> fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Debug, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LOG_INFO(const char* tag, fmt::format_string<Args...> fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Info, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LOG_WARN(const char* tag, fmt::format_string<Args...> fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Warn, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LOG_ERROR(const char* tag, fmt::format_string<Args...> fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Error, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LOG_FATAL(const char* tag, fmt::format_string<Args...> fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Fatal, fmt_str, std::forward<Args>(args)...);
}


// 클래스 내부에서 사용: 클래스에 LOG_TAG 가 선언되어 있어야 한다.
#define LOGT(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Trace, __VA_ARGS__)
#define LOGD(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Debug, __VA_ARGS__)
#define LOGI(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Info, __VA_ARGS__)
#define LOGW(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Warn, __VA_ARGS__)
#define LOGE(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Error, __VA_ARGS__)
#define LOGF(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Fatal, __VA_ARGS__)
