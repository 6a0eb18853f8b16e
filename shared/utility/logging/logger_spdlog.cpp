#include "logger_spdlog.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>
#include <syslog.h>


namespace logging {


void SpdlogBackend::init() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");
    initialized_ = true;
    shutdown_ = false;
}

void SpdlogBackend::shutdown() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (!initialized_ || shutdown_) return;
    spdlog::apply_all([](std::shared_ptr<spdlog::logger> l){ l->flush(); });
    // 등록한 logger 만 해제한다. spdlog 전역 상태는 다른 사용자와 공유된다.
    for (const auto& [tag, _] : tag_sinks_) {
        spdlog::drop(tag);
    }
    shutdown_ = true;
}

std::shared_ptr<spdlog::logger> SpdlogBackend::registerLoggerLocked_(const std::string& tag) {
    auto logger = spdlog::get(tag);
    if (logger) return logger;

    std::vector<spdlog::sink_ptr> sinks;
    auto it = tag_sinks_.find(tag);
    if (it != tag_sinks_.end()) sinks = it->second;

    // attach global sink
    auto g_it = tag_sinks_.find(std::string(GLOBAL_TAG));
    if (g_it != tag_sinks_.end()) {
        for (auto& g_sink : g_it->second) {
            sinks.push_back(g_sink);
        }
    }
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    logger = std::make_shared<spdlog::logger>(tag, sinks.begin(), sinks.end());
    auto lv = tag_levels_.find(tag);
    logger->set_level(toSpd_(lv != tag_levels_.end() ? lv->second : global_level_));
    spdlog::register_logger(logger);
    tag_sinks_.try_emplace(tag);
    return logger;
}

void SpdlogBackend::registerLogger(const std::string& tag) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    registerLoggerLocked_(tag);
}

void SpdlogBackend::setLevel(const std::string& tag, Level level) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (tag == GLOBAL_TAG) {
        global_level_ = level;
        return;
    }
    tag_levels_[tag] = level;
    auto logger = spdlog::get(tag);
    if (logger) {
        logger->set_level(toSpd_(level));
    }
}

void SpdlogBackend::setConsoleSink(const std::string& tag) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    tag_sinks_[tag].push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
}

void SpdlogBackend::setFileSink(const std::string& tag, const std::string& filename) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    tag_sinks_[tag].push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true));
}

void SpdlogBackend::setRotatingFileSink(const std::string& tag, const std::string& filename, std::size_t max_size, std::size_t max_files) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    tag_sinks_[tag].push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(filename, max_size, max_files));
}

void SpdlogBackend::setSyslogSink(const std::string& tag, const std::string& ident) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    tag_sinks_[tag].push_back(std::make_shared<spdlog::sinks::syslog_sink_mt>(ident, LOG_PID, LOG_USER, true));
}

void SpdlogBackend::log(const std::string& tag, Level level, const std::string& msg) {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (shutdown_ || disabled_tags_.count(tag)) return;
        logger = registerLoggerLocked_(tag);
    }

    logger->log(toSpd_(level), msg);
    if (level == Level::Fatal) {
        spdlog::apply_all([](std::shared_ptr<spdlog::logger> l){ l->flush(); });
    }
}


} // namespace logging
