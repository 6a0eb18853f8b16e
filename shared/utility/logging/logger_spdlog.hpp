#pragma once
#include "logger_backend.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <mutex>


namespace logging {


// spdlog 기반 backend. tag 마다 spdlog logger 하나를 등록하고
// GLOBAL_TAG("*") 에 설정된 sink 는 모든 logger 에 붙는다.
class SpdlogBackend : virtual public LoggerBackend {
public:
    SpdlogBackend() : global_level_(Level::Info) { };
    ~SpdlogBackend() override = default;

    void init() override;
    void shutdown() override;
    void registerLogger(const std::string& tag) override;
    void setLevel(const std::string& tag, Level lvl) override;
    void enableTag(const std::string& tag) override {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        disabled_tags_.erase(tag);
    }
    void disableTag(const std::string& tag) override {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        disabled_tags_.insert(tag);
    }

    void setConsoleSink(const std::string& tag) override;
    void setFileSink(const std::string& tag, const std::string& filename) override;
    void setRotatingFileSink(const std::string& tag,
                                const std::string& filename,
                                std::size_t max_size, std::size_t max_files) override;
    void setSyslogSink(const std::string& tag, const std::string& ident) override;
    void log(const std::string& tag, Level level, const std::string& msg) override;

private:
    static spdlog::level::level_enum toSpd_(Level lvl) {
        switch (lvl) {
            case Level::Trace: return spdlog::level::trace;
            case Level::Debug: return spdlog::level::debug;
            case Level::Info:  return spdlog::level::info;
            case Level::Warn:  return spdlog::level::warn;
            case Level::Error: return spdlog::level::err;
            case Level::Fatal: return spdlog::level::critical;
            case Level::Off:   return spdlog::level::off;
        }
        return spdlog::level::off;
    }

    // sink_mutex_ 를 잡은 상태에서 호출
    std::shared_ptr<spdlog::logger> registerLoggerLocked_(const std::string& tag);

private:
    bool initialized_ = false;
    bool shutdown_ = false;
    std::unordered_set<std::string> disabled_tags_;
    std::unordered_map<std::string, std::vector<spdlog::sink_ptr>> tag_sinks_;
    std::unordered_map<std::string, Level> tag_levels_;
    std::mutex sink_mutex_;

    Level global_level_;
};

} // namespace logging
