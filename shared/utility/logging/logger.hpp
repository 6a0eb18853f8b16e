#pragma once
#include <memory>
#include <mutex>
#include <string>
#include "common/result.h"
#include "common/logging_def.hpp"
#include "logger_backend.hpp"
#include <yaml-cpp/yaml.h>

namespace logging {

// 프로세스 전역 Logger. init 전에는 log 호출이 무시된다.
class Logger {
public:
    static Logger& instance();

    Result<void> init(logging::Type logger, const std::string& filename);
    Result<void> init(logging::Type logger, const YAML::Node& config);
    Result<void> apply();
    void shutdown();

    void log(const std::string& tag, Level level, const std::string& msg);

    void setLevel(const std::string& tag, Level level);
    void enableTag(const std::string& tag);
    void disableTag(const std::string& tag);

private:
    Logger();
    ~Logger();

    // 복사/이동 금지
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<LoggerBackend> backend() const;
    void configureSink(const std::shared_ptr<LoggerBackend>& backend,
                       const std::string& tag, const YAML::Node& sink);

    YAML::Node config_;
    std::shared_ptr<LoggerBackend> logger_;
    mutable std::mutex mutex_;
};

} // namespace logging
