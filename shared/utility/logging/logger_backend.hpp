#pragma once
#include <cstddef>
#include <string>
#include "common/logging_def.hpp"

namespace logging {


// 로그 출력 구현체 interface. Logger 가 tag 단위로 위임한다.
class LoggerBackend {
public:
    virtual ~LoggerBackend() = default;
    virtual void init() = 0;
    virtual void shutdown() = 0;
    virtual void registerLogger(const std::string& tag) = 0;
    virtual void setLevel(const std::string& tag, Level level) = 0;
    virtual void log(const std::string& tag, Level level, const std::string& msg) = 0;

    virtual void enableTag(const std::string& tag) = 0;
    virtual void disableTag(const std::string& tag) = 0;

    // Sink 추가
    virtual void setConsoleSink(const std::string& tag) = 0;
    virtual void setFileSink(const std::string& tag, const std::string& filename) = 0;
    virtual void setRotatingFileSink(const std::string& tag,
                            const std::string& filename,
                            std::size_t max_size,
                            std::size_t max_files) = 0;
    virtual void setSyslogSink(const std::string& tag, const std::string& ident) = 0;
};

} // namespace logging
