#include "logger.hpp"
#include "logger_spdlog.hpp"
#include <iostream>

namespace logging {

Logger& Logger::instance() {
    static Logger instance;  // C++11 이후 thread-safe 보장
    return instance;
}

Logger::Logger() {

}

// backend 정리는 명시적인 shutdown() 에서만 한다.
// 정적 객체 소멸 순서상 spdlog registry 가 먼저 해제될 수 있다.
Logger::~Logger() {
}

Result<void> Logger::init(logging::Type logger_type, const std::string& filename) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        std::cerr << "YAML load error: " << e.what() << std::endl;
        return Error(ResultCode::InvalidArgument, "cannot load log config '" + filename + "': " + e.what());
    }
    return init(logger_type, config);
}

Result<void> Logger::init(logging::Type logger_type, const YAML::Node& config) {
    std::shared_ptr<LoggerBackend> backend;
    switch (logger_type)
    {
    case logging::Type::SpdLog:
        backend = std::make_shared<SpdlogBackend>();
        break;
    default:
        return Error(ResultCode::InvalidArgument, "unknown logger type");
    }

    backend->init();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logger_) logger_->shutdown();
        config_ = config;
        logger_ = std::move(backend);
    }
    return OK();
}

void Logger::shutdown() {
    std::shared_ptr<LoggerBackend> backend;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        backend = std::move(logger_);
    }
    if (backend) backend->shutdown();
}

std::shared_ptr<LoggerBackend> Logger::backend() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_;
}

void Logger::log(const std::string& tag, Level level, const std::string& msg) {
    if (auto b = backend()) b->log(tag, level, msg);
}

void Logger::setLevel(const std::string& tag, Level level) {
    if (auto b = backend()) b->setLevel(tag, level);
}

void Logger::enableTag(const std::string& tag) {
    if (auto b = backend()) b->enableTag(tag);
}

void Logger::disableTag(const std::string& tag) {
    if (auto b = backend()) b->disableTag(tag);
}

Result<void> Logger::apply() {
    auto b = backend();
    if (!b) return Error(ResultCode::InvalidState, "logger is not initialized");

    YAML::Node log_node;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        log_node = config_["log"];
    }
    if (!log_node) return OK();

    try {
        auto g_tag = std::string(GLOBAL_TAG);
        if (log_node[g_tag]) {
            auto node = log_node[g_tag];

            // Global level 설정
            if (node["level"]) {
                b->setLevel(g_tag, toLevel(node["level"].as<std::string>()));
            }

            // Global sink 설정
            if (node["sinks"]) {
                for (auto sink : node["sinks"]) {
                    configureSink(b, g_tag, sink);
                }
            }
        }

        // tag 별 설정
        for (auto it : log_node) {
            std::string tag = it.first.as<std::string>();
            if (tag == GLOBAL_TAG) continue;
            auto node = it.second;

            if (node["sinks"]) {
                for (auto sink : node["sinks"]) {
                    configureSink(b, tag, sink);
                }
            }
            b->registerLogger(tag);

            // 레벨 적용
            if (node["level"]) {
                b->setLevel(tag, toLevel(node["level"].as<std::string>()));
            }
        }
    } catch (const YAML::Exception& e) {
        return Error(ResultCode::InvalidArgument, std::string("invalid log config: ") + e.what());
    }
    return OK();
}

void Logger::configureSink(const std::shared_ptr<LoggerBackend>& backend,
                           const std::string& tag, const YAML::Node& sink) {
    std::string type = sink["type"].as<std::string>();

    if (type == "console") {
        backend->setConsoleSink(tag);
    } else if (type == "file") {
        backend->setFileSink(tag, sink["filename"].as<std::string>());
    } else if (type == "rotating_file") {
        backend->setRotatingFileSink(tag,
            sink["filename"].as<std::string>(),
            sink["max_size"].as<std::size_t>(),
            sink["max_files"].as<std::size_t>());
    } else if (type == "syslog") {
        backend->setSyslogSink(tag,
            sink["ident"] ? sink["ident"].as<std::string>() : tag);
    } else {
        std::cerr << "Unknown sink type: " << type << std::endl;
    }
}

} // namespace logging
