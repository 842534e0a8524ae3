#pragma once
#include <memory>
#include <string>
#include "result.h"
#include "logging_def.hpp"
#include "logger_backend.hpp"
#include <yaml-cpp/yaml.h>

namespace logging {

class Logger {
public:
    static Logger& instance();

    // backend + config file ("log:" section, see config/logging.yaml)
    Result<void> init(logging::Type logger, const std::string& filename);
    // backend only, no sinks configured beyond the default console sink
    Result<void> init(logging::Type logger);
    Result<void> apply();
    Result<void> shutdown();

    bool initialized() const { return logger_ != nullptr; }
    void log(const std::string& tag, Level level, const std::string& msg) { if(logger_) logger_->log(tag, level, msg); };

    Result<void> setLevel(const std::string& tag, Level level) {
        if(logger_) return logger_->setLevel(tag, level);
        return Error(ResultCode::InvalidState, "logger is not initialized");
    };
    Result<void> enableTag(const std::string& tag) {
        if(logger_) return logger_->enableTag(tag);
        return Error(ResultCode::InvalidState, "logger is not initialized");
    }
    Result<void> disableTag(const std::string& tag) {
        if(logger_) return logger_->disableTag(tag);
        return Error(ResultCode::InvalidState, "logger is not initialized");
    }

    static logging::Level toLevel(const std::string& s);

private:
    Logger();
    ~Logger();

    // no copy / move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    Result<void> configureSink(const std::string& tag, const YAML::Node& sink);

    YAML::Node config_;
    std::shared_ptr<LoggerBackend> logger_;
};

} // namespace logging
