#include "logger.hpp"
#include "logger_console.hpp"
#include "logger_spdlog.hpp"
#include <fmt/format.h>

namespace logging {

Logger& Logger::instance() {
    static Logger instance;  // thread-safe since C++11
    return instance;
}

Logger::Logger() = default;

Logger::~Logger() {
    if(logger_) logger_->shutdown();
}

Result<void> Logger::init(logging::Type logger_type, const std::string& filename) {
    try {
        config_ = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        return Error(ResultCode::InvalidArgument,
                     fmt::format("logging config '{}': {}", filename, e.what()));
    }
    return init(logger_type);
}

Result<void> Logger::init(logging::Type logger_type) {
    if (logger_) logger_->shutdown();

    switch (logger_type)
    {
    case logging::Type::SpdLog:
        logger_ = std::make_shared<SpdlogBackend>();
        break;
    case logging::Type::Console:
        logger_ = std::make_shared<ConsoleBackend>();
        break;
    default:
        return Error(ResultCode::InvalidArgument, "unknown logger type");
    }

    return logger_->init();
}

Result<void> Logger::shutdown() {
    if (!logger_) return OK();
    auto result = logger_->shutdown();
    logger_.reset();
    return result;
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

Result<void> Logger::apply() {
    if (!logger_) return Error(ResultCode::InvalidState, "logger is not initialized");
    if (!config_["log"]) return OK();

    try {
        const auto g_tag = std::string(GLOBAL_TAG);
        if (config_["log"][g_tag]) {
            auto node = config_["log"][g_tag];

            // global level first, tag loggers inherit it
            if (node["level"]) {
                auto r = logger_->setLevel(g_tag, toLevel(node["level"].as<std::string>()));
                if (!r) return r;
            }
            if (node["sinks"]) {
                for (const auto& sink : node["sinks"]) {
                    auto r = configureSink(g_tag, sink);
                    if (!r) return r;
                }
            }
        }

        for (const auto& it : config_["log"]) {
            std::string tag = it.first.as<std::string>();
            if (tag == GLOBAL_TAG) continue;
            auto node = it.second;

            if (node["sinks"]) {
                for (const auto& sink : node["sinks"]) {
                    auto r = configureSink(tag, sink);
                    if (!r) return r;
                }
            }
            if (node["level"]) {
                auto r = logger_->setLevel(tag, toLevel(node["level"].as<std::string>()));
                if (!r) return r;
            }
            auto r = logger_->registerLogger(tag);
            if (!r) return r;
        }
    } catch (const YAML::Exception& e) {
        return Error(ResultCode::InvalidArgument, fmt::format("logging config: {}", e.what()));
    }
    return OK();
}

Result<void> Logger::configureSink(const std::string& tag, const YAML::Node& sink) {
    if (!sink["type"]) {
        return Error(ResultCode::InvalidArgument, fmt::format("sink of tag '{}' has no type", tag));
    }
    std::string type = sink["type"].as<std::string>();

    if (type == "console") {
        return logger_->setConsoleSink(tag);
    } else if (type == "file") {
        return logger_->setFileSink(tag, sink["filename"].as<std::string>());
    } else if (type == "rotating_file") {
        return logger_->setRotatingFileSink(tag,
            sink["filename"].as<std::string>(),
            sink["max_size"].as<size_t>(),
            sink["max_files"].as<size_t>());
    }
    return Error(ResultCode::InvalidArgument, fmt::format("unknown sink type '{}' for tag '{}'", type, tag));
}

} // namespace logging
