#pragma once
#include "result.h"
#include "logger_backend.hpp"
#include <chrono>
#include <ctime>
#include <iostream>
#include <iterator>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <fmt/format.h>

namespace logging {

// Backend without third-party sinks. Writes the same line layout as the
// spdlog backend, "[time] [tag] [level] message", colored by level.
// Every sink request maps onto the terminal; file sinks are not supported.
class ConsoleBackend : public LoggerBackend {
public:
    Result<void> init() override {
        std::lock_guard<std::mutex> lock(mutex_);
        global_level_ = Level::Info;
        tag_levels_.clear();
        disabled_tags_.clear();
        return OK();
    }

    Result<void> shutdown() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout.flush();
        std::cerr.flush();
        return OK();
    }

    Result<void> registerLogger(const std::string& tag) override {
        std::lock_guard<std::mutex> lock(mutex_);
        tag_levels_.emplace(tag, global_level_);
        return OK();
    }

    Result<void> setLevel(const std::string& tag, Level level) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tag == GLOBAL_TAG) global_level_ = level;
        else tag_levels_[tag] = level;
        return OK();
    }

    Result<void> enableTag(const std::string& tag) override {
        std::lock_guard<std::mutex> lock(mutex_);
        disabled_tags_.erase(tag);
        return OK();
    }

    Result<void> disableTag(const std::string& tag) override {
        std::lock_guard<std::mutex> lock(mutex_);
        disabled_tags_.insert(tag);
        return OK();
    }

    Result<void> setConsoleSink(const std::string&) override { return OK(); }

    Result<void> setFileSink(const std::string&, const std::string& filename) override {
        return Error(ResultCode::NotSupported, fmt::format("console backend cannot write '{}'", filename));
    }

    Result<void> setRotatingFileSink(const std::string&, const std::string& filename, size_t, size_t) override {
        return Error(ResultCode::NotSupported, fmt::format("console backend cannot write '{}'", filename));
    }

    void log(const std::string& tag, Level level, const std::string& msg) override {
        if (level == Level::Off) return;

        std::lock_guard<std::mutex> lock(mutex_);
        if (disabled_tags_.count(tag)) return;

        auto it = tag_levels_.find(tag);
        const Level threshold = it != tag_levels_.end() ? it->second : global_level_;
        if (level < threshold) return;

        const auto& style = styleOf(level);
        std::ostream& out = level >= Level::Error ? std::cerr : std::cout;
        out << fmt::format("[{}] [{}] [{}{}\033[0m] {}\n", timestamp(), tag, style.color, style.name, msg);
        if (level >= Level::Error) out.flush();
    }

private:
    struct Style {
        const char* name;
        const char* color;
    };

    static const Style& styleOf(Level level) {
        static const Style styles[] = {
            {"trace", "\033[90m"},
            {"debug", "\033[36m"},
            {"info", "\033[32m"},
            {"warning", "\033[33m"},
            {"error", "\033[31m"},
            {"critical", "\033[1;31m"},
        };
        const auto index = static_cast<size_t>(level);
        return styles[index < std::size(styles) ? index : std::size(styles) - 1];
    }

    // %H:%M:%S.%e
    static std::string timestamp() {
        const auto now = std::chrono::system_clock::now();
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        std::tm local{};
        localtime_r(&seconds, &local);
        return fmt::format("{:02}:{:02}:{:02}.{:03}", local.tm_hour, local.tm_min, local.tm_sec, millis);
    }

    std::mutex mutex_;
    Level global_level_ = Level::Info;
    std::unordered_map<std::string, Level> tag_levels_;
    std::unordered_set<std::string> disabled_tags_;
};

} // namespace logging
