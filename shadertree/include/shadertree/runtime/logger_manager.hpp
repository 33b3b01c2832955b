#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "../prelude/option.hpp"

namespace st::rt {

enum class LogLevel : uint8_t {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    off,
};

enum class Logger : size_t;

inline constexpr char const* log_level_env_var = "SHADERTREE_LOG_LEVEL";

struct LoggerManager final {
    LoggerManager();

    auto register_logger(std::string_view name, Option<LogLevel> level = {}) -> Logger;

    // Applies to every registered logger and to loggers registered later.
    auto set_level(LogLevel level) -> void;

    // Loggers keep writing to the console; the file receives the same records.
    auto add_file_sink(std::filesystem::path const& path) -> bool;

#define DEFINE_LOG_METHOD(level) \
    template <typename... Args> \
    auto level(Logger logger, spdlog::format_string_t<Args...> fmt, Args&&... args) -> void { \
        loggers_[static_cast<size_t>(logger)]->level(fmt, std::forward<Args>(args)...); \
    } \
    template <typename... Args> \
    auto level(std::string_view logger, spdlog::format_string_t<Args...> fmt, Args&&... args) -> void { \
        if (auto it = logger_map_.find(logger); it != logger_map_.end()) { \
            level(it->second, fmt, std::forward<Args>(args)...); \
        } \
    }

    DEFINE_LOG_METHOD(trace)
    DEFINE_LOG_METHOD(debug)
    DEFINE_LOG_METHOD(info)
    DEFINE_LOG_METHOD(warn)
    DEFINE_LOG_METHOD(error)
    DEFINE_LOG_METHOD(critical)

#undef DEFINE_LOG_METHOD

private:
    LogLevel level_ = LogLevel::info;
    std::vector<spdlog::sink_ptr> sinks_;
    std::vector<std::shared_ptr<spdlog::logger>> loggers_;
    std::map<std::string, Logger, std::less<>> logger_map_;
};

auto logger_manager() -> LoggerManager&;

// Reads `SHADERTREE_LOG_LEVEL`, returns nothing when it is unset or not a level name.
auto log_level_from_env() -> Option<LogLevel>;

auto parse_log_level(std::string_view str) -> Option<LogLevel>;

}
