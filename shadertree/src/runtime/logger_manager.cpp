#include <shadertree/runtime/logger_manager.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include <magic_enum.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace st::rt {

namespace {

constexpr char const* log_pattern = "%^[%H:%M:%S.%e] [%l] [%n] %v%$";

auto to_spd_log_level(LogLevel log_level) -> spdlog::level::level_enum {
    return static_cast<spdlog::level::level_enum>(static_cast<uint8_t>(log_level));
}

}

LoggerManager::LoggerManager() {
    auto sink_console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink_console->set_pattern(log_pattern);
    sinks_ = {sink_console};

    register_logger("general");
    register_logger("build");
    register_logger("compiler");
    register_logger("extension");
}

auto LoggerManager::register_logger(std::string_view name, Option<LogLevel> level) -> Logger {
    if (auto it = logger_map_.find(name); it != logger_map_.end()) {
        return it->second;
    }

    auto logger = std::make_shared<spdlog::logger>(std::string{name}, sinks_.begin(), sinks_.end());
    logger->set_level(to_spd_log_level(level.value_or(level_)));
    loggers_.emplace_back(logger);

    auto logger_handle = static_cast<Logger>(loggers_.size() - 1);
    logger_map_.emplace(std::string{name}, logger_handle);
    return logger_handle;
}

auto LoggerManager::set_level(LogLevel level) -> void {
    level_ = level;
    for (auto& logger : loggers_) {
        logger->set_level(to_spd_log_level(level));
    }
}

auto LoggerManager::add_file_sink(std::filesystem::path const& path) -> bool {
    spdlog::sink_ptr sink_file;
    try {
        sink_file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true);
    } catch (spdlog::spdlog_ex const& e) {
        critical("general", "failed to open log file '{}': {}", path.string(), e.what());
        return false;
    }
    sink_file->set_pattern(log_pattern);
    sinks_.push_back(sink_file);
    for (auto& logger : loggers_) {
        logger->sinks().push_back(sink_file);
    }
    return true;
}

auto logger_manager() -> LoggerManager& {
    static LoggerManager manager{};
    return manager;
}

auto parse_log_level(std::string_view str) -> Option<LogLevel> {
    std::string lowered{str};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (auto level = magic_enum::enum_cast<LogLevel>(lowered); level.has_value()) {
        return level.value();
    }
    return {};
}

auto log_level_from_env() -> Option<LogLevel> {
    auto value = std::getenv(log_level_env_var);
    if (!value) { return {}; }
    return parse_log_level(value);
}

}
