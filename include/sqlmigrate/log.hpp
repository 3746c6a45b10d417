/**
 * @file log.hpp
 * @brief spdlog-backed logging for sqlmigrate
 *
 * All library components log through the shared "sqlmigrate" logger.
 * The logger initializes itself with defaults on first use; applications
 * call init() or init_from_env() early to change level, pattern or sinks.
 *
 *   sqlmigrate::log::init_from_env();
 *   sqlmigrate::log::info("Migrated: {}", identifier);
 */

#pragma once

#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace sqlmigrate {
namespace log {

constexpr const char* LOGGER_NAME = "sqlmigrate";

enum class Level {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

struct LogConfig {
    Level level{Level::Info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};
    bool console{true};
    // Rotating file sink is added when non-empty
    std::string file_path;
    size_t max_file_size{10 * 1024 * 1024};
    size_t max_files{3};
};

/**
 * @brief (Re)build the shared logger from the given configuration
 */
void init(const LogConfig& config = LogConfig{});

/**
 * @brief init() with overrides from the environment
 *
 * SQLMIGRATE_LOG_LEVEL: trace, debug, info, warn, error, critical, off
 * SQLMIGRATE_LOG_FILE:  path to a rotating log file
 */
void init_from_env();

std::shared_ptr<spdlog::logger> get();

void set_level(Level level);

Level get_level();

/**
 * @brief Parse a level name; unknown names map to Info
 */
Level parse_level(const std::string& name);

spdlog::level::level_enum to_spdlog_level(Level level);

void flush();

void shutdown();

template<typename... Args>
inline void trace(fmt::format_string<Args...> fmt, Args&&... args) {
    get()->trace(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    get()->debug(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
    get()->info(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    get()->warn(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void error(fmt::format_string<Args...> fmt, Args&&... args) {
    get()->error(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void critical(fmt::format_string<Args...> fmt, Args&&... args) {
    get()->critical(fmt, std::forward<Args>(args)...);
}

} // namespace log
} // namespace sqlmigrate
