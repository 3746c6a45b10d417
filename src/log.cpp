/**
 * @file log.cpp
 * @brief Shared logger setup
 */

#include "sqlmigrate/log.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <mutex>
#include <vector>

namespace sqlmigrate {
namespace log {

namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;
LogConfig g_config;

// Diagnostics go to stderr so command output on stdout stays clean
std::shared_ptr<spdlog::logger> create_logger(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    if (!config.file_path.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path, config.max_file_size, config.max_files));
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(to_spdlog_level(config.level));
    logger->set_pattern(config.pattern);
    return logger;
}

} // anonymous namespace

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info: return spdlog::level::info;
        case Level::Warn: return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Critical: return spdlog::level::critical;
        case Level::Off: return spdlog::level::off;
        default: return spdlog::level::info;
    }
}

Level parse_level(const std::string& name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error" || name == "err") return Level::Error;
    if (name == "critical" || name == "crit") return Level::Critical;
    if (name == "off") return Level::Off;
    return Level::Info;
}

void init(const LogConfig& config) {
    auto logger = create_logger(config);

    std::lock_guard<std::mutex> lock(g_mutex);
    g_config = config;
    g_logger = std::move(logger);
}

void init_from_env() {
    LogConfig config;

    if (const char* level = std::getenv("SQLMIGRATE_LOG_LEVEL")) {
        config.level = parse_level(level);
    }

    if (const char* file = std::getenv("SQLMIGRATE_LOG_FILE")) {
        config.file_path = file;
    }

    init(config);
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        g_logger = create_logger(g_config);
    }
    return g_logger;
}

void set_level(Level level) {
    auto logger = get();
    std::lock_guard<std::mutex> lock(g_mutex);
    g_config.level = level;
    logger->set_level(to_spdlog_level(level));
}

Level get_level() {
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_config.level;
}

void flush() {
    get()->flush();
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->flush();
        g_logger.reset();
    }
}

} // namespace log
} // namespace sqlmigrate
