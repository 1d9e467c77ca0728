#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <cstddef>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace GenEvo {

/**
 * @brief Available logging channels for categorizing log messages.
 */
enum class LogChannel { Config, Engine, Operators, Selection };

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Config:
            return "config";
        case LogChannel::Engine:
            return "engine";
        case LogChannel::Operators:
            return "operators";
        case LogChannel::Selection:
            return "selection";
    }
    return "";
}

/**
 * @brief Sink and channel settings, usually read from logging.json.
 *
 * Levels are spdlog level names ("trace" ... "off"). Channels missing from
 * `channels` keep their built-in level.
 */
struct LoggingConfig {
    std::string consoleLevel = "info";
    std::string fileLevel = "debug";
    bool consoleToStderr = false;

    bool fileEnabled = true;
    std::string logFile = "genevo.log";
    bool truncateLogFile = true;
    std::optional<size_t> maxLogSizeMb; // Rotating file sink when set.
    size_t maxLogFiles = 3;

    int flushIntervalMs = 1000;
    std::map<std::string, std::string> channels;
};

void to_json(nlohmann::json& j, const LoggingConfig& config);
void from_json(const nlohmann::json& j, LoggingConfig& config);

/**
 * @brief Centralized logging channel management for fine-grained log filtering.
 *
 * Provides named loggers for the engine, the variation operators and selection
 * so a long run can trace one subsystem without flooding the console.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system with shared sinks.
     * @param consoleLevel Default log level for console output
     * @param fileLevel Default log level for file output
     * @param componentName Component name for log pattern (e.g., "cli", "tests")
     * @param consoleToStderr Route console output to stderr (keeps stdout for results)
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default",
        bool consoleToStderr = false);

    /**
     * @brief Rebuild sinks and channel loggers from a config.
     * Safe to call after initialize(); existing channel loggers are replaced.
     */
    static void configure(
        const LoggingConfig& config, const std::string& componentName = "default");

    /**
     * @brief Get a specific channel logger.
     */
    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Configure channels from a specification string.
     * @param spec Format: "channel:level,channel2:level2" or "*:level" for all
     * Examples:
     *   "engine:debug,selection:trace"
     *   "*:off,engine:info"
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);
    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

private:
    static void createLogger(
        const std::string& name,
        const std::vector<spdlog::sink_ptr>& sinks,
        spdlog::level::level_enum level);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#ifdef LOG_INFO
#undef LOG_INFO
#endif
#ifdef LOG_WARN
#undef LOG_WARN
#endif
#ifdef LOG_ERROR
#undef LOG_ERROR
#endif

#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(::GenEvo::LoggingChannels::get(::GenEvo::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(::GenEvo::LoggingChannels::get(::GenEvo::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(::GenEvo::LoggingChannels::get(::GenEvo::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(::GenEvo::LoggingChannels::get(::GenEvo::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(::GenEvo::LoggingChannels::get(::GenEvo::LogChannel::channel), __VA_ARGS__)

// Simple logging macros using default logger (no channel parameter, omits channel in output).
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)

} // namespace GenEvo
