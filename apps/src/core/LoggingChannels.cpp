#include "LoggingChannels.h"
#include "Assert.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>

namespace GenEvo {

namespace {
const std::string BASE_PATTERN = "[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v";

// Built-in channel levels; operator and selection traces are very chatty.
const std::map<std::string, spdlog::level::level_enum> CHANNEL_DEFAULTS = {
    { "config", spdlog::level::info },
    { "engine", spdlog::level::info },
    { "operators", spdlog::level::warn },
    { "selection", spdlog::level::warn },
};

std::string channelPattern(const std::string& componentName)
{
    return componentName == "default"
        ? BASE_PATTERN
        : "[%H:%M:%S.%e] [" + componentName + "] [%n] [%^%l%$] [%s:%#] %v";
}

std::string defaultLoggerPattern(const std::string& componentName)
{
    return componentName == "default"
        ? "[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v"
        : "[%H:%M:%S.%e] [" + componentName + "] [%^%l%$] [%s:%#] %v";
}

spdlog::sink_ptr makeConsoleSink(bool toStderr, spdlog::level::level_enum level)
{
    spdlog::sink_ptr sink;
    if (toStderr) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    else {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    sink->set_level(level);
    return sink;
}

// Rotating when maxLogSizeMb is set. Only one of these may exist per log file.
spdlog::sink_ptr makeFileSink(const LoggingConfig& config, bool truncate)
{
    spdlog::sink_ptr sink;
    if (config.maxLogSizeMb.has_value()) {
        sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.logFile, *config.maxLogSizeMb * 1024 * 1024, config.maxLogFiles);
    }
    else {
        sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.logFile, truncate);
    }
    sink->set_level(LoggingChannels::parseLevelString(config.fileLevel));
    return sink;
}

void installDefaultLogger(
    const std::string& componentName, std::vector<spdlog::sink_ptr> defaultSinks)
{
    const std::string pattern = defaultLoggerPattern(componentName);
    for (auto& sink : defaultSinks) {
        sink->set_pattern(pattern);
    }

    std::string loggerName = componentName.empty() ? "default" : componentName;
    auto default_logger =
        std::make_shared<spdlog::logger>(loggerName, defaultSinks.begin(), defaultSinks.end());
    default_logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(default_logger);
}
} // namespace

void to_json(nlohmann::json& j, const LoggingConfig& config)
{
    j = nlohmann::json{
        { "consoleLevel", config.consoleLevel },
        { "fileLevel", config.fileLevel },
        { "consoleToStderr", config.consoleToStderr },
        { "fileEnabled", config.fileEnabled },
        { "logFile", config.logFile },
        { "truncateLogFile", config.truncateLogFile },
        { "maxLogFiles", config.maxLogFiles },
        { "flushIntervalMs", config.flushIntervalMs },
        { "channels", config.channels },
    };
    if (config.maxLogSizeMb.has_value()) {
        j["maxLogSizeMb"] = *config.maxLogSizeMb;
    }
}

void from_json(const nlohmann::json& j, LoggingConfig& config)
{
    const LoggingConfig defaults;
    config.consoleLevel = j.value("consoleLevel", defaults.consoleLevel);
    config.fileLevel = j.value("fileLevel", defaults.fileLevel);
    config.consoleToStderr = j.value("consoleToStderr", defaults.consoleToStderr);
    config.fileEnabled = j.value("fileEnabled", defaults.fileEnabled);
    config.logFile = j.value("logFile", defaults.logFile);
    config.truncateLogFile = j.value("truncateLogFile", defaults.truncateLogFile);
    config.maxLogFiles = j.value("maxLogFiles", defaults.maxLogFiles);
    config.flushIntervalMs = j.value("flushIntervalMs", defaults.flushIntervalMs);
    config.channels = j.value("channels", defaults.channels);

    config.maxLogSizeMb.reset();
    if (j.contains("maxLogSizeMb") && !j.at("maxLogSizeMb").is_null()) {
        config.maxLogSizeMb = j.at("maxLogSizeMb").get<size_t>();
    }
}

bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    bool consoleToStderr)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    LoggingConfig config;
    const auto consoleName = spdlog::level::to_string_view(consoleLevel);
    const auto fileName = spdlog::level::to_string_view(fileLevel);
    config.consoleLevel = std::string(consoleName.data(), consoleName.size());
    config.fileLevel = std::string(fileName.data(), fileName.size());
    config.consoleToStderr = consoleToStderr;
    configure(config, componentName);
}

void LoggingChannels::configure(const LoggingConfig& config, const std::string& componentName)
{
    const auto consoleLevel = parseLevelString(config.consoleLevel);

    sharedSinks_ = { makeConsoleSink(config.consoleToStderr, consoleLevel) };
    std::vector<spdlog::sink_ptr> defaultSinks = { makeConsoleSink(
        config.consoleToStderr, consoleLevel) };
    if (config.fileEnabled) {
        sharedSinks_.push_back(makeFileSink(config, config.truncateLogFile));
        // Plain appending handle; only the shared sink rotates, or the two would
        // rename the same file out from under each other.
        auto default_file_sink =
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.logFile, false);
        default_file_sink->set_level(parseLevelString(config.fileLevel));
        defaultSinks.push_back(default_file_sink);
    }

    const std::string pattern = channelPattern(componentName);
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    for (const auto& [name, level] : CHANNEL_DEFAULTS) {
        createLogger(name, sharedSinks_, level);
    }
    initialized_ = true;

    for (const auto& [channel, levelStr] : config.channels) {
        setChannelLevel(channel, parseLevelString(levelStr));
    }

    // Default logger gets its own sinks so its pattern doesn't affect channel loggers.
    installDefaultLogger(componentName, defaultSinks);

    spdlog::flush_every(std::chrono::milliseconds(config.flushIntervalMs));

    SLOG_DEBUG(
        "LoggingChannels configured (console {}, file {})",
        config.consoleLevel,
        config.fileEnabled ? config.logFile : "disabled");
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Auto-initialize with defaults if get() is called before initialize().
    // This commonly happens in unit tests that use gtest_main.
    if (!initialized_) {
        initialize(spdlog::level::warn, spdlog::level::debug);
    }

    auto logger = spdlog::get(toString(channel));
    GENEVO_ASSERT(logger, "LogChannel not found after initialization");
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    // Parse format: "channel:level,channel2:level2"
    std::stringstream ss(spec);
    std::string item;

    auto trim = [](std::string& s) {
        s.erase(0, s.find_first_not_of(" \t"));
        s.erase(s.find_last_not_of(" \t") + 1);
    };

    while (std::getline(ss, item, ',')) {
        trim(item);

        size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        std::string channel = item.substr(0, colonPos);
        std::string levelStr = item.substr(colonPos + 1);
        trim(channel);
        trim(levelStr);

        auto level = parseLevelString(levelStr);

        if (channel == "*") {
            for (const auto& entry : CHANNEL_DEFAULTS) {
                setChannelLevel(entry.first, level);
            }
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    setChannelLevel(std::string(toString(channel)), level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Unknown log channel '{}', ignoring", channel);
        return;
    }
    logger->set_level(level);
    spdlog::debug("Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    if (spdlog::get(name)) {
        spdlog::drop(name);
    }
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    else if (lower == "debug") {
        return spdlog::level::debug;
    }
    else if (lower == "info") {
        return spdlog::level::info;
    }
    else if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    else if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    else if (lower == "critical") {
        return spdlog::level::critical;
    }
    else if (lower == "off") {
        return spdlog::level::off;
    }
    else {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
}

} // namespace GenEvo
