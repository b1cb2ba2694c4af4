#include "LoggingChannels.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace FallingSand {

namespace {

constexpr const char* DEFAULT_PATTERN = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";
constexpr const char* DEFAULT_LOG_FILE = "falling-sand.log";

const std::vector<std::string> CHANNEL_NAMES = { "sim",   "grid",     "rules",
                                                 "tools", "scenario", "config" };

std::string trim(const std::string& s)
{
    const auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

} // namespace

bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel, spdlog::level::level_enum fileLevel)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(consoleLevel);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(DEFAULT_LOG_FILE, true);
    file_sink->set_level(fileLevel);

    sharedSinks_ = { console_sink, file_sink };
    createChannelLoggers();
    spdlog::set_pattern(DEFAULT_PATTERN);
    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    spdlog::info("LoggingChannels initialized");
}

bool LoggingChannels::initializeFromConfig(const std::string& configPath)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    bool fromFile = false;
    applyConfig(loadConfigFile(configPath, fromFile));

    initialized_ = true;
    return fromFile;
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(const std::string& channel)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        return spdlog::default_logger();
    }
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item = trim(item);

        const size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        const std::string channel = trim(item.substr(0, colonPos));
        const auto level = parseLevelString(trim(item.substr(colonPos + 1)));

        if (channel == "*") {
            spdlog::apply_all(
                [level](std::shared_ptr<spdlog::logger> logger) { logger->set_level(level); });
            spdlog::debug("Set all channels to level: {}", spdlog::level::to_string_view(level));
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (logger) {
        logger->set_level(level);
        spdlog::debug(
            "Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
    }
    else {
        spdlog::warn("Channel '{}' not found, cannot set level", channel);
    }
}

nlohmann::json LoggingChannels::defaultConfig()
{
    nlohmann::json channels = nlohmann::json::object();
    for (const auto& name : CHANNEL_NAMES) {
        channels[name] = "info";
    }

    return {
        { "defaults", { { "pattern", DEFAULT_PATTERN }, { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" } } },
            { "file",
              { { "enabled", true },
                { "level", "debug" },
                { "path", DEFAULT_LOG_FILE },
                { "truncate", true } } } } },
        { "channels", channels },
    };
}

void LoggingChannels::createChannelLoggers()
{
    for (const auto& name : CHANNEL_NAMES) {
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(name, sharedSinks_.begin(), sharedSinks_.end());
        logger->set_level(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    auto default_logger =
        std::make_shared<spdlog::logger>("default", sharedSinks_.begin(), sharedSinks_.end());
    default_logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(default_logger);
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;

    const auto level = spdlog::level::from_str(lower);
    if (level == spdlog::level::off && lower != "off") {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
    return level;
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath, bool& fromFile)
{
    namespace fs = std::filesystem;

    fromFile = false;
    const std::string localPath = configPath + ".local";
    std::string pathToUse;

    if (fs::exists(localPath)) {
        pathToUse = localPath;
        spdlog::info("Using local config override: {}", localPath);
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
    }
    else {
        spdlog::info("Logging config {} not found, creating default", configPath);
        std::ofstream out(configPath);
        if (out.is_open()) {
            out << defaultConfig().dump(2) << std::endl;
        }
        else {
            spdlog::warn("Could not create {}, using built-in defaults", configPath);
        }
        return defaultConfig();
    }

    std::ifstream configFile(pathToUse);
    if (!configFile.is_open()) {
        spdlog::error("Cannot open logging config {}, using built-in defaults", pathToUse);
        return defaultConfig();
    }

    try {
        nlohmann::json config = nlohmann::json::parse(configFile);
        fromFile = true;
        return config;
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error("Failed to parse logging config {}: {}", pathToUse, e.what());
        return defaultConfig();
    }
}

void LoggingChannels::applyConfig(const nlohmann::json& config)
{
    std::string pattern = DEFAULT_PATTERN;
    int flushIntervalMs = 1000;
    std::vector<spdlog::sink_ptr> sinks;

    try {
        if (config.contains("defaults")) {
            const auto& defaults = config["defaults"];
            pattern = defaults.value("pattern", pattern);
            flushIntervalMs = defaults.value("flush_interval_ms", flushIntervalMs);
        }

        if (config.contains("sinks")) {
            const auto& sinksConfig = config["sinks"];

            if (sinksConfig.contains("console")) {
                const auto& consoleCfg = sinksConfig["console"];
                if (consoleCfg.value("enabled", true)) {
                    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
                    console_sink->set_level(parseLevelString(consoleCfg.value("level", "info")));
                    sinks.push_back(console_sink);
                }
            }

            if (sinksConfig.contains("file")) {
                const auto& fileCfg = sinksConfig["file"];
                if (fileCfg.value("enabled", true)) {
                    const std::string path = fileCfg.value("path", DEFAULT_LOG_FILE);
                    spdlog::sink_ptr file_sink;
                    if (fileCfg.contains("max_size_mb")) {
                        const size_t maxSizeBytes =
                            fileCfg.value("max_size_mb", size_t{ 100 }) * 1024 * 1024;
                        const size_t maxFiles = fileCfg.value("max_files", size_t{ 3 });
                        file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                            path, maxSizeBytes, maxFiles);
                    }
                    else {
                        file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                            path, fileCfg.value("truncate", true));
                    }
                    file_sink->set_level(parseLevelString(fileCfg.value("level", "debug")));
                    sinks.push_back(file_sink);
                }
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Error creating sinks from config: {}, using defaults", e.what());
        sinks = { std::make_shared<spdlog::sinks::stderr_color_sink_mt>() };
    }

    sharedSinks_ = sinks;
    createChannelLoggers();
    spdlog::set_pattern(pattern);

    if (config.contains("channels")) {
        for (const auto& [channel, levelStr] : config["channels"].items()) {
            if (!levelStr.is_string()) {
                spdlog::warn("Channel '{}' level must be a string", channel);
                continue;
            }
            setChannelLevel(channel, parseLevelString(levelStr.get<std::string>()));
        }
    }

    spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));
    spdlog::debug("LoggingChannels initialized from config");
}

} // namespace FallingSand
