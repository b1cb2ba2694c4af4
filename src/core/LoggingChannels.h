#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace FallingSand {

/**
 * @brief Named spdlog loggers for each simulation subsystem.
 *
 * All channels share the same sinks (stderr + log file) so stdout stays free for
 * JSON results. Levels are set per channel from a config file or a spec string.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize with built-in defaults.
     * @param consoleLevel Level for the stderr sink
     * @param fileLevel Level for the log file sink
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug);

    /**
     * @brief Initialize from a JSON config file.
     * Looks for <configPath>.local first, falls back to <configPath>.
     * @return true if a config file was applied, false if built-in defaults were used
     */
    static bool initializeFromConfig(const std::string& configPath = "logging-config.json");

    /**
     * @brief Get a channel logger, or the default logger if the channel doesn't exist.
     */
    static std::shared_ptr<spdlog::logger> get(const std::string& channel);

    /**
     * @brief Configure channel levels from a "channel:level" list.
     * @param spec Format: "channel:level,channel2:level2" or "*:level" for all
     * Examples:
     *   "rules:trace,grid:debug"
     *   "*:off,scenario:info"
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    // Built-in defaults, also written out when no config file exists.
    static nlohmann::json defaultConfig();

    static std::shared_ptr<spdlog::logger> sim() { return get("sim"); }
    static std::shared_ptr<spdlog::logger> grid() { return get("grid"); }
    static std::shared_ptr<spdlog::logger> rules() { return get("rules"); }
    static std::shared_ptr<spdlog::logger> tools() { return get("tools"); }
    static std::shared_ptr<spdlog::logger> scenario() { return get("scenario"); }
    static std::shared_ptr<spdlog::logger> config() { return get("config"); }

private:
    static void createChannelLoggers();

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

    static nlohmann::json loadConfigFile(const std::string& configPath, bool& fromFile);

    static void applyConfig(const nlohmann::json& config);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

} // namespace FallingSand
