/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Logging configuration consumed by the LoggingManager

**************************************************/

#ifndef USAXS_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define USAXS_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <string>
#include <vector>

#include "../core/config_section.hpp"

namespace usaxs::config {

/**
 * @brief Sink configuration for additional log sinks
 */
struct LogSinkConfig {
    std::string name;       ///< Sink identifier
    std::string type;       ///< Type: "console", "file", "rotating_file", "daily_file"
    std::string level;      ///< Log level for this sink
    std::string pattern;    ///< Log pattern (optional, uses default if empty)

    // File sink options
    std::string filePath;        ///< File path (for file sinks)
    size_t maxFileSize{10 * 1024 * 1024};  ///< Max file size for rotation
    size_t maxFiles{5};          ///< Max number of rotated files

    // Daily file options
    int rotationHour{0};         ///< Hour for daily rotation
    int rotationMinute{0};       ///< Minute for daily rotation

    [[nodiscard]] json toJson() const {
        return {
            {"name", name},
            {"type", type},
            {"level", level},
            {"pattern", pattern},
            {"filePath", filePath},
            {"maxFileSize", maxFileSize},
            {"maxFiles", maxFiles},
            {"rotationHour", rotationHour},
            {"rotationMinute", rotationMinute}
        };
    }

    [[nodiscard]] static LogSinkConfig fromJson(const json& j) {
        LogSinkConfig cfg;
        cfg.name = j.value("name", "");
        cfg.type = j.value("type", "console");
        cfg.level = j.value("level", "info");
        cfg.pattern = j.value("pattern", "");
        cfg.filePath = j.value("filePath", "");
        cfg.maxFileSize = readCount(j, "maxFileSize", cfg.maxFileSize, "sink");
        cfg.maxFiles = readCount(j, "maxFiles", cfg.maxFiles, "sink");
        cfg.rotationHour = j.value("rotationHour", 0);
        cfg.rotationMinute = j.value("rotationMinute", 0);
        return cfg;
    }
};

/**
 * @brief Console and file logging of the gain controller and scans
 *
 * @example
 * ```json
 * {
 *   "usaxs": {
 *     "logging": {
 *       "consoleLevel": "info",
 *       "enableFile": true,
 *       "logDir": "logs",
 *       "fileLevel": "debug"
 *     }
 *   }
 * }
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    static constexpr std::string_view PATH = "/usaxs/logging";

    // Console
    bool enableConsole{true};
    std::string consoleLevel{"info"};
    bool consoleColor{true};

    // File
    bool enableFile{false};
    std::string logDir{"logs"};
    std::string logFilename{"usaxs"};  ///< Base filename (without extension)
    std::string fileLevel{"debug"};

    // Rotation
    size_t maxFileSize{10 * 1024 * 1024};  ///< Max file size before rotation (10 MB)
    size_t maxFiles{5};
    bool useDailyRotation{false};  ///< Use daily rotation instead of size-based
    int rotationHour{0};
    int rotationMinute{0};

    /// Available placeholders: %Y %m %d %H %M %S %e (milliseconds)
    ///                        %l (level), %n (logger name), %t (thread id)
    ///                        %v (message)
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v"};

    // Async
    bool asyncMode{false};
    size_t asyncQueueSize{8192};
    size_t asyncThreadCount{1};

    std::vector<LogSinkConfig> additionalSinks;

    [[nodiscard]] json serialize() const {
        json sinksArray = json::array();
        for (const auto& sink : additionalSinks) {
            sinksArray.push_back(sink.toJson());
        }

        return {
            // Console
            {"enableConsole", enableConsole},
            {"consoleLevel", consoleLevel},
            {"consoleColor", consoleColor},
            // File
            {"enableFile", enableFile},
            {"logDir", logDir},
            {"logFilename", logFilename},
            {"fileLevel", fileLevel},
            // Rotation
            {"maxFileSize", maxFileSize},
            {"maxFiles", maxFiles},
            {"useDailyRotation", useDailyRotation},
            {"rotationHour", rotationHour},
            {"rotationMinute", rotationMinute},
            // Format
            {"pattern", pattern},
            // Async
            {"asyncMode", asyncMode},
            {"asyncQueueSize", asyncQueueSize},
            {"asyncThreadCount", asyncThreadCount},
            // Additional
            {"additionalSinks", sinksArray}
        };
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;

        cfg.enableConsole = j.value("enableConsole", cfg.enableConsole);
        cfg.consoleLevel = j.value("consoleLevel", cfg.consoleLevel);
        cfg.consoleColor = j.value("consoleColor", cfg.consoleColor);

        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.logDir = j.value("logDir", cfg.logDir);
        cfg.logFilename = j.value("logFilename", cfg.logFilename);
        cfg.fileLevel = j.value("fileLevel", cfg.fileLevel);

        cfg.maxFileSize = readCount(j, "maxFileSize", cfg.maxFileSize, PATH);
        cfg.maxFiles = readCount(j, "maxFiles", cfg.maxFiles, PATH);
        cfg.useDailyRotation = j.value("useDailyRotation", cfg.useDailyRotation);
        cfg.rotationHour = j.value("rotationHour", cfg.rotationHour);
        cfg.rotationMinute = j.value("rotationMinute", cfg.rotationMinute);

        cfg.pattern = j.value("pattern", cfg.pattern);

        cfg.asyncMode = j.value("asyncMode", cfg.asyncMode);
        cfg.asyncQueueSize =
            readCount(j, "asyncQueueSize", cfg.asyncQueueSize, PATH);
        cfg.asyncThreadCount =
            readCount(j, "asyncThreadCount", cfg.asyncThreadCount, PATH);

        if (j.contains("additionalSinks") && j["additionalSinks"].is_array()) {
            for (const auto& sinkJson : j["additionalSinks"]) {
                cfg.additionalSinks.push_back(LogSinkConfig::fromJson(sinkJson));
            }
        }

        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        return {
            {"type", "object"},
            {"properties", {
                {"enableConsole", {{"type", "boolean"}, {"default", true}}},
                {"consoleLevel", {
                    {"type", "string"},
                    {"enum", {"trace", "debug", "info", "warn", "error", "critical", "off"}},
                    {"default", "info"}
                }},
                {"consoleColor", {{"type", "boolean"}, {"default", true}}},
                {"enableFile", {{"type", "boolean"}, {"default", false}}},
                {"logDir", {{"type", "string"}, {"default", "logs"}}},
                {"logFilename", {{"type", "string"}, {"default", "usaxs"}}},
                {"fileLevel", {
                    {"type", "string"},
                    {"enum", {"trace", "debug", "info", "warn", "error", "critical", "off"}},
                    {"default", "debug"}
                }},
                {"maxFileSize", {
                    {"type", "integer"},
                    {"minimum", 1024},
                    {"maximum", 1073741824},  // 1 GB
                    {"default", 10485760}
                }},
                {"maxFiles", {
                    {"type", "integer"},
                    {"minimum", 1},
                    {"maximum", 100},
                    {"default", 5}
                }},
                {"useDailyRotation", {{"type", "boolean"}, {"default", false}}},
                {"rotationHour", {
                    {"type", "integer"}, {"minimum", 0}, {"maximum", 23}, {"default", 0}
                }},
                {"rotationMinute", {
                    {"type", "integer"}, {"minimum", 0}, {"maximum", 59}, {"default", 0}
                }},
                {"pattern", {{"type", "string"}}},
                {"asyncMode", {{"type", "boolean"}, {"default", false}}},
                {"asyncQueueSize", {
                    {"type", "integer"}, {"minimum", 128}, {"maximum", 1048576}, {"default", 8192}
                }},
                {"asyncThreadCount", {
                    {"type", "integer"}, {"minimum", 1}, {"maximum", 16}, {"default", 1}
                }},
                {"additionalSinks", {{"type", "array"}}}
            }}
        };
    }
};

}  // namespace usaxs::config

#endif  // USAXS_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
