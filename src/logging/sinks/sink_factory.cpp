/*
 * sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sink_factory.hpp"

#include <filesystem>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace usaxs::logging {

auto SinkFactory::createSink(const config::LogSinkConfig& config)
    -> spdlog::sink_ptr {
    auto level = spdlog::level::from_str(config.level);
    try {
        if (config.type == "console" || config.type == "stdout") {
            return createConsoleSink(level, config.pattern);
        }
        if (config.type == "file" || config.type == "basic_file") {
            return createFileSink(config.filePath, level, config.pattern);
        }
        if (config.type == "rotating_file") {
            return createRotatingFileSink(config.filePath, config.maxFileSize,
                                          config.maxFiles, level,
                                          config.pattern);
        }
        if (config.type == "daily_file") {
            return createDailyFileSink(config.filePath, config.rotationHour,
                                       config.rotationMinute, level,
                                       config.pattern);
        }
        spdlog::warn("Unknown sink type: {}", config.type);
        return nullptr;
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Failed to create sink '{}': {}", config.name, e.what());
        return nullptr;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to create sink '{}': {}", config.name, e.what());
        return nullptr;
    }
}

auto SinkFactory::createConsoleSink(spdlog::level::level_enum level,
                                    const std::string& pattern, bool color)
    -> spdlog::sink_ptr {
    spdlog::sink_ptr sink;
    if (color) {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    }
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

auto SinkFactory::createFileSink(const std::string& file_path,
                                 spdlog::level::level_enum level,
                                 const std::string& pattern, bool truncate)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(file_path);
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path,
                                                                    truncate);
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

auto SinkFactory::createRotatingFileSink(const std::string& file_path,
                                         size_t max_size, size_t max_files,
                                         spdlog::level::level_enum level,
                                         const std::string& pattern)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(file_path);
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        file_path, max_size, max_files);
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

auto SinkFactory::createDailyFileSink(const std::string& file_path,
                                      int rotation_hour, int rotation_minute,
                                      spdlog::level::level_enum level,
                                      const std::string& pattern)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(file_path);
    auto sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
        file_path, rotation_hour, rotation_minute);
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

void SinkFactory::ensureDirectoryExists(const std::string& file_path) {
    std::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
}

}  // namespace usaxs::logging
