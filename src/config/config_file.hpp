/*
 * config_file.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-11

Description: Loading and saving of the instrument configuration document

**************************************************/

#ifndef USAXS_CONFIG_CONFIG_FILE_HPP
#define USAXS_CONFIG_CONFIG_FILE_HPP

#include <filesystem>
#include <string_view>

#include "atom/type/json.hpp"
#include "sections/sections.hpp"

namespace fs = std::filesystem;

namespace usaxs::config {

using json = nlohmann::json;

/**
 * @brief Every section of the configuration document
 */
struct UsaxsConfig {
    AmplifierConfig amplifier;
    StepScanConfig scan;
    LoggingConfig logging;

    /**
     * @brief Whole document with each section at its PATH
     */
    [[nodiscard]] json toDocument() const;

    /**
     * @brief Read and validate every section; missing sections get defaults
     * @throw BadConfigException family on a malformed or invalid section
     */
    [[nodiscard]] static UsaxsConfig fromDocument(const json& document);
};

/**
 * @brief Read a JSON (.json) or YAML (.yaml, .yml) document
 * @throw ConfigIOException if the file cannot be read
 * @throw ConfigSerializationException if it cannot be parsed
 */
[[nodiscard]] auto loadConfigFile(const fs::path& path) -> json;

/**
 * @brief Read a configuration file into its sections
 */
[[nodiscard]] auto loadUsaxsConfig(const fs::path& path) -> UsaxsConfig;

/**
 * @brief Write a document as JSON, or as YAML for .yaml and .yml paths
 * @throw ConfigIOException if the file cannot be written
 */
void saveConfigFile(const fs::path& path, const json& document);

/**
 * @brief Convert YAML text to JSON
 * @throw ConfigSerializationException on a syntax error
 */
[[nodiscard]] auto parseYaml(std::string_view content) -> json;

}  // namespace usaxs::config

#endif  // USAXS_CONFIG_CONFIG_FILE_HPP
