/*
 * config_file.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "config_file.hpp"

#include <charconv>
#include <fstream>
#include <iterator>
#include <string>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace usaxs::config {

namespace {

constexpr std::size_t MAX_YAML_DEPTH = 100;

auto isYaml(const fs::path& path) -> bool {
    auto extension = path.extension().string();
    return extension == ".yaml" || extension == ".yml";
}

auto scalarToJson(const std::string& value) -> json {
    if (value == "true" || value == "True" || value == "TRUE" ||
        value == "yes" || value == "Yes" || value == "on" || value == "On") {
        return json(true);
    }
    if (value == "false" || value == "False" || value == "FALSE" ||
        value == "no" || value == "No" || value == "off" || value == "Off") {
        return json(false);
    }
    if (value == "null" || value == "Null" || value == "NULL" ||
        value == "~" || value.empty()) {
        return json(nullptr);
    }

    const char* first = value.data();
    const char* last = value.data() + value.size();
    long long intVal = 0;
    auto [intEnd, intErr] = std::from_chars(first, last, intVal);
    if (intErr == std::errc() && intEnd == last) {
        return json(intVal);
    }
    double floatVal = 0.0;
    auto [floatEnd, floatErr] = std::from_chars(first, last, floatVal);
    if (floatErr == std::errc() && floatEnd == last) {
        return json(floatVal);
    }
    return json(value);
}

auto yamlNodeToJson(const YAML::Node& node, std::size_t depth) -> json {
    if (depth > MAX_YAML_DEPTH) {
        THROW_CONFIG_SERIALIZATION_EXCEPTION("Maximum YAML nesting depth "
                                             "exceeded");
    }

    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            // Quoted scalars carry the "!" tag and stay strings
            if (node.Tag() == "!") {
                return json(node.Scalar());
            }
            return scalarToJson(node.Scalar());

        case YAML::NodeType::Sequence: {
            json arr = json::array();
            for (const auto& item : node) {
                arr.push_back(yamlNodeToJson(item, depth + 1));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            json obj = json::object();
            for (const auto& pair : node) {
                obj[pair.first.as<std::string>()] =
                    yamlNodeToJson(pair.second, depth + 1);
            }
            return obj;
        }

        default:
            return json(nullptr);
    }
}

void emitJson(YAML::Emitter& out, const json& value) {
    if (value.is_object()) {
        out << YAML::BeginMap;
        for (const auto& [key, item] : value.items()) {
            out << YAML::Key << key << YAML::Value;
            emitJson(out, item);
        }
        out << YAML::EndMap;
    } else if (value.is_array()) {
        out << YAML::BeginSeq;
        for (const auto& item : value) {
            emitJson(out, item);
        }
        out << YAML::EndSeq;
    } else if (value.is_string()) {
        // Plain scalars such as yes, 123 or null would reload as other types
        out << YAML::DoubleQuoted << value.get<std::string>();
    } else if (value.is_boolean()) {
        out << value.get<bool>();
    } else if (value.is_number_integer()) {
        out << value.get<long long>();
    } else if (value.is_number()) {
        out << value.get<double>();
    } else {
        out << YAML::Null;
    }
}

}  // namespace

auto UsaxsConfig::toDocument() const -> json {
    json document = json::object();
    document[json::json_pointer(std::string(AmplifierConfig::PATH))] =
        amplifier.serialize();
    document[json::json_pointer(std::string(StepScanConfig::PATH))] =
        scan.serialize();
    document[json::json_pointer(std::string(LoggingConfig::PATH))] =
        logging.serialize();
    return document;
}

auto UsaxsConfig::fromDocument(const json& document) -> UsaxsConfig {
    UsaxsConfig config;
    config.amplifier = AmplifierConfig::fromDocument(document);
    config.scan = StepScanConfig::fromDocument(document);
    config.logging = LoggingConfig::fromDocument(document);
    config.amplifier.validate();
    config.scan.validate();
    return config;
}

auto parseYaml(std::string_view content) -> json {
    try {
        return yamlNodeToJson(YAML::Load(std::string(content)), 0);
    } catch (const YAML::Exception& e) {
        THROW_CONFIG_SERIALIZATION_EXCEPTION(std::string("YAML: ") + e.what());
    }
}

auto loadConfigFile(const fs::path& path) -> json {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        THROW_CONFIG_IO_EXCEPTION("Failed to open file: " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    json document;
    if (isYaml(path)) {
        document = parseYaml(content);
    } else {
        try {
            document = json::parse(content);
        } catch (const json::parse_error& e) {
            THROW_CONFIG_SERIALIZATION_EXCEPTION(path.string() + ": " +
                                                 e.what());
        }
    }
    spdlog::info("Loaded configuration from {} ({} bytes)", path.string(),
                 content.size());
    return document;
}

auto loadUsaxsConfig(const fs::path& path) -> UsaxsConfig {
    return UsaxsConfig::fromDocument(loadConfigFile(path));
}

void saveConfigFile(const fs::path& path, const json& document) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            THROW_CONFIG_IO_EXCEPTION("Cannot create " +
                                      path.parent_path().string() + ": " +
                                      ec.message());
        }
    }
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        THROW_CONFIG_IO_EXCEPTION("Failed to open file for writing: " +
                                  path.string());
    }
    if (isYaml(path)) {
        YAML::Emitter out;
        emitJson(out, document);
        file << out.c_str() << '\n';
    } else {
        file << document.dump(4) << '\n';
    }
    if (!file) {
        THROW_CONFIG_IO_EXCEPTION("Failed to write " + path.string());
    }
}

}  // namespace usaxs::config
