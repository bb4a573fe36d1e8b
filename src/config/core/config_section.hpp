/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: ConfigSection CRTP base class for type-safe configuration sections

**************************************************/

#ifndef USAXS_CONFIG_CORE_CONFIG_SECTION_HPP
#define USAXS_CONFIG_CORE_CONFIG_SECTION_HPP

#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include "atom/type/json.hpp"
#include "exception.hpp"

namespace usaxs::config {

using json = nlohmann::json;

/**
 * @brief Read an unsigned count, rejecting negative and oversized values
 * instead of letting them wrap.
 * @throw InvalidConfigException if the value does not fit in T
 * @throw ConfigSerializationException if the value is not a number
 */
template <std::unsigned_integral T>
[[nodiscard]] T readCount(const json& j, const std::string& key, T fallback,
                          std::string_view context) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j.at(key);
    auto where = std::string(context) + ": " + key;
    if (value.is_number_integer()) {
        if (!value.is_number_unsigned() && value.get<std::int64_t>() < 0) {
            THROW_INVALID_CONFIG_EXCEPTION(where + " must not be negative");
        }
        auto count = value.get<std::uint64_t>();
        if (count > std::numeric_limits<T>::max()) {
            THROW_INVALID_CONFIG_EXCEPTION(where + " is too large");
        }
        return static_cast<T>(count);
    }
    if (value.is_number_float()) {
        THROW_INVALID_CONFIG_EXCEPTION(where + " must be a whole number");
    }
    THROW_CONFIG_SERIALIZATION_EXCEPTION(where + " must be an integer, got " +
                                         value.type_name());
}

/**
 * @brief Concept for valid ConfigSection derived types
 */
template <typename T>
concept ConfigSectionDerived = requires(T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
    { T::generateSchema() } -> std::convertible_to<json>;
};

/**
 * @brief CRTP base class for type-safe configuration sections
 *
 * Derived classes must:
 *
 * 1. Define a static constexpr PATH member, a JSON pointer into the
 *    configuration document
 * 2. Implement serialize() to convert to JSON
 * 3. Implement static deserialize(const json&) to create from JSON
 * 4. Implement static generateSchema() to return JSON Schema
 *
 * @tparam Derived The derived configuration struct type (CRTP)
 *
 * @example
 * ```cpp
 * struct ScanConfig : ConfigSection<ScanConfig> {
 *     static constexpr std::string_view PATH = "/usaxs/scan";
 *
 *     double countTime = 1.0;
 *
 *     [[nodiscard]] json serialize() const {
 *         return {{"countTime", countTime}};
 *     }
 *
 *     [[nodiscard]] static ScanConfig deserialize(const json& j) {
 *         ScanConfig config;
 *         config.countTime = j.value("countTime", config.countTime);
 *         return config;
 *     }
 *
 *     [[nodiscard]] static json generateSchema() {
 *         json schema;
 *         schema["type"] = "object";
 *         schema["properties"]["countTime"] = {{"type", "number"},
 *                                              {"default", 1.0}};
 *         return schema;
 *     }
 * };
 * ```
 */
template <typename Derived>
class ConfigSection {
public:
    /**
     * @brief Get the configuration path for this section
     * @return Configuration path (e.g., "/usaxs/amplifier")
     */
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    /**
     * @brief Convert this config to JSON
     */
    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    /**
     * @brief Create a configuration from JSON
     * @throw ConfigSerializationException if a value has the wrong type
     */
    [[nodiscard]] static Derived fromJson(const json& j) {
        try {
            return Derived::deserialize(j);
        } catch (const json::exception& e) {
            THROW_CONFIG_SERIALIZATION_EXCEPTION(
                std::string(Derived::PATH) + ": " + e.what());
        }
    }

    /**
     * @brief Try to create a configuration from JSON
     * @return Configuration instance or nullopt if the JSON does not fit
     */
    [[nodiscard]] static std::optional<Derived> tryFromJson(const json& j) {
        try {
            return Derived::deserialize(j);
        } catch (const json::exception&) {
            return std::nullopt;
        } catch (const BadConfigException&) {
            return std::nullopt;
        }
    }

    /**
     * @brief Read this section from a whole configuration document.
     * A missing section yields the defaults.
     */
    [[nodiscard]] static Derived fromDocument(const json& document) {
        json::json_pointer pointer{std::string(Derived::PATH)};
        if (!document.contains(pointer)) {
            return Derived{};
        }
        return fromJson(document.at(pointer));
    }

    /**
     * @brief Get the JSON Schema for this configuration section
     */
    [[nodiscard]] static json schema() { return Derived::generateSchema(); }

    /**
     * @brief Get a default-constructed configuration
     */
    [[nodiscard]] static Derived defaults() { return Derived{}; }

    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == static_cast<const Derived&>(other).toJson();
    }

protected:
    /**
     * @brief Helper to add range constraint to a numeric property
     */
    static void addRange(json& schema, const std::string& name,
                         std::optional<double> minimum = std::nullopt,
                         std::optional<double> maximum = std::nullopt) {
        if (schema.contains("properties") &&
            schema["properties"].contains(name)) {
            auto& prop = schema["properties"][name];
            if (minimum) {
                prop["minimum"] = *minimum;
            }
            if (maximum) {
                prop["maximum"] = *maximum;
            }
        }
    }
};

}  // namespace usaxs::config

#endif  // USAXS_CONFIG_CORE_CONFIG_SECTION_HPP
