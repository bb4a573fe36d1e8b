/*
 * amplifier_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-11

Description: Amplifier autoscale, background and detector bundle
configuration

**************************************************/

#ifndef USAXS_CONFIG_SECTIONS_AMPLIFIER_CONFIG_HPP
#define USAXS_CONFIG_SECTIONS_AMPLIFIER_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "../core/config_section.hpp"

namespace usaxs::config {

/**
 * @brief Channel names of one background storage slot
 */
struct BackgroundSlotConfig {
    std::string background;
    std::string backgroundError;

    [[nodiscard]] json toJson() const {
        return {{"background", background},
                {"backgroundError", backgroundError}};
    }

    [[nodiscard]] static BackgroundSlotConfig fromJson(const json& j) {
        BackgroundSlotConfig cfg;
        cfg.background = j.value("background", "");
        cfg.backgroundError = j.value("backgroundError", "");
        return cfg;
    }
};

/**
 * @brief One detector channel: scaler, signal and amplifier controls
 */
struct DetectorBundleConfig {
    std::string nickname;
    std::string counter;       ///< Counting device (scaler) name
    std::string signal;        ///< Scaler channel with raw counts
    std::string gainReadback;  ///< Current gain range
    std::string rangeSelect;   ///< Requested gain range
    std::string mode;          ///< Autorange mode, empty if absent
    std::string writeForm{"index"};  ///< "index" or "label"
    double settlingTime{0.08};
    double maxCountRate{950000.0};
    std::vector<BackgroundSlotConfig> backgroundSlots;  ///< Per gain range

    [[nodiscard]] json toJson() const {
        json slots = json::array();
        for (const auto& slot : backgroundSlots) {
            slots.push_back(slot.toJson());
        }
        return {{"nickname", nickname},
                {"counter", counter},
                {"signal", signal},
                {"gainReadback", gainReadback},
                {"rangeSelect", rangeSelect},
                {"mode", mode},
                {"writeForm", writeForm},
                {"settlingTime", settlingTime},
                {"maxCountRate", maxCountRate},
                {"backgroundSlots", slots}};
    }

    [[nodiscard]] static DetectorBundleConfig fromJson(const json& j) {
        DetectorBundleConfig cfg;
        cfg.nickname = j.value("nickname", "");
        cfg.counter = j.value("counter", "");
        cfg.signal = j.value("signal", "");
        cfg.gainReadback = j.value("gainReadback", "");
        cfg.rangeSelect = j.value("rangeSelect", "");
        cfg.mode = j.value("mode", "");
        cfg.writeForm = j.value("writeForm", cfg.writeForm);
        cfg.settlingTime = j.value("settlingTime", cfg.settlingTime);
        cfg.maxCountRate = j.value("maxCountRate", cfg.maxCountRate);
        if (j.contains("backgroundSlots") && j["backgroundSlots"].is_array()) {
            for (const auto& slot : j["backgroundSlots"]) {
                cfg.backgroundSlots.push_back(
                    BackgroundSlotConfig::fromJson(slot));
            }
        }
        return cfg;
    }
};

/**
 * @brief Autoscale and background calibration settings
 *
 * @example
 * ```json
 * {
 *   "usaxs": {
 *     "amplifier": {
 *       "autoscaleCountTime": 0.05,
 *       "maxIterations": 9,
 *       "liveMode": true,
 *       "detectors": [
 *         {"nickname": "I0", "counter": "scaler0", "signal": "I0_SIGNAL",
 *          "gainReadback": "I0_gain", "rangeSelect": "I0_reqrange",
 *          "mode": "I0_mode"}
 *       ]
 *     }
 *   }
 * }
 * ```
 */
struct AmplifierConfig : ConfigSection<AmplifierConfig> {
    static constexpr std::string_view PATH = "/usaxs/amplifier";

    // Autoscale
    double autoscaleCountTime{0.05};
    std::uint32_t maxIterations{9};
    double autoscaleCounterDelay{0.02};
    bool liveMode{true};
    bool parallelGroups{false};

    // Background
    double backgroundCountTime{0.2};
    std::uint32_t backgroundReadings{5};
    double readingInterval{0.05};

    // Shared
    double minimumSettlingTime{0.01};
    std::int64_t writeTimeoutMs{5000};
    std::int64_t triggerMarginMs{2000};

    std::vector<DetectorBundleConfig> detectors;

    /**
     * @throw InvalidConfigException on a value outside its range
     */
    void validate() const {
        if (!(autoscaleCountTime > 0) || !(backgroundCountTime > 0)) {
            THROW_INVALID_CONFIG_EXCEPTION(std::string(PATH) +
                                           ": count times must be positive");
        }
        if (maxIterations == 0 || backgroundReadings == 0) {
            THROW_INVALID_CONFIG_EXCEPTION(
                std::string(PATH) +
                ": maxIterations and backgroundReadings must be at least 1");
        }
        if (autoscaleCounterDelay < 0 || readingInterval < 0 ||
            minimumSettlingTime < 0 || writeTimeoutMs <= 0 ||
            triggerMarginMs < 0) {
            THROW_INVALID_CONFIG_EXCEPTION(std::string(PATH) +
                                           ": negative delay or timeout");
        }
        for (const auto& detector : detectors) {
            if (detector.writeForm != "index" && detector.writeForm != "label") {
                THROW_INVALID_CONFIG_EXCEPTION(
                    std::string(PATH) + ": detector '" + detector.nickname +
                    "' has unknown writeForm '" + detector.writeForm + "'");
            }
        }
    }

    [[nodiscard]] json serialize() const {
        json detectorArray = json::array();
        for (const auto& detector : detectors) {
            detectorArray.push_back(detector.toJson());
        }

        return {
            // Autoscale
            {"autoscaleCountTime", autoscaleCountTime},
            {"maxIterations", maxIterations},
            {"autoscaleCounterDelay", autoscaleCounterDelay},
            {"liveMode", liveMode},
            {"parallelGroups", parallelGroups},
            // Background
            {"backgroundCountTime", backgroundCountTime},
            {"backgroundReadings", backgroundReadings},
            {"readingInterval", readingInterval},
            // Shared
            {"minimumSettlingTime", minimumSettlingTime},
            {"writeTimeoutMs", writeTimeoutMs},
            {"triggerMarginMs", triggerMarginMs},
            {"detectors", detectorArray}};
    }

    [[nodiscard]] static AmplifierConfig deserialize(const json& j) {
        AmplifierConfig cfg;

        cfg.autoscaleCountTime =
            j.value("autoscaleCountTime", cfg.autoscaleCountTime);
        cfg.maxIterations =
            readCount(j, "maxIterations", cfg.maxIterations, PATH);
        cfg.autoscaleCounterDelay =
            j.value("autoscaleCounterDelay", cfg.autoscaleCounterDelay);
        cfg.liveMode = j.value("liveMode", cfg.liveMode);
        cfg.parallelGroups = j.value("parallelGroups", cfg.parallelGroups);

        cfg.backgroundCountTime =
            j.value("backgroundCountTime", cfg.backgroundCountTime);
        cfg.backgroundReadings =
            readCount(j, "backgroundReadings", cfg.backgroundReadings, PATH);
        cfg.readingInterval = j.value("readingInterval", cfg.readingInterval);

        cfg.minimumSettlingTime =
            j.value("minimumSettlingTime", cfg.minimumSettlingTime);
        cfg.writeTimeoutMs = j.value("writeTimeoutMs", cfg.writeTimeoutMs);
        cfg.triggerMarginMs = j.value("triggerMarginMs", cfg.triggerMarginMs);

        if (j.contains("detectors") && j["detectors"].is_array()) {
            for (const auto& detector : j["detectors"]) {
                cfg.detectors.push_back(DetectorBundleConfig::fromJson(detector));
            }
        }
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema = {
            {"type", "object"},
            {"properties",
             {{"autoscaleCountTime", {{"type", "number"}, {"default", 0.05}}},
              {"maxIterations", {{"type", "integer"}, {"default", 9}}},
              {"autoscaleCounterDelay", {{"type", "number"}, {"default", 0.02}}},
              {"liveMode", {{"type", "boolean"}, {"default", true}}},
              {"parallelGroups", {{"type", "boolean"}, {"default", false}}},
              {"backgroundCountTime", {{"type", "number"}, {"default", 0.2}}},
              {"backgroundReadings", {{"type", "integer"}, {"default", 5}}},
              {"readingInterval", {{"type", "number"}, {"default", 0.05}}},
              {"minimumSettlingTime", {{"type", "number"}, {"default", 0.01}}},
              {"writeTimeoutMs", {{"type", "integer"}, {"default", 5000}}},
              {"triggerMarginMs", {{"type", "integer"}, {"default", 2000}}},
              {"detectors",
               {{"type", "array"},
                {"items",
                 {{"type", "object"},
                  {"required",
                   {"nickname", "counter", "signal", "gainReadback",
                    "rangeSelect"}},
                  {"properties",
                   {{"writeForm",
                     {{"type", "string"}, {"enum", {"index", "label"}}}}}}}}}}}}};
        addRange(schema, "autoscaleCountTime", 0.0);
        addRange(schema, "maxIterations", 1);
        addRange(schema, "backgroundCountTime", 0.0);
        addRange(schema, "backgroundReadings", 1);
        return schema;
    }
};

}  // namespace usaxs::config

#endif  // USAXS_CONFIG_SECTIONS_AMPLIFIER_CONFIG_HPP
