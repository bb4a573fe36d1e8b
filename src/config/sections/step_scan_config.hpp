/*
 * step_scan_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-11

Description: Non-uniform step scan configuration

**************************************************/

#ifndef USAXS_CONFIG_SECTIONS_STEP_SCAN_CONFIG_HPP
#define USAXS_CONFIG_SECTIONS_STEP_SCAN_CONFIG_HPP

#include <cmath>
#include <cstdint>
#include <string>

#include "../core/config_section.hpp"

namespace usaxs::config {

/**
 * @brief Step series parameters and per-point counting settings
 *
 * Defaults describe a typical analyzer rocking curve: 200 points from
 * 8.7474 down to 7.9 degrees, densest at 8.746588.
 */
struct StepScanConfig : ConfigSection<StepScanConfig> {
    static constexpr std::string_view PATH = "/usaxs/scan";

    // Step series
    double start{8.7474};
    double reference{8.746588};
    double finish{7.9};
    std::uint32_t numPoints{200};
    double exponent{1.0};
    double minStep{0.000025};

    // Counting
    double countTime{1.0};
    bool useDynamicTime{false};  ///< countTime/3, countTime, 2*countTime by thirds
    bool autoscalePerPoint{false};
    bool subtractBackground{true};

    // Motion
    bool returnToStart{true};
    std::int64_t moveTimeoutMs{30000};
    std::int64_t triggerMarginMs{2000};

    /**
     * @throw InvalidConfigException on a value outside its range
     */
    void validate() const {
        if (numPoints < 2) {
            THROW_INVALID_CONFIG_EXCEPTION(std::string(PATH) +
                                           ": numPoints must be at least 2");
        }
        if (!std::isfinite(start) || !std::isfinite(reference) ||
            !std::isfinite(finish) || !std::isfinite(exponent) ||
            !std::isfinite(minStep)) {
            THROW_INVALID_CONFIG_EXCEPTION(std::string(PATH) +
                                           ": step parameters must be finite");
        }
        if (!(countTime > 0)) {
            THROW_INVALID_CONFIG_EXCEPTION(std::string(PATH) +
                                           ": countTime must be positive");
        }
        if (moveTimeoutMs <= 0 || triggerMarginMs < 0) {
            THROW_INVALID_CONFIG_EXCEPTION(std::string(PATH) +
                                           ": invalid timeout");
        }
    }

    [[nodiscard]] json serialize() const {
        return {{"start", start},
                {"reference", reference},
                {"finish", finish},
                {"numPoints", numPoints},
                {"exponent", exponent},
                {"minStep", minStep},
                {"countTime", countTime},
                {"useDynamicTime", useDynamicTime},
                {"autoscalePerPoint", autoscalePerPoint},
                {"subtractBackground", subtractBackground},
                {"returnToStart", returnToStart},
                {"moveTimeoutMs", moveTimeoutMs},
                {"triggerMarginMs", triggerMarginMs}};
    }

    [[nodiscard]] static StepScanConfig deserialize(const json& j) {
        StepScanConfig cfg;
        cfg.start = j.value("start", cfg.start);
        cfg.reference = j.value("reference", cfg.reference);
        cfg.finish = j.value("finish", cfg.finish);
        cfg.numPoints = readCount(j, "numPoints", cfg.numPoints, PATH);
        cfg.exponent = j.value("exponent", cfg.exponent);
        cfg.minStep = j.value("minStep", cfg.minStep);
        cfg.countTime = j.value("countTime", cfg.countTime);
        cfg.useDynamicTime = j.value("useDynamicTime", cfg.useDynamicTime);
        cfg.autoscalePerPoint =
            j.value("autoscalePerPoint", cfg.autoscalePerPoint);
        cfg.subtractBackground =
            j.value("subtractBackground", cfg.subtractBackground);
        cfg.returnToStart = j.value("returnToStart", cfg.returnToStart);
        cfg.moveTimeoutMs = j.value("moveTimeoutMs", cfg.moveTimeoutMs);
        cfg.triggerMarginMs = j.value("triggerMarginMs", cfg.triggerMarginMs);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema = {
            {"type", "object"},
            {"properties",
             {{"start", {{"type", "number"}, {"default", 8.7474}}},
              {"reference", {{"type", "number"}, {"default", 8.746588}}},
              {"finish", {{"type", "number"}, {"default", 7.9}}},
              {"numPoints", {{"type", "integer"}, {"default", 200}}},
              {"exponent", {{"type", "number"}, {"default", 1.0}}},
              {"minStep", {{"type", "number"}, {"default", 0.000025}}},
              {"countTime", {{"type", "number"}, {"default", 1.0}}},
              {"useDynamicTime", {{"type", "boolean"}, {"default", false}}},
              {"autoscalePerPoint", {{"type", "boolean"}, {"default", false}}},
              {"subtractBackground", {{"type", "boolean"}, {"default", true}}},
              {"returnToStart", {{"type", "boolean"}, {"default", true}}},
              {"moveTimeoutMs", {{"type", "integer"}, {"default", 30000}}},
              {"triggerMarginMs", {{"type", "integer"}, {"default", 2000}}}}}};
        addRange(schema, "numPoints", 2);
        addRange(schema, "countTime", 0.0);
        return schema;
    }
};

}  // namespace usaxs::config

#endif  // USAXS_CONFIG_SECTIONS_STEP_SCAN_CONFIG_HPP
