/*
 * step_scan.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-12

Description: Step scan over a non-uniform series with amplifier autoscale
and background corrected count rates

**************************************************/

#ifndef USAXS_TASK_STEP_SCAN_HPP
#define USAXS_TASK_STEP_SCAN_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "config/sections/step_scan_config.hpp"
#include "device/amplifier/autoscale.hpp"
#include "device/amplifier/control_bundle.hpp"
#include "device/amplifier/gain_cache.hpp"
#include "device/amplifier/grouping.hpp"
#include "device/template/positioner.hpp"

namespace usaxs::task {

/**
 * @brief One detector channel read at one scan point
 */
struct DetectorReading {
    std::string nickname;
    double counts{0.0};
    double rate{0.0};  ///< counts per second of the count
    std::optional<std::uint32_t> gainIndex;
    std::optional<device::BackgroundSample> background;  ///< Of gainIndex
    double correctedRate{0.0};  ///< rate minus the background mean
};

struct ScanPoint {
    std::size_t index{0};
    double position{0.0};
    double countTime{0.0};
    std::vector<DetectorReading> readings;
};

struct ScanResult {
    double factor{0.0};  ///< Step series factor
    int sign{1};         ///< Scan direction
    std::vector<ScanPoint> points;
    std::vector<device::AutoscaleOutcome> autoscaleFailures;
};

/**
 * @class StepScanDriver
 * @brief Moves a positioner through a StepSeries and counts every detector
 * bundle at each position.
 *
 * Counting devices keep the scan's configuration between points; their
 * original configuration is restored when run() returns or throws.
 */
class StepScanDriver {
public:
    using PointCallback = std::function<void(const ScanPoint&)>;

    /**
     * @throw InvalidBundleError if the positioner is missing.
     */
    StepScanDriver(std::shared_ptr<device::Positioner> positioner,
                   std::vector<device::BundlePtr> bundles,
                   device::GainCache& cache, config::StepScanConfig scan,
                   device::AutoscaleOptions autoscale = {});

    /**
     * @brief Called after each point is counted.
     */
    void setPointCallback(PointCallback callback) {
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto getConfig() const -> const config::StepScanConfig& {
        return scan_;
    }

    /**
     * @throw config::InvalidConfigException if the scan settings are invalid.
     * @throw NumericDivergenceError if no step series fits them.
     * @throw HardwareError if a move, configuration or read fails.
     * @throw DeviceTimeoutError if a count does not complete.
     * @throw OperationCancelled if a stop is requested.
     */
    auto run(std::stop_token stopToken = {}) -> ScanResult;

    /**
     * @brief Count time of point index: a third of the base time for the
     * first third of the scan and twice it for the last third when dynamic.
     */
    [[nodiscard]] static auto countTimeFor(std::size_t index,
                                           std::size_t numPoints,
                                           double baseTime, bool dynamic)
        -> double;

private:
    auto countGroup(const device::ResourceGroup& group, double countTime)
        -> std::vector<DetectorReading>;
    void returnToStart(const std::optional<double>& start);

    std::shared_ptr<device::Positioner> positioner_;
    std::vector<device::BundlePtr> bundles_;
    device::GainCache& cache_;
    config::StepScanConfig scan_;
    device::AutoscaleOptions autoscale_;
    PointCallback callback_;
};

}  // namespace usaxs::task

#endif  // USAXS_TASK_STEP_SCAN_HPP
