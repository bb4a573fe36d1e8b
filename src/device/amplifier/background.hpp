/*
 * background.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-10

Description: Per gain range background (dark current) calibration

**************************************************/

#ifndef USAXS_DEVICE_AMPLIFIER_BACKGROUND_HPP
#define USAXS_DEVICE_AMPLIFIER_BACKGROUND_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "grouping.hpp"
#include "types.hpp"

namespace usaxs::device {

struct BackgroundOptions {
    double countTime{0.2};            ///< Preset time of each reading (s)
    std::uint32_t numReadings{5};     ///< Readings averaged per range
    double readingInterval{0.05};     ///< Pause before each reading (s)
    double minimumSettlingTime{0.01};  ///< Lower bound of the settle wait (s)
    std::chrono::milliseconds writeTimeout{5000};
    std::chrono::milliseconds triggerMargin{2000};
};

/**
 * @brief Measured background per bundle nickname, indexed by gain range.
 * Ranges a bundle does not have stay empty.
 */
using BackgroundTable =
    std::map<std::string, std::vector<std::optional<BackgroundSample>>>;

/**
 * @class BackgroundCalibrator
 * @brief Sweeps every gain range of a resource group from the highest index
 * down to 0 and records mean and standard deviation of the dark signal.
 *
 * The counting device's operation mutex is held for the whole sweep. The
 * original counter configuration is restored before any error leaves
 * calibrate().
 */
class BackgroundCalibrator {
public:
    /**
     * @throw atom::error::InvalidArgument if countTime is not positive or
     * numReadings is zero.
     */
    explicit BackgroundCalibrator(BackgroundOptions options = {});

    [[nodiscard]] auto getOptions() const -> const BackgroundOptions& {
        return options_;
    }

    /**
     * @throw HardwareError on a failed write or read.
     * @throw DeviceTimeoutError if a count does not complete.
     * @throw OperationCancelled if a stop is requested.
     */
    auto calibrate(const ResourceGroup& group, std::stop_token stopToken = {})
        -> BackgroundTable;

    /**
     * @brief Close the shutter, if given, then calibrate each group in turn.
     * The first failure aborts.
     * @throw HardwareError if the shutter does not close.
     */
    auto calibrateAll(const std::vector<BundlePtr>& bundles,
                      std::stop_token stopToken = {},
                      const std::shared_ptr<Shutter>& shutter = nullptr)
        -> BackgroundTable;

private:
    auto sweep(const ResourceGroup& group, CountMode mode,
               const std::stop_token& stopToken) -> BackgroundTable;
    auto sampleRange(const ResourceGroup& group, std::uint32_t range,
                     const std::stop_token& stopToken)
        -> std::vector<BackgroundSample>;

    BackgroundOptions options_;
};

/**
 * @brief Measure the background of every bundle with default options for
 * everything but the count time and number of readings.
 */
auto measureBackground(const std::vector<BundlePtr>& bundles,
                       double countTime = 0.2, std::uint32_t numReadings = 5,
                       std::stop_token stopToken = {},
                       const std::shared_ptr<Shutter>& shutter = nullptr)
    -> BackgroundTable;

}  // namespace usaxs::device

#endif  // USAXS_DEVICE_AMPLIFIER_BACKGROUND_HPP
