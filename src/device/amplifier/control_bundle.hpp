/*
 * control_bundle.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-9

Description: Detector, scaler channel and amplifier controls of one
detector channel

**************************************************/

#ifndef USAXS_DEVICE_AMPLIFIER_CONTROL_BUNDLE_HPP
#define USAXS_DEVICE_AMPLIFIER_CONTROL_BUNDLE_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "device/template/channel.hpp"
#include "device/template/counting_device.hpp"
#include "gain_channel.hpp"
#include "types.hpp"

namespace usaxs::device {

/// Settling time of a Femto current amplifier after a gain change (< 150 ms)
inline constexpr double DEFAULT_SETTLING_TIME = 0.08;
inline constexpr double DEFAULT_MAX_COUNT_RATE = 950000.0;

/**
 * @brief Channels storing the background of one gain range.
 */
struct BackgroundSlot {
    std::shared_ptr<Channel> background;
    std::shared_ptr<Channel> backgroundError;
};

/**
 * @brief Channels of one detector bundle.
 */
struct BundleChannels {
    std::shared_ptr<Channel> signal;        ///< Raw scaler counts
    std::shared_ptr<Channel> gainReadback;  ///< Current gain range
    std::shared_ptr<Channel> rangeSelect;   ///< Requested gain range
    std::shared_ptr<Channel> mode;          ///< Autorange mode, optional
    std::vector<BackgroundSlot> backgroundSlots;  ///< Indexed by gain range
};

/**
 * @class DetectorControlBundle
 * @brief Coordinates the objects that control a photodiode or ion chamber.
 *
 * Bundles sharing a counting device are measured together by one trigger of
 * that device. Bundles are created once at startup and live for the whole
 * process.
 */
class DetectorControlBundle {
public:
    /**
     * @throw InvalidBundleError if the counting device or a mandatory
     * channel is missing.
     */
    DetectorControlBundle(std::string nickname,
                          std::shared_ptr<CountingDevice> counter,
                          BundleChannels channels,
                          RangeWriteForm writeForm = RangeWriteForm::Index,
                          double settlingTime = DEFAULT_SETTLING_TIME,
                          double maxCountRate = DEFAULT_MAX_COUNT_RATE);

    const std::string& getNickname() const { return nickname_; }
    const std::shared_ptr<CountingDevice>& getCounter() const {
        return counter_;
    }
    const BundleChannels& getChannels() const { return channels_; }
    GainChannel& getGainChannel() { return gain_; }

    double getSettlingTime() const { return settlingTime_; }
    double getMaxCountRate() const { return maxCountRate_; }

    /**
     * @brief Key of this bundle in the gain cache.
     */
    const std::string& getGainIdentity() const {
        return channels_.gainReadback->getName();
    }

    /**
     * @brief Switch the autorange sequence program. Bundles without a mode
     * channel always report success.
     */
    auto setMode(AutorangeMode mode, std::chrono::milliseconds timeout)
        -> bool;

    /**
     * @brief Current gain range index, if it could be read.
     */
    auto readGainIndex() -> std::optional<std::uint32_t>;

    /**
     * @brief Raw counts of the last count, if they could be read.
     */
    auto readCounts() -> std::optional<double>;

    void setBackground(std::size_t range, const BackgroundSample& sample);
    auto getBackground(std::size_t range) const
        -> std::optional<BackgroundSample>;

    /**
     * @brief Write a background sample to the storage slot of its range.
     * @return true if there is no slot or both writes completed.
     */
    auto storeBackground(std::size_t range, const BackgroundSample& sample,
                         std::chrono::milliseconds timeout) -> bool;

private:
    std::string nickname_;
    std::shared_ptr<CountingDevice> counter_;
    BundleChannels channels_;
    GainChannel gain_;
    double settlingTime_;
    double maxCountRate_;
    std::vector<std::optional<BackgroundSample>> backgrounds_;
};

using BundlePtr = std::shared_ptr<DetectorControlBundle>;

}  // namespace usaxs::device

#endif  // USAXS_DEVICE_AMPLIFIER_CONTROL_BUNDLE_HPP
