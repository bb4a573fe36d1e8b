/*
 * mock_amplifier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-10

Description: Mock current amplifier with an autorange sequence program,
counted by a MockScaler

*************************************************/

#pragma once

#include "mock_channel.hpp"

#include "device/amplifier/control_bundle.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Simulated detector: photocurrent -> amplifier gain -> voltage to
 * frequency converter -> scaler channel.
 *
 * While the mode channel reads anything but "manual" every count
 * moves the gain one range down when the rate is above UPPER_RATE and one
 * range up when it is below LOWER_RATE. Must outlive the scaler it is
 * attached to.
 */
class MockAutorangeAmplifier {
public:
    static constexpr double VFC_GAIN = 1e5;          ///< counts/s per volt
    static constexpr double FULL_SCALE_RATE = 1e6;   ///< counts/s
    static constexpr double UPPER_RATE = 9e5;
    static constexpr double LOWER_RATE = 9e3;

    MockAutorangeAmplifier(std::string nickname,
                           std::shared_ptr<MockScaler> scaler,
                           double photocurrent,
                           std::vector<std::string> labels = defaultLabels());

    static auto defaultLabels() -> std::vector<std::string>;

    /**
     * @brief Build a control bundle over the simulated channels.
     */
    auto makeBundle(usaxs::device::RangeWriteForm writeForm =
                        usaxs::device::RangeWriteForm::Index,
                    double settlingTime = 0.0,
                    double maxCountRate = usaxs::device::DEFAULT_MAX_COUNT_RATE)
        -> usaxs::device::BundlePtr;

    void setPhotocurrent(double amperes);
    /**
     * @brief Dark rate added to the signal: base + perRange * gain index.
     */
    void setDarkRate(double base, double perRange = 0.0);
    void setGainIndex(std::uint32_t index);
    auto getGainIndex() const -> std::uint32_t;
    auto getRangeCount() const -> std::size_t { return magnitudes_.size(); }

    auto signal() const -> const std::shared_ptr<MockChannel>& {
        return signal_;
    }
    auto readback() const -> const std::shared_ptr<MockChannel>& {
        return readback_;
    }
    auto rangeSelect() const -> const std::shared_ptr<MockChannel>& {
        return rangeSelect_;
    }
    auto mode() const -> const std::shared_ptr<MockChannel>& { return mode_; }
    auto backgroundSlot(std::size_t range) const
        -> const usaxs::device::BackgroundSlot& {
        return slots_.at(range);
    }

private:
    void onTrigger(double presetTime);
    void onRangeWrite(const usaxs::device::ChannelValue& value);
    auto autorangeEnabled() const -> bool;
    void publishGain();

    std::string nickname_;
    std::shared_ptr<MockScaler> scaler_;
    std::vector<std::string> labels_;
    std::vector<double> magnitudes_;

    std::shared_ptr<MockChannel> signal_;
    std::shared_ptr<MockChannel> readback_;
    std::shared_ptr<MockChannel> rangeSelect_;
    std::shared_ptr<MockChannel> mode_;
    std::vector<usaxs::device::BackgroundSlot> slots_;

    mutable std::mutex mutex_;
    double photocurrent_;
    double darkBase_{0.0};
    double darkPerRange_{0.0};
    std::uint32_t index_{0};
};
