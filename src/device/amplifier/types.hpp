/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-9

Description: Common types for amplifier gain control

**************************************************/

#ifndef USAXS_DEVICE_AMPLIFIER_TYPES_HPP
#define USAXS_DEVICE_AMPLIFIER_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "device/template/shutter.hpp"

namespace usaxs::device {

/**
 * @brief Gain requested by label, by range index or by nominal magnitude.
 */
using GainTarget = std::variant<std::string, std::uint32_t, double>;

/**
 * @brief Values accepted by the autorange sequence program's mode channel.
 */
enum class AutorangeMode { Automatic, Manual };

[[nodiscard]] inline std::string_view autorangeModeToString(
    AutorangeMode mode) {
    switch (mode) {
        case AutorangeMode::Automatic: return "automatic";
        case AutorangeMode::Manual: return "manual";
    }
    return "manual";
}

/**
 * @brief Background (dark current) statistics for one gain range.
 */
struct BackgroundSample {
    double mean{0.0};       ///< Mean normalized reading (counts/s)
    double deviation{0.0};  ///< Population standard deviation (counts/s)
    std::uint32_t readings{0};
};

/**
 * @brief Convergence state of one bundle after an autoscale iteration.
 */
struct BundleConvergence {
    std::string nickname;
    bool gainStable{false};
    bool notSaturated{false};
    std::optional<std::uint32_t> gainIndex;
    double observedRate{0.0};

    [[nodiscard]] bool converged() const {
        return gainStable && notSaturated;
    }
};

/**
 * @brief Render a convergence vector for log and error messages.
 */
[[nodiscard]] std::string describeConvergence(
    const std::vector<BundleConvergence>& convergence);

/**
 * @brief Cancellation checkpoint.
 * @throw OperationCancelled if a stop was requested.
 */
void checkpoint(const std::stop_token& stopToken, std::string_view where);

/**
 * @brief Block the calling thread for a number of seconds.
 */
void sleepSeconds(double seconds);

/**
 * @brief Time allowed for one count of countTime seconds.
 */
[[nodiscard]] auto triggerTimeout(double countTime,
                                  std::chrono::milliseconds margin)
    -> std::chrono::milliseconds;

/**
 * @brief Move the beam shutter, if there is one.
 * @throw HardwareError if it does not reach the state.
 */
void moveShutter(const std::shared_ptr<Shutter>& shutter, ShutterState state,
                 std::chrono::milliseconds timeout);

}  // namespace usaxs::device

#endif  // USAXS_DEVICE_AMPLIFIER_TYPES_HPP
