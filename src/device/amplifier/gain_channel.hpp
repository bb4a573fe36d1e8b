/*
 * gain_channel.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-9

Description: Amplifier gain range addressing by label, index or magnitude

**************************************************/

#ifndef USAXS_DEVICE_AMPLIFIER_GAIN_CHANNEL_HPP
#define USAXS_DEVICE_AMPLIFIER_GAIN_CHANNEL_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "device/template/channel.hpp"
#include "types.hpp"

namespace usaxs::device {

/**
 * @brief How the range selection channel expects its value.
 */
enum class RangeWriteForm {
    Label,  ///< Write the gain label, e.g. "1e6 V/A"
    Index   ///< Write the range index (sequence program reqrange)
};

/**
 * @brief Format a gain magnitude with one significant digit, e.g. 1e6.
 */
[[nodiscard]] auto formatGainLabel(double magnitude) -> std::string;

/**
 * @class GainChannel
 * @brief Selects amplifier gain ranges on a range selection channel.
 *
 * The gain labels are learned from the channel's enumeration on first use.
 * Labels are always formatted "{magnitude}{suffix}" with one suffix shared by
 * every range, for example "1e4 V/A". A gain can then be requested by label,
 * by range index or by nominal magnitude.
 */
class GainChannel {
public:
    GainChannel(std::shared_ptr<Channel> rangeSelect,
                RangeWriteForm writeForm = RangeWriteForm::Index);

    /**
     * @brief Resolve a gain target to its range index.
     * @throw InvalidGainError if the target is not acceptable.
     * @throw ConfigurationError if the channel labels are inconsistent.
     */
    auto resolve(const GainTarget& target) -> std::uint32_t;

    /**
     * @brief Request a gain range with a single write.
     * @return Completion reported by the channel write.
     */
    auto setGain(const GainTarget& target, std::chrono::milliseconds timeout)
        -> bool;

    auto getRangeCount() -> std::size_t;
    auto getLabels() -> const std::vector<std::string>&;
    auto getMagnitudes() -> const std::vector<double>&;
    auto getSuffix() -> const std::string&;

    /**
     * @brief Every accepted label, magnitude and index, rendered as text.
     */
    auto getAcceptableValues() -> std::vector<std::string>;

    [[nodiscard]] auto getChannel() const -> const std::shared_ptr<Channel>& {
        return rangeSelect_;
    }
    [[nodiscard]] auto getWriteForm() const -> RangeWriteForm {
        return writeForm_;
    }

    /**
     * @brief Forget the learned labels so they are read again on next use.
     */
    void reset();

private:
    void ensureRangesKnown();
    auto findMagnitude(double magnitude) const -> std::optional<std::uint32_t>;
    [[noreturn]] void rejectTarget(const std::string& rendered);

    std::shared_ptr<Channel> rangeSelect_;
    RangeWriteForm writeForm_;

    bool rangesKnown_{false};
    std::vector<std::string> labels_;
    std::vector<double> magnitudes_;
    std::string suffix_;
};

}  // namespace usaxs::device

#endif  // USAXS_DEVICE_AMPLIFIER_GAIN_CHANNEL_HPP
