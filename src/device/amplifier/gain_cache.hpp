/*
 * gain_cache.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-9

Description: Last known autoscale gains, per counting device

**************************************************/

#ifndef USAXS_DEVICE_AMPLIFIER_GAIN_CACHE_HPP
#define USAXS_DEVICE_AMPLIFIER_GAIN_CACHE_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace usaxs::device {

/**
 * @class GainCache
 * @brief Gain range each bundle last settled on during autoscale.
 *
 * Entries are keyed by counting device name and then by the bundle's gain
 * identity. Values are only a starting hint for the next autoscale and are
 * never persisted. Last write wins.
 */
class GainCache {
public:
    GainCache() = default;
    GainCache(const GainCache&) = delete;
    GainCache& operator=(const GainCache&) = delete;

    auto lookup(const std::string& counter, const std::string& gainIdentity)
        const -> std::optional<std::uint32_t>;

    void store(const std::string& counter, const std::string& gainIdentity,
               std::uint32_t gainIndex);

    void forget(const std::string& counter);
    void clear();

    [[nodiscard]] auto size() const -> std::size_t;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string,
                       std::unordered_map<std::string, std::uint32_t>>
        entries_;
};

}  // namespace usaxs::device

#endif  // USAXS_DEVICE_AMPLIFIER_GAIN_CACHE_HPP
