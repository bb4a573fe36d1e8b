/*
 * grouping.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef USAXS_DEVICE_AMPLIFIER_GROUPING_HPP
#define USAXS_DEVICE_AMPLIFIER_GROUPING_HPP

#include <memory>
#include <vector>

#include "control_bundle.hpp"

namespace usaxs::device {

/**
 * @brief Bundles sharing one counting device.
 */
struct ResourceGroup {
    std::shared_ptr<CountingDevice> counter;
    std::vector<BundlePtr> bundles;
};

/**
 * @brief Partition bundles by their counting device.
 *
 * Groups appear in the order their counting device is first seen and keep
 * the order of their bundles.
 *
 * @throw InvalidBundleError if an element is null.
 */
[[nodiscard]] auto groupByCounter(const std::vector<BundlePtr>& bundles)
    -> std::vector<ResourceGroup>;

}  // namespace usaxs::device

#endif  // USAXS_DEVICE_AMPLIFIER_GROUPING_HPP
