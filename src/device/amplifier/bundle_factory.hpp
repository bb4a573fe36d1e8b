/*
 * bundle_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-11

Description: Detector control bundles and amplifier options built from
configuration

**************************************************/

#ifndef USAXS_DEVICE_AMPLIFIER_BUNDLE_FACTORY_HPP
#define USAXS_DEVICE_AMPLIFIER_BUNDLE_FACTORY_HPP

#include <memory>
#include <string>
#include <vector>

#include "autoscale.hpp"
#include "background.hpp"
#include "config/sections/amplifier_config.hpp"
#include "control_bundle.hpp"
#include "device/template/device_registry.hpp"

namespace usaxs::device {

/**
 * @class BundleFactory
 * @brief Resolves the device names of DetectorBundleConfig entries through
 * a DeviceRegistry.
 */
class BundleFactory {
public:
    explicit BundleFactory(DeviceRegistry& registry) : registry_(registry) {}

    /**
     * @throw ConfigurationError if a name is empty or unknown, or the write
     * form is not "index" or "label".
     */
    auto create(const config::DetectorBundleConfig& config) -> BundlePtr;

    /**
     * @brief Build every detector of the section, in order.
     * @throw ConfigurationError on the first bad entry or a repeated
     * nickname.
     */
    auto createAll(const config::AmplifierConfig& config)
        -> std::vector<BundlePtr>;

private:
    auto requireChannel(const std::string& nickname, const std::string& role,
                        const std::string& name) -> std::shared_ptr<Channel>;
    auto optionalChannel(const std::string& nickname, const std::string& role,
                         const std::string& name) -> std::shared_ptr<Channel>;

    DeviceRegistry& registry_;
};

[[nodiscard]] auto parseRangeWriteForm(const std::string& text)
    -> RangeWriteForm;

[[nodiscard]] auto makeAutoscaleOptions(const config::AmplifierConfig& config)
    -> AutoscaleOptions;

[[nodiscard]] auto makeBackgroundOptions(const config::AmplifierConfig& config)
    -> BackgroundOptions;

}  // namespace usaxs::device

#endif  // USAXS_DEVICE_AMPLIFIER_BUNDLE_FACTORY_HPP
