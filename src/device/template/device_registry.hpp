/*
 * device_registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-11

Description: Lookup of channels, counting devices and positioners by name

*************************************************/

#ifndef USAXS_DEVICE_TEMPLATE_DEVICE_REGISTRY_HPP
#define USAXS_DEVICE_TEMPLATE_DEVICE_REGISTRY_HPP

#include <memory>
#include <string>

#include "channel.hpp"
#include "counting_device.hpp"
#include "positioner.hpp"

namespace usaxs::device {

/**
 * @brief Devices known to the control system, found by name.
 * Each lookup returns nullptr for an unknown name.
 */
class DeviceRegistry {
public:
    virtual ~DeviceRegistry() = default;

    virtual auto findChannel(const std::string& name)
        -> std::shared_ptr<Channel> = 0;
    virtual auto findCounter(const std::string& name)
        -> std::shared_ptr<CountingDevice> = 0;
    virtual auto findPositioner(const std::string& name)
        -> std::shared_ptr<Positioner> = 0;
};

}  // namespace usaxs::device

#endif  // USAXS_DEVICE_TEMPLATE_DEVICE_REGISTRY_HPP
