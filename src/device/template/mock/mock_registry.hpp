/*
 * mock_registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-11

Description: In-memory DeviceRegistry for testing

*************************************************/

#pragma once

#include "../device_registry.hpp"
#include "mock_amplifier.hpp"

#include <map>

class MockDeviceRegistry : public usaxs::device::DeviceRegistry {
public:
    void add(const std::shared_ptr<usaxs::device::Channel>& channel) {
        channels_[channel->getName()] = channel;
    }
    void add(const std::shared_ptr<usaxs::device::CountingDevice>& counter) {
        counters_[counter->getName()] = counter;
    }
    void add(const std::shared_ptr<usaxs::device::Positioner>& positioner) {
        positioners_[positioner->getName()] = positioner;
    }

    /**
     * @brief Register every channel of a simulated amplifier
     */
    void add(const MockAutorangeAmplifier& amplifier) {
        add(amplifier.signal());
        add(amplifier.readback());
        add(amplifier.rangeSelect());
        add(amplifier.mode());
        for (std::size_t i = 0; i < amplifier.getRangeCount(); ++i) {
            add(amplifier.backgroundSlot(i).background);
            add(amplifier.backgroundSlot(i).backgroundError);
        }
    }

    auto findChannel(const std::string& name)
        -> std::shared_ptr<usaxs::device::Channel> override {
        auto it = channels_.find(name);
        return it == channels_.end() ? nullptr : it->second;
    }

    auto findCounter(const std::string& name)
        -> std::shared_ptr<usaxs::device::CountingDevice> override {
        auto it = counters_.find(name);
        return it == counters_.end() ? nullptr : it->second;
    }

    auto findPositioner(const std::string& name)
        -> std::shared_ptr<usaxs::device::Positioner> override {
        auto it = positioners_.find(name);
        return it == positioners_.end() ? nullptr : it->second;
    }

private:
    std::map<std::string, std::shared_ptr<usaxs::device::Channel>> channels_;
    std::map<std::string, std::shared_ptr<usaxs::device::CountingDevice>>
        counters_;
    std::map<std::string, std::shared_ptr<usaxs::device::Positioner>>
        positioners_;
};
