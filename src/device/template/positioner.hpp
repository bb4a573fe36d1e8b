/*
 * positioner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef USAXS_DEVICE_TEMPLATE_POSITIONER_HPP
#define USAXS_DEVICE_TEMPLATE_POSITIONER_HPP

#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace usaxs::device {

/**
 * @brief Motor axis stepped through by a scan.
 */
class Positioner {
public:
    explicit Positioner(std::string name) : name_(std::move(name)) {}
    virtual ~Positioner() = default;

    const std::string& getName() const { return name_; }

    virtual auto moveTo(double position, std::chrono::milliseconds timeout)
        -> bool = 0;
    virtual auto getPosition() -> std::optional<double> = 0;

protected:
    std::string name_;
};

}  // namespace usaxs::device

#endif  // USAXS_DEVICE_TEMPLATE_POSITIONER_HPP
