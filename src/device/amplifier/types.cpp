/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <format>
#include <thread>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace usaxs::device {

auto describeConvergence(const std::vector<BundleConvergence>& convergence)
    -> std::string {
    std::string text = "[";
    for (const auto& entry : convergence) {
        if (text.size() > 1) {
            text += ", ";
        }
        text += std::format(
            "{}: gain={} stable={} rate={:.6g} unsaturated={}", entry.nickname,
            entry.gainIndex ? std::to_string(*entry.gainIndex) : "?",
            entry.gainStable, entry.observedRate, entry.notSaturated);
    }
    return text + "]";
}

void checkpoint(const std::stop_token& stopToken, std::string_view where) {
    if (stopToken.stop_requested()) {
        THROW_OPERATION_CANCELLED("Stop requested before " +
                                  std::string(where));
    }
}

void sleepSeconds(double seconds) {
    if (seconds > 0) {
        std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
    }
}

auto triggerTimeout(double countTime, std::chrono::milliseconds margin)
    -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::duration<double>(countTime)) +
           margin;
}

void moveShutter(const std::shared_ptr<Shutter>& shutter, ShutterState state,
                 std::chrono::milliseconds timeout) {
    if (!shutter) {
        return;
    }
    const char* action = state == ShutterState::Open ? "open" : "close";
    if (!shutter->moveTo(state, timeout)) {
        THROW_HARDWARE_ERROR("Cannot " + std::string(action) + " " +
                             shutter->getName());
    }
    spdlog::debug("{}: {}", shutter->getName(), action);
}

}  // namespace usaxs::device
