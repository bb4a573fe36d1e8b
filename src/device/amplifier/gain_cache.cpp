/*
 * gain_cache.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "gain_cache.hpp"

namespace usaxs::device {

auto GainCache::lookup(const std::string& counter,
                       const std::string& gainIdentity) const
    -> std::optional<std::uint32_t> {
    std::lock_guard lock(mutex_);
    auto device = entries_.find(counter);
    if (device == entries_.end()) {
        return std::nullopt;
    }
    auto entry = device->second.find(gainIdentity);
    if (entry == device->second.end()) {
        return std::nullopt;
    }
    return entry->second;
}

void GainCache::store(const std::string& counter,
                      const std::string& gainIdentity,
                      std::uint32_t gainIndex) {
    std::lock_guard lock(mutex_);
    entries_[counter][gainIdentity] = gainIndex;
}

void GainCache::forget(const std::string& counter) {
    std::lock_guard lock(mutex_);
    entries_.erase(counter);
}

void GainCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

auto GainCache::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    std::size_t count = 0;
    for (const auto& [counter, gains] : entries_) {
        count += gains.size();
    }
    return count;
}

}  // namespace usaxs::device
