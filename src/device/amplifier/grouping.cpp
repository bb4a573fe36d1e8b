/*
 * grouping.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "grouping.hpp"

#include <string>
#include <unordered_map>

#include "exception/exception.hpp"

namespace usaxs::device {

auto groupByCounter(const std::vector<BundlePtr>& bundles)
    -> std::vector<ResourceGroup> {
    std::vector<ResourceGroup> groups;
    std::unordered_map<std::string, std::size_t> positions;

    for (std::size_t i = 0; i < bundles.size(); ++i) {
        const auto& bundle = bundles[i];
        if (!bundle) {
            THROW_INVALID_BUNDLE("bundles[" + std::to_string(i) +
                                 "] must be a DetectorControlBundle, "
                                 "provided: null");
        }
        const auto& counter = bundle->getCounter();
        auto [it, inserted] =
            positions.try_emplace(counter->getName(), groups.size());
        if (inserted) {
            groups.push_back(ResourceGroup{counter, {}});
        }
        groups[it->second].bundles.push_back(bundle);
    }
    return groups;
}

}  // namespace usaxs::device
