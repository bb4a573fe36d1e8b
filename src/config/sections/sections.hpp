/*
 * sections.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Aggregated header for all configuration sections

**************************************************/

#ifndef USAXS_CONFIG_SECTIONS_HPP
#define USAXS_CONFIG_SECTIONS_HPP

#include "amplifier_config.hpp"
#include "logging_config.hpp"
#include "step_scan_config.hpp"

namespace usaxs::config {

static_assert(ConfigSectionDerived<AmplifierConfig>);
static_assert(ConfigSectionDerived<StepScanConfig>);
static_assert(ConfigSectionDerived<LoggingConfig>);

}  // namespace usaxs::config

#endif  // USAXS_CONFIG_SECTIONS_HPP
