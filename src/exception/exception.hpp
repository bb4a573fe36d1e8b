/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-9

Description: Gain control and step series exceptions

**************************************************/

#ifndef USAXS_EXCEPTION_EXCEPTION_HPP
#define USAXS_EXCEPTION_EXCEPTION_HPP

#include <string>
#include <utility>
#include <vector>

#include "atom/error/exception.hpp"
#include "device/amplifier/types.hpp"

namespace usaxs {

// ============================================================================
// Configuration Exceptions
// ============================================================================

/**
 * @brief Exception thrown when hardware reports an inconsistent
 * configuration, e.g. gain labels with differing unit suffixes.
 */
class ConfigurationError : public atom::error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Exception thrown when a requested gain is not one of the
 * acceptable labels, indices or magnitudes.
 */
class InvalidGainError : public atom::error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Exception thrown when a detector bundle is missing or incomplete.
 */
class InvalidBundleError : public atom::error::Exception {
public:
    using Exception::Exception;
};

// ============================================================================
// Hardware Exceptions
// ============================================================================

/**
 * @brief Exception thrown when a channel read/write or a move fails.
 */
class HardwareError : public atom::error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Exception thrown when a trigger does not complete in time.
 */
class DeviceTimeoutError : public HardwareError {
public:
    using HardwareError::HardwareError;
};

/**
 * @brief Exception thrown at a checkpoint after a stop was requested.
 */
class OperationCancelled : public atom::error::Exception {
public:
    using Exception::Exception;
};

// ============================================================================
// Algorithm Exceptions
// ============================================================================

/**
 * @brief Exception thrown when autoscale does not converge while the
 * instrument is live. Carries the convergence state of the last iteration.
 */
class AutoscaleError : public atom::error::Exception {
public:
    AutoscaleError(const char* file, int line, const char* func,
                   std::vector<device::BundleConvergence> lastConvergence,
                   const std::string& message)
        : Exception(file, line, func, message),
          lastConvergence_(std::move(lastConvergence)) {}

    [[nodiscard]] auto getLastConvergence() const
        -> const std::vector<device::BundleConvergence>& {
        return lastConvergence_;
    }

private:
    std::vector<device::BundleConvergence> lastConvergence_;
};

/**
 * @brief Exception thrown when the step factor root finder cannot bracket
 * a solution.
 */
class NumericDivergenceError : public atom::error::Exception {
public:
    using Exception::Exception;
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define THROW_CONFIGURATION_ERROR(...)                               \
    throw usaxs::ConfigurationError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                    ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_GAIN(...)                                    \
    throw usaxs::InvalidGainError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                  ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_BUNDLE(...)                                    \
    throw usaxs::InvalidBundleError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                    ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_HARDWARE_ERROR(...)                                 \
    throw usaxs::HardwareError(ATOM_FILE_NAME, ATOM_FILE_LINE,   \
                               ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_DEVICE_TIMEOUT(...)                                    \
    throw usaxs::DeviceTimeoutError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                    ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_OPERATION_CANCELLED(...)                               \
    throw usaxs::OperationCancelled(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                    ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_AUTOSCALE_ERROR(convergence, message)                       \
    throw usaxs::AutoscaleError(ATOM_FILE_NAME, ATOM_FILE_LINE,           \
                                ATOM_FUNC_NAME, (convergence), (message))

#define THROW_NUMERIC_DIVERGENCE(...)                                    \
    throw usaxs::NumericDivergenceError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                        ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace usaxs

#endif  // USAXS_EXCEPTION_EXCEPTION_HPP
