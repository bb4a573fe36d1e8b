/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Configuration Exception Types

**************************************************/

#ifndef USAXS_CONFIG_CORE_EXCEPTION_HPP
#define USAXS_CONFIG_CORE_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace usaxs::config {

/**
 * @brief Base exception for configuration errors
 */
class BadConfigException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_BAD_CONFIG_EXCEPTION(...)                                     \
    throw usaxs::config::BadConfigException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                            ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for invalid configuration values
 */
class InvalidConfigException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_INVALID_CONFIG_EXCEPTION(...)      \
    throw usaxs::config::InvalidConfigException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for configuration file I/O errors
 */
class ConfigIOException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_IO_EXCEPTION(...)                                     \
    throw usaxs::config::ConfigIOException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                           ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for configuration serialization errors
 */
class ConfigSerializationException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_SERIALIZATION_EXCEPTION(...)      \
    throw usaxs::config::ConfigSerializationException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace usaxs::config

#endif  // USAXS_CONFIG_CORE_EXCEPTION_HPP
