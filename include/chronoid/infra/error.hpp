/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file error.hpp
 * @brief Exception types raised by chronoid.
 *
 * @details
 * Every failure in the library is unrecoverable for the operation that raised it:
 * a generator cannot be built without a trustworthy clock and a secure entropy
 * source. Callers catch `chronoid::infra::Error` (or `std::exception`) at their
 * outermost boundary.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace chronoid::infra {

/**
 * @class Error
 * @brief Base class of every exception thrown by chronoid.
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class EntropyUnavailable
 * @brief The secure random source could not supply the requested bytes.
 *
 * Raised by node identifier creation and by counter seeding.
 */
class EntropyUnavailable : public Error {
  public:
    explicit EntropyUnavailable(const std::string& what) : Error(what) {}
};

/**
 * @class ClockFault
 * @brief The system clock is before the Unix epoch, or the epoch shift overflowed.
 */
class ClockFault : public Error {
  public:
    explicit ClockFault(const std::string& what) : Error(what) {}
};

/**
 * @class ConfigError
 * @brief A configuration document is unreadable or malformed.
 */
class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

} // namespace chronoid::infra
