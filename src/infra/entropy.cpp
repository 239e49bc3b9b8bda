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
 * @file entropy.cpp
 * @brief Implementation of the secure random byte source.
 */

#include "chronoid/infra/entropy.hpp"

#include "chronoid/infra/error.hpp"
#include "chronoid/infra/logger.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <sys/random.h>

namespace chronoid::infra {

void Entropy::fill(std::uint8_t* buffer, std::size_t size)
{
    std::size_t filled = 0;
    while (filled < size) {
        ssize_t n = getrandom(buffer + filled, size - filled, 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string reason = "Entropy: getrandom failed (" + std::string(std::strerror(errno)) + ")";
            Logger::log(LogLevel::ERROR, reason);
            throw EntropyUnavailable(reason);
        }
        filled += static_cast<std::size_t>(n);
    }
}

std::uint16_t Entropy::next_u16()
{
    std::uint8_t bytes[2];
    fill(bytes, sizeof(bytes));
    return static_cast<std::uint16_t>((bytes[0] << 8) | bytes[1]);
}

} // namespace chronoid::infra
