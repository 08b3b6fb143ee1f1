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
 * @file hashing.hpp
 * @brief Stable, platform-independent content hashing.
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace dataeater::infra {

/// @brief Initial state of the DJB2 hash.
constexpr std::uint64_t kDjb2Seed = 5381;

/**
 * @brief Computes the DJB2 hash (`hash * 33 + byte`) over raw bytes.
 *
 * Arithmetic wraps modulo 2^64 and each byte is taken as unsigned, so the
 * result depends only on the byte content and never on the platform's
 * `char` signedness or `std::hash` implementation. Used to reduce opaque
 * host identifiers to a node id; the value must therefore stay stable
 * across builds.
 *
 * @param bytes The content to hash.
 * @return std::uint64_t The 64-bit hash.
 */
std::uint64_t consistent_hash(std::string_view bytes);

} // namespace dataeater::infra
