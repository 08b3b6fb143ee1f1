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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "dataeater/infra/string.hpp"

#include <cctype>
#include <limits>

namespace dataeater::infra {

/**
 * @brief Trims leading and trailing whitespace from a string view.
 *
 * @note The cast to `unsigned char` keeps `std::isspace` defined for bytes
 * above 0x7F on platforms where `char` is signed.
 */
std::string String::trim(std::string_view s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (end != start && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

/**
 * @brief Parses decimal or `0x`-prefixed hexadecimal text into a `uint64_t`.
 *
 * Overflow is detected before each multiply-add so no intermediate value
 * ever wraps.
 */
std::optional<std::uint64_t> String::parse_u64(std::string_view s)
{
    std::uint64_t base = 10;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        base = 16;
        s.remove_prefix(2);
    }

    if (s.empty()) {
        return std::nullopt;
    }

    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t value = 0;

    for (char c : s) {
        std::uint64_t digit = 0;
        if (c >= '0' && c <= '9') {
            digit = static_cast<std::uint64_t>(c - '0');
        } else if (base == 16 && c >= 'a' && c <= 'f') {
            digit = static_cast<std::uint64_t>(c - 'a' + 10);
        } else if (base == 16 && c >= 'A' && c <= 'F') {
            digit = static_cast<std::uint64_t>(c - 'A' + 10);
        } else {
            return std::nullopt;
        }

        if (value > (kMax - digit) / base) {
            return std::nullopt;
        }
        value = value * base + digit;
    }

    return value;
}

} // namespace dataeater::infra
