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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Stateless text helpers shared by the host identity probe (sanitizing file
 * contents), the JSON codec (identifiers travel as decimal strings) and the
 * command line tool (raw identifier arguments).
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dataeater::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * Whitespace is whatever `std::isspace` accepts in the "C" locale
     * (space, `\t`, `\n`, `\r`, `\v`, `\f`).
     *
     * @param s The source string to process.
     * @return std::string The trimmed content, empty if @p s is all whitespace.
     *
     * @code
     * std::string id = String::trim("4c4c4544004d3610\n"); // "4c4c4544004d3610"
     * @endcode
     */
    static std::string trim(std::string_view s);

    /**
     * @brief Parses an unsigned 64-bit integer, rejecting anything ambiguous.
     *
     * Accepts plain decimal digits, or hexadecimal digits behind a `0x`/`0X`
     * prefix. Signs, whitespace, empty input, trailing garbage and values
     * above `UINT64_MAX` are rejected.
     *
     * @param s The text to parse.
     * @return The parsed value, or `std::nullopt` on any violation.
     */
    static std::optional<std::uint64_t> parse_u64(std::string_view s);
};

} // namespace dataeater::infra
