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
 * @file snowflake.hpp
 * @brief The 64-bit composite identifier and its bit-exact codec.
 *
 * @details
 * A `Snowflake` packs three fields into one unsigned 64-bit integer,
 * most significant bit first:
 *
 * | Bits   | Width | Field                                         |
 * |--------|-------|-----------------------------------------------|
 * | 63     | 1     | reserved, always 0                            |
 * | 62..20 | 43    | milliseconds since the Unix epoch (low bits)  |
 * | 19..10 | 10    | node id                                       |
 * | 9..0   | 10    | sequence within the millisecond               |
 *
 * Because the timestamp occupies the high bits, comparing raw values is the
 * same as comparing (timestamp, node id, sequence) lexicographically.
 * The raw integer is the only wire representation; the text produced by
 * `to_string()` is for humans and cannot be parsed back.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace dataeater::core {

/**
 * @class SnowflakeFormatError
 * @brief Raised when a raw 64-bit value has its reserved top bit set.
 */
class SnowflakeFormatError : public std::runtime_error {
  public:
    explicit SnowflakeFormatError(std::uint64_t raw);

    /// @brief The rejected raw value.
    std::uint64_t raw() const
    {
        return raw_;
    }

  private:
    std::uint64_t raw_;
};

/**
 * @struct SnowflakeFields
 * @brief The three logical fields of a `Snowflake`, unpacked.
 *
 * Values wider than their field are truncated to the low bits when encoded.
 */
struct SnowflakeFields {
    std::uint64_t timestamp = 0; ///< Milliseconds since the Unix epoch (43 bits kept).
    std::uint16_t node_id = 0;   ///< Originating node (10 bits kept).
    std::uint16_t sequence = 0;  ///< Per-millisecond counter (10 bits kept).

    bool operator==(const SnowflakeFields& other) const
    {
        return timestamp == other.timestamp && node_id == other.node_id &&
               sequence == other.sequence;
    }

    bool operator!=(const SnowflakeFields& other) const
    {
        return !(*this == other);
    }
};

/**
 * @class Snowflake
 * @brief An opaque, totally ordered, hashable 64-bit identifier.
 *
 * @details
 * Instances only come from `encode()` or from a validated raw value, so the
 * reserved bit of every `Snowflake` is always clear.
 */
class Snowflake {
  public:
    static constexpr unsigned kSequenceBits = 10;
    static constexpr unsigned kNodeIdBits = 10;
    static constexpr unsigned kTimestampBits = 43;

    static constexpr unsigned kSequenceShift = 0;
    static constexpr unsigned kNodeIdShift = kSequenceShift + kSequenceBits;
    static constexpr unsigned kTimestampShift = kNodeIdShift + kNodeIdBits;

    static constexpr std::uint64_t kSequenceMask = (std::uint64_t{1} << kSequenceBits) - 1;
    static constexpr std::uint64_t kNodeIdMask = (std::uint64_t{1} << kNodeIdBits) - 1;
    static constexpr std::uint64_t kTimestampMask = (std::uint64_t{1} << kTimestampBits) - 1;
    static constexpr std::uint64_t kReservedBit = std::uint64_t{1} << 63;

    /// @brief Number of distinct sequence values per millisecond (1024).
    static constexpr std::uint32_t kSequenceCapacity = std::uint32_t{1} << kSequenceBits;

    static_assert(kTimestampShift + kTimestampBits == 63,
                  "fields must fill bits 0..62 and leave bit 63 reserved");
    static_assert(kNodeIdBits <= 16 && kSequenceBits <= 16,
                  "node id and sequence must fit their uint16_t accessors");

    /// @brief The all-zero identifier (timestamp 0, node 0, sequence 0).
    Snowflake() = default;

    /**
     * @brief Packs the three fields into an identifier.
     *
     * Each argument is truncated to the low bits of its field width. This is
     * a fixed-width encoding: high bits of an oversized timestamp or node id
     * are discarded, not preserved.
     */
    static Snowflake encode(std::uint64_t timestamp_millis, std::uint16_t node_id,
                            std::uint16_t sequence);

    /// @brief Packs an unpacked field set. See the three-argument overload.
    static Snowflake encode(const SnowflakeFields& fields);

    /**
     * @brief Validates a raw value received from outside the process.
     *
     * @return The identifier, or `std::nullopt` if bit 63 is set. Any other
     * 63-bit pattern is structurally valid.
     */
    static std::optional<Snowflake> try_from_raw(std::uint64_t raw);

    /**
     * @brief Like `try_from_raw()`, but reports the failure as an exception.
     *
     * @throws SnowflakeFormatError If bit 63 of @p raw is set.
     */
    static Snowflake from_raw(std::uint64_t raw);

    /// @brief The raw wire value. Lossless; bit 63 is always clear.
    std::uint64_t to_raw() const
    {
        return raw_;
    }

    /// @brief Unpacks the three fields exactly as they are stored.
    SnowflakeFields decompose() const;

    /// @brief The stored timestamp field in milliseconds since the Unix epoch.
    std::uint64_t timestamp_raw() const;

    /// @brief The id of the node that created this identifier.
    std::uint16_t node_id() const;

    /// @brief The position of this identifier within its millisecond.
    std::uint16_t sequence() const;

    /**
     * @brief The creation time as a calendar time point.
     *
     * The field is interpreted in milliseconds, the unit it was stored in.
     */
    std::chrono::system_clock::time_point timestamp() const;

    /**
     * @brief Debug rendering: `<timestamp>|<node id>|<sequence>` in lowercase hex.
     *
     * @code
     * Snowflake::encode(0x18f, 0x2a, 3).to_string(); // "18f|2a|3"
     * @endcode
     */
    std::string to_string() const;

    friend bool operator==(Snowflake a, Snowflake b)
    {
        return a.raw_ == b.raw_;
    }
    friend bool operator!=(Snowflake a, Snowflake b)
    {
        return a.raw_ != b.raw_;
    }
    friend bool operator<(Snowflake a, Snowflake b)
    {
        return a.raw_ < b.raw_;
    }
    friend bool operator<=(Snowflake a, Snowflake b)
    {
        return a.raw_ <= b.raw_;
    }
    friend bool operator>(Snowflake a, Snowflake b)
    {
        return a.raw_ > b.raw_;
    }
    friend bool operator>=(Snowflake a, Snowflake b)
    {
        return a.raw_ >= b.raw_;
    }

  private:
    explicit Snowflake(std::uint64_t raw) : raw_(raw) {}

    std::uint64_t raw_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Snowflake& id);

/// @brief Prints `{timestamp=..., node_id=..., sequence=...}` in decimal.
std::ostream& operator<<(std::ostream& os, const SnowflakeFields& fields);

} // namespace dataeater::core

namespace std {

template <> struct hash<dataeater::core::Snowflake> {
    size_t operator()(const dataeater::core::Snowflake& id) const
    {
        return std::hash<std::uint64_t>{}(id.to_raw());
    }
};

} // namespace std
