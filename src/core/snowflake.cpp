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
 * @file snowflake.cpp
 * @brief Bit packing, unpacking and validation of `Snowflake` identifiers.
 */

#include "dataeater/core/snowflake.hpp"

#include <iomanip>
#include <sstream>

namespace dataeater::core {

namespace {

std::string hex_u64(std::uint64_t value)
{
    std::stringstream ss;
    ss << "0x" << std::hex << std::setfill('0') << std::setw(16) << value;
    return ss.str();
}

} // namespace

SnowflakeFormatError::SnowflakeFormatError(std::uint64_t raw)
    : std::runtime_error("Snowflake not in correct format: reserved bit 63 is set in " +
                         hex_u64(raw)),
      raw_(raw)
{
}

Snowflake Snowflake::encode(std::uint64_t timestamp_millis, std::uint16_t node_id,
                            std::uint16_t sequence)
{
    std::uint64_t raw = ((timestamp_millis & kTimestampMask) << kTimestampShift) |
                        ((static_cast<std::uint64_t>(node_id) & kNodeIdMask) << kNodeIdShift) |
                        ((static_cast<std::uint64_t>(sequence) & kSequenceMask) << kSequenceShift);
    return Snowflake(raw);
}

Snowflake Snowflake::encode(const SnowflakeFields& fields)
{
    return encode(fields.timestamp, fields.node_id, fields.sequence);
}

std::optional<Snowflake> Snowflake::try_from_raw(std::uint64_t raw)
{
    if (raw & kReservedBit) {
        return std::nullopt;
    }
    return Snowflake(raw);
}

Snowflake Snowflake::from_raw(std::uint64_t raw)
{
    auto id = try_from_raw(raw);
    if (!id) {
        throw SnowflakeFormatError(raw);
    }
    return *id;
}

SnowflakeFields Snowflake::decompose() const
{
    SnowflakeFields fields;
    fields.timestamp = timestamp_raw();
    fields.node_id = node_id();
    fields.sequence = sequence();
    return fields;
}

std::uint64_t Snowflake::timestamp_raw() const
{
    return (raw_ >> kTimestampShift) & kTimestampMask;
}

std::uint16_t Snowflake::node_id() const
{
    return static_cast<std::uint16_t>((raw_ >> kNodeIdShift) & kNodeIdMask);
}

std::uint16_t Snowflake::sequence() const
{
    return static_cast<std::uint16_t>((raw_ >> kSequenceShift) & kSequenceMask);
}

std::chrono::system_clock::time_point Snowflake::timestamp() const
{
    return std::chrono::system_clock::time_point(
        std::chrono::milliseconds(static_cast<std::int64_t>(timestamp_raw())));
}

std::string Snowflake::to_string() const
{
    std::stringstream ss;
    ss << std::hex << timestamp_raw() << "|" << node_id() << "|" << sequence();
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Snowflake& id)
{
    return os << id.to_string();
}

std::ostream& operator<<(std::ostream& os, const SnowflakeFields& fields)
{
    return os << "{timestamp=" << fields.timestamp << ", node_id=" << fields.node_id
              << ", sequence=" << fields.sequence << "}";
}

} // namespace dataeater::core
