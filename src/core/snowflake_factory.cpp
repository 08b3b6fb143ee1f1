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
 * @file snowflake_factory.cpp
 * @brief Node id derivation and the per-millisecond sequencing loop.
 */

#include "dataeater/core/snowflake_factory.hpp"

#include "dataeater/infra/hashing.hpp"
#include "dataeater/infra/host_identity.hpp"
#include "dataeater/infra/logger.hpp"

#include <sstream>
#include <string>
#include <utility>

namespace dataeater::core {

SnowflakeFactory::Clock SnowflakeFactory::system_clock()
{
    return [] { return std::chrono::system_clock::now(); };
}

SnowflakeFactory::SnowflakeFactory() : SnowflakeFactory(infra::HostIdentity::get()) {}

SnowflakeFactory::SnowflakeFactory(std::string_view host_id, Clock clock)
    : node_id_(derive_node_id(host_id)), clock_(std::move(clock))
{
    if (infra::Logger::enabled(infra::LogLevel::DEBUG)) {
        std::stringstream ss;
        ss << "Factory: Derived node id 0x" << std::hex << node_id_ << " from a "
           << std::dec << host_id.size() << "-byte host identifier.";
        infra::Logger::log(infra::LogLevel::DEBUG, ss.str());
    }
}

std::uint16_t SnowflakeFactory::derive_node_id(std::string_view host_id)
{
    auto hash16 = static_cast<std::uint16_t>(infra::consistent_hash(host_id));
    return static_cast<std::uint16_t>(hash16 & Snowflake::kNodeIdMask);
}

/**
 * @details
 * The clock reading is masked to the same 43 bits the timestamp field
 * stores, so the value compared against `last_timestamp_` is exactly the
 * value that ends up in the identifier.
 */
Snowflake SnowflakeFactory::next()
{
    auto since_epoch = clock_().time_since_epoch();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count();
    std::uint64_t timestamp = static_cast<std::uint64_t>(millis) & Snowflake::kTimestampMask;

    if (timestamp == last_timestamp_) {
        // Wraps to 0 after 1023: the documented per-millisecond capacity limit.
        sequence_ = static_cast<std::uint16_t>((sequence_ + 1) & Snowflake::kSequenceMask);
    } else {
        last_timestamp_ = timestamp;
        sequence_ = 0;
    }

    return Snowflake::encode(last_timestamp_, node_id_, sequence_);
}

SynchronizedSnowflakeFactory::SynchronizedSnowflakeFactory(std::string_view host_id,
                                                           SnowflakeFactory::Clock clock)
    : factory_(host_id, std::move(clock))
{
}

Snowflake SynchronizedSnowflakeFactory::next()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return factory_.next();
}

} // namespace dataeater::core
