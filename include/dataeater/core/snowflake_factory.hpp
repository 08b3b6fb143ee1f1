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
 * @file snowflake_factory.hpp
 * @brief Stateful generators producing streams of `Snowflake` identifiers.
 *
 * @details
 * A factory derives its node id once, from the host identifier, and then
 * combines wall-clock milliseconds with a per-millisecond sequence counter.
 *
 * **Known limits:**
 * - **Capacity:** at most 1024 distinct identifiers per millisecond per
 *   factory. Call 1025 within the same millisecond wraps the sequence back to
 *   0 and repeats an earlier identifier. The factory never blocks or spins
 *   waiting for the clock.
 * - **Clock rewind:** a wall clock moving backwards is accepted as is. The
 *   sequence restarts at 0 and the emitted identifier may compare lower than
 *   one emitted before.
 * - **Scope:** uniqueness across hosts is only as good as the 10-bit node id
 *   hash of the host identifier.
 */

#pragma once

#include "dataeater/core/snowflake.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string_view>

namespace dataeater::core {

/**
 * @class SnowflakeFactory
 * @brief Single-owner identifier generator.
 *
 * @details
 * `next()` mutates the `(last_timestamp, sequence)` pair without any
 * synchronization. Share one instance between threads only through
 * `SynchronizedSnowflakeFactory`, or give every worker its own factory with a
 * distinct host id.
 */
class SnowflakeFactory {
  public:
    /// @brief Source of wall-clock readings.
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /// @brief The default clock, `std::chrono::system_clock::now`.
    static Clock system_clock();

    /**
     * @brief Creates a factory for this host, reading the clock from the system.
     *
     * @throws infra::HostIdentityUnavailable If the host identifier cannot be read.
     */
    SnowflakeFactory();

    /**
     * @brief Creates a factory from an explicit host identifier and clock.
     *
     * @param host_id Opaque, stable identifier of the host or shard.
     * @param clock Wall-clock source, queried once per `next()`.
     */
    explicit SnowflakeFactory(std::string_view host_id, Clock clock = system_clock());

    /**
     * @brief Reduces a host identifier to a node id.
     *
     * The DJB2 hash of the identifier is truncated to 16 bits and then to the
     * low 10 bits that fit the node id field.
     */
    static std::uint16_t derive_node_id(std::string_view host_id);

    /**
     * @brief Produces the next identifier.
     *
     * Reads the clock once and truncates it to whole milliseconds within the
     * 43-bit timestamp range. The same millisecond as the previous call
     * advances the sequence modulo 1024; any other value restarts it at 0.
     */
    Snowflake next();

    /// @brief The node id stamped on every identifier from this factory.
    std::uint16_t node_id() const
    {
        return node_id_;
    }

    /// @brief The masked millisecond value seen by the latest `next()` call.
    std::uint64_t last_timestamp() const
    {
        return last_timestamp_;
    }

    /// @brief The sequence value used by the latest `next()` call.
    std::uint16_t sequence() const
    {
        return sequence_;
    }

  private:
    std::uint16_t node_id_;
    std::uint16_t sequence_ = 0;
    std::uint64_t last_timestamp_ = 0;
    Clock clock_;
};

/**
 * @class SynchronizedSnowflakeFactory
 * @brief A `SnowflakeFactory` that may be shared by concurrent callers.
 *
 * Each `next()` call holds the mutex for exactly one underlying `next()`, so
 * the timestamp and the sequence always advance together.
 */
class SynchronizedSnowflakeFactory {
  public:
    /// @throws infra::HostIdentityUnavailable If the host identifier cannot be read.
    SynchronizedSnowflakeFactory() = default;

    explicit SynchronizedSnowflakeFactory(std::string_view host_id,
                                          SnowflakeFactory::Clock clock =
                                              SnowflakeFactory::system_clock());

    SynchronizedSnowflakeFactory(const SynchronizedSnowflakeFactory&) = delete;
    SynchronizedSnowflakeFactory& operator=(const SynchronizedSnowflakeFactory&) = delete;

    Snowflake next();

    std::uint16_t node_id() const
    {
        return factory_.node_id();
    }

  private:
    std::mutex mutex_;
    SnowflakeFactory factory_;
};

} // namespace dataeater::core
