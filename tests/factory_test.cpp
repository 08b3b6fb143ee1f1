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
 * @file factory_test.cpp
 * @brief Tests for identifier sequencing, node id derivation and shared use.
 *
 * @details
 * Most cases drive the factory with a `ManualClock` so that "same
 * millisecond" and "clock went backwards" are exact, reproducible states.
 */

#include "dataeater/core/snowflake_factory.hpp"
#include "dataeater/infra/host_identity.hpp"
#include "framework.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

using dataeater::core::Snowflake;
using dataeater::core::SnowflakeFactory;
using dataeater::core::SynchronizedSnowflakeFactory;

namespace {

constexpr const char* kHostId = "4c4c4544004d3610804cb4c04f4d3732";
constexpr std::uint16_t kHostNodeId = 783; // low 10 bits of DJB2(kHostId)

/**
 * @class ManualClock
 * @brief A clock that only moves when told to.
 */
class ManualClock {
  public:
    explicit ManualClock(std::int64_t millis) : millis_(std::make_shared<std::int64_t>(millis)) {}

    SnowflakeFactory::Clock fn() const
    {
        auto millis = millis_;
        return [millis] {
            return std::chrono::system_clock::time_point(std::chrono::milliseconds(*millis));
        };
    }

    void set(std::int64_t millis)
    {
        *millis_ = millis;
    }

    void advance(std::int64_t delta)
    {
        *millis_ += delta;
    }

  private:
    std::shared_ptr<std::int64_t> millis_;
};

constexpr std::int64_t kStart = 1792324800000; // 2026-10-18T12:00:00Z

} // namespace

void test_node_id_derivation()
{
    ASSERT_EQ(SnowflakeFactory::derive_node_id(kHostId), kHostNodeId);
    ASSERT_EQ(SnowflakeFactory::derive_node_id(""), std::uint16_t{261});
    ASSERT_EQ(SnowflakeFactory::derive_node_id("a"), std::uint16_t{518});

    SnowflakeFactory factory(kHostId);
    ASSERT_EQ(factory.node_id(), kHostNodeId);
}

void test_first_id_starts_sequence_at_zero()
{
    ManualClock clock(kStart);
    SnowflakeFactory factory(kHostId, clock.fn());

    Snowflake id = factory.next();
    ASSERT_EQ(id.timestamp_raw(), static_cast<std::uint64_t>(kStart));
    ASSERT_EQ(id.node_id(), kHostNodeId);
    ASSERT_EQ(id.sequence(), std::uint16_t{0});
    ASSERT_EQ(factory.last_timestamp(), static_cast<std::uint64_t>(kStart));
}

void test_same_millisecond_increments_sequence()
{
    ManualClock clock(kStart);
    SnowflakeFactory factory(kHostId, clock.fn());

    Snowflake a = factory.next();
    Snowflake b = factory.next();
    Snowflake c = factory.next();

    ASSERT_EQ(b.sequence(), std::uint16_t{1});
    ASSERT_EQ(c.sequence(), std::uint16_t{2});
    ASSERT_EQ(a.timestamp_raw(), c.timestamp_raw());
    ASSERT_TRUE(a < b);
    ASSERT_TRUE(b < c);
}

void test_new_millisecond_resets_sequence()
{
    ManualClock clock(kStart);
    SnowflakeFactory factory(kHostId, clock.fn());

    factory.next();
    factory.next();
    Snowflake before = factory.next();

    clock.advance(1);
    Snowflake after = factory.next();

    ASSERT_EQ(before.sequence(), std::uint16_t{2});
    ASSERT_EQ(after.sequence(), std::uint16_t{0});
    ASSERT_EQ(after.timestamp_raw(), static_cast<std::uint64_t>(kStart + 1));
    ASSERT_TRUE(before < after);
}

/**
 * @brief Sub-millisecond clock movement stays within the same millisecond.
 */
void test_sub_millisecond_readings_share_a_tick()
{
    auto base = std::chrono::system_clock::time_point(std::chrono::milliseconds(kStart));
    auto offset = std::make_shared<std::chrono::microseconds>(0);
    SnowflakeFactory factory(kHostId, [base, offset] { return base + *offset; });

    Snowflake a = factory.next();
    *offset = std::chrono::microseconds(999);
    Snowflake b = factory.next();

    ASSERT_EQ(a.timestamp_raw(), b.timestamp_raw());
    ASSERT_EQ(b.sequence(), std::uint16_t{1});
}

/**
 * @brief Call 1025 within one millisecond wraps the sequence and repeats call 1.
 */
void test_sequence_wraps_after_capacity()
{
    ManualClock clock(kStart);
    SnowflakeFactory factory(kHostId, clock.fn());

    std::vector<Snowflake> ids;
    for (std::uint32_t i = 0; i < Snowflake::kSequenceCapacity + 1; ++i) {
        ids.push_back(factory.next());
    }

    for (std::size_t i = 1; i < Snowflake::kSequenceCapacity; ++i) {
        ASSERT_TRUE(ids[i - 1] < ids[i]);
    }
    ASSERT_EQ(ids[1023].sequence(), std::uint16_t{1023});

    const Snowflake& first = ids.front();
    const Snowflake& wrapped = ids.back();
    ASSERT_EQ(wrapped.sequence(), std::uint16_t{0});
    ASSERT_EQ(wrapped.timestamp_raw(), first.timestamp_raw());
    ASSERT_TRUE(wrapped == first);
}

/**
 * @brief A rewound clock is accepted; the next id may sort before earlier ones.
 */
void test_clock_rewind_breaks_monotonicity()
{
    ManualClock clock(kStart);
    SnowflakeFactory factory(kHostId, clock.fn());

    factory.next();
    Snowflake before = factory.next();

    clock.set(kStart - 5);
    Snowflake after = factory.next();

    ASSERT_EQ(after.sequence(), std::uint16_t{0});
    ASSERT_EQ(after.timestamp_raw(), static_cast<std::uint64_t>(kStart - 5));
    ASSERT_TRUE(after < before);
}

/**
 * @brief The clock is masked to 43 bits before it is compared or stored.
 */
void test_timestamp_masked_to_field_width()
{
    const std::int64_t beyond = (std::int64_t{1} << 43) + 7;
    ManualClock clock(beyond);
    SnowflakeFactory factory(kHostId, clock.fn());

    Snowflake a = factory.next();
    ASSERT_EQ(a.timestamp_raw(), std::uint64_t{7});
    ASSERT_EQ(factory.last_timestamp(), std::uint64_t{7});

    Snowflake b = factory.next();
    ASSERT_EQ(b.sequence(), std::uint16_t{1});
}

void test_real_clock_ids_increase()
{
    SnowflakeFactory factory(kHostId);

    Snowflake previous = factory.next();
    for (int i = 0; i < 1000; ++i) {
        Snowflake current = factory.next();
        ASSERT_TRUE(current > previous);
        ASSERT_EQ(current.node_id(), previous.node_id());
        ASSERT_TRUE(current.timestamp_raw() > previous.timestamp_raw() ||
                    current.sequence() > previous.sequence());
        previous = current;
    }
}

/**
 * @brief Concurrent callers sharing one synchronized factory never collide.
 */
void test_synchronized_factory_is_unique_across_threads()
{
    constexpr int kThreads = 4;
    constexpr int kPerThread = 200;

    ManualClock clock(kStart);
    std::mutex clock_mutex;
    int calls = 0;

    // Advance the clock every 100 calls so no millisecond exceeds its capacity.
    auto tick = [&clock, &clock_mutex, &calls, base = clock.fn()] {
        std::lock_guard<std::mutex> lock(clock_mutex);
        if (++calls % 100 == 0) {
            clock.advance(1);
        }
        return base();
    };
    SynchronizedSnowflakeFactory shared(kHostId, tick);

    std::vector<std::vector<Snowflake>> results(kThreads);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&shared, &results, t] {
            for (int i = 0; i < kPerThread; ++i) {
                results[t].push_back(shared.next());
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    std::unordered_set<Snowflake> seen;
    for (const auto& batch : results) {
        for (std::size_t i = 0; i < batch.size(); ++i) {
            ASSERT_EQ(batch[i].node_id(), kHostNodeId);
            if (i > 0) {
                ASSERT_TRUE(batch[i - 1] < batch[i]);
            }
            seen.insert(batch[i]);
        }
    }
    ASSERT_EQ(seen.size(), static_cast<size_t>(kThreads * kPerThread));
    ASSERT_EQ(shared.node_id(), kHostNodeId);
}

/**
 * @brief The default constructor either reads this host's id or fails loudly.
 */
void test_default_factory_uses_host_identity()
{
    try {
        SnowflakeFactory factory;
        std::string host_id = dataeater::infra::HostIdentity::get();
        ASSERT_EQ(factory.node_id(), SnowflakeFactory::derive_node_id(host_id));
    } catch (const dataeater::infra::HostIdentityUnavailable&) {
        // Containers without a machine id: the failure mode itself is the contract.
        ASSERT_THROWS(dataeater::infra::HostIdentity::get(),
                      dataeater::infra::HostIdentityUnavailable);
    }
}
