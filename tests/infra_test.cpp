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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure (String, hashing, HostIdentity, Logger).
 */

#include "dataeater/infra/hashing.hpp"
#include "dataeater/infra/host_identity.hpp"
#include "dataeater/infra/logger.hpp"
#include "dataeater/infra/string.hpp"
#include "framework.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

using dataeater::infra::HostIdentity;
using dataeater::infra::HostIdentityUnavailable;
using dataeater::infra::Logger;
using dataeater::infra::LogLevel;
using dataeater::infra::String;

/**
 * @class HostIdTestDir
 * @brief RAII scratch directory for host identity files.
 *
 * Each instance gets its own directory, named after the process id and a
 * counter, so concurrent runs never touch each other's files. Built inside
 * the test body so a filesystem failure is reported as a test failure.
 */
class HostIdTestDir {
  public:
    const fs::path path = fs::temp_directory_path() / unique_name();

    HostIdTestDir()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
        fs::create_directories(path);
    }

    ~HostIdTestDir()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    HostIdTestDir(const HostIdTestDir&) = delete;
    HostIdTestDir& operator=(const HostIdTestDir&) = delete;

    std::string write(const std::string& name, const std::string& content) const
    {
        fs::path file = path / name;
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out << content;
        return file.string();
    }

  private:
    static std::string unique_name()
    {
        static std::atomic<int> counter{0};
        return "dataeater_host_identity_test_" + std::to_string(::getpid()) + "_" +
               std::to_string(counter++);
    }
};

// ---------------------------------------------------------------------------
// String
// ---------------------------------------------------------------------------

void test_string_trim()
{
    std::string clean = String::trim("   4c4c4544 004d3610   ");
    ASSERT_EQ(clean, std::string("4c4c4544 004d3610"));
}

void test_string_trim_empty()
{
    std::string result = String::trim("  \t\n  \r ");
    ASSERT_EQ(result, std::string(""));
    ASSERT_EQ(String::trim(""), std::string(""));
    ASSERT_EQ(String::trim("x"), std::string("x"));
}

void test_parse_u64_decimal_and_hex()
{
    ASSERT_EQ(String::parse_u64("0").value(), std::uint64_t{0});
    ASSERT_EQ(String::parse_u64("18446744073709551615").value(), UINT64_MAX);
    ASSERT_EQ(String::parse_u64("0x7fffffffffffffff").value(), std::uint64_t{0x7fffffffffffffff});
    ASSERT_EQ(String::parse_u64("0XFF").value(), std::uint64_t{255});
}

/**
 * @brief Anything that is not a clean unsigned literal must be rejected.
 */
void test_parse_u64_rejects_malformed()
{
    ASSERT_FALSE(String::parse_u64("").has_value());
    ASSERT_FALSE(String::parse_u64("0x").has_value());
    ASSERT_FALSE(String::parse_u64("-1").has_value());
    ASSERT_FALSE(String::parse_u64("+1").has_value());
    ASSERT_FALSE(String::parse_u64(" 1").has_value());
    ASSERT_FALSE(String::parse_u64("12abc").has_value());
    ASSERT_FALSE(String::parse_u64("ff").has_value());
    ASSERT_FALSE(String::parse_u64("18446744073709551616").has_value());
    ASSERT_FALSE(String::parse_u64("0x10000000000000000").has_value());
}

// ---------------------------------------------------------------------------
// Hashing
// ---------------------------------------------------------------------------

/**
 * @brief Pins the DJB2 values; node ids already handed out depend on them.
 */
void test_consistent_hash_known_values()
{
    ASSERT_EQ(dataeater::infra::consistent_hash(""), std::uint64_t{5381});
    ASSERT_EQ(dataeater::infra::consistent_hash("a"), std::uint64_t{177670});
    ASSERT_EQ(dataeater::infra::consistent_hash("ab"), std::uint64_t{5863208});
}

void test_consistent_hash_high_bytes()
{
    // Bytes >= 0x80 hash as unsigned regardless of char signedness.
    std::string high(1, static_cast<char>(0xFF));
    ASSERT_EQ(dataeater::infra::consistent_hash(high), std::uint64_t{5381 * 33 + 255});
    ASSERT_NE(dataeater::infra::consistent_hash("ab"), dataeater::infra::consistent_hash("ba"));
}

// ---------------------------------------------------------------------------
// HostIdentity
// ---------------------------------------------------------------------------

void test_host_identity_reads_first_usable_source()
{
    HostIdTestDir dir;
    std::string blank = dir.write("blank", "  \n");
    std::string valid = dir.write("machine-id", "4c4c4544004d3610804cb4c04f4d3732\n");
    std::string later = dir.write("later", "ignored");
    std::string missing = (dir.path / "missing").string();

    std::string id = HostIdentity::read_from({missing, blank, valid, later});
    ASSERT_EQ(id, std::string("4c4c4544004d3610804cb4c04f4d3732"));
}

void test_host_identity_unavailable()
{
    HostIdTestDir dir;
    std::string blank = dir.write("blank", "\n");
    std::string missing = (dir.path / "missing").string();
    std::string directory = dir.path.string();

    ASSERT_THROWS(HostIdentity::read_from({missing, blank, directory}), HostIdentityUnavailable);
    ASSERT_THROWS(HostIdentity::read_from({}), HostIdentityUnavailable);
}

void test_host_identity_default_sources()
{
    const auto& sources = HostIdentity::default_sources();
    ASSERT_EQ(sources.size(), static_cast<size_t>(2));
    ASSERT_EQ(sources.front(), std::string("/etc/machine-id"));
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------

void test_logger_parse_level()
{
    ASSERT_TRUE(Logger::parse_level("trace") == LogLevel::TRACE);
    ASSERT_TRUE(Logger::parse_level(" DEBUG ") == LogLevel::DEBUG);
    ASSERT_TRUE(Logger::parse_level("Warn") == LogLevel::WARN);
    ASSERT_TRUE(Logger::parse_level("fatal") == LogLevel::FATAL);
    ASSERT_FALSE(Logger::parse_level("verbose").has_value());
}

void test_logger_threshold()
{
    LogLevel previous = Logger::level();

    Logger::set_level(LogLevel::WARN);
    ASSERT_FALSE(Logger::enabled(LogLevel::INFO));
    ASSERT_TRUE(Logger::enabled(LogLevel::WARN));
    ASSERT_TRUE(Logger::enabled(LogLevel::FATAL));

    // Filtered messages must be dropped quietly.
    Logger::log(LogLevel::DEBUG, "Test: this line is below the threshold.");

    Logger::set_level(previous);
    ASSERT_TRUE(Logger::level() == previous);
}
