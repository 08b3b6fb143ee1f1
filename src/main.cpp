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
 * @file main.cpp
 * @brief Command line front end for the identifier generator.
 *
 * @details
 * Startup sequence:
 * 1. Option parsing (`--log-level`, `--host-id`, `--help`).
 * 2. Logger configuration (option, then `DATAEATER_LOG_LEVEL`, then INFO).
 * 3. Command dispatch (`generate`, `decompose`, `node-id`, `bench`).
 */

#include "dataeater/core/snowflake.hpp"
#include "dataeater/core/snowflake_factory.hpp"
#include "dataeater/infra/host_identity.hpp"
#include "dataeater/infra/logger.hpp"
#include "dataeater/infra/string.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using dataeater::core::Snowflake;
using dataeater::core::SnowflakeFactory;
using dataeater::infra::Logger;
using dataeater::infra::LogLevel;
using dataeater::infra::String;

namespace {

/// @brief Parsed command line.
struct Options {
    std::optional<std::string> log_level;
    std::optional<std::string> host_id;
    std::string command;
    std::vector<std::string> args;
    bool help = false;
};

constexpr std::uint64_t kDefaultBenchIterations = 1000000;

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [OPTIONS] <COMMAND> [ARGS]\n"
              << "Commands:\n"
              << "  generate [COUNT]     Print COUNT new identifiers (Default: 1)\n"
              << "  decompose <RAW>      Split a raw identifier (decimal or 0x hex) into fields\n"
              << "  node-id              Print the node id derived for this host\n"
              << "  bench [ITERATIONS]   Time factory creation, next() and decompose()\n"
              << "                       (Default: " << kDefaultBenchIterations << ")\n"
              << "Options:\n"
              << "  --log-level=LEVEL    trace|debug|info|warn|error|fatal (Default: info,\n"
              << "                       or $DATAEATER_LOG_LEVEL when set)\n"
              << "  --host-id=STRING     Use STRING instead of the OS machine id\n"
              << "  --help               Show this help message\n";
}

Options parse_options(int argc, char* argv[])
{
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg.rfind("--log-level=", 0) == 0) {
            opts.log_level = arg.substr(12);
        } else if (arg.rfind("--host-id=", 0) == 0) {
            opts.host_id = arg.substr(10);
        } else if (arg.rfind("--", 0) == 0) {
            throw std::invalid_argument("unknown option '" + arg + "'");
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.args.push_back(arg);
        }
    }
    return opts;
}

void configure_logging(const Options& opts)
{
    std::string name = "info";
    if (opts.log_level) {
        name = *opts.log_level;
    } else if (const char* env = std::getenv("DATAEATER_LOG_LEVEL")) {
        name = env;
    }

    auto level = Logger::parse_level(name);
    if (!level) {
        throw std::invalid_argument("unknown log level '" + name + "'");
    }
    Logger::set_level(*level);
}

std::uint64_t count_argument(const Options& opts, std::uint64_t fallback)
{
    if (opts.args.empty()) {
        return fallback;
    }
    auto value = String::parse_u64(opts.args.front());
    if (!value) {
        throw std::invalid_argument("'" + opts.args.front() + "' is not a non-negative integer");
    }
    return *value;
}

SnowflakeFactory make_factory(const Options& opts)
{
    if (opts.host_id) {
        return SnowflakeFactory(*opts.host_id);
    }
    return SnowflakeFactory();
}

std::string format_utc(std::chrono::system_clock::time_point tp)
{
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t seconds = static_cast<std::time_t>(millis / 1000);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0')
       << (millis % 1000) << "Z";
    return ss.str();
}

int cmd_generate(const Options& opts)
{
    std::uint64_t count = count_argument(opts, 1);
    SnowflakeFactory factory = make_factory(opts);

    for (std::uint64_t i = 0; i < count; ++i) {
        Snowflake id = factory.next();
        std::cout << id.to_raw() << " " << id << "\n";
    }
    std::cout.flush();
    return 0;
}

int cmd_decompose(const Options& opts)
{
    if (opts.args.empty()) {
        throw std::invalid_argument("decompose requires a raw identifier");
    }

    auto raw = String::parse_u64(opts.args.front());
    if (!raw) {
        throw std::invalid_argument("'" + opts.args.front() + "' is not an unsigned 64-bit integer");
    }

    Snowflake id = Snowflake::from_raw(*raw);
    auto fields = id.decompose();

    std::cout << "raw:       " << id.to_raw() << "\n"
              << "timestamp: " << fields.timestamp << " (" << format_utc(id.timestamp()) << ")\n"
              << "node_id:   " << fields.node_id << "\n"
              << "sequence:  " << fields.sequence << std::endl;
    return 0;
}

int cmd_node_id(const Options& opts)
{
    std::string host_id = opts.host_id ? *opts.host_id : dataeater::infra::HostIdentity::get();
    std::cout << SnowflakeFactory::derive_node_id(host_id) << std::endl;
    return 0;
}

/// @brief Runs @p body @p iterations times and prints the mean cost per call.
template <typename Body> void time_it(const std::string& name, std::uint64_t iterations, Body body)
{
    auto start = std::chrono::steady_clock::now();
    for (std::uint64_t i = 0; i < iterations; ++i) {
        body();
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
                       std::chrono::steady_clock::now() - start)
                       .count();

    double per_op = iterations ? static_cast<double>(elapsed) / iterations : 0.0;
    std::cout << std::left << std::setw(10) << name << std::right << std::fixed
              << std::setprecision(1) << std::setw(12) << per_op << " ns/op  (" << iterations
              << " iterations)" << std::endl;
}

int cmd_bench(const Options& opts)
{
    std::uint64_t iterations = count_argument(opts, kDefaultBenchIterations);
    volatile std::uint64_t sink = 0;

    // Construction re-reads the host identity each time; fewer rounds keep it bounded.
    time_it("new", iterations / 100, [&] { sink = sink + make_factory(opts).node_id(); });

    SnowflakeFactory factory = make_factory(opts);
    time_it("next", iterations, [&] { sink = sink + factory.next().to_raw(); });

    Snowflake id = factory.next();
    time_it("decompose", iterations, [&] { sink = sink + id.decompose().sequence; });

    Logger::log(LogLevel::DEBUG, "Bench: checksum " + std::to_string(sink));
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    try {
        Options opts = parse_options(argc, argv);
        if (opts.help || opts.command.empty()) {
            print_help(argv[0]);
            return opts.help ? 0 : 1;
        }

        configure_logging(opts);
        Logger::log(LogLevel::DEBUG, "System: Running command '" + opts.command + "'.");

        if (opts.command == "generate")
            return cmd_generate(opts);
        if (opts.command == "decompose")
            return cmd_decompose(opts);
        if (opts.command == "node-id")
            return cmd_node_id(opts);
        if (opts.command == "bench")
            return cmd_bench(opts);

        throw std::invalid_argument("unknown command '" + opts.command + "'");

    } catch (const dataeater::infra::HostIdentityUnavailable& e) {
        Logger::log(LogLevel::FATAL,
                    "System: Host identity unavailable: " + std::string(e.what()) +
                        ". Pass --host-id to supply one.");
        return 1;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: " + std::string(e.what()));
        return 1;
    }
}
