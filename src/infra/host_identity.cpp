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
 * @file host_identity.cpp
 * @brief File-backed host identifier lookup.
 */

#include "dataeater/infra/host_identity.hpp"

#include "dataeater/infra/logger.hpp"
#include "dataeater/infra/string.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace dataeater::infra {

const std::vector<std::string>& HostIdentity::default_sources()
{
    static const std::vector<std::string> sources = {
        "/etc/machine-id",
        "/var/lib/dbus/machine-id",
    };
    return sources;
}

std::string HostIdentity::get()
{
    return read_from(default_sources());
}

/**
 * @brief Probes each candidate in order and returns the first usable value.
 *
 * A candidate is skipped when it is not a regular file, cannot be opened, or
 * contains only whitespace. Skips are reported at TRACE level; the final
 * failure is left to the caller.
 */
std::string HostIdentity::read_from(const std::vector<std::string>& sources)
{
    for (const auto& path : sources) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            Logger::log(LogLevel::TRACE, "HostIdentity: '" + path + "' is not a regular file.");
            continue;
        }

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            Logger::log(LogLevel::TRACE, "HostIdentity: '" + path + "' could not be opened.");
            continue;
        }

        std::ostringstream buffer;
        buffer << file.rdbuf();
        std::string id = String::trim(buffer.str());

        if (id.empty()) {
            Logger::log(LogLevel::TRACE, "HostIdentity: '" + path + "' is empty.");
            continue;
        }

        Logger::log(LogLevel::DEBUG, "HostIdentity: Using host identifier from '" + path + "'.");
        return id;
    }

    throw HostIdentityUnavailable("could not read a host identifier from any of " +
                                  std::to_string(sources.size()) + " source(s)");
}

} // namespace dataeater::infra
