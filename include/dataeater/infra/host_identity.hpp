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
 * @file host_identity.hpp
 * @brief Access to the operating system's stable per-host identifier.
 *
 * @details
 * The identifier factory needs an opaque, stable byte string that differs
 * between machines. On Linux this is the systemd/D-Bus machine id, a
 * 32-character hex string generated at install time. Its format is not
 * interpreted here; only availability and stability matter.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace dataeater::infra {

/**
 * @class HostIdentityUnavailable
 * @brief Raised when no host identifier source yields a usable value.
 *
 * This is a startup failure: without a host identifier no node id can be
 * derived, and no identifiers can be generated.
 */
class HostIdentityUnavailable : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @class HostIdentity
 * @brief Reads the host identifier from a prioritized list of files.
 */
class HostIdentity {
  public:
    /**
     * @brief The default candidate files, in priority order.
     *
     * - `/etc/machine-id` (systemd)
     * - `/var/lib/dbus/machine-id` (D-Bus, older distributions)
     */
    static const std::vector<std::string>& default_sources();

    /**
     * @brief Returns the host identifier from the default sources.
     *
     * @throws HostIdentityUnavailable If none of the sources can be read.
     */
    static std::string get();

    /**
     * @brief Returns the trimmed content of the first readable, non-empty file.
     *
     * @param sources Candidate file paths, tried in order.
     * @return std::string The identifier with surrounding whitespace removed.
     * @throws HostIdentityUnavailable If every candidate is missing, unreadable or blank.
     */
    static std::string read_from(const std::vector<std::string>& sources);
};

} // namespace dataeater::infra
