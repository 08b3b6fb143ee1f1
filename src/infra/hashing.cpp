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
 * @file hashing.cpp
 * @brief DJB2 content hash.
 */

#include "dataeater/infra/hashing.hpp"

namespace dataeater::infra {

std::uint64_t consistent_hash(std::string_view bytes)
{
    std::uint64_t hash = kDjb2Seed;
    for (char c : bytes)
        hash = ((hash << 5) + hash) + static_cast<unsigned char>(c);
    return hash;
}

} // namespace dataeater::infra
