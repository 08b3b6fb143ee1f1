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
 * @file document.cpp
 * @brief Ordered field map operations of `Document`.
 *
 * @details
 * Fields live in a flat vector and are found by linear scan. Documents carry
 * few fields, and the vector gives insertion order for free.
 */

#include "dataeater/document/document.hpp"

#include <algorithm>

namespace dataeater::document {

std::vector<Document::Field>::iterator Document::find(const std::string& name)
{
    return std::find_if(fields_.begin(), fields_.end(),
                        [&name](const Field& f) { return f.first == name; });
}

std::vector<Document::Field>::const_iterator Document::find(const std::string& name) const
{
    return std::find_if(fields_.begin(), fields_.end(),
                        [&name](const Field& f) { return f.first == name; });
}

bool Document::set_field(const std::string& name, Document value)
{
    auto it = find(name);
    if (it != fields_.end()) {
        it->second = std::move(value);
        return false;
    }
    fields_.emplace_back(name, std::move(value));
    return true;
}

const Document* Document::field(const std::string& name) const
{
    auto it = find(name);
    return it == fields_.end() ? nullptr : &it->second;
}

Document* Document::field(const std::string& name)
{
    auto it = find(name);
    return it == fields_.end() ? nullptr : &it->second;
}

bool Document::remove_field(const std::string& name)
{
    auto it = find(name);
    if (it == fields_.end()) {
        return false;
    }
    fields_.erase(it);
    return true;
}

bool operator==(const Document& a, const Document& b)
{
    if (a.id_ != b.id_ || a.fields_.size() != b.fields_.size()) {
        return false;
    }
    for (const auto& [name, value] : a.fields_) {
        const Document* other = b.field(name);
        if (!other || *other != value) {
            return false;
        }
    }
    return true;
}

} // namespace dataeater::document
