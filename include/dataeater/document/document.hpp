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
 * @file document.hpp
 * @brief The document record: an identifier plus an ordered tree of fields.
 */

#pragma once

#include "dataeater/core/snowflake.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace dataeater::document {

/**
 * @class Document
 * @brief A single entity, keyed by a `Snowflake`, holding named sub-documents.
 *
 * @details
 * Fields keep their insertion order. Replacing an existing field keeps its
 * position; removing one shifts the later fields up. Equality compares the
 * identifier and the field contents, ignoring field order.
 */
class Document {
  public:
    using Field = std::pair<std::string, Document>;

    explicit Document(core::Snowflake id) : id_(id) {}

    /// @brief The primary key of this document.
    core::Snowflake id() const
    {
        return id_;
    }

    /**
     * @brief Sets a field, replacing an existing one in place.
     *
     * @return true If the field was newly appended, false if it was replaced.
     */
    bool set_field(const std::string& name, Document value);

    /// @brief Returns the named field, or `nullptr` if absent.
    const Document* field(const std::string& name) const;

    /// @brief Mutable variant of `field()`.
    Document* field(const std::string& name);

    bool contains(const std::string& name) const
    {
        return field(name) != nullptr;
    }

    /**
     * @brief Removes a field, preserving the order of the others.
     *
     * @return true If a field was removed.
     */
    bool remove_field(const std::string& name);

    /// @brief All fields in insertion order.
    const std::vector<Field>& fields() const
    {
        return fields_;
    }

    std::size_t size() const
    {
        return fields_.size();
    }

    bool empty() const
    {
        return fields_.empty();
    }

    friend bool operator==(const Document& a, const Document& b);
    friend bool operator!=(const Document& a, const Document& b)
    {
        return !(a == b);
    }

  private:
    std::vector<Field>::iterator find(const std::string& name);
    std::vector<Field>::const_iterator find(const std::string& name) const;

    core::Snowflake id_;
    std::vector<Field> fields_;
};

} // namespace dataeater::document
