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
 * @file json_codec.hpp
 * @brief JSON serialization of documents and values, built on cJSON.
 *
 * @details
 * ## Shapes
 * - **Identifiers** are written as decimal strings (`"1234"`). cJSON stores
 *   numbers as IEEE doubles, which cannot hold all 63 identifier bits.
 * - **Values** are externally tagged, one key per object:
 *   `"Empty"`, `{"Boolean":true}`, `{"Float":1.5}`, `{"Integer":7}`,
 *   `{"String":"x"}`, `{"Blob":[0,255]}`, `{"List":[...]}`,
 *   `{"Reference":"1234"}`. Integers with more than 15 digits are written
 *   as decimal strings; numbers below +/-2^53 and strings are both read back.
 * - Strings and field names must not contain NUL characters, and floats
 *   must be finite, in both directions.
 * - **Documents** are `{"_id":"1234","fields":{"name":{...}}}`, with fields
 *   in insertion order.
 *
 * ## Ownership
 * cJSON trees and printed buffers are held by the RAII guards below from the
 * moment they are allocated, so no exit path can leak them.
 */

#pragma once

#include "dataeater/document/document.hpp"
#include "dataeater/document/value.hpp"

#include <cJSON.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dataeater::document {

/**
 * @class DocumentFormatError
 * @brief Raised when JSON text does not describe a valid `Document` or `Value`.
 */
class DocumentFormatError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ScopedJson
 * @brief Owns a cJSON tree and deletes it on scope exit.
 */
class ScopedJson {
  public:
    explicit ScopedJson(cJSON* node) : node_(node) {}

    ScopedJson(const ScopedJson&) = delete;
    ScopedJson& operator=(const ScopedJson&) = delete;

    ~ScopedJson()
    {
        if (node_) {
            cJSON_Delete(node_);
        }
    }

    cJSON* get() const
    {
        return node_;
    }

    /// Gives up ownership, e.g. after attaching the node to a parent.
    cJSON* release()
    {
        cJSON* node = node_;
        node_ = nullptr;
        return node;
    }

  private:
    cJSON* node_;
};

/**
 * @class ScopedJsonString
 * @brief Owns a buffer returned by `cJSON_Print*` and frees it on scope exit.
 */
class ScopedJsonString {
  public:
    explicit ScopedJsonString(char* raw) : ptr_(raw) {}

    ScopedJsonString(const ScopedJsonString&) = delete;
    ScopedJsonString& operator=(const ScopedJsonString&) = delete;

    ~ScopedJsonString()
    {
        if (ptr_) {
            cJSON_free(ptr_);
        }
    }

    const char* get() const
    {
        return ptr_;
    }

    /// Copies the buffer into a `std::string`. Null becomes an empty string.
    std::string to_string() const
    {
        return ptr_ ? std::string(ptr_) : std::string();
    }

  private:
    char* ptr_;
};

// ------------------------------------------------------------------------
// Tree-level conversion (caller owns the returned cJSON*)
// ------------------------------------------------------------------------

/// @throws DocumentFormatError If a float is NaN or infinite, or a string holds a NUL.
cJSON* to_cjson(const Value& value);

/// @throws DocumentFormatError If a field name holds a NUL or a nested value cannot be encoded.
cJSON* to_cjson(const Document& doc);

/// @throws DocumentFormatError On any shape violation.
Value value_from_cjson(const cJSON* node);

/// @throws DocumentFormatError On any shape violation or invalid identifier.
Document document_from_cjson(const cJSON* node);

// ------------------------------------------------------------------------
// Text-level conversion
// ------------------------------------------------------------------------

/// @brief Serializes a value to compact JSON text.
std::string to_json(const Value& value);

/// @brief Serializes a document to compact JSON text.
std::string to_json(const Document& doc);

/// @throws DocumentFormatError If @p json is not valid JSON or not a value.
Value value_from_json(std::string_view json);

/// @throws DocumentFormatError If @p json is not valid JSON or not a document.
Document document_from_json(std::string_view json);

/// @brief Decimal string form of an identifier, as used in JSON.
std::string id_to_json_string(core::Snowflake id);

/// @throws DocumentFormatError If @p text is not a decimal id with bit 63 clear.
core::Snowflake id_from_json_string(std::string_view text);

} // namespace dataeater::document
