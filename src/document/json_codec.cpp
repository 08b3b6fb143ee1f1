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
 * @file json_codec.cpp
 * @brief cJSON-backed encoders and decoders for `Value` and `Document`.
 */

#include "dataeater/document/json_codec.hpp"

#include "dataeater/infra/string.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace dataeater::document {

namespace {

/// Largest magnitude an IEEE double represents exactly for every integer up to it.
constexpr std::int64_t kMaxExactDouble = std::int64_t{1} << 53;

/// Largest magnitude written as a JSON number. cJSON prints with 15 significant digits.
constexpr std::int64_t kMaxJsonNumber = 999999999999999;

constexpr const char* kTagEmpty = "Empty";
constexpr const char* kTagBoolean = "Boolean";
constexpr const char* kTagFloat = "Float";
constexpr const char* kTagInteger = "Integer";
constexpr const char* kTagString = "String";
constexpr const char* kTagBlob = "Blob";
constexpr const char* kTagList = "List";
constexpr const char* kTagReference = "Reference";

/// cJSON copies C strings, so an embedded NUL would silently cut the text short.
void require_no_nul(std::string_view text, const char* what)
{
    if (text.find('\0') != std::string_view::npos) {
        throw DocumentFormatError(std::string(what) + ": embedded NUL characters cannot be encoded");
    }
}

/// Creates an object holding a single `tag: payload` member, taking ownership of payload.
cJSON* tagged(const char* tag, cJSON* payload)
{
    ScopedJson guard(payload);
    ScopedJson obj(cJSON_CreateObject());
    if (!obj.get() || !guard.get()) {
        throw DocumentFormatError("JSON encode: allocation failed");
    }
    cJSON_AddItemToObject(obj.get(), tag, guard.release());
    return obj.release();
}

cJSON* integer_to_cjson(std::int64_t v)
{
    if (v >= -kMaxJsonNumber && v <= kMaxJsonNumber) {
        return cJSON_CreateNumber(static_cast<double>(v));
    }
    return cJSON_CreateString(std::to_string(v).c_str());
}

std::int64_t integer_from_cjson(const cJSON* node)
{
    if (cJSON_IsNumber(node)) {
        double d = node->valuedouble;
        // 2^53 itself is excluded: 2^53 + 1 parses to the same double.
        if (!std::isfinite(d) || std::trunc(d) != d ||
            std::fabs(d) >= static_cast<double>(kMaxExactDouble)) {
            throw DocumentFormatError("Integer: number is not an exactly representable integer");
        }
        return static_cast<std::int64_t>(d);
    }

    if (cJSON_IsString(node) && node->valuestring) {
        std::string_view text = node->valuestring;
        bool negative = !text.empty() && text.front() == '-';
        if (negative) {
            text.remove_prefix(1);
        }
        if (text.size() > 1 && (text[1] == 'x' || text[1] == 'X')) {
            throw DocumentFormatError("Integer: expected a decimal string");
        }

        auto magnitude = infra::String::parse_u64(text);
        constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        if (!magnitude || *magnitude > kMax + (negative ? 1 : 0)) {
            throw DocumentFormatError("Integer: '" + std::string(node->valuestring) +
                                      "' is not a 64-bit integer");
        }
        if (negative) {
            // Two's complement negation handles INT64_MIN without overflow.
            return static_cast<std::int64_t>(~*magnitude + 1);
        }
        return static_cast<std::int64_t>(*magnitude);
    }

    throw DocumentFormatError("Integer: expected a number or a decimal string");
}

double float_from_cjson(const cJSON* node)
{
    if (!cJSON_IsNumber(node)) {
        throw DocumentFormatError("Float: expected a number");
    }
    if (!std::isfinite(node->valuedouble)) {
        throw DocumentFormatError("Float: value is out of the finite double range");
    }
    return node->valuedouble;
}

Value::Blob blob_from_cjson(const cJSON* node)
{
    if (!cJSON_IsArray(node)) {
        throw DocumentFormatError("Blob: expected an array of bytes");
    }
    Value::Blob bytes;
    bytes.reserve(static_cast<std::size_t>(cJSON_GetArraySize(node)));

    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, node)
    {
        if (!cJSON_IsNumber(item)) {
            throw DocumentFormatError("Blob: element is not a number");
        }
        double d = item->valuedouble;
        if (std::trunc(d) != d || d < 0 || d > 255) {
            throw DocumentFormatError("Blob: element is not a byte");
        }
        bytes.push_back(static_cast<std::uint8_t>(d));
    }
    return bytes;
}

} // namespace

std::string id_to_json_string(core::Snowflake id)
{
    return std::to_string(id.to_raw());
}

core::Snowflake id_from_json_string(std::string_view text)
{
    if (text.size() > 1 && (text[1] == 'x' || text[1] == 'X')) {
        throw DocumentFormatError("Identifier: expected a decimal string");
    }
    auto raw = infra::String::parse_u64(text);
    if (!raw) {
        throw DocumentFormatError("Identifier: '" + std::string(text) +
                                  "' is not an unsigned 64-bit integer");
    }
    auto id = core::Snowflake::try_from_raw(*raw);
    if (!id) {
        throw DocumentFormatError("Identifier: '" + std::string(text) +
                                  "' has the reserved bit set");
    }
    return *id;
}

cJSON* to_cjson(const Value& value)
{
    switch (value.kind()) {
    case ValueKind::EMPTY:
        return cJSON_CreateString(kTagEmpty);

    case ValueKind::BOOLEAN:
        return tagged(kTagBoolean, cJSON_CreateBool(*value.as_boolean() ? 1 : 0));

    case ValueKind::FLOAT: {
        double d = *value.as_float();
        if (!std::isfinite(d)) {
            throw DocumentFormatError("Float: NaN and infinity have no JSON representation");
        }
        return tagged(kTagFloat, cJSON_CreateNumber(d));
    }

    case ValueKind::INTEGER:
        return tagged(kTagInteger, integer_to_cjson(*value.as_integer()));

    case ValueKind::STRING:
        require_no_nul(*value.as_string(), kTagString);
        return tagged(kTagString, cJSON_CreateString(value.as_string()->c_str()));

    case ValueKind::BLOB: {
        ScopedJson arr(cJSON_CreateArray());
        for (std::uint8_t b : *value.as_blob()) {
            cJSON_AddItemToArray(arr.get(), cJSON_CreateNumber(b));
        }
        return tagged(kTagBlob, arr.release());
    }

    case ValueKind::LIST: {
        ScopedJson arr(cJSON_CreateArray());
        for (const Value& item : *value.as_list()) {
            cJSON_AddItemToArray(arr.get(), to_cjson(item));
        }
        return tagged(kTagList, arr.release());
    }

    case ValueKind::REFERENCE:
        return tagged(kTagReference,
                      cJSON_CreateString(id_to_json_string(value.as_reference()->target()).c_str()));
    }

    throw DocumentFormatError("JSON encode: unknown value kind");
}

/**
 * @details
 * Decoding rules:
 * 1. The bare string `"Empty"` is the empty value.
 * 2. Anything else must be an object with exactly one member whose key is a
 *    known tag (case-sensitive).
 * 3. The member's payload is checked against the tag's expected JSON type.
 */
Value value_from_cjson(const cJSON* node)
{
    if (!node) {
        throw DocumentFormatError("Value: missing node");
    }

    if (cJSON_IsString(node)) {
        if (node->valuestring && std::string_view(node->valuestring) == kTagEmpty) {
            return Value();
        }
        throw DocumentFormatError("Value: the only bare string form is \"Empty\"");
    }

    if (!cJSON_IsObject(node) || !node->child || node->child->next) {
        throw DocumentFormatError("Value: expected an object with exactly one tag");
    }

    const cJSON* payload = node->child;
    std::string_view tag = payload->string ? payload->string : "";

    if (tag == kTagBoolean) {
        if (!cJSON_IsBool(payload)) {
            throw DocumentFormatError("Boolean: expected true or false");
        }
        return Value::boolean(cJSON_IsTrue(payload));
    }
    if (tag == kTagFloat) {
        return Value::floating(float_from_cjson(payload));
    }
    if (tag == kTagInteger) {
        return Value::integer(integer_from_cjson(payload));
    }
    if (tag == kTagString) {
        if (!cJSON_IsString(payload) || !payload->valuestring) {
            throw DocumentFormatError("String: expected a string");
        }
        return Value::string(payload->valuestring);
    }
    if (tag == kTagBlob) {
        return Value::blob(blob_from_cjson(payload));
    }
    if (tag == kTagList) {
        if (!cJSON_IsArray(payload)) {
            throw DocumentFormatError("List: expected an array");
        }
        Value::List items;
        const cJSON* item = nullptr;
        cJSON_ArrayForEach(item, payload)
        {
            items.push_back(value_from_cjson(item));
        }
        return Value::list(std::move(items));
    }
    if (tag == kTagReference) {
        if (!cJSON_IsString(payload) || !payload->valuestring) {
            throw DocumentFormatError("Reference: expected a decimal identifier string");
        }
        return Value::reference(DocumentRef(id_from_json_string(payload->valuestring)));
    }

    throw DocumentFormatError("Value: unknown tag '" + std::string(tag) + "'");
}

cJSON* to_cjson(const Document& doc)
{
    ScopedJson obj(cJSON_CreateObject());
    ScopedJson fields(cJSON_CreateObject());
    if (!obj.get() || !fields.get()) {
        throw DocumentFormatError("JSON encode: allocation failed");
    }

    cJSON_AddStringToObject(obj.get(), "_id", id_to_json_string(doc.id()).c_str());

    for (const auto& [name, child] : doc.fields()) {
        require_no_nul(name, "Field name");
        cJSON_AddItemToObject(fields.get(), name.c_str(), to_cjson(child));
    }
    cJSON_AddItemToObject(obj.get(), "fields", fields.release());

    return obj.release();
}

Document document_from_cjson(const cJSON* node)
{
    if (!cJSON_IsObject(node)) {
        throw DocumentFormatError("Document: expected an object");
    }

    const cJSON* id_node = cJSON_GetObjectItemCaseSensitive(node, "_id");
    if (!cJSON_IsString(id_node) || !id_node->valuestring) {
        throw DocumentFormatError("Document: '_id' must be a decimal identifier string");
    }
    Document doc(id_from_json_string(id_node->valuestring));

    const cJSON* fields = cJSON_GetObjectItemCaseSensitive(node, "fields");
    if (!fields) {
        return doc;
    }
    if (!cJSON_IsObject(fields)) {
        throw DocumentFormatError("Document: 'fields' must be an object");
    }

    const cJSON* child = nullptr;
    cJSON_ArrayForEach(child, fields)
    {
        doc.set_field(child->string, document_from_cjson(child));
    }
    return doc;
}

std::string to_json(const Value& value)
{
    ScopedJson tree(to_cjson(value));
    ScopedJsonString text(cJSON_PrintUnformatted(tree.get()));
    if (!text.get()) {
        throw DocumentFormatError("JSON encode: printing failed");
    }
    return text.to_string();
}

std::string to_json(const Document& doc)
{
    ScopedJson tree(to_cjson(doc));
    ScopedJsonString text(cJSON_PrintUnformatted(tree.get()));
    if (!text.get()) {
        throw DocumentFormatError("JSON encode: printing failed");
    }
    return text.to_string();
}

namespace {

/// Parses a complete JSON text; trailing non-whitespace or an embedded NUL is an error.
cJSON* parse_strict(std::string_view json)
{
    if (json.find('\0') != std::string_view::npos) {
        throw DocumentFormatError("JSON parse: input contains a NUL character");
    }
    std::string buffer(json);
    const char* end = nullptr;
    cJSON* root = cJSON_ParseWithOpts(buffer.c_str(), &end, 1);
    if (!root) {
        throw DocumentFormatError("JSON parse: malformed input");
    }
    return root;
}

} // namespace

Value value_from_json(std::string_view json)
{
    ScopedJson root(parse_strict(json));
    return value_from_cjson(root.get());
}

Document document_from_json(std::string_view json)
{
    ScopedJson root(parse_strict(json));
    return document_from_cjson(root.get());
}

} // namespace dataeater::document
