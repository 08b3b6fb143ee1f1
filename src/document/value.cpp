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

#include "dataeater/document/value.hpp"

namespace dataeater::document {

Value Value::boolean(bool v)
{
    return Value(Storage(std::in_place_type<bool>, v));
}

Value Value::floating(double v)
{
    return Value(Storage(std::in_place_type<double>, v));
}

Value Value::integer(std::int64_t v)
{
    return Value(Storage(std::in_place_type<std::int64_t>, v));
}

Value Value::string(std::string v)
{
    return Value(Storage(std::in_place_type<std::string>, std::move(v)));
}

Value Value::blob(Blob v)
{
    return Value(Storage(std::in_place_type<Blob>, std::move(v)));
}

Value Value::list(List v)
{
    return Value(Storage(std::in_place_type<List>, std::move(v)));
}

Value Value::reference(DocumentRef v)
{
    return Value(Storage(std::in_place_type<DocumentRef>, v));
}

const char* to_string(ValueKind kind)
{
    switch (kind) {
    case ValueKind::EMPTY:
        return "empty";
    case ValueKind::BOOLEAN:
        return "boolean";
    case ValueKind::FLOAT:
        return "float";
    case ValueKind::INTEGER:
        return "integer";
    case ValueKind::STRING:
        return "string";
    case ValueKind::BLOB:
        return "blob";
    case ValueKind::LIST:
        return "list";
    case ValueKind::REFERENCE:
        return "reference";
    }
    return "unknown";
}

} // namespace dataeater::document
