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
 * @file value.hpp
 * @brief Scalar and composite values stored in documents, and document references.
 */

#pragma once

#include "dataeater/core/snowflake.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace dataeater::document {

/**
 * @class DocumentRef
 * @brief A pointer to another document, by identifier.
 *
 * References are only ever built from identifiers that a factory or a
 * validated raw value produced.
 */
class DocumentRef {
  public:
    explicit DocumentRef(core::Snowflake target) : target_(target) {}

    /// @brief The identifier of the referenced document.
    core::Snowflake target() const
    {
        return target_;
    }

    friend bool operator==(DocumentRef a, DocumentRef b)
    {
        return a.target_ == b.target_;
    }
    friend bool operator!=(DocumentRef a, DocumentRef b)
    {
        return a.target_ != b.target_;
    }
    friend bool operator<(DocumentRef a, DocumentRef b)
    {
        return a.target_ < b.target_;
    }
    friend bool operator>(DocumentRef a, DocumentRef b)
    {
        return b < a;
    }
    friend bool operator<=(DocumentRef a, DocumentRef b)
    {
        return !(b < a);
    }
    friend bool operator>=(DocumentRef a, DocumentRef b)
    {
        return !(a < b);
    }

  private:
    core::Snowflake target_;
};

/**
 * @enum ValueKind
 * @brief Discriminator of a `Value`, in the order of its alternatives.
 */
enum class ValueKind { EMPTY, BOOLEAN, FLOAT, INTEGER, STRING, BLOB, LIST, REFERENCE };

/**
 * @class Value
 * @brief A tagged union over every type a document field can hold.
 *
 * A default-constructed `Value` is empty. Values are built through the named
 * factories below so that literals like `1` or `"x"` never silently pick the
 * wrong alternative.
 */
class Value {
  public:
    using Blob = std::vector<std::uint8_t>;
    using List = std::vector<Value>;

    Value() = default;

    static Value boolean(bool v);
    static Value floating(double v);
    static Value integer(std::int64_t v);
    static Value string(std::string v);
    static Value blob(Blob v);
    static Value list(List v);
    static Value reference(DocumentRef v);

    ValueKind kind() const
    {
        return static_cast<ValueKind>(data_.index());
    }

    bool is_empty() const
    {
        return kind() == ValueKind::EMPTY;
    }

    /// @name Typed access
    /// Each accessor returns `nullptr` when the value holds another alternative.
    /// @{
    const bool* as_boolean() const
    {
        return std::get_if<bool>(&data_);
    }
    const double* as_float() const
    {
        return std::get_if<double>(&data_);
    }
    const std::int64_t* as_integer() const
    {
        return std::get_if<std::int64_t>(&data_);
    }
    const std::string* as_string() const
    {
        return std::get_if<std::string>(&data_);
    }
    const Blob* as_blob() const
    {
        return std::get_if<Blob>(&data_);
    }
    const List* as_list() const
    {
        return std::get_if<List>(&data_);
    }
    const DocumentRef* as_reference() const
    {
        return std::get_if<DocumentRef>(&data_);
    }
    /// @}

    friend bool operator==(const Value& a, const Value& b)
    {
        return a.data_ == b.data_;
    }
    friend bool operator!=(const Value& a, const Value& b)
    {
        return !(a == b);
    }

  private:
    using Storage =
        std::variant<std::monostate, bool, double, std::int64_t, std::string, Blob, List, DocumentRef>;

    explicit Value(Storage data) : data_(std::move(data)) {}

    Storage data_;
};

/// @brief Stable lowercase name of a value kind (e.g. `"integer"`).
const char* to_string(ValueKind kind);

} // namespace dataeater::document

namespace std {

template <> struct hash<dataeater::document::DocumentRef> {
    size_t operator()(const dataeater::document::DocumentRef& ref) const
    {
        return std::hash<dataeater::core::Snowflake>{}(ref.target());
    }
};

} // namespace std
