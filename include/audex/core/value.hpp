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
 * @brief Scalar field values and the ordered field containers built on them.
 *
 * @details
 * Entities expose their persistent state as a `FieldMap` (field name -> scalar).
 * The unit of work reports edits as a `FieldChangeSet` (field name -> old/new pair).
 * Both keep insertion order, which is the order fields appear in audit payloads.
 */

#pragma once

#include <cJSON.h>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace audex::core {

/**
 * @class Value
 * @brief A nullable scalar: boolean, integer, double or UTF-8 string.
 */
class Value {
  public:
    enum class Type { Null, Bool, Integer, Double, String };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : data_(b) {}
    Value(int i) : data_(static_cast<std::int64_t>(i)) {}
    Value(std::int64_t i) : data_(i) {}
    Value(double d) : data_(d) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}

    Type type() const { return static_cast<Type>(data_.index()); }
    bool is_null() const { return type() == Type::Null; }
    bool is_string() const { return type() == Type::String; }

    /// @throws std::bad_variant_access If the value holds another type.
    bool as_bool() const { return std::get<bool>(data_); }
    std::int64_t as_integer() const { return std::get<std::int64_t>(data_); }
    double as_double() const { return std::get<double>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }

    /// @brief Human-readable rendering for diagnostics (`null`, `true`, `42`, `"x"`).
    std::string to_display() const;

    /**
     * @brief Converts to a freshly allocated cJSON node.
     *
     * @warning The caller owns the returned node.
     */
    cJSON* to_json() const;

    /**
     * @brief Reads a scalar cJSON node.
     *
     * Numbers without a fractional part become integers. Arrays, objects and
     * `nullptr` read as null.
     */
    static Value from_json(const cJSON* node);

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

  private:
    std::variant<std::monostate, bool, std::int64_t, double, std::string> data_;
};

/**
 * @class FieldMap
 * @brief Insertion-ordered mapping of field name to value.
 */
class FieldMap {
  public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    FieldMap() = default;
    FieldMap(std::initializer_list<Entry> entries);

    /// @brief Inserts or replaces; a replaced field keeps its original position.
    void set(const std::string& name, Value value);

    /// @brief Returns the value of `name`, or `nullptr` if absent.
    const Value* find(const std::string& name) const;

    bool contains(const std::string& name) const { return find(name) != nullptr; }
    bool erase(const std::string& name);

    std::vector<std::string> keys() const;

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    /// @brief Serializes as a JSON object. The caller owns the result.
    cJSON* to_json() const;

    /// @brief Reads a JSON object; non-object input yields an empty map.
    static FieldMap from_json(const cJSON* object);

    bool operator==(const FieldMap& other) const { return entries_ == other.entries_; }
    bool operator!=(const FieldMap& other) const { return !(*this == other); }

  private:
    std::vector<Entry> entries_;
};

/**
 * @struct FieldChange
 * @brief Previous and new value of one edited field.
 */
struct FieldChange {
    Value old_value;
    Value new_value;
};

/// @brief Edited fields of one entity, in field declaration order.
using FieldChangeSet = std::vector<std::pair<std::string, FieldChange>>;

} // namespace audex::core
