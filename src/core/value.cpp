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
 * @file value.cpp
 * @brief Value rendering, cJSON bridging and ordered map operations.
 */

#include "audex/core/value.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace audex::core {

std::string Value::to_display() const
{
    switch (type()) {
    case Type::Null:
        return "null";
    case Type::Bool:
        return as_bool() ? "true" : "false";
    case Type::Integer:
        return std::to_string(as_integer());
    case Type::Double: {
        std::ostringstream ss;
        ss << as_double();
        return ss.str();
    }
    case Type::String:
        return "\"" + as_string() + "\"";
    }
    return "null";
}

cJSON* Value::to_json() const
{
    switch (type()) {
    case Type::Null:
        return cJSON_CreateNull();
    case Type::Bool:
        return cJSON_CreateBool(as_bool());
    case Type::Integer:
        return cJSON_CreateNumber(static_cast<double>(as_integer()));
    case Type::Double:
        return cJSON_CreateNumber(as_double());
    case Type::String:
        return cJSON_CreateString(as_string().c_str());
    }
    return cJSON_CreateNull();
}

Value Value::from_json(const cJSON* node)
{
    if (node == nullptr || cJSON_IsNull(node))
        return Value();
    if (cJSON_IsBool(node))
        return Value(static_cast<bool>(cJSON_IsTrue(node)));
    if (cJSON_IsString(node) && node->valuestring != nullptr)
        return Value(std::string(node->valuestring));
    if (cJSON_IsNumber(node)) {
        double d = node->valuedouble;
        // 2^53: beyond this a double no longer represents every integer exactly.
        constexpr double kExactLimit = 9007199254740992.0;
        if (std::trunc(d) == d && std::fabs(d) <= kExactLimit)
            return Value(static_cast<std::int64_t>(d));
        return Value(d);
    }
    return Value();
}

FieldMap::FieldMap(std::initializer_list<Entry> entries)
{
    for (const auto& e : entries)
        set(e.first, e.second);
}

void FieldMap::set(const std::string& name, Value value)
{
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&name](const Entry& e) { return e.first == name; });
    if (it != entries_.end()) {
        it->second = std::move(value);
        return;
    }
    entries_.emplace_back(name, std::move(value));
}

const Value* FieldMap::find(const std::string& name) const
{
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&name](const Entry& e) { return e.first == name; });
    return it == entries_.end() ? nullptr : &it->second;
}

bool FieldMap::erase(const std::string& name)
{
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&name](const Entry& e) { return e.first == name; });
    if (it == entries_.end())
        return false;
    entries_.erase(it);
    return true;
}

std::vector<std::string> FieldMap::keys() const
{
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [name, value] : entries_)
        out.push_back(name);
    return out;
}

cJSON* FieldMap::to_json() const
{
    cJSON* obj = cJSON_CreateObject();
    for (const auto& [name, value] : entries_)
        cJSON_AddItemToObject(obj, name.c_str(), value.to_json());
    return obj;
}

FieldMap FieldMap::from_json(const cJSON* object)
{
    FieldMap out;
    if (!cJSON_IsObject(object))
        return out;

    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, object)
    {
        if (item->string != nullptr)
            out.set(item->string, Value::from_json(item));
    }
    return out;
}

} // namespace audex::core
