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
 * @file entity.cpp
 * @brief Kind table, subtype closure and the `Entity` base implementation.
 */

#include "audex/core/entity.hpp"

#include <array>
#include <stdexcept>

namespace audex::core {

namespace {

struct KindInfo {
    EntityKind kind;
    const char* name;
    std::optional<EntityKind> parent;
};

// Indexed by enumerator value.
const std::array<KindInfo, kEntityKindCount> kKinds = {{
    {EntityKind::DBElement, "DBElement", std::nullopt},
    {EntityKind::Attachment, "Attachment", EntityKind::DBElement},
    {EntityKind::PartAttachment, "PartAttachment", EntityKind::Attachment},
    {EntityKind::UserAttachment, "UserAttachment", EntityKind::Attachment},
    {EntityKind::AttachmentType, "AttachmentType", EntityKind::DBElement},
    {EntityKind::Part, "Part", EntityKind::DBElement},
    {EntityKind::PartLot, "PartLot", EntityKind::DBElement},
    {EntityKind::Orderdetail, "Orderdetail", EntityKind::DBElement},
    {EntityKind::Pricedetail, "Pricedetail", EntityKind::DBElement},
    {EntityKind::User, "User", EntityKind::DBElement},
    {EntityKind::Group, "Group", EntityKind::DBElement},
    {EntityKind::LogEntry, "LogEntry", EntityKind::DBElement},
    {EntityKind::ApiToken, "ApiToken", std::nullopt},
}};

std::size_t index_of(EntityKind kind)
{
    return static_cast<std::size_t>(kind);
}

using Closure = std::array<std::array<bool, kEntityKindCount>, kEntityKindCount>;

/// closure[k][b] == true iff k is b or a descendant of b.
Closure build_closure()
{
    Closure closure{};
    for (const auto& info : kKinds) {
        std::optional<EntityKind> cur = info.kind;
        while (cur) {
            closure[index_of(info.kind)][index_of(*cur)] = true;
            cur = kKinds[index_of(*cur)].parent;
        }
    }
    return closure;
}

const Closure& closure()
{
    static const Closure table = build_closure();
    return table;
}

} // namespace

const char* kind_name(EntityKind kind)
{
    return kKinds[index_of(kind)].name;
}

std::optional<EntityKind> kind_from_name(const std::string& name)
{
    for (const auto& info : kKinds) {
        if (name == info.name)
            return info.kind;
    }
    return std::nullopt;
}

std::optional<EntityKind> parent_of(EntityKind kind)
{
    return kKinds[index_of(kind)].parent;
}

bool is_a(EntityKind kind, EntityKind base)
{
    return closure()[index_of(kind)][index_of(base)];
}

std::vector<EntityKind> lineage_of(EntityKind kind)
{
    std::vector<EntityKind> out;
    std::optional<EntityKind> cur = kind;
    while (cur) {
        out.push_back(*cur);
        cur = parent_of(*cur);
    }
    return out;
}

const Entity* Entity::read_association(const std::string& field) const
{
    throw std::out_of_range(std::string(kind_name(kind())) + " has no association '" + field +
                            "'");
}

cJSON* Entity::to_document() const
{
    cJSON* doc = cJSON_CreateObject();
    if (id_)
        cJSON_AddNumberToObject(doc, "_id", static_cast<double>(*id_));
    else
        cJSON_AddNullToObject(doc, "_id");
    for (const auto& [name, value] : read_fields())
        cJSON_AddItemToObject(doc, name.c_str(), value.to_json());
    return doc;
}

void Entity::assign_id(EntityId id)
{
    if (id_)
        throw std::logic_error(std::string(kind_name(kind())) + " already has id " +
                               std::to_string(*id_));
    id_ = id;
}

} // namespace audex::core
