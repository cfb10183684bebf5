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
 * @file log_entry.cpp
 * @brief Audit record envelope, payload accessors and document mapping.
 */

#include "audex/audit/log_entry.hpp"

#include "audex/audit/errors.hpp"
#include "audex/infra/string.hpp"

#include <array>
#include <stdexcept>

namespace audex::audit {

namespace {

struct TypeInfo {
    LogEntryType type;
    const char* name;
};

const std::array<TypeInfo, 4> kTypes = {{
    {LogEntryType::ElementCreated, "element_created"},
    {LogEntryType::ElementEdited, "element_edited"},
    {LogEntryType::ElementDeleted, "element_deleted"},
    {LogEntryType::CollectionElementDeleted, "collection_element_deleted"},
}};

const std::array<const char*, 8> kLevels = {
    {"emergency", "alert", "critical", "error", "warning", "notice", "info", "debug"}};

std::optional<std::string> read_string(const cJSON* node)
{
    if (cJSON_IsString(node) && node->valuestring != nullptr)
        return std::string(node->valuestring);
    return std::nullopt;
}

} // namespace

const char* type_name(LogEntryType type)
{
    for (const auto& info : kTypes) {
        if (info.type == type)
            return info.name;
    }
    return "unknown";
}

std::optional<LogEntryType> type_from_name(const std::string& name)
{
    for (const auto& info : kTypes) {
        if (name == info.name)
            return info.type;
    }
    return std::nullopt;
}

const char* level_name(LogLevel level)
{
    return kLevels[static_cast<std::size_t>(level)];
}

LogLevel level_from_name(const std::string& name)
{
    std::string n = infra::String::to_lower(infra::String::trim(name));
    for (std::size_t i = 0; i < kLevels.size(); ++i) {
        if (n == kLevels[i])
            return static_cast<LogLevel>(i);
    }
    throw ConfigurationError("Unknown audit log level: " + name);
}

// ============================================================================
//  LogEntry
// ============================================================================

LogEntry::LogEntry(LogEntryType type, core::EntityRef target)
    : type_(type), target_(std::move(target)), extra_(cJSON_CreateObject())
{
}

LogEntry::~LogEntry()
{
    cJSON_Delete(extra_);
}

void LogEntry::put_extra(const char* key, cJSON* item)
{
    cJSON_DeleteItemFromObjectCaseSensitive(extra_, key);
    if (item)
        cJSON_AddItemToObject(extra_, key, item);
}

const cJSON* LogEntry::get_extra(const char* key) const
{
    return cJSON_GetObjectItemCaseSensitive(extra_, key);
}

void LogEntry::write_old_data(const ChangeSet& data)
{
    put_extra("d", data.to_json());
}

ChangeSet LogEntry::read_old_data() const
{
    return core::FieldMap::from_json(get_extra("d"));
}

core::FieldMap LogEntry::read_fields() const
{
    core::FieldMap fields;
    fields.set("type", type_name(type_));
    fields.set("level", static_cast<int>(level_));
    fields.set("target_type", core::kind_name(target_.kind));
    fields.set("target_id", target_.id ? core::Value(*target_.id) : core::Value());
    if (timestamp_) {
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(
            timestamp_->time_since_epoch());
        fields.set("datetime", static_cast<std::int64_t>(secs.count()));
    } else {
        fields.set("datetime", core::Value());
    }
    fields.set("username", username_);
    return fields;
}

cJSON* LogEntry::to_document() const
{
    cJSON* doc = Entity::to_document();
    cJSON_AddItemToObject(doc, "extra", cJSON_Duplicate(extra_, 1));
    return doc;
}

std::unique_ptr<LogEntry> LogEntry::from_document(const cJSON* doc)
{
    auto type_str = read_string(cJSON_GetObjectItemCaseSensitive(doc, "type"));
    auto target_str = read_string(cJSON_GetObjectItemCaseSensitive(doc, "target_type"));
    std::optional<LogEntryType> type = type_str ? type_from_name(*type_str) : std::nullopt;
    std::optional<core::EntityKind> kind =
        target_str ? core::kind_from_name(*target_str) : std::nullopt;
    if (!type || !kind)
        throw std::invalid_argument("Document is not a log entry");

    core::EntityRef target{*kind, std::nullopt};
    core::Value target_id = core::Value::from_json(cJSON_GetObjectItemCaseSensitive(doc, "target_id"));
    if (target_id.type() == core::Value::Type::Integer)
        target.id = target_id.as_integer();

    std::unique_ptr<LogEntry> entry;
    switch (*type) {
    case LogEntryType::ElementCreated:
        entry = std::make_unique<ElementCreatedLogEntry>(target);
        break;
    case LogEntryType::ElementEdited:
        entry = std::make_unique<ElementEditedLogEntry>(target);
        break;
    case LogEntryType::ElementDeleted:
        entry = std::make_unique<ElementDeletedLogEntry>(target);
        break;
    case LogEntryType::CollectionElementDeleted:
        entry = std::make_unique<CollectionElementDeleted>(target);
        break;
    }

    const cJSON* id = cJSON_GetObjectItemCaseSensitive(doc, "_id");
    if (cJSON_IsNumber(id))
        entry->assign_id(static_cast<core::EntityId>(id->valuedouble));

    const cJSON* level = cJSON_GetObjectItemCaseSensitive(doc, "level");
    if (cJSON_IsNumber(level) && level->valueint >= 0 && level->valueint <= 7)
        entry->level_ = static_cast<LogLevel>(level->valueint);

    const cJSON* datetime = cJSON_GetObjectItemCaseSensitive(doc, "datetime");
    if (cJSON_IsNumber(datetime))
        entry->timestamp_ = Clock::time_point(
            std::chrono::seconds(static_cast<std::int64_t>(datetime->valuedouble)));

    if (auto username = read_string(cJSON_GetObjectItemCaseSensitive(doc, "username")))
        entry->username_ = *username;

    const cJSON* extra = cJSON_GetObjectItemCaseSensitive(doc, "extra");
    if (cJSON_IsObject(extra)) {
        cJSON_Delete(entry->extra_);
        entry->extra_ = cJSON_Duplicate(extra, 1);
    }
    return entry;
}

// ============================================================================
//  Element entries
// ============================================================================

bool ElementLogEntry::has_comment() const
{
    return comment().has_value();
}

std::optional<std::string> ElementLogEntry::comment() const
{
    return read_string(get_extra("m"));
}

void ElementLogEntry::set_comment(const std::optional<std::string>& comment)
{
    if (!comment) {
        put_extra("m", nullptr);
        return;
    }
    put_extra("m", cJSON_CreateString(
                       infra::String::truncate(*comment, kMaxCommentLength, "...").c_str()));
}

ElementCreatedLogEntry::ElementCreatedLogEntry(const core::Entity& new_element)
    : ElementCreatedLogEntry(new_element.ref())
{
}

ElementCreatedLogEntry::ElementCreatedLogEntry(core::EntityRef target)
    : ElementLogEntry(LogEntryType::ElementCreated, target)
{
}

std::optional<std::string> ElementCreatedLogEntry::creation_instock_value() const
{
    return read_string(get_extra("i"));
}

void ElementCreatedLogEntry::set_creation_instock_value(const std::string& value)
{
    put_extra("i", cJSON_CreateString(value.c_str()));
}

ElementEditedLogEntry::ElementEditedLogEntry(const core::Entity& changed_element)
    : ElementEditedLogEntry(changed_element.ref())
{
}

ElementEditedLogEntry::ElementEditedLogEntry(core::EntityRef target)
    : ElementLogEntry(LogEntryType::ElementEdited, target)
{
}

std::vector<std::string> ElementEditedLogEntry::changed_fields() const
{
    std::vector<std::string> out;
    const cJSON* list = get_extra("f");
    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, list)
    {
        if (auto name = read_string(item))
            out.push_back(*name);
    }
    return out;
}

void ElementEditedLogEntry::set_changed_fields(const std::vector<std::string>& fields)
{
    cJSON* list = cJSON_CreateArray();
    for (const auto& name : fields)
        cJSON_AddItemToArray(list, cJSON_CreateString(name.c_str()));
    put_extra("f", list);
}

ElementDeletedLogEntry::ElementDeletedLogEntry(const core::Entity& deleted_element)
    : ElementDeletedLogEntry(deleted_element.ref())
{
}

ElementDeletedLogEntry::ElementDeletedLogEntry(core::EntityRef target)
    : ElementLogEntry(LogEntryType::ElementDeleted, target)
{
}

CollectionElementDeleted::CollectionElementDeleted(const core::Entity& changed_element,
                                                   const std::string& collection_name,
                                                   const core::Entity& deleted_element)
    : CollectionElementDeleted(changed_element.ref())
{
    put_extra("n", cJSON_CreateString(collection_name.c_str()));
    put_extra("c", cJSON_CreateString(core::kind_name(deleted_element.kind())));
    if (deleted_element.id())
        put_extra("e", cJSON_CreateNumber(static_cast<double>(*deleted_element.id())));
}

CollectionElementDeleted::CollectionElementDeleted(core::EntityRef target)
    : ElementLogEntry(LogEntryType::CollectionElementDeleted, target)
{
}

std::string CollectionElementDeleted::collection_name() const
{
    return read_string(get_extra("n")).value_or("");
}

core::EntityRef CollectionElementDeleted::deleted_element() const
{
    core::EntityRef ref;
    if (auto kind_str = read_string(get_extra("c"))) {
        if (auto kind = core::kind_from_name(*kind_str))
            ref.kind = *kind;
    }
    core::Value id = core::Value::from_json(get_extra("e"));
    if (id.type() == core::Value::Type::Integer)
        ref.id = id.as_integer();
    return ref;
}

} // namespace audex::audit
