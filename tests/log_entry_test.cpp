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
 * @file log_entry_test.cpp
 * @brief Unit tests for the log entry model and its compact payload.
 */

#include "audex/audit/errors.hpp"
#include "audex/audit/log_entry.hpp"
#include "audex/infra/string.hpp"
#include "audex/model/entities.hpp"
#include "framework.hpp"

#include <cJSON.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

using namespace audex::audit;
using audex::core::EntityKind;
using audex::core::EntityRef;

/**
 * @brief Comments are optional, removable and bounded to 2000 characters.
 */
void test_log_entry_comment()
{
    ElementEditedLogEntry entry(EntityRef{EntityKind::Part, 4});
    ASSERT_FALSE(entry.has_comment());

    entry.set_comment(std::string("Recount after inventory"));
    ASSERT_TRUE(entry.has_comment());
    ASSERT_EQ(entry.comment().value_or(""), std::string("Recount after inventory"));

    entry.set_comment(std::string(2500, 'c'));
    ASSERT_EQ(audex::infra::String::char_length(entry.comment().value_or("")),
              LogWithComment::kMaxCommentLength);

    entry.set_comment(std::nullopt);
    ASSERT_FALSE(entry.has_comment());
}

/**
 * @brief Element entries target the entity's kind and identifier, at level Info.
 */
void test_log_entry_targets_entity()
{
    audex::model::Part part;
    part.assign_id(12);

    ElementCreatedLogEntry created(part);
    ASSERT_TRUE(created.type() == LogEntryType::ElementCreated);
    ASSERT_TRUE(created.target() == (EntityRef{EntityKind::Part, 12}));
    ASSERT_TRUE(created.level() == LogLevel::Info);
    ASSERT_TRUE(created.kind() == EntityKind::LogEntry);
    ASSERT_FALSE(created.has_creation_instock_value());

    created.set_creation_instock_value("17");
    ASSERT_EQ(created.creation_instock_value().value_or(""), std::string("17"));
}

/**
 * @brief Changed-field names and old data are independent payload keys.
 */
void test_log_entry_edited_payload()
{
    ElementEditedLogEntry entry(EntityRef{EntityKind::User, 1});
    ASSERT_FALSE(entry.has_changed_fields());
    ASSERT_FALSE(entry.has_old_data());
    ASSERT_TRUE(entry.old_data().empty());

    entry.set_changed_fields({"name", "email"});
    ASSERT_TRUE(entry.has_changed_fields());
    ASSERT_EQ(entry.changed_fields().size(), static_cast<size_t>(2));
    ASSERT_EQ(entry.changed_fields()[1], std::string("email"));
    ASSERT_FALSE(entry.has_old_data());

    entry.set_old_data(ChangeSet{{"name", "alice"}, {"trustedDeviceCookieVersion", 3}});
    ASSERT_TRUE(entry.has_old_data());
    ASSERT_EQ(entry.old_data().find("trustedDeviceCookieVersion")->as_integer(),
              static_cast<std::int64_t>(3));
}

/**
 * @brief The collection record targets the owner and names the removed element.
 */
void test_log_entry_collection_element_deleted()
{
    audex::model::Part part;
    part.assign_id(5);
    audex::model::PartLot lot;
    lot.assign_id(9);

    CollectionElementDeleted entry(part, "partLots", lot);
    ASSERT_TRUE(entry.target() == (EntityRef{EntityKind::Part, 5}));
    ASSERT_EQ(entry.collection_name(), std::string("partLots"));
    ASSERT_TRUE(entry.deleted_element() == (EntityRef{EntityKind::PartLot, 9}));
}

/**
 * @brief Documents carry the envelope and the full payload; reading them restores both.
 */
void test_log_entry_document_round_trip()
{
    audex::model::PartLot lot;
    lot.assign_id(3);

    ElementDeletedLogEntry original(lot);
    original.set_comment(std::string("scrapped"));
    original.set_old_data(ChangeSet{{"description", "reel"}, {"expiration_date", nullptr}});
    original.set_username("bob");
    original.set_timestamp(LogEntry::Clock::time_point(std::chrono::seconds(1700000000)));
    original.assign_id(77);

    cJSON* doc = original.to_document();
    ASSERT_EQ(std::string(cJSON_GetObjectItem(doc, "type")->valuestring),
              std::string("element_deleted"));
    ASSERT_TRUE(cJSON_IsObject(cJSON_GetObjectItem(doc, "extra")));

    std::unique_ptr<LogEntry> restored = LogEntry::from_document(doc);
    cJSON_Delete(doc);

    auto* deleted = dynamic_cast<ElementDeletedLogEntry*>(restored.get());
    ASSERT_TRUE(deleted != nullptr);
    ASSERT_EQ(deleted->id().value_or(0), static_cast<audex::core::EntityId>(77));
    ASSERT_TRUE(deleted->target() == lot.ref());
    ASSERT_EQ(deleted->username(), std::string("bob"));
    ASSERT_TRUE(deleted->timestamp() == original.timestamp());
    ASSERT_EQ(deleted->comment().value_or(""), std::string("scrapped"));
    ASSERT_TRUE(deleted->old_data() == original.old_data());
}

/**
 * @brief Documents without a known type or target are rejected.
 */
void test_log_entry_rejects_foreign_document()
{
    cJSON* doc = cJSON_Parse("{\"_id\":1,\"type\":\"user_login\",\"target_type\":\"User\"}");
    ASSERT_THROWS(LogEntry::from_document(doc), std::invalid_argument);
    cJSON_Delete(doc);

    doc = cJSON_Parse("{\"_id\":1,\"type\":\"element_created\",\"target_type\":\"Shelf\"}");
    ASSERT_THROWS(LogEntry::from_document(doc), std::invalid_argument);
    cJSON_Delete(doc);
}

/**
 * @brief Severity names map both ways; unknown names are configuration errors.
 */
void test_log_entry_level_names()
{
    ASSERT_EQ(std::string(level_name(LogLevel::Warning)), std::string("warning"));
    ASSERT_TRUE(level_from_name("Critical") == LogLevel::Critical);
    ASSERT_TRUE(type_from_name("collection_element_deleted") ==
                LogEntryType::CollectionElementDeleted);
    ASSERT_FALSE(type_from_name("element_undeleted").has_value());
    ASSERT_THROWS(level_from_name("loud"), ConfigurationError);
}
