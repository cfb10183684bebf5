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
 * @file capture_test.cpp
 * @brief Integration tests of the capture pipeline on a real entity manager.
 *
 * @details
 * Every test runs the full path: domain mutation -> `EntityManager::flush()` ->
 * `ChangeCaptureSubscriber` hooks -> `EventLogger` -> entries written by the
 * same manager. Entries are inspected through the manager's identity map and,
 * for durability, through the engine files.
 */

#include "audex/audit/change_capture.hpp"
#include "audex/audit/errors.hpp"
#include "audex/infra/string.hpp"
#include "audex/model/entities.hpp"
#include "audex/storage/entity_manager.hpp"
#include "fixtures.hpp"
#include "framework.hpp"

#include <cJSON.h>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace audex::audit;
using audex::core::Entity;
using audex::core::EntityKind;
using audex::core::EntityRef;
using audex::storage::EntityManager;
using audex::storage::StorageError;
using audex::test::TestWorkspace;

namespace {

/**
 * @struct AuditHarness
 * @brief Manager, sink, comment context and subscriber wired together on a scratch directory.
 */
struct AuditHarness {
    TestWorkspace ws;
    EntityManager em;
    EventLogger events;
    CommentContext comments;
    ChangeCaptureSubscriber capture;

    explicit AuditHarness(const std::string& dir, AuditConfig config = {},
                          EventLoggerConfig sink = {},
                          AssociationTriggers triggers = default_association_triggers())
        : ws(dir), em(ws.path), events(em, std::move(sink)),
          capture(events, comments, config, RedactionPolicy::defaults(), std::move(triggers))
    {
        em.add_listener(&capture);
    }

    /// Entries of type `T` currently held by the manager, in staging order.
    template <typename T> std::vector<const T*> entries() const
    {
        std::vector<const T*> out;
        for (const Entity* entity : em.managed(EntityKind::LogEntry)) {
            if (const auto* entry = dynamic_cast<const T*>(entity))
                out.push_back(entry);
        }
        return out;
    }
};

AuditConfig with_changed_data()
{
    AuditConfig config;
    config.save_changed_data = true;
    return config;
}

} // namespace

/**
 * @brief A Created entry carries the identifier assigned by the same flush, and is written.
 */
void test_capture_created_after_identifier()
{
    AuditHarness h("./test_capture_created");

    auto* part = h.em.create<audex::model::Part>();
    part->name = "BC547";
    h.comments.set("Initial import");
    h.em.flush();

    auto created = h.entries<ElementCreatedLogEntry>();
    ASSERT_EQ(created.size(), static_cast<size_t>(1));
    ASSERT_TRUE(created[0]->target() == part->ref());
    ASSERT_TRUE(created[0]->target().id.has_value());
    ASSERT_TRUE(created[0]->id().has_value());
    ASSERT_EQ(created[0]->comment().value_or(""), std::string("Initial import"));
    ASSERT_EQ(created[0]->username(), std::string(EventLogger::kAnonymousUser));
    ASSERT_TRUE(created[0]->timestamp().has_value());

    // Drained within the same flush() call.
    ASSERT_FALSE(h.em.has_pending_writes());
    ASSERT_EQ(h.em.engine().load_log("LogEntry").size(), static_cast<size_t>(1));
    ASSERT_TRUE(h.capture.state() == FlushState::Done);
    ASSERT_FALSE(h.comments.is_set());
}

/**
 * @brief One changed field with diff capture: the change set is exactly {field: old value}.
 */
void test_capture_edit_records_old_value()
{
    AuditHarness h("./test_capture_edit", with_changed_data());

    auto* part = h.em.create<audex::model::Part>();
    part->name = "old";
    part->description = "stays";
    h.em.flush();

    part->name = "new";
    h.em.flush();

    auto edited = h.entries<ElementEditedLogEntry>();
    ASSERT_EQ(edited.size(), static_cast<size_t>(1));
    ASSERT_TRUE(edited[0]->target() == part->ref());
    ASSERT_TRUE(edited[0]->old_data() == (ChangeSet{{"name", "old"}}));
    ASSERT_FALSE(edited[0]->has_changed_fields());
}

/**
 * @brief Editing password and name of a User stores only the name.
 */
void test_capture_edit_redacts_password()
{
    AuditHarness h("./test_capture_user", with_changed_data());

    auto* user = h.em.create<audex::model::User>();
    user->name = "alice";
    user->password = "$2y$old";
    h.em.flush();

    user->name = "alice2";
    user->password = "$2y$new";
    h.em.flush();

    auto edited = h.entries<ElementEditedLogEntry>();
    ASSERT_EQ(edited.size(), static_cast<size_t>(1));
    ASSERT_TRUE(edited[0]->old_data() == (ChangeSet{{"name", "alice"}}));
}

/**
 * @brief Without diff capture only the names of changed fields are stored, redacted as well.
 */
void test_capture_edit_changed_field_names()
{
    AuditHarness h("./test_capture_names");

    auto* user = h.em.create<audex::model::User>();
    h.em.flush();

    user->email = "alice@example.org";
    user->password = "secret";
    h.em.flush();

    auto edited = h.entries<ElementEditedLogEntry>();
    ASSERT_EQ(edited.size(), static_cast<size_t>(1));
    ASSERT_FALSE(edited[0]->has_old_data());
    std::vector<std::string> fields = edited[0]->changed_fields();
    ASSERT_EQ(fields.size(), static_cast<size_t>(1));
    ASSERT_EQ(fields[0], std::string("email"));
}

/**
 * @brief Only a redacted field changed: the entry exists with an empty change set.
 */
void test_capture_edit_only_redacted_field()
{
    AuditHarness h("./test_capture_redacted_only", with_changed_data());

    auto* user = h.em.create<audex::model::User>();
    user->password = "a";
    h.em.flush();

    user->password = "b";
    h.em.flush();

    auto edited = h.entries<ElementEditedLogEntry>();
    ASSERT_EQ(edited.size(), static_cast<size_t>(1));
    ASSERT_TRUE(edited[0]->has_old_data());
    ASSERT_TRUE(edited[0]->old_data().empty());
}

/**
 * @brief Long previous values are stored cut to the bound with the marker.
 */
void test_capture_edit_truncates_long_value()
{
    AuditHarness h("./test_capture_truncate", with_changed_data());

    auto* part = h.em.create<audex::model::Part>();
    part->description = std::string(2500, 'd');
    h.em.flush();

    part->description = "short";
    h.em.flush();

    auto edited = h.entries<ElementEditedLogEntry>();
    ASSERT_EQ(edited.size(), static_cast<size_t>(1));
    std::string stored = edited[0]->old_data().find("description")->as_string();
    ASSERT_EQ(audex::infra::String::char_length(stored), static_cast<size_t>(2000));
    ASSERT_EQ(stored.substr(stored.size() - 3), std::string("..."));
}

/**
 * @brief Deleting a PartLot with a part: one Deleted entry and one collection entry on the part.
 */
void test_capture_delete_part_lot()
{
    AuditHarness h("./test_capture_delete_lot", with_changed_data());

    auto* part = h.em.create<audex::model::Part>();
    auto* lot = h.em.create<audex::model::PartLot>();
    lot->description = "reel";
    lot->part = part;
    h.em.flush();

    EntityRef lot_ref = lot->ref();
    h.comments.set("scrapped");
    h.em.remove(lot);
    h.em.flush();

    auto deleted = h.entries<ElementDeletedLogEntry>();
    ASSERT_EQ(deleted.size(), static_cast<size_t>(1));
    ASSERT_TRUE(deleted[0]->target() == lot_ref);
    ChangeSet snapshot = deleted[0]->old_data();
    ASSERT_EQ(snapshot.find("description")->as_string(), std::string("reel"));
    ASSERT_TRUE(snapshot.find("expiration_date")->is_null());

    auto collection = h.entries<CollectionElementDeleted>();
    ASSERT_EQ(collection.size(), static_cast<size_t>(1));
    ASSERT_TRUE(collection[0]->target() == part->ref());
    ASSERT_EQ(collection[0]->collection_name(), std::string("partLots"));
    ASSERT_TRUE(collection[0]->deleted_element() == lot_ref);
    ASSERT_EQ(collection[0]->comment().value_or(""), std::string("scrapped"));
    ASSERT_EQ(deleted[0]->comment().value_or(""), std::string("scrapped"));
}

/**
 * @brief No collection entry for an empty association, nor without diff capture.
 */
void test_capture_delete_without_collection_entry()
{
    {
        AuditHarness h("./test_capture_delete_orphan", with_changed_data());
        auto* lot = h.em.create<audex::model::PartLot>();
        h.em.flush();
        h.em.remove(lot);
        h.em.flush();

        ASSERT_EQ(h.entries<ElementDeletedLogEntry>().size(), static_cast<size_t>(1));
        ASSERT_TRUE(h.entries<CollectionElementDeleted>().empty());
    }
    {
        AuditHarness h("./test_capture_delete_plain");
        auto* part = h.em.create<audex::model::Part>();
        auto* lot = h.em.create<audex::model::PartLot>();
        lot->part = part;
        h.em.flush();
        h.em.remove(lot);
        h.em.flush();

        auto deleted = h.entries<ElementDeletedLogEntry>();
        ASSERT_EQ(deleted.size(), static_cast<size_t>(1));
        ASSERT_TRUE(deleted[0]->has_old_data());
        ASSERT_TRUE(h.entries<CollectionElementDeleted>().empty());
    }
}

/**
 * @brief Attachment subtypes inherit the trigger; the mapping of the subtype names the collection.
 */
void test_capture_delete_attachment_subtype()
{
    AuditHarness h("./test_capture_attachment", with_changed_data());

    auto* part = h.em.create<audex::model::Part>();
    auto* file = h.em.create<audex::model::Attachment>(EntityKind::PartAttachment);
    file->name = "datasheet.pdf";
    file->element = part;
    h.em.flush();

    h.em.remove(file);
    h.em.flush();

    auto collection = h.entries<CollectionElementDeleted>();
    ASSERT_EQ(collection.size(), static_cast<size_t>(1));
    ASSERT_TRUE(collection[0]->target() == part->ref());
    ASSERT_EQ(collection[0]->collection_name(), std::string("attachments"));
    ASSERT_TRUE(collection[0]->deleted_element().kind == EntityKind::PartAttachment);
}

/**
 * @brief Log entries and untracked objects are never themselves logged.
 */
void test_capture_never_logs_itself()
{
    AuditHarness h("./test_capture_self", with_changed_data());

    auto* part = h.em.create<audex::model::Part>();
    auto* token = h.em.create<audex::model::ApiToken>();
    h.em.flush();

    part->name = "edited";
    token->name = "renamed";
    h.em.flush();

    h.em.remove(part);
    h.em.remove(token);
    h.em.flush();

    auto all = h.entries<LogEntry>();
    ASSERT_EQ(all.size(), static_cast<size_t>(3));
    for (const LogEntry* entry : all) {
        ASSERT_TRUE(entry->target().kind == EntityKind::Part);
    }
    ASSERT_FALSE(h.em.has_pending_writes());
}

/**
 * @brief The comment belongs to one flush; the next flush records none.
 */
void test_capture_comment_is_per_flush()
{
    AuditHarness h("./test_capture_comment");

    auto* first = h.em.create<audex::model::Part>();
    {
        CommentScope scope(h.comments, "  first batch  ");
        h.em.flush();
        ASSERT_FALSE(h.comments.is_set());
    }

    auto* second = h.em.create<audex::model::Part>();
    h.em.flush();

    auto created = h.entries<ElementCreatedLogEntry>();
    ASSERT_EQ(created.size(), static_cast<size_t>(2));
    ASSERT_TRUE(created[0]->target() == first->ref());
    ASSERT_EQ(created[0]->comment().value_or(""), std::string("first batch"));
    ASSERT_TRUE(created[1]->target() == second->ref());
    ASSERT_FALSE(created[1]->has_comment());
}

/**
 * @brief The same comment reaches edits, deletions and creations of one flush.
 */
void test_capture_comment_shared_across_phases()
{
    AuditHarness h("./test_capture_comment_phases");

    auto* edited = h.em.create<audex::model::Group>();
    auto* removed = h.em.create<audex::model::Group>();
    h.em.flush();

    edited->name = "renamed";
    h.em.remove(removed);
    h.em.create<audex::model::Group>();
    h.comments.set("cleanup");
    h.em.flush();

    ASSERT_EQ(h.entries<ElementEditedLogEntry>()[0]->comment().value_or(""),
              std::string("cleanup"));
    ASSERT_EQ(h.entries<ElementDeletedLogEntry>()[0]->comment().value_or(""),
              std::string("cleanup"));
    ASSERT_EQ(h.entries<ElementCreatedLogEntry>().back()->comment().value_or(""),
              std::string("cleanup"));
}

/**
 * @brief A whitelisted association missing from the mapping aborts the flush and resets state.
 */
void test_capture_missing_association_aborts()
{
    AssociationTriggers triggers = {{EntityKind::PartLot, {"storage_location"}}};
    AuditHarness h("./test_capture_bad_trigger", with_changed_data(), {}, triggers);

    auto* lot = h.em.create<audex::model::PartLot>();
    h.em.flush();

    h.em.remove(lot);
    h.comments.set("should not survive");
    ASSERT_THROWS(h.em.flush(), ConfigurationError);

    ASSERT_FALSE(h.comments.is_set());
    ASSERT_TRUE(h.capture.state() == FlushState::Idle);

    // The Deleted entry built before the failure was never staged.
    ASSERT_TRUE(h.entries<ElementDeletedLogEntry>().empty());
    ASSERT_TRUE(h.entries<CollectionElementDeleted>().empty());
    ASSERT_EQ(h.em.managed(EntityKind::LogEntry).size(), static_cast<size_t>(1));
}

/**
 * @brief A failed write resets the flush; the retry records every change once, without the comment.
 */
void test_capture_storage_failure_clears_comment()
{
    namespace fs = std::filesystem;
    AuditHarness h("./test_capture_storage_failure");

    auto* group = h.em.create<audex::model::Group>();
    group->name = "before";
    h.em.flush();

    // A directory in place of the collection file makes every append fail.
    std::string blocked = h.em.engine().get_path("Part");
    fs::create_directories(blocked);

    auto* part = h.em.create<audex::model::Part>();
    group->name = "after";
    h.comments.set("batch import");
    ASSERT_THROWS(h.em.flush(), StorageError);

    ASSERT_FALSE(h.comments.is_set());
    ASSERT_TRUE(h.capture.state() == FlushState::Idle);
    ASSERT_FALSE(part->id().has_value());
    ASSERT_TRUE(h.entries<ElementEditedLogEntry>().empty());
    ASSERT_EQ(h.em.original_snapshot(*group).find("name")->as_string(), std::string("before"));
    ASSERT_TRUE(h.em.has_pending_writes());

    fs::remove(blocked);
    h.em.flush();

    ASSERT_EQ(part->id().value_or(0), static_cast<audex::core::EntityId>(1));
    auto edited = h.entries<ElementEditedLogEntry>();
    ASSERT_EQ(edited.size(), static_cast<size_t>(1));
    ASSERT_TRUE(edited[0]->target() == group->ref());
    ASSERT_FALSE(edited[0]->comment().has_value());
    ASSERT_EQ(h.entries<ElementCreatedLogEntry>().size(), static_cast<size_t>(2));
    ASSERT_FALSE(h.em.has_pending_writes());
    ASSERT_TRUE(h.capture.state() == FlushState::Done);
}

/**
 * @brief Hooks outside the on_flush / post_persist / post_flush sequence are rejected.
 */
void test_capture_rejects_out_of_order_hooks()
{
    AuditHarness h("./test_capture_order");
    audex::model::Part part;
    part.assign_id(1);

    ASSERT_THROWS(h.capture.post_persist(h.em, part), OrderingError);
    ASSERT_THROWS(h.capture.post_flush(h.em), OrderingError);
    ASSERT_TRUE(h.capture.state() == FlushState::Idle);
}

/**
 * @brief Change sets can only be stored on Edited and Deleted entries.
 */
void test_capture_save_change_set_contract()
{
    AuditHarness h("./test_capture_contract");
    audex::model::Part part;
    part.assign_id(1);

    ElementCreatedLogEntry created(part);
    ASSERT_THROWS(h.capture.save_change_set(part, created, h.em), ContractViolation);

    ElementDeletedLogEntry deleted(part);
    h.capture.save_change_set(part, deleted, h.em, true);
    ASSERT_TRUE(deleted.has_old_data());
}

/**
 * @brief Filtered entry types are never staged, and no drain cycle is needed for them.
 */
void test_capture_event_logger_filters()
{
    EventLoggerConfig sink;
    sink.blacklist = {LogEntryType::ElementCreated};
    AuditHarness h("./test_capture_filter", {}, sink);

    auto* part = h.em.create<audex::model::Part>();
    h.em.flush();
    ASSERT_TRUE(h.entries<LogEntry>().empty());

    part->name = "edited";
    h.em.flush();
    ASSERT_EQ(h.entries<ElementEditedLogEntry>().size(), static_cast<size_t>(1));

    EventLoggerConfig quiet;
    quiet.minimum_level = LogLevel::Warning;
    EventLogger strict(h.em, quiet);
    ElementCreatedLogEntry info_entry(part->ref());
    ASSERT_FALSE(strict.should_be_added(info_entry));
    info_entry.set_level(LogLevel::Error);
    ASSERT_TRUE(strict.should_be_added(info_entry));

    EventLoggerConfig only_deletes;
    only_deletes.whitelist = {LogEntryType::ElementDeleted};
    EventLogger narrow(h.em, only_deletes);
    ASSERT_FALSE(narrow.should_be_added(ElementEditedLogEntry(part->ref())));
    ASSERT_TRUE(narrow.should_be_added(ElementDeletedLogEntry(part->ref())));
}

/**
 * @brief The actor set on the sink is stamped on every entry of the flush.
 */
void test_capture_actor_stamping()
{
    AuditHarness h("./test_capture_actor");
    h.events.set_actor("alice");

    h.em.create<audex::model::Part>();
    h.em.flush();

    h.events.clear_actor();
    h.em.create<audex::model::Part>();
    h.em.flush();

    auto created = h.entries<ElementCreatedLogEntry>();
    ASSERT_EQ(created.size(), static_cast<size_t>(2));
    ASSERT_EQ(created[0]->username(), std::string("alice"));
    ASSERT_EQ(created[1]->username(), std::string("anonymous"));
}

/**
 * @brief The creation annotator can attach the stock value at creation.
 */
void test_capture_creation_annotator()
{
    AuditHarness h("./test_capture_annotator");
    h.capture.set_creation_annotator([](const Entity& entity, ElementCreatedLogEntry& entry) {
        if (const auto* lot = dynamic_cast<const audex::model::PartLot*>(&entity))
            entry.set_creation_instock_value(std::to_string(static_cast<int>(lot->amount)));
    });

    auto* lot = h.em.create<audex::model::PartLot>();
    lot->amount = 25;
    h.em.create<audex::model::Part>();
    h.em.flush();

    auto created = h.entries<ElementCreatedLogEntry>();
    ASSERT_EQ(created.size(), static_cast<size_t>(2));
    ASSERT_EQ(created[0]->creation_instock_value().value_or(""), std::string("25"));
    ASSERT_FALSE(created[1]->has_creation_instock_value());
}

/**
 * @brief Written entries are read back from disk with their payload, and sequences resume.
 */
void test_capture_entries_survive_restart()
{
    AuditHarness h("./test_capture_restart", with_changed_data());

    auto* part = h.em.create<audex::model::Part>();
    part->name = "old";
    h.em.flush();
    part->name = "new";
    h.comments.set("renamed");
    h.em.flush();

    std::vector<std::unique_ptr<LogEntry>> stored;
    for (const auto& raw : h.em.engine().load_log("LogEntry")) {
        cJSON* doc = cJSON_Parse(raw.c_str());
        stored.push_back(LogEntry::from_document(doc));
        cJSON_Delete(doc);
    }
    ASSERT_EQ(stored.size(), static_cast<size_t>(2));
    auto* edited = dynamic_cast<ElementEditedLogEntry*>(stored[1].get());
    ASSERT_TRUE(edited != nullptr);
    ASSERT_TRUE(edited->old_data() == (ChangeSet{{"name", "old"}}));
    ASSERT_EQ(edited->comment().value_or(""), std::string("renamed"));

    EntityManager reopened(h.ws.path);
    auto* next = reopened.create<audex::model::Part>();
    reopened.flush();
    ASSERT_EQ(next->id().value_or(0), static_cast<audex::core::EntityId>(2));
}
