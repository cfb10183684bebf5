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
 * @file log_entry.hpp
 * @brief Audit record types.
 *
 * @details
 * A log entry is itself a persistent entity (kind `LogEntry`) so that it is
 * written by the same unit of work as the change it records. Kind-specific data
 * lives in the compact `extra` payload:
 *
 * | key | meaning                              | used by                  |
 * |-----|--------------------------------------|--------------------------|
 * | `m` | user comment                         | all element entries      |
 * | `i` | stock value at creation              | ElementCreated           |
 * | `f` | changed field names                  | ElementEdited            |
 * | `d` | previous values (field -> value)     | ElementEdited, Deleted   |
 * | `n` | collection name on the owner side    | CollectionElementDeleted |
 * | `c` | kind of the removed element          | CollectionElementDeleted |
 * | `e` | identifier of the removed element    | CollectionElementDeleted |
 *
 * Absent keys read as "not set".
 */

#pragma once

#include "audex/audit/change_set.hpp"
#include "audex/core/entity.hpp"

#include <cJSON.h>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace audex::audit {

/**
 * @enum LogEntryType
 * @brief Discriminator persisted in the `type` column.
 */
enum class LogEntryType { ElementCreated, ElementEdited, ElementDeleted, CollectionElementDeleted };

/// @brief Persisted name, e.g. `element_created`.
const char* type_name(LogEntryType type);
std::optional<LogEntryType> type_from_name(const std::string& name);

/**
 * @enum LogLevel
 * @brief Syslog-style severity; lower is more severe.
 */
enum class LogLevel {
    Emergency = 0,
    Alert = 1,
    Critical = 2,
    Error = 3,
    Warning = 4,
    Notice = 5,
    Info = 6,
    Debug = 7
};

const char* level_name(LogLevel level);

/// @throws ConfigurationError If the name is unknown.
LogLevel level_from_name(const std::string& name);

/**
 * @class LogEntry
 * @brief Common envelope of every audit record.
 *
 * The timestamp and username are stamped by `EventLogger` when the entry is
 * handed over for storage; the capture pipeline never sets them.
 */
class LogEntry : public core::Entity {
  public:
    using Clock = std::chrono::system_clock;

    ~LogEntry() override;

    LogEntry(const LogEntry&) = delete;
    LogEntry& operator=(const LogEntry&) = delete;

    core::EntityKind kind() const override { return core::EntityKind::LogEntry; }

    LogEntryType type() const { return type_; }
    LogLevel level() const { return level_; }
    void set_level(LogLevel level) { level_ = level; }

    /// @brief The entity this record is about.
    const core::EntityRef& target() const { return target_; }

    std::optional<Clock::time_point> timestamp() const { return timestamp_; }
    void set_timestamp(Clock::time_point when) { timestamp_ = when; }

    const std::string& username() const { return username_; }
    void set_username(std::string username) { username_ = std::move(username); }

    /// @brief The raw payload object (never null).
    const cJSON* extra() const { return extra_; }

    /// @brief Envelope columns: type, level, target, timestamp, username.
    core::FieldMap read_fields() const override;

    /// @brief Envelope columns plus the `extra` payload object.
    cJSON* to_document() const override;

    /**
     * @brief Rebuilds an entry from a stored document.
     *
     * @throws std::invalid_argument If the document has no known `type`/`target_type`.
     */
    static std::unique_ptr<LogEntry> from_document(const cJSON* doc);

  protected:
    LogEntry(LogEntryType type, core::EntityRef target);

    /// @brief Replaces payload key `key`; takes ownership of `item` (null removes the key).
    void put_extra(const char* key, cJSON* item);

    /// @brief Payload value under `key`, `nullptr` if absent.
    const cJSON* get_extra(const char* key) const;

    void write_old_data(const ChangeSet& data);
    ChangeSet read_old_data() const;

  private:
    LogEntryType type_;
    LogLevel level_ = LogLevel::Info;
    core::EntityRef target_;
    std::optional<Clock::time_point> timestamp_;
    std::string username_;
    cJSON* extra_;
};

/**
 * @class LogWithComment
 * @brief Entries that can carry a user-supplied reason for the change.
 */
class LogWithComment {
  public:
    /// Comments longer than this many characters are cut with a marker.
    static constexpr std::size_t kMaxCommentLength = 2000;

    virtual ~LogWithComment() = default;

    virtual bool has_comment() const = 0;
    virtual std::optional<std::string> comment() const = 0;

    /// @brief Sets (or with `std::nullopt`, removes) the comment.
    virtual void set_comment(const std::optional<std::string>& comment) = 0;
};

/**
 * @class ElementLogEntry
 * @brief Shared base of the four element records; stores the comment under `m`.
 */
class ElementLogEntry : public LogEntry, public LogWithComment {
  public:
    bool has_comment() const override;
    std::optional<std::string> comment() const override;
    void set_comment(const std::optional<std::string>& comment) override;

  protected:
    ElementLogEntry(LogEntryType type, core::EntityRef target) : LogEntry(type, target) {}
};

class ElementCreatedLogEntry : public ElementLogEntry {
  public:
    explicit ElementCreatedLogEntry(const core::Entity& new_element);
    explicit ElementCreatedLogEntry(core::EntityRef target);

    std::optional<std::string> creation_instock_value() const;
    bool has_creation_instock_value() const { return creation_instock_value().has_value(); }
    void set_creation_instock_value(const std::string& value);
};

class ElementEditedLogEntry : public ElementLogEntry {
  public:
    explicit ElementEditedLogEntry(const core::Entity& changed_element);
    explicit ElementEditedLogEntry(core::EntityRef target);

    std::vector<std::string> changed_fields() const;
    bool has_changed_fields() const { return get_extra("f") != nullptr; }
    void set_changed_fields(const std::vector<std::string>& fields);

    ChangeSet old_data() const { return read_old_data(); }
    bool has_old_data() const { return get_extra("d") != nullptr; }
    void set_old_data(const ChangeSet& data) { write_old_data(data); }
};

class ElementDeletedLogEntry : public ElementLogEntry {
  public:
    explicit ElementDeletedLogEntry(const core::Entity& deleted_element);
    explicit ElementDeletedLogEntry(core::EntityRef target);

    ChangeSet old_data() const { return read_old_data(); }
    bool has_old_data() const { return get_extra("d") != nullptr; }
    void set_old_data(const ChangeSet& data) { write_old_data(data); }
};

/**
 * @class CollectionElementDeleted
 * @brief An element vanished from a collection of `changed_element`.
 *
 * Field diffs of the owner cannot show this when the foreign key lives on the
 * element side, so the deletion is recorded against the owner explicitly.
 */
class CollectionElementDeleted : public ElementLogEntry {
  public:
    /**
     * @param changed_element The collection owner (target of this entry).
     * @param collection_name The owner-side collection (`inversed_by` of the mapping).
     * @param deleted_element The removed element.
     */
    CollectionElementDeleted(const core::Entity& changed_element, const std::string& collection_name,
                             const core::Entity& deleted_element);
    explicit CollectionElementDeleted(core::EntityRef target);

    std::string collection_name() const;

    /// @brief Kind and identifier of the removed element.
    core::EntityRef deleted_element() const;
};

} // namespace audex::audit
