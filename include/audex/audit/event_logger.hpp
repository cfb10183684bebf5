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
 * @file event_logger.hpp
 * @brief Sink that hands audit entries to the storage layer.
 */

#pragma once

#include "audex/audit/log_entry.hpp"
#include "audex/storage/unit_of_work.hpp"

#include <memory>
#include <optional>
#include <set>
#include <string>

namespace audex::audit {

/**
 * @struct EventLoggerConfig
 * @brief Which entries are worth storing.
 */
struct EventLoggerConfig {
    /// Entries less severe than this are dropped.
    LogLevel minimum_level = LogLevel::Info;
    /// Types that are never stored.
    std::set<LogEntryType> blacklist;
    /// If non-empty, only these types are stored.
    std::set<LogEntryType> whitelist;
};

/**
 * @class EventLogger
 * @brief Stamps actor and time, filters, and stages entries in the unit of work.
 *
 * @details
 * Staging means `UnitOfWork::persist`: the entry is written by whichever commit
 * cycle runs next. `log_and_flush` forces that cycle immediately.
 */
class EventLogger {
  public:
    /// Username recorded when no actor is set.
    static constexpr const char* kAnonymousUser = "anonymous";

    explicit EventLogger(storage::UnitOfWork& uow, EventLoggerConfig config = {});

    /// @brief True if `entry` passes the level, blacklist and whitelist filters.
    bool should_be_added(const LogEntry& entry) const;

    /**
     * @brief Takes ownership of `entry` and stages it for storage.
     *
     * @return The staged entry, or `nullptr` if it was filtered out (and discarded).
     */
    LogEntry* log(std::unique_ptr<LogEntry> entry);

    /// @brief `log()` followed by `UnitOfWork::flush()` when the entry was staged.
    bool log_and_flush(std::unique_ptr<LogEntry> entry);

    /// @brief Sets the user recorded on subsequent entries.
    void set_actor(const std::string& username) { actor_ = username; }
    void clear_actor() { actor_.reset(); }
    const std::optional<std::string>& actor() const { return actor_; }

    const EventLoggerConfig& config() const { return config_; }

  private:
    storage::UnitOfWork& uow_;
    EventLoggerConfig config_;
    std::optional<std::string> actor_;
};

} // namespace audex::audit
