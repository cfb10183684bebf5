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
 * @file event_logger.cpp
 * @brief Audit sink implementation.
 */

#include "audex/audit/event_logger.hpp"

#include "audex/infra/logger.hpp"

namespace audex::audit {

using infra::Logger;

EventLogger::EventLogger(storage::UnitOfWork& uow, EventLoggerConfig config)
    : uow_(uow), config_(std::move(config))
{
}

bool EventLogger::should_be_added(const LogEntry& entry) const
{
    // Lower numeric level means more severe.
    if (static_cast<int>(entry.level()) > static_cast<int>(config_.minimum_level))
        return false;
    if (config_.blacklist.count(entry.type()))
        return false;
    if (!config_.whitelist.empty() && !config_.whitelist.count(entry.type()))
        return false;
    return true;
}

LogEntry* EventLogger::log(std::unique_ptr<LogEntry> entry)
{
    if (!entry)
        return nullptr;

    if (!should_be_added(*entry)) {
        Logger::log(infra::LogLevel::TRACE,
                    std::string("Audit: Dropped ") + type_name(entry->type()) + " entry by filter.");
        return nullptr;
    }

    entry->set_username(actor_.value_or(kAnonymousUser));
    entry->set_timestamp(LogEntry::Clock::now());
    LogEntry* staged = entry.get();
    uow_.persist(std::move(entry));
    return staged;
}

bool EventLogger::log_and_flush(std::unique_ptr<LogEntry> entry)
{
    bool staged = log(std::move(entry)) != nullptr;
    if (staged)
        uow_.flush();
    return staged;
}

} // namespace audex::audit
