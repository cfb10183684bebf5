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
 * @file change_capture.cpp
 * @brief Commit-cycle state machine and entry construction.
 */

#include "audex/audit/change_capture.hpp"

#include "audex/audit/errors.hpp"
#include "audex/infra/logger.hpp"

#include <algorithm>
#include <exception>
#include <memory>
#include <stdexcept>

namespace audex::audit {

using core::Entity;
using core::EntityKind;
using infra::Logger;
using infra::LogLevel;
using storage::UnitOfWork;

AssociationTriggers default_association_triggers()
{
    return {
        {EntityKind::PartLot, {"part"}},
        {EntityKind::Orderdetail, {"part"}},
        {EntityKind::Pricedetail, {"orderdetail"}},
        {EntityKind::Attachment, {"element"}},
    };
}

const char* state_name(FlushState state)
{
    switch (state) {
    case FlushState::Idle:
        return "idle";
    case FlushState::Scanning:
        return "scanning";
    case FlushState::AwaitingIdentifiers:
        return "awaiting_identifiers";
    case FlushState::DrainingDeferred:
        return "draining_deferred";
    case FlushState::Done:
        return "done";
    }
    return "unknown";
}

/**
 * @class ChangeCaptureSubscriber::AbortCleanup
 * @brief Resets the flush when a hook is left by an exception.
 */
class ChangeCaptureSubscriber::AbortCleanup {
  public:
    explicit AbortCleanup(ChangeCaptureSubscriber& owner)
        : owner_(owner), exceptions_(std::uncaught_exceptions())
    {
    }

    ~AbortCleanup()
    {
        if (std::uncaught_exceptions() > exceptions_)
            owner_.abort_flush();
    }

    AbortCleanup(const AbortCleanup&) = delete;
    AbortCleanup& operator=(const AbortCleanup&) = delete;

  private:
    ChangeCaptureSubscriber& owner_;
    int exceptions_;
};

ChangeCaptureSubscriber::ChangeCaptureSubscriber(EventLogger& logger, CommentContext& comments,
                                                 AuditConfig config, RedactionPolicy policy,
                                                 AssociationTriggers triggers)
    : logger_(logger), comments_(comments), config_(config), policy_(std::move(policy)),
      builder_(policy_), triggers_(std::move(triggers))
{
}

bool ChangeCaptureSubscriber::is_loggable(const Entity& entity)
{
    return core::is_a(entity.kind(), EntityKind::DBElement) &&
           !core::is_a(entity.kind(), EntityKind::LogEntry);
}

// ========================================================================
// Flush hooks
// ========================================================================

void ChangeCaptureSubscriber::on_flush(UnitOfWork& uow)
{
    expect_state({FlushState::Idle, FlushState::Done, FlushState::DrainingDeferred}, "on_flush");
    AbortCleanup cleanup(*this);

    if (state_ != FlushState::DrainingDeferred)
        deferred_created_ = 0;
    state_ = FlushState::Scanning;
    scan_entries_.clear();

    // Nothing reaches the unit of work until the whole scan succeeded.
    std::vector<std::unique_ptr<LogEntry>> entries;

    std::size_t edited = 0;
    for (const Entity* entity : uow.pending_updates()) {
        if (!is_loggable(*entity))
            continue;
        log_element_edited(*entity, uow, entries);
        ++edited;
    }

    std::size_t deleted = 0;
    for (const Entity* entity : uow.pending_deletes()) {
        if (!is_loggable(*entity))
            continue;
        log_element_deleted(*entity, uow, entries);
        ++deleted;
    }

    for (auto& entry : entries) {
        if (const LogEntry* staged = logger_.log(std::move(entry)))
            scan_entries_.push_back(staged);
    }

    // Entries staged above must be written by this cycle.
    uow.recompute_change_sets();
    state_ = FlushState::AwaitingIdentifiers;

    if (edited + deleted > 0)
        Logger::log(LogLevel::DEBUG, "Audit: Pre-commit scan recorded " + std::to_string(edited) +
                                         " edit(s) and " + std::to_string(deleted) +
                                         " deletion(s).");
}

void ChangeCaptureSubscriber::post_persist(UnitOfWork& /*uow*/, const Entity& entity)
{
    expect_state({FlushState::AwaitingIdentifiers}, "post_persist");
    if (!is_loggable(entity))
        return;

    AbortCleanup cleanup(*this);

    auto entry = std::make_unique<ElementCreatedLogEntry>(entity);
    attach_comment(*entry);
    if (annotator_)
        annotator_(entity, *entry);

    if (logger_.log(std::move(entry)))
        ++deferred_created_;
}

void ChangeCaptureSubscriber::post_flush(UnitOfWork& uow)
{
    expect_state({FlushState::AwaitingIdentifiers}, "post_flush");
    AbortCleanup cleanup(*this);
    CommentScope clear_comment(comments_);
    scan_entries_.clear();

    if (deferred_created_ > 0 && uow.has_pending_writes()) {
        Logger::log(LogLevel::TRACE, "Audit: Draining " + std::to_string(deferred_created_) +
                                         " deferred creation entr(ies).");
        state_ = FlushState::DrainingDeferred;
        deferred_created_ = 0;
        uow.flush();
        return;
    }

    deferred_created_ = 0;
    state_ = FlushState::Done;
}

/**
 * @brief Withdraws this cycle's unwritten scan entries and resets the flush.
 *
 * The changes they describe are still pending, so the next flush records
 * them again. Creation entries are kept: their entities were written.
 */
void ChangeCaptureSubscriber::on_abort(UnitOfWork& uow)
{
    std::size_t withdrawn = 0;
    for (const LogEntry* entry : scan_entries_) {
        if (entry->id())
            continue;
        uow.remove(entry);
        ++withdrawn;
    }
    scan_entries_.clear();

    if (withdrawn > 0)
        Logger::log(LogLevel::DEBUG, "Audit: Withdrew " + std::to_string(withdrawn) +
                                         " unwritten entr(ies) of the failed flush.");
    if (state_ != FlushState::Idle || comments_.is_set())
        abort_flush();
}

// ========================================================================
// Entry construction
// ========================================================================

void ChangeCaptureSubscriber::save_change_set(const Entity& entity, LogEntry& entry,
                                              const UnitOfWork& uow, bool was_deleted) const
{
    auto* edited = dynamic_cast<ElementEditedLogEntry*>(&entry);
    auto* deleted = dynamic_cast<ElementDeletedLogEntry*>(&entry);
    if (edited == nullptr && deleted == nullptr)
        throw ContractViolation(std::string("Cannot store a change set on a ") +
                                type_name(entry.type()) + " entry");

    ChangeSet data;
    if (was_deleted) {
        core::FieldMap snapshot = uow.original_snapshot(entity);
        data = builder_.build(entity, DiffSource::from_snapshot(snapshot), true);
    } else {
        core::FieldChangeSet changes = uow.field_change_set(entity);
        data = builder_.build(entity, DiffSource::from_changes(changes), false);
    }

    if (edited != nullptr)
        edited->set_old_data(data);
    else
        deleted->set_old_data(data);
}

void ChangeCaptureSubscriber::log_element_edited(const Entity& entity, UnitOfWork& uow,
                                                 std::vector<std::unique_ptr<LogEntry>>& out)
{
    auto entry = std::make_unique<ElementEditedLogEntry>(entity);

    if (config_.save_changed_data) {
        save_change_set(entity, *entry, uow, false);
    } else if (config_.save_changed_fields) {
        std::vector<std::string> names;
        for (const auto& change : uow.field_change_set(entity))
            names.push_back(change.first);
        entry->set_changed_fields(policy_.filter_names(entity.kind(), names));
    }

    attach_comment(*entry);
    Logger::log(LogLevel::TRACE, std::string("Audit: Edited ") + core::kind_name(entity.kind()));
    out.push_back(std::move(entry));
}

void ChangeCaptureSubscriber::log_element_deleted(const Entity& entity, UnitOfWork& uow,
                                                  std::vector<std::unique_ptr<LogEntry>>& out)
{
    auto entry = std::make_unique<ElementDeletedLogEntry>(entity);
    attach_comment(*entry);
    if (config_.save_removed_data)
        save_change_set(entity, *entry, uow, true);

    Logger::log(LogLevel::TRACE, std::string("Audit: Deleted ") + core::kind_name(entity.kind()));
    out.push_back(std::move(entry));

    if (config_.save_changed_data)
        log_collection_elements_deleted(entity, uow, out);
}

void ChangeCaptureSubscriber::log_collection_elements_deleted(
    const Entity& entity, UnitOfWork& uow, std::vector<std::unique_ptr<LogEntry>>& out)
{
    std::vector<std::string> names = triggers_for(entity.kind());
    if (names.empty())
        return;

    storage::AssociationMappings mappings = uow.association_mappings(entity.kind());

    for (const auto& name : names) {
        auto mapping = std::find_if(mappings.begin(), mappings.end(),
                                    [&](const storage::AssociationMapping& m) {
                                        return m.field == name;
                                    });
        if (mapping == mappings.end())
            throw ConfigurationError(std::string(core::kind_name(entity.kind())) +
                                     " has no association '" + name + "'");

        const Entity* owner = nullptr;
        try {
            owner = entity.read_association(name);
        } catch (const std::out_of_range& e) {
            throw ConfigurationError(e.what());
        }
        if (owner == nullptr)
            continue;

        auto entry = std::make_unique<CollectionElementDeleted>(*owner, mapping->inversed_by, entity);
        attach_comment(*entry);
        out.push_back(std::move(entry));
    }
}

std::vector<std::string> ChangeCaptureSubscriber::triggers_for(EntityKind kind) const
{
    std::vector<std::string> names;
    for (EntityKind ancestor : core::lineage_of(kind)) {
        auto it = triggers_.find(ancestor);
        if (it == triggers_.end())
            continue;
        for (const auto& name : it->second) {
            if (std::find(names.begin(), names.end(), name) == names.end())
                names.push_back(name);
        }
    }
    return names;
}

void ChangeCaptureSubscriber::attach_comment(LogWithComment& entry) const
{
    if (comments_.is_set())
        entry.set_comment(comments_.message());
}

void ChangeCaptureSubscriber::expect_state(std::initializer_list<FlushState> allowed,
                                           const char* hook) const
{
    if (std::find(allowed.begin(), allowed.end(), state_) != allowed.end())
        return;
    throw OrderingError(std::string(hook) + " received in state " + state_name(state_));
}

void ChangeCaptureSubscriber::abort_flush()
{
    Logger::log(LogLevel::WARN, std::string("Audit: Flush aborted in state ") + state_name(state_));
    comments_.clear();
    deferred_created_ = 0;
    state_ = FlushState::Idle;
}

} // namespace audex::audit
