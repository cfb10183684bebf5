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
 * @file change_capture.hpp
 * @brief Flush listener that turns entity mutations into audit entries.
 *
 * @details
 * Hook sequence per commit cycle and what each one records:
 *
 * | hook           | state afterwards      | records                                         |
 * |----------------|-----------------------|-------------------------------------------------|
 * | `on_flush`     | `AwaitingIdentifiers` | Edited, Deleted, CollectionElementDeleted       |
 * | `post_persist` | `AwaitingIdentifiers` | Created (the entity now has its identifier)     |
 * | `post_flush`   | `DrainingDeferred` or `Done` | nothing; requests the drain cycle for Created entries |
 * | `on_abort`     | `Idle`                | nothing; withdraws the failed cycle's unwritten scan entries |
 *
 * Created entries are staged while the cycle that produced them is already
 * writing, so they need one more cycle (the drain). The comment context is
 * cleared at the end of every `post_flush`, and also whenever an exception
 * escapes one of the hooks or the flush fails in storage.
 */

#pragma once

#include "audex/audit/change_set.hpp"
#include "audex/audit/comment_context.hpp"
#include "audex/audit/event_logger.hpp"
#include "audex/audit/log_entry.hpp"
#include "audex/audit/redaction_policy.hpp"
#include "audex/storage/unit_of_work.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace audex::audit {

/**
 * @struct AuditConfig
 * @brief What the capture pipeline stores about edits and deletions.
 */
struct AuditConfig {
    /// Store the names of edited fields (ignored when `save_changed_data` is set).
    bool save_changed_fields = true;
    /// Store previous values of edited fields; also enables collection-element records.
    bool save_changed_data = false;
    /// Store the last committed state of deleted entities.
    bool save_removed_data = true;
};

/// @brief Kind -> to-one associations whose owner gets a CollectionElementDeleted record.
using AssociationTriggers = std::map<core::EntityKind, std::vector<std::string>>;

/// @brief `PartLot.part`, `Orderdetail.part`, `Pricedetail.orderdetail`, `Attachment.element`.
AssociationTriggers default_association_triggers();

enum class FlushState { Idle, Scanning, AwaitingIdentifiers, DrainingDeferred, Done };

const char* state_name(FlushState state);

/**
 * @class ChangeCaptureSubscriber
 * @brief The change-capture orchestrator.
 */
class ChangeCaptureSubscriber : public storage::FlushListener {
  public:
    /// @brief Caller hook to enrich a Created entry (e.g. stock at creation) before it is staged.
    using CreationAnnotator = std::function<void(const core::Entity&, ElementCreatedLogEntry&)>;

    ChangeCaptureSubscriber(EventLogger& logger, CommentContext& comments, AuditConfig config = {},
                            RedactionPolicy policy = RedactionPolicy::defaults(),
                            AssociationTriggers triggers = default_association_triggers());

    ChangeCaptureSubscriber(const ChangeCaptureSubscriber&) = delete;
    ChangeCaptureSubscriber& operator=(const ChangeCaptureSubscriber&) = delete;

    /**
     * @brief Pre-commit scan of pending updates and deletions.
     *
     * @throws ConfigurationError If a whitelisted association is not mapped on the entity.
     * @throws OrderingError If called while a scan or cycle of this subscriber is open.
     */
    void on_flush(storage::UnitOfWork& uow) override;

    /// @throws OrderingError If no scan preceded this hook in the current cycle.
    void post_persist(storage::UnitOfWork& uow, const core::Entity& entity) override;

    /// @throws OrderingError If no scan preceded this hook in the current cycle.
    void post_flush(storage::UnitOfWork& uow) override;
    void on_abort(storage::UnitOfWork& uow) override;

    /**
     * @brief Fills the `d` payload of an Edited or Deleted entry.
     *
     * @param was_deleted Use the last committed snapshot instead of the edit diff.
     * @throws ContractViolation If `entry` is neither Edited nor Deleted.
     */
    void save_change_set(const core::Entity& entity, LogEntry& entry, const storage::UnitOfWork& uow,
                         bool was_deleted = false) const;

    /// @brief Tracked domain object that is not itself an audit record.
    static bool is_loggable(const core::Entity& entity);

    void set_creation_annotator(CreationAnnotator annotator) { annotator_ = std::move(annotator); }

    FlushState state() const { return state_; }
    const AuditConfig& config() const { return config_; }
    const RedactionPolicy& policy() const { return policy_; }

  private:
    class AbortCleanup;

    EventLogger& logger_;
    CommentContext& comments_;
    AuditConfig config_;
    RedactionPolicy policy_;
    ChangeSetBuilder builder_;
    AssociationTriggers triggers_;
    CreationAnnotator annotator_;

    FlushState state_ = FlushState::Idle;
    std::size_t deferred_created_ = 0;
    std::vector<const LogEntry*> scan_entries_;

    void log_element_edited(const core::Entity& entity, storage::UnitOfWork& uow,
                            std::vector<std::unique_ptr<LogEntry>>& out);
    void log_element_deleted(const core::Entity& entity, storage::UnitOfWork& uow,
                             std::vector<std::unique_ptr<LogEntry>>& out);
    void log_collection_elements_deleted(const core::Entity& entity, storage::UnitOfWork& uow,
                                         std::vector<std::unique_ptr<LogEntry>>& out);

    std::vector<std::string> triggers_for(core::EntityKind kind) const;
    void attach_comment(LogWithComment& entry) const;
    void expect_state(std::initializer_list<FlushState> allowed, const char* hook) const;
    void abort_flush();
};

} // namespace audex::audit
