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
 * @file unit_of_work.hpp
 * @brief The commit contract between the storage layer and flush listeners.
 *
 * @details
 * A flush runs one or more commit cycles. Each cycle notifies listeners in a
 * fixed order:
 * 1. `on_flush` once, before identifiers are assigned. Pending update and
 *    delete lists are only valid here.
 * 2. `post_persist` once per inserted entity, right after it received its
 *    identifier.
 * 3. `post_flush` once, after the cycle's writes are durable.
 *
 * If any step throws (a listener or a failed write), every listener receives
 * `on_abort` before the exception leaves `flush()`. Writes that already
 * reached storage stay; everything else is still pending for the next flush.
 *
 * A listener may stage more writes (e.g. audit entries) at any point. Calling
 * `flush()` from inside a cycle does not recurse: it requests one more cycle,
 * which starts after the current `post_flush` notifications return.
 */

#pragma once

#include "audex/core/entity.hpp"
#include "audex/core/value.hpp"
#include "audex/storage/metadata.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

namespace audex::storage {

/**
 * @class StorageError
 * @brief Physical persistence failure (I/O, corrupt identifiers).
 */
class StorageError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @class UnitOfWork
 * @brief Read view of a pending commit plus the write primitives listeners need.
 */
class UnitOfWork {
  public:
    virtual ~UnitOfWork() = default;

    /// @brief Managed entities with field changes, in the current cycle's plan.
    virtual std::vector<const core::Entity*> pending_updates() const = 0;

    /// @brief Entities scheduled for deletion in the current cycle's plan.
    virtual std::vector<const core::Entity*> pending_deletes() const = 0;

    /// @brief Old/new values of the fields that changed since the last commit.
    virtual core::FieldChangeSet field_change_set(const core::Entity& entity) const = 0;

    /// @brief Field values as of the last commit (empty for new entities).
    virtual core::FieldMap original_snapshot(const core::Entity& entity) const = 0;

    virtual AssociationMappings association_mappings(core::EntityKind kind) const = 0;

    /**
     * @brief Rebuilds the current cycle's plan.
     *
     * Picks up entities persisted and fields modified since the cycle started.
     */
    virtual void recompute_change_sets() = 0;

    /// @brief True if anything is staged that no commit cycle has written yet.
    virtual bool has_pending_writes() const = 0;

    /// @brief Commits staged writes (or requests a drain cycle when inside one).
    virtual void flush() = 0;

    /**
     * @brief Takes ownership of a new entity and schedules its insertion.
     *
     * @return Non-owning pointer, valid until the entity is removed and flushed.
     */
    virtual core::Entity* persist(std::unique_ptr<core::Entity> entity) = 0;

    /**
     * @brief Schedules a managed entity for deletion.
     *
     * An entity that was never written is dropped instead (its insertion is cancelled).
     */
    virtual void remove(const core::Entity* entity) = 0;
};

/**
 * @class FlushListener
 * @brief Observer of commit cycles.
 */
class FlushListener {
  public:
    virtual ~FlushListener() = default;

    virtual void on_flush(UnitOfWork& uow) = 0;
    virtual void post_persist(UnitOfWork& uow, const core::Entity& entity) = 0;
    virtual void post_flush(UnitOfWork& uow) = 0;

    /// @brief The flush failed; reset per-flush state. Must not throw.
    virtual void on_abort(UnitOfWork& /*uow*/) {}
};

} // namespace audex::storage
