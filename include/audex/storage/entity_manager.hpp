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
 * @file entity_manager.hpp
 * @brief Identity map and commit cycle over the append-only engine.
 *
 * @details
 * The `EntityManager` owns every entity handed to it, tracks the field
 * snapshot of the last commit to detect edits, and runs the commit cycles
 * described in `unit_of_work.hpp`. Physical writes go through `Engine`,
 * one collection per entity kind.
 */

#pragma once

#include "audex/infra/id_generator.hpp"
#include "audex/storage/engine.hpp"
#include "audex/storage/metadata.hpp"
#include "audex/storage/unit_of_work.hpp"

#include <cJSON.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace audex::storage {

/**
 * @class EntityManager
 * @brief Reference `UnitOfWork` implementation.
 *
 * @details
 * **Commit cycle:**
 * 1. Compute the plan (insertions, edited managed entities, deletions).
 * 2. `on_flush` listeners; they may stage entries and call `recompute_change_sets()`.
 * 3. For each planned insertion: write, assign the identifier, `post_persist`.
 * 4. Write updates and tombstones, refresh snapshots, release deleted entities.
 * 5. `post_flush` listeners.
 *
 * Entities persisted during steps 3-5 stay pending for the next cycle. An
 * identifier and a snapshot only change once the matching write succeeded,
 * so a flush that failed with `StorageError` can simply be retried.
 *
 * @note Not thread-safe. One manager serves one caller thread.
 */
class EntityManager : public UnitOfWork {
  public:
    /**
     * @brief Opens (or creates) the data directory and restores identifier sequences.
     *
     * @param data_dir Directory of the collection files.
     * @param metadata Association mappings of the domain model.
     */
    explicit EntityManager(std::string data_dir,
                           ClassMetadata metadata = ClassMetadata::defaults());

    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;

    /**
     * @brief Constructs an entity in place and schedules its insertion.
     *
     * @code
     * auto* part = em.create<model::Part>();
     * part->name = "BC547";
     * em.flush();
     * @endcode
     */
    template <typename T, typename... Args> T* create(Args&&... args)
    {
        auto owned = std::make_unique<T>(std::forward<Args>(args)...);
        T* raw = owned.get();
        persist(std::move(owned));
        return raw;
    }

    core::Entity* persist(std::unique_ptr<core::Entity> entity) override;

    /**
     * @brief Schedules a managed entity for deletion.
     *
     * Removing an entity that was never committed cancels its insertion.
     *
     * @throws std::invalid_argument If the entity is not managed here.
     */
    void remove(const core::Entity* entity) override;

    /// @brief Registers a non-owning listener. Listeners are notified in registration order.
    void add_listener(FlushListener* listener);

    void flush() override;

    /// @brief Managed entity by reference, `nullptr` if unknown.
    core::Entity* find(core::EntityKind kind, core::EntityId id) const;

    /// @brief All managed entities whose kind is `base` or a subtype, in persist order.
    std::vector<const core::Entity*> managed(core::EntityKind base) const;

    /// @brief The engine backing this manager (read access for inspection).
    const Engine& engine() const { return engine_; }

    std::vector<const core::Entity*> pending_updates() const override;
    std::vector<const core::Entity*> pending_deletes() const override;
    core::FieldChangeSet field_change_set(const core::Entity& entity) const override;
    core::FieldMap original_snapshot(const core::Entity& entity) const override;
    AssociationMappings association_mappings(core::EntityKind kind) const override;
    void recompute_change_sets() override;
    bool has_pending_writes() const override;

  private:
    enum class SlotState { ScheduledInsert, Managed, ScheduledDelete };

    struct Slot {
        std::unique_ptr<core::Entity> entity;
        SlotState state = SlotState::ScheduledInsert;
        core::FieldMap original;
        core::FieldChangeSet changes;
    };

    Engine engine_;
    ClassMetadata metadata_;
    infra::IdGenerator ids_;
    std::vector<Slot> slots_;
    std::unordered_map<const core::Entity*, std::size_t> index_;
    std::vector<FlushListener*> listeners_;

    std::vector<core::Entity*> plan_inserts_;
    std::vector<core::Entity*> plan_updates_;
    std::vector<core::Entity*> plan_deletes_;

    bool in_cycle_ = false;
    bool drain_requested_ = false;

    void restore_sequences();
    void run_cycle();
    void write_inserts();
    void write_updates_and_deletes();
    void release_deleted();
    void abort_cycle();
    void reindex();

    Slot* slot_of(const core::Entity* entity);
    const Slot* slot_of(const core::Entity* entity) const;

    core::FieldChangeSet diff(const Slot& slot) const;
    std::string serialize(const core::Entity& entity,
                          std::optional<core::EntityId> id = std::nullopt) const;
    void write(const std::string& collection, const std::vector<std::string>& docs);
};

} // namespace audex::storage
