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
 * @file entity_manager.cpp
 * @brief Implementation of the identity map and commit cycle.
 */

#include "audex/storage/entity_manager.hpp"

#include "audex/infra/logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace audex::storage {

using core::Entity;
using core::EntityKind;
using infra::Logger;
using infra::LogLevel;

namespace {

/// Upper bound on drain cycles per flush; listeners that keep staging writes trip it.
constexpr int kMaxCyclesPerFlush = 8;

/// Raises a flag for the lifetime of a scope.
class ScopedFlag {
  public:
    explicit ScopedFlag(bool& flag) : flag_(flag) { flag_ = true; }
    ~ScopedFlag() { flag_ = false; }

    ScopedFlag(const ScopedFlag&) = delete;
    ScopedFlag& operator=(const ScopedFlag&) = delete;

  private:
    bool& flag_;
};

std::string print_and_free(cJSON* doc)
{
    char* raw = cJSON_PrintUnformatted(doc);
    std::string out = raw ? raw : "";
    free(raw);
    cJSON_Delete(doc);
    return out;
}

} // namespace

EntityManager::EntityManager(std::string data_dir, ClassMetadata metadata)
    : engine_(std::move(data_dir)), metadata_(std::move(metadata))
{
    Logger::log(LogLevel::INFO, "Storage: Opening entity store...");
    engine_.init();
    restore_sequences();
}

/**
 * @brief Replays every collection file to find the highest identifier in use.
 *
 * Entities are not hydrated; only the sequences are restored so new inserts
 * never reuse an identifier that is already on disk.
 */
void EntityManager::restore_sequences()
{
    for (const auto& name : engine_.list_collections()) {
        std::vector<std::string> docs = engine_.load_log(name);
        for (const auto& raw : docs) {
            cJSON* doc = cJSON_Parse(raw.c_str());
            if (!doc) {
                Logger::log(LogLevel::ERROR, "Storage: Corrupt frame in " + name + ". Skipping.");
                continue;
            }
            cJSON* id = cJSON_GetObjectItem(doc, "_id");
            if (cJSON_IsNumber(id))
                ids_.observe(name, static_cast<core::EntityId>(id->valuedouble));
            cJSON_Delete(doc);
        }
        Logger::log(LogLevel::DEBUG, "Storage: " + name + " resumes after id " +
                                         std::to_string(ids_.current(name)));
    }
}

Entity* EntityManager::persist(std::unique_ptr<Entity> entity)
{
    if (!entity)
        throw std::invalid_argument("Cannot persist a null entity");
    if (entity->id())
        throw std::invalid_argument(std::string(core::kind_name(entity->kind())) +
                                    " already carries an identifier");

    Entity* raw = entity.get();
    Slot slot;
    slot.entity = std::move(entity);
    slots_.push_back(std::move(slot));
    index_[raw] = slots_.size() - 1;

    Logger::log(LogLevel::TRACE,
                std::string("Storage: Scheduled insert of ") + core::kind_name(raw->kind()));
    return raw;
}

void EntityManager::remove(const Entity* entity)
{
    Slot* slot = slot_of(entity);
    if (!slot)
        throw std::invalid_argument("Entity is not managed by this EntityManager");

    if (slot->state == SlotState::ScheduledInsert) {
        plan_inserts_.erase(std::remove(plan_inserts_.begin(), plan_inserts_.end(), entity),
                            plan_inserts_.end());
        slots_.erase(std::remove_if(slots_.begin(), slots_.end(),
                                    [entity](const Slot& s) { return s.entity.get() == entity; }),
                     slots_.end());
        reindex();
        return;
    }
    slot->state = SlotState::ScheduledDelete;
}

void EntityManager::add_listener(FlushListener* listener)
{
    listeners_.push_back(listener);
}

/**
 * @brief Runs commit cycles until no drain is requested.
 *
 * A call made while a cycle is running (typically from `post_flush`) only sets
 * the drain flag; the outer call runs the extra cycle once the current one has
 * finished notifying. Any exception aborts the flush: listeners get `on_abort`
 * and the exception is rethrown unchanged.
 */
void EntityManager::flush()
{
    if (in_cycle_) {
        drain_requested_ = true;
        Logger::log(LogLevel::DEBUG, "Storage: Drain cycle requested.");
        return;
    }

    ScopedFlag cycle_guard(in_cycle_);
    try {
        int cycles = 0;
        do {
            if (++cycles > kMaxCyclesPerFlush)
                throw StorageError("Flush did not settle after " +
                                   std::to_string(kMaxCyclesPerFlush) + " commit cycles");
            drain_requested_ = false;
            run_cycle();
        } while (drain_requested_ && has_pending_writes());
    } catch (...) {
        abort_cycle();
        throw;
    }
}

void EntityManager::abort_cycle()
{
    Logger::log(LogLevel::WARN, "Storage: Flush aborted. Unwritten changes stay pending.");
    drain_requested_ = false;
    plan_inserts_.clear();
    plan_updates_.clear();
    plan_deletes_.clear();

    for (FlushListener* listener : listeners_)
        listener->on_abort(*this);
}

void EntityManager::run_cycle()
{
    recompute_change_sets();
    Logger::log(LogLevel::DEBUG, "Storage: Commit cycle (" + std::to_string(plan_inserts_.size()) +
                                     " inserts, " + std::to_string(plan_updates_.size()) +
                                     " updates, " + std::to_string(plan_deletes_.size()) +
                                     " deletes).");

    for (FlushListener* listener : listeners_)
        listener->on_flush(*this);

    write_inserts();
    write_updates_and_deletes();
    release_deleted();

    for (FlushListener* listener : listeners_)
        listener->post_flush(*this);
}

void EntityManager::write_inserts()
{
    // Listeners may persist during post_persist; those wait for the next cycle.
    std::vector<Entity*> inserts = plan_inserts_;
    for (Entity* entity : inserts) {
        Slot* slot = slot_of(entity);
        if (!slot || slot->state != SlotState::ScheduledInsert)
            continue;

        std::string collection = core::kind_name(entity->kind());
        core::EntityId id = ids_.current(collection) + 1;
        write(collection, {serialize(*entity, id)});
        entity->assign_id(ids_.next(collection));

        slot = slot_of(entity);
        slot->state = SlotState::Managed;
        slot->original = entity->read_fields();
        slot->changes.clear();

        for (FlushListener* listener : listeners_)
            listener->post_persist(*this, *entity);
    }
}

/**
 * @brief Appends one batch per collection.
 *
 * Snapshots of a collection's updated entities are refreshed only after its
 * batch was written; a failed batch leaves its edits pending.
 */
void EntityManager::write_updates_and_deletes()
{
    std::unordered_map<std::string, std::vector<std::string>> batches;
    std::unordered_map<std::string, std::vector<Entity*>> updated;

    for (Entity* entity : plan_updates_) {
        const Slot* slot = slot_of(entity);
        if (!slot || slot->state != SlotState::Managed)
            continue;
        std::string collection = core::kind_name(entity->kind());
        batches[collection].push_back(serialize(*entity));
        updated[collection].push_back(entity);
    }

    for (Entity* entity : plan_deletes_) {
        cJSON* tomb = cJSON_CreateObject();
        cJSON_AddNumberToObject(tomb, "_id", static_cast<double>(entity->id().value_or(0)));
        cJSON_AddBoolToObject(tomb, "_deleted", true);
        batches[core::kind_name(entity->kind())].push_back(print_and_free(tomb));
    }

    for (const auto& [collection, docs] : batches) {
        write(collection, docs);
        for (Entity* entity : updated[collection]) {
            Slot* slot = slot_of(entity);
            slot->original = entity->read_fields();
            slot->changes.clear();
        }
    }
}

void EntityManager::release_deleted()
{
    std::vector<Entity*> deleted = plan_deletes_;
    slots_.erase(std::remove_if(slots_.begin(), slots_.end(),
                                [&deleted](const Slot& s) {
                                    return s.state == SlotState::ScheduledDelete &&
                                           std::find(deleted.begin(), deleted.end(),
                                                     s.entity.get()) != deleted.end();
                                }),
                 slots_.end());
    reindex();

    plan_inserts_.clear();
    plan_updates_.clear();
    plan_deletes_.clear();
}

Entity* EntityManager::find(EntityKind kind, core::EntityId id) const
{
    for (const auto& slot : slots_) {
        if (slot.entity->kind() == kind && slot.entity->id() == id)
            return slot.entity.get();
    }
    return nullptr;
}

std::vector<const Entity*> EntityManager::managed(EntityKind base) const
{
    std::vector<const Entity*> out;
    for (const auto& slot : slots_) {
        if (core::is_a(slot.entity->kind(), base))
            out.push_back(slot.entity.get());
    }
    return out;
}

std::vector<const Entity*> EntityManager::pending_updates() const
{
    return std::vector<const Entity*>(plan_updates_.begin(), plan_updates_.end());
}

std::vector<const Entity*> EntityManager::pending_deletes() const
{
    return std::vector<const Entity*>(plan_deletes_.begin(), plan_deletes_.end());
}

core::FieldChangeSet EntityManager::field_change_set(const Entity& entity) const
{
    const Slot* slot = slot_of(&entity);
    return slot ? slot->changes : core::FieldChangeSet{};
}

core::FieldMap EntityManager::original_snapshot(const Entity& entity) const
{
    const Slot* slot = slot_of(&entity);
    return slot ? slot->original : core::FieldMap{};
}

AssociationMappings EntityManager::association_mappings(EntityKind kind) const
{
    return metadata_.associations_of(kind);
}

void EntityManager::recompute_change_sets()
{
    plan_inserts_.clear();
    plan_updates_.clear();
    plan_deletes_.clear();

    for (auto& slot : slots_) {
        switch (slot.state) {
        case SlotState::ScheduledInsert:
            plan_inserts_.push_back(slot.entity.get());
            break;
        case SlotState::ScheduledDelete:
            plan_deletes_.push_back(slot.entity.get());
            break;
        case SlotState::Managed:
            slot.changes = diff(slot);
            if (!slot.changes.empty())
                plan_updates_.push_back(slot.entity.get());
            break;
        }
    }
}

bool EntityManager::has_pending_writes() const
{
    return std::any_of(slots_.begin(), slots_.end(), [this](const Slot& slot) {
        return slot.state != SlotState::Managed || !diff(slot).empty();
    });
}

EntityManager::Slot* EntityManager::slot_of(const Entity* entity)
{
    auto it = index_.find(entity);
    return it == index_.end() ? nullptr : &slots_[it->second];
}

const EntityManager::Slot* EntityManager::slot_of(const Entity* entity) const
{
    auto it = index_.find(entity);
    return it == index_.end() ? nullptr : &slots_[it->second];
}

/// Rebuilds the entity to slot position index after slots were erased.
void EntityManager::reindex()
{
    index_.clear();
    for (std::size_t i = 0; i < slots_.size(); ++i)
        index_[slots_[i].entity.get()] = i;
}

/**
 * @brief Field-level diff of the current state against the last committed snapshot.
 *
 * Fields present now are listed in declaration order; fields that disappeared
 * are appended with a null new value.
 */
core::FieldChangeSet EntityManager::diff(const Slot& slot) const
{
    core::FieldChangeSet changes;
    core::FieldMap current = slot.entity->read_fields();

    for (const auto& [name, value] : current) {
        const core::Value* old = slot.original.find(name);
        if (old && *old == value)
            continue;
        changes.push_back({name, core::FieldChange{old ? *old : core::Value(), value}});
    }
    for (const auto& [name, value] : slot.original) {
        if (!current.contains(name))
            changes.push_back({name, core::FieldChange{value, core::Value()}});
    }
    return changes;
}

/**
 * @brief Storage document of an entity: its own document plus `<field>_id`
 * foreign keys for every mapped association.
 *
 * `id` overrides `_id` for an insert whose identifier is assigned after the write.
 */
std::string EntityManager::serialize(const Entity& entity, std::optional<core::EntityId> id) const
{
    cJSON* doc = entity.to_document();
    if (id)
        cJSON_ReplaceItemInObjectCaseSensitive(doc, "_id",
                                               cJSON_CreateNumber(static_cast<double>(*id)));
    for (const auto& mapping : metadata_.associations_of(entity.kind())) {
        const Entity* target = entity.read_association(mapping.field);
        std::string key = mapping.field + "_id";
        if (target && target->id())
            cJSON_AddNumberToObject(doc, key.c_str(), static_cast<double>(*target->id()));
        else
            cJSON_AddNullToObject(doc, key.c_str());
    }
    return print_and_free(doc);
}

void EntityManager::write(const std::string& collection, const std::vector<std::string>& docs)
{
    if (!engine_.append(collection, docs)) {
        Logger::log(LogLevel::ERROR, "Storage: Append failed for " + collection);
        throw StorageError("Failed to append to " + engine_.get_path(collection));
    }
}

} // namespace audex::storage
