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
 * @file entity.hpp
 * @brief Entity kinds, the static kind hierarchy and the readable-field interface.
 *
 * @details
 * Every persistent object carries an `EntityKind` tag. Kinds form a single
 * inheritance tree rooted at `DBElement` (tracked domain objects); kinds outside
 * that tree are untracked. The subtype closure is computed once, so `is_a` is a
 * table lookup.
 */

#pragma once

#include "audex/core/value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace audex::core {

/**
 * @enum EntityKind
 * @brief Type tag of a persistent object.
 */
enum class EntityKind {
    DBElement,      ///< Abstract root of all tracked domain objects.
    Attachment,     ///< File attached to another element.
    PartAttachment, ///< Attachment owned by a part.
    UserAttachment, ///< Attachment owned by a user.
    AttachmentType,
    Part,
    PartLot,     ///< Stock of a part at one storage location.
    Orderdetail, ///< Supplier order information of a part.
    Pricedetail, ///< Price tier of an order detail.
    User,
    Group,
    LogEntry, ///< Audit records themselves. Tracked by storage, never audited.
    ApiToken  ///< Untracked: outside the `DBElement` tree.
};

/// @brief Number of `EntityKind` enumerators.
constexpr std::size_t kEntityKindCount = static_cast<std::size_t>(EntityKind::ApiToken) + 1;

/// @brief Stable name of a kind; also used as storage collection name.
const char* kind_name(EntityKind kind);

/// @brief Reverse of `kind_name`.
std::optional<EntityKind> kind_from_name(const std::string& name);

/// @brief Direct parent in the kind tree, empty for roots.
std::optional<EntityKind> parent_of(EntityKind kind);

/**
 * @brief Subtype test: true if `kind == base` or `base` is an ancestor of `kind`.
 */
bool is_a(EntityKind kind, EntityKind base);

/// @brief `kind` followed by its ancestors, nearest first.
std::vector<EntityKind> lineage_of(EntityKind kind);

/// @brief Persistent identifier. Assigned by the storage layer on insert.
using EntityId = std::int64_t;

/**
 * @struct EntityRef
 * @brief Polymorphic reference to a persistent object.
 */
struct EntityRef {
    EntityKind kind = EntityKind::DBElement;
    std::optional<EntityId> id;

    bool operator==(const EntityRef& other) const { return kind == other.kind && id == other.id; }
    bool operator!=(const EntityRef& other) const { return !(*this == other); }
};

/**
 * @class Entity
 * @brief Base of every persistent object.
 *
 * @details
 * Subclasses expose their state through `read_fields()` (scalar columns) and
 * `read_association()` (to-one references). The storage layer diffs successive
 * `read_fields()` snapshots to detect edits.
 */
class Entity {
  public:
    virtual ~Entity() = default;

    virtual EntityKind kind() const = 0;

    /// @brief Scalar persistent state, in declaration order.
    virtual FieldMap read_fields() const = 0;

    /**
     * @brief Reads a to-one association.
     *
     * @return The referenced entity, or `nullptr` if the association is empty.
     * @throws std::out_of_range If the entity has no association named `field`.
     */
    virtual const Entity* read_association(const std::string& field) const;

    /**
     * @brief Storage document: `_id` followed by `read_fields()`.
     *
     * @warning The caller owns the returned object.
     */
    virtual cJSON* to_document() const;

    std::optional<EntityId> id() const { return id_; }
    EntityRef ref() const { return EntityRef{kind(), id_}; }

    /**
     * @brief Sets the persistent identifier. Called by the storage layer only.
     *
     * @throws std::logic_error If an identifier was already assigned.
     */
    void assign_id(EntityId id);

  protected:
    Entity() = default;
    Entity(const Entity&) = default;
    Entity& operator=(const Entity&) = default;

  private:
    std::optional<EntityId> id_;
};

} // namespace audex::core
