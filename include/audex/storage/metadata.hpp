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
 * @file metadata.hpp
 * @brief Static association mapping registry.
 */

#pragma once

#include "audex/core/entity.hpp"

#include <map>
#include <string>
#include <vector>

namespace audex::storage {

/**
 * @struct AssociationMapping
 * @brief A to-one association and the collection it populates on the other side.
 *
 * Example: `PartLot.part` targets `Part`, inversed by `Part.partLots`.
 */
struct AssociationMapping {
    std::string field;
    core::EntityKind target_kind;
    std::string inversed_by;
};

using AssociationMappings = std::vector<AssociationMapping>;

/**
 * @class ClassMetadata
 * @brief Per-kind association mappings, inherited along the kind tree.
 *
 * A subtype may redeclare an inherited field to narrow its target; the nearest
 * declaration wins.
 */
class ClassMetadata {
  public:
    /// @brief Mappings of the inventory domain model.
    static ClassMetadata defaults();

    void add(core::EntityKind owner, AssociationMapping mapping);

    /// @brief Own and inherited mappings of `kind`, nearest declaration first.
    AssociationMappings associations_of(core::EntityKind kind) const;

  private:
    std::map<core::EntityKind, AssociationMappings> declared_;
};

} // namespace audex::storage
