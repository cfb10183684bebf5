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
 * @file redaction_policy.hpp
 * @brief Per-kind field blacklist for audit payloads.
 */

#pragma once

#include "audex/core/entity.hpp"
#include "audex/core/value.hpp"

#include <array>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace audex::audit {

/**
 * @class RedactionPolicy
 * @brief Decides which fields of an entity may appear in a log entry.
 *
 * @details
 * The table maps a kind to forbidden field names. A rule declared for a kind
 * applies to all of its subtypes; the effective set of every kind is computed
 * once in the constructor. Kinds without rules allow every field.
 *
 * The policy is immutable after construction.
 */
class RedactionPolicy {
  public:
    using Table = std::map<core::EntityKind, std::set<std::string>>;

    explicit RedactionPolicy(const Table& blacklist);

    /// @brief The credential fields of `User`.
    static RedactionPolicy defaults();

    /// @brief True if `kind` (or an ancestor) has any forbidden field.
    bool is_restricted(core::EntityKind kind) const;

    /// @brief False iff `field` is forbidden for `kind` or one of its ancestors.
    bool should_field_be_saved(core::EntityKind kind, const std::string& field) const;

    /// @brief Copy of `fields` without forbidden keys, order preserved.
    core::FieldMap filter(core::EntityKind kind, const core::FieldMap& fields) const;

    /// @brief Copy of `names` without forbidden names, order preserved.
    std::vector<std::string> filter_names(core::EntityKind kind,
                                          const std::vector<std::string>& names) const;

  private:
    std::array<std::set<std::string>, core::kEntityKindCount> effective_;

    const std::set<std::string>& rules_for(core::EntityKind kind) const;
};

} // namespace audex::audit
