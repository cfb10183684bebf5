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
 * @file change_set.hpp
 * @brief Redacted, size-bounded "previous values" of one entity.
 */

#pragma once

#include "audex/audit/redaction_policy.hpp"
#include "audex/core/entity.hpp"
#include "audex/core/value.hpp"

#include <cstddef>

namespace audex::audit {

/// @brief Field name -> previous value, as stored under payload key `d`.
using ChangeSet = core::FieldMap;

/**
 * @class DiffSource
 * @brief Non-owning view of what the unit of work knows about an entity's prior state.
 *
 * Either the per-field old/new pairs of an edit, or the full snapshot of the
 * last commit (used for deletions). The referenced container must outlive the view.
 */
class DiffSource {
  public:
    static DiffSource from_changes(const core::FieldChangeSet& changes);
    static DiffSource from_snapshot(const core::FieldMap& snapshot);

    bool is_snapshot() const { return snapshot_ != nullptr; }

    /**
     * @brief Candidate previous values.
     *
     * @param keep_nulls Whether fields whose previous value is null are listed.
     */
    core::FieldMap previous_values(bool keep_nulls) const;

  private:
    DiffSource() = default;

    const core::FieldChangeSet* changes_ = nullptr;
    const core::FieldMap* snapshot_ = nullptr;
};

/**
 * @class ChangeSetBuilder
 * @brief Turns a diff source into the `ChangeSet` stored in an audit entry.
 *
 * @details
 * Steps: pick candidates (whole snapshot for a deletion, non-null old values
 * for an edit), drop forbidden fields, cut long strings. An empty result is
 * valid. Never throws.
 */
class ChangeSetBuilder {
  public:
    /// Maximum characters of a string value, marker included.
    static constexpr std::size_t kMaxStringLength = 2000;
    static constexpr const char* kTruncationMarker = "...";

    explicit ChangeSetBuilder(const RedactionPolicy& policy) : policy_(policy) {}

    ChangeSet build(const core::Entity& entity, const DiffSource& source, bool was_deleted) const;

  private:
    const RedactionPolicy& policy_;
};

} // namespace audex::audit
