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
 * @file change_set.cpp
 * @brief Change-set construction.
 */

#include "audex/audit/change_set.hpp"

#include "audex/infra/string.hpp"

namespace audex::audit {

DiffSource DiffSource::from_changes(const core::FieldChangeSet& changes)
{
    DiffSource source;
    source.changes_ = &changes;
    return source;
}

DiffSource DiffSource::from_snapshot(const core::FieldMap& snapshot)
{
    DiffSource source;
    source.snapshot_ = &snapshot;
    return source;
}

core::FieldMap DiffSource::previous_values(bool keep_nulls) const
{
    core::FieldMap out;
    if (snapshot_) {
        for (const auto& [name, value] : *snapshot_) {
            if (keep_nulls || !value.is_null())
                out.set(name, value);
        }
    } else if (changes_) {
        for (const auto& [name, change] : *changes_) {
            if (keep_nulls || !change.old_value.is_null())
                out.set(name, change.old_value);
        }
    }
    return out;
}

ChangeSet ChangeSetBuilder::build(const core::Entity& entity, const DiffSource& source,
                                  bool was_deleted) const
{
    // A deleted entity is described by its whole last committed state; an edit
    // only by the informative (non-null) previous values.
    core::FieldMap candidates = source.previous_values(was_deleted);
    core::FieldMap allowed = policy_.filter(entity.kind(), candidates);

    ChangeSet out;
    for (const auto& [name, value] : allowed) {
        if (value.is_string())
            out.set(name, infra::String::truncate(value.as_string(), kMaxStringLength,
                                                  kTruncationMarker));
        else
            out.set(name, value);
    }
    return out;
}

} // namespace audex::audit
