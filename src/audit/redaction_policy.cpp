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
 * @file redaction_policy.cpp
 * @brief Blacklist closure and filtering.
 */

#include "audex/audit/redaction_policy.hpp"

namespace audex::audit {

using core::EntityKind;

RedactionPolicy::RedactionPolicy(const Table& blacklist)
{
    for (std::size_t i = 0; i < core::kEntityKindCount; ++i) {
        auto kind = static_cast<EntityKind>(i);
        for (EntityKind ancestor : core::lineage_of(kind)) {
            auto it = blacklist.find(ancestor);
            if (it != blacklist.end())
                effective_[i].insert(it->second.begin(), it->second.end());
        }
    }
}

RedactionPolicy RedactionPolicy::defaults()
{
    return RedactionPolicy({
        {EntityKind::User,
         {"password", "need_pw_change", "googleAuthenticatorSecret", "backupCodes",
          "trustedDeviceCookieVersion", "pw_reset_token", "backupCodesGenerationDate"}},
    });
}

const std::set<std::string>& RedactionPolicy::rules_for(EntityKind kind) const
{
    return effective_[static_cast<std::size_t>(kind)];
}

bool RedactionPolicy::is_restricted(EntityKind kind) const
{
    return !rules_for(kind).empty();
}

bool RedactionPolicy::should_field_be_saved(EntityKind kind, const std::string& field) const
{
    return rules_for(kind).count(field) == 0;
}

core::FieldMap RedactionPolicy::filter(EntityKind kind, const core::FieldMap& fields) const
{
    if (!is_restricted(kind))
        return fields;

    core::FieldMap out;
    for (const auto& [name, value] : fields) {
        if (should_field_be_saved(kind, name))
            out.set(name, value);
    }
    return out;
}

std::vector<std::string> RedactionPolicy::filter_names(EntityKind kind,
                                                       const std::vector<std::string>& names) const
{
    if (!is_restricted(kind))
        return names;

    std::vector<std::string> out;
    for (const auto& name : names) {
        if (should_field_be_saved(kind, name))
            out.push_back(name);
    }
    return out;
}

} // namespace audex::audit
