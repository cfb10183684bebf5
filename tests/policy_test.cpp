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
 * @file policy_test.cpp
 * @brief Unit tests for the kind hierarchy and the redaction policy.
 */

#include "audex/audit/redaction_policy.hpp"
#include "audex/core/entity.hpp"
#include "framework.hpp"

#include <string>
#include <vector>

using audex::audit::RedactionPolicy;
using audex::core::EntityKind;
using audex::core::FieldMap;

/**
 * @brief Subtype closure: every tracked kind is a DBElement, tokens are not.
 */
void test_kind_hierarchy_closure()
{
    using audex::core::is_a;

    ASSERT_TRUE(is_a(EntityKind::PartAttachment, EntityKind::Attachment));
    ASSERT_TRUE(is_a(EntityKind::PartAttachment, EntityKind::DBElement));
    ASSERT_TRUE(is_a(EntityKind::LogEntry, EntityKind::DBElement));
    ASSERT_FALSE(is_a(EntityKind::Attachment, EntityKind::PartAttachment));
    ASSERT_FALSE(is_a(EntityKind::ApiToken, EntityKind::DBElement));

    auto lineage = audex::core::lineage_of(EntityKind::UserAttachment);
    ASSERT_EQ(lineage.size(), static_cast<size_t>(3));
    ASSERT_TRUE(lineage[2] == EntityKind::DBElement);

    ASSERT_TRUE(audex::core::kind_from_name("PartLot") == EntityKind::PartLot);
    ASSERT_FALSE(audex::core::kind_from_name("Storelocation").has_value());
}

/**
 * @brief The default table forbids User credentials and nothing on other kinds.
 */
void test_policy_defaults()
{
    RedactionPolicy policy = RedactionPolicy::defaults();

    ASSERT_TRUE(policy.is_restricted(EntityKind::User));
    ASSERT_FALSE(policy.should_field_be_saved(EntityKind::User, "password"));
    ASSERT_FALSE(policy.should_field_be_saved(EntityKind::User, "googleAuthenticatorSecret"));
    ASSERT_FALSE(policy.should_field_be_saved(EntityKind::User, "backupCodesGenerationDate"));
    ASSERT_TRUE(policy.should_field_be_saved(EntityKind::User, "name"));

    ASSERT_FALSE(policy.is_restricted(EntityKind::Part));
    ASSERT_TRUE(policy.should_field_be_saved(EntityKind::Part, "password"));
}

/**
 * @brief Rules declared on a base kind apply to every subtype.
 */
void test_policy_inherits_to_subtypes()
{
    RedactionPolicy policy({{EntityKind::Attachment, {"path"}},
                            {EntityKind::PartAttachment, {"name"}}});

    ASSERT_FALSE(policy.should_field_be_saved(EntityKind::PartAttachment, "path"));
    ASSERT_FALSE(policy.should_field_be_saved(EntityKind::PartAttachment, "name"));
    ASSERT_TRUE(policy.should_field_be_saved(EntityKind::Attachment, "name"));
    ASSERT_TRUE(policy.is_restricted(EntityKind::UserAttachment));
    ASSERT_FALSE(policy.is_restricted(EntityKind::Part));
}

/**
 * @brief Filtering drops forbidden keys and keeps the order of the rest.
 */
void test_policy_filter_keeps_order()
{
    RedactionPolicy policy = RedactionPolicy::defaults();
    FieldMap fields{{"email", "a@b.c"}, {"password", "hash"}, {"name", "alice"},
                    {"pw_reset_token", nullptr}};

    FieldMap allowed = policy.filter(EntityKind::User, fields);
    std::vector<std::string> keys = allowed.keys();
    ASSERT_EQ(keys.size(), static_cast<size_t>(2));
    ASSERT_EQ(keys[0], std::string("email"));
    ASSERT_EQ(keys[1], std::string("name"));

    std::vector<std::string> names =
        policy.filter_names(EntityKind::User, {"password", "need_pw_change", "last_name"});
    ASSERT_EQ(names.size(), static_cast<size_t>(1));
    ASSERT_EQ(names[0], std::string("last_name"));

    ASSERT_TRUE(policy.filter(EntityKind::Part, fields) == fields);
}
