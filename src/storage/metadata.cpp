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
 * @file metadata.cpp
 * @brief Association mapping registry.
 */

#include "audex/storage/metadata.hpp"

#include <algorithm>

namespace audex::storage {

using core::EntityKind;

ClassMetadata ClassMetadata::defaults()
{
    ClassMetadata m;
    m.add(EntityKind::PartLot, {"part", EntityKind::Part, "partLots"});
    m.add(EntityKind::Orderdetail, {"part", EntityKind::Part, "orderdetails"});
    m.add(EntityKind::Pricedetail, {"orderdetail", EntityKind::Orderdetail, "pricedetails"});
    m.add(EntityKind::Attachment, {"element", EntityKind::DBElement, "attachments"});
    m.add(EntityKind::PartAttachment, {"element", EntityKind::Part, "attachments"});
    m.add(EntityKind::UserAttachment, {"element", EntityKind::User, "attachments"});
    return m;
}

void ClassMetadata::add(EntityKind owner, AssociationMapping mapping)
{
    declared_[owner].push_back(std::move(mapping));
}

AssociationMappings ClassMetadata::associations_of(EntityKind kind) const
{
    AssociationMappings out;
    for (EntityKind k : core::lineage_of(kind)) {
        auto it = declared_.find(k);
        if (it == declared_.end())
            continue;
        for (const auto& mapping : it->second) {
            bool shadowed = std::any_of(out.begin(), out.end(), [&](const AssociationMapping& m) {
                return m.field == mapping.field;
            });
            if (!shadowed)
                out.push_back(mapping);
        }
    }
    return out;
}

} // namespace audex::storage
