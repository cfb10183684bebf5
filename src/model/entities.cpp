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
 * @file entities.cpp
 * @brief Field exposure of the inventory domain objects.
 */

#include "audex/model/entities.hpp"

#include <stdexcept>

namespace audex::model {

using core::Value;

namespace {

Value optional_text(const std::optional<std::string>& v)
{
    return v ? Value(*v) : Value();
}

} // namespace

FieldMap User::read_fields() const
{
    return FieldMap{
        {"name", name},
        {"first_name", first_name},
        {"last_name", last_name},
        {"email", email},
        {"password", password},
        {"need_pw_change", need_pw_change},
        {"googleAuthenticatorSecret", optional_text(google_authenticator_secret)},
        {"backupCodes", backup_codes},
        {"trustedDeviceCookieVersion", trusted_device_cookie_version},
        {"pw_reset_token", optional_text(pw_reset_token)},
        {"backupCodesGenerationDate", optional_text(backup_codes_generation_date)},
    };
}

FieldMap Group::read_fields() const
{
    return FieldMap{{"name", name}, {"comment", comment}};
}

FieldMap Part::read_fields() const
{
    return FieldMap{
        {"name", name},
        {"description", description},
        {"comment", comment},
        {"minamount", min_amount},
        {"needs_review", needs_review},
        {"manufacturer_product_number", optional_text(manufacturer_product_number)},
    };
}

FieldMap PartLot::read_fields() const
{
    return FieldMap{
        {"description", description},
        {"comment", comment},
        {"amount", amount},
        {"instock_unknown", instock_unknown},
        {"expiration_date", optional_text(expiration_date)},
    };
}

const Entity* PartLot::read_association(const std::string& field) const
{
    if (field == "part")
        return part;
    return Entity::read_association(field);
}

FieldMap Orderdetail::read_fields() const
{
    return FieldMap{
        {"supplierpartnr", supplierpartnr},
        {"obsolete", obsolete},
        {"supplier_product_url", supplier_product_url},
    };
}

const Entity* Orderdetail::read_association(const std::string& field) const
{
    if (field == "part")
        return part;
    return Entity::read_association(field);
}

FieldMap Pricedetail::read_fields() const
{
    return FieldMap{
        {"price", price},
        {"min_discount_quantity", min_discount_quantity},
        {"price_related_quantity", price_related_quantity},
    };
}

const Entity* Pricedetail::read_association(const std::string& field) const
{
    if (field == "orderdetail")
        return orderdetail;
    return Entity::read_association(field);
}

Attachment::Attachment(EntityKind kind) : kind_(kind)
{
    if (!core::is_a(kind, EntityKind::Attachment))
        throw std::invalid_argument(std::string("Not an attachment kind: ") +
                                    core::kind_name(kind));
}

FieldMap Attachment::read_fields() const
{
    return FieldMap{{"name", name}, {"path", path}, {"show_in_table", show_in_table}};
}

const Entity* Attachment::read_association(const std::string& field) const
{
    if (field == "element")
        return element;
    return Entity::read_association(field);
}

FieldMap ApiToken::read_fields() const
{
    return FieldMap{{"name", name}, {"token", token}};
}

} // namespace audex::model
