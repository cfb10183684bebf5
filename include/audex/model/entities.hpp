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
 * @file entities.hpp
 * @brief Tracked inventory domain objects.
 *
 * @details
 * Plain state holders. Associations are non-owning pointers into the entity
 * manager's identity map; the manager owns every persisted object.
 */

#pragma once

#include "audex/core/entity.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace audex::model {

using core::Entity;
using core::EntityKind;
using core::FieldMap;

class User : public Entity {
  public:
    std::string name;
    std::string first_name;
    std::string last_name;
    std::string email;
    std::string password;
    bool need_pw_change = false;
    std::optional<std::string> google_authenticator_secret;
    std::string backup_codes;
    int trusted_device_cookie_version = 0;
    std::optional<std::string> pw_reset_token;
    std::optional<std::string> backup_codes_generation_date;

    EntityKind kind() const override { return EntityKind::User; }
    FieldMap read_fields() const override;
};

class Group : public Entity {
  public:
    std::string name;
    std::string comment;

    EntityKind kind() const override { return EntityKind::Group; }
    FieldMap read_fields() const override;
};

class Part : public Entity {
  public:
    std::string name;
    std::string description;
    std::string comment;
    double min_amount = 0.0;
    bool needs_review = false;
    std::optional<std::string> manufacturer_product_number;

    EntityKind kind() const override { return EntityKind::Part; }
    FieldMap read_fields() const override;
};

class PartLot : public Entity {
  public:
    std::string description;
    std::string comment;
    double amount = 0.0;
    bool instock_unknown = false;
    std::optional<std::string> expiration_date;
    Part* part = nullptr;

    EntityKind kind() const override { return EntityKind::PartLot; }
    FieldMap read_fields() const override;
    const Entity* read_association(const std::string& field) const override;
};

class Orderdetail : public Entity {
  public:
    std::string supplierpartnr;
    bool obsolete = false;
    std::string supplier_product_url;
    Part* part = nullptr;

    EntityKind kind() const override { return EntityKind::Orderdetail; }
    FieldMap read_fields() const override;
    const Entity* read_association(const std::string& field) const override;
};

class Pricedetail : public Entity {
  public:
    /// Decimal price kept as text to avoid binary rounding.
    std::string price = "0";
    double min_discount_quantity = 1.0;
    double price_related_quantity = 1.0;
    Orderdetail* orderdetail = nullptr;

    EntityKind kind() const override { return EntityKind::Pricedetail; }
    FieldMap read_fields() const override;
    const Entity* read_association(const std::string& field) const override;
};

/**
 * @class Attachment
 * @brief A file attached to an element. The concrete kind names the owner type.
 */
class Attachment : public Entity {
  public:
    explicit Attachment(EntityKind kind = EntityKind::Attachment);

    std::string name;
    std::string path;
    bool show_in_table = false;
    Entity* element = nullptr;

    EntityKind kind() const override { return kind_; }
    FieldMap read_fields() const override;
    const Entity* read_association(const std::string& field) const override;

  private:
    EntityKind kind_;
};

/// @brief An untracked object; the audit layer ignores it.
class ApiToken : public Entity {
  public:
    std::string name;
    std::string token;

    EntityKind kind() const override { return EntityKind::ApiToken; }
    FieldMap read_fields() const override;
};

} // namespace audex::model
