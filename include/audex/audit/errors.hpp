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
 * @file errors.hpp
 * @brief Exception types raised by the change-capture layer.
 *
 * @details
 * None of these are caught inside the layer. Storage failures are reported as
 * `audex::storage::StorageError` and pass through unchanged.
 */

#pragma once

#include <stdexcept>

namespace audex::audit {

/**
 * @class ContractViolation
 * @brief A caller passed an argument the operation is not defined for.
 */
class ContractViolation : public std::logic_error {
  public:
    using std::logic_error::logic_error;
};

/**
 * @class OrderingError
 * @brief A flush hook arrived outside the on_flush / post_persist / post_flush sequence.
 */
class OrderingError : public std::logic_error {
  public:
    using std::logic_error::logic_error;
};

/**
 * @class ConfigurationError
 * @brief Static tables or configuration files are inconsistent with the model.
 */
class ConfigurationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

} // namespace audex::audit
