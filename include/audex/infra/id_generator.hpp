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
 * @file id_generator.hpp
 * @brief Per-collection identifier sequences.
 *
 * @details
 * Entities receive their persistent identifier only when the storage layer
 * commits them. Identifiers are positive, strictly increasing within a
 * collection and never reused, including across restarts once the generator
 * has observed the replayed identifiers.
 */

#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace audex::infra {

/**
 * @class IdGenerator
 * @brief Hands out monotonically increasing identifiers per collection.
 *
 * @note Not thread-safe. One generator belongs to one entity manager, which
 * runs its commit cycle on the caller's thread.
 */
class IdGenerator {
  public:
    /**
     * @brief Allocates the next identifier for `collection`.
     *
     * The first identifier of an empty collection is `1`.
     */
    std::int64_t next(const std::string& collection);

    /**
     * @brief Records an identifier that already exists (e.g. replayed from disk).
     *
     * Subsequent `next()` calls for the collection return values greater than `id`.
     */
    void observe(const std::string& collection, std::int64_t id);

    /// @brief Highest identifier handed out or observed, `0` if none.
    std::int64_t current(const std::string& collection) const;

  private:
    std::unordered_map<std::string, std::int64_t> sequences_;
};

} // namespace audex::infra
