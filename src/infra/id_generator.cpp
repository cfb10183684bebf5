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
 * @file id_generator.cpp
 * @brief Implementation of the per-collection identifier sequences.
 */

#include "audex/infra/id_generator.hpp"

#include <algorithm>

namespace audex::infra {

std::int64_t IdGenerator::next(const std::string& collection)
{
    return ++sequences_[collection];
}

void IdGenerator::observe(const std::string& collection, std::int64_t id)
{
    auto& seq = sequences_[collection];
    seq = std::max(seq, id);
}

std::int64_t IdGenerator::current(const std::string& collection) const
{
    auto it = sequences_.find(collection);
    return it == sequences_.end() ? 0 : it->second;
}

} // namespace audex::infra
