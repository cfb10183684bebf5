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
 * @file comment_context.cpp
 * @brief Comment normalization.
 */

#include "audex/audit/comment_context.hpp"

#include "audex/infra/string.hpp"

namespace audex::audit {

void CommentContext::set(const std::string& message)
{
    std::string trimmed = infra::String::trim(message);
    if (trimmed.empty()) {
        message_.reset();
        return;
    }
    message_ = std::move(trimmed);
}

} // namespace audex::audit
