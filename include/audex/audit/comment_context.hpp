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
 * @file comment_context.hpp
 * @brief The "reason for change" attached to every entry of one flush.
 */

#pragma once

#include <optional>
#include <string>

namespace audex::audit {

/**
 * @class CommentContext
 * @brief Holds at most one pending comment for the next flush.
 *
 * @details
 * The caller sets the comment before flushing. Every entry built during that
 * flush (pre-commit scan and creation hooks alike) reads the same value; the
 * capture subscriber clears it when the flush's post-commit phase ends.
 */
class CommentContext {
  public:
    /// @brief Stores the trimmed message; a blank message leaves the context empty.
    void set(const std::string& message);

    bool is_set() const { return message_.has_value(); }
    const std::optional<std::string>& message() const { return message_; }

    void clear() { message_.reset(); }

  private:
    std::optional<std::string> message_;
};

/**
 * @class CommentScope
 * @brief Clears a `CommentContext` when the scope ends, however it ends.
 *
 * @code
 * {
 *     audit::CommentScope scope(comments, "Recount after inventory");
 *     em.flush();
 * } // comment gone even if flush() threw
 * @endcode
 */
class CommentScope {
  public:
    explicit CommentScope(CommentContext& context) : context_(context) {}
    CommentScope(CommentContext& context, const std::string& message) : context_(context)
    {
        context_.set(message);
    }
    ~CommentScope() { context_.clear(); }

    CommentScope(const CommentScope&) = delete;
    CommentScope& operator=(const CommentScope&) = delete;

  private:
    CommentContext& context_;
};

} // namespace audex::audit
