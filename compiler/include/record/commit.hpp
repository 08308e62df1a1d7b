//! # Commit Records
//!
//! The record type the `stencil` tool renders, and its keyword binding.
//!
//! ## Keywords
//!
//! | Keyword                | Kind               |
//! |------------------------|--------------------|
//! | `description`          | String             |
//! | `change_id`            | CommitOrChangeId   |
//! | `commit_id`            | CommitOrChangeId   |
//! | `author`               | Signature          |
//! | `committer`            | Signature          |
//! | `working_copies`       | String             |
//! | `current_working_copy` | Boolean            |
//! | `branches`             | String             |
//! | `tags`                 | String             |
//! | `git_refs`             | String             |
//! | `git_head`             | String             |
//! | `divergent`            | Boolean            |
//! | `conflict`             | Boolean            |
//! | `empty`                | Boolean            |
//!
//! Every keyword value is labeled with the keyword's name.
//!
//! ## Records File
//!
//! ```toml
//! [[commit]]
//! commit_id = "8a3f5c2e..."
//! change_id = "kmqzyvwx..."
//! description = "Fix lexer\n"
//! author_name = "Ada"
//! author_email = "ada@example.com"
//! author_timestamp = 1700000000000   # milliseconds since the epoch
//! author_tz = 60                     # minutes east of UTC
//! branches = "main"
//! conflict = false
//! ```
//!
//! `committer_*` fields default to the author's.

#ifndef STENCIL_RECORD_COMMIT_HPP
#define STENCIL_RECORD_COMMIT_HPP

#include "builder/expression.hpp"
#include "common.hpp"
#include "config/toml_reader.hpp"
#include "types/value_types.hpp"

#include <string>
#include <vector>

namespace stencil::record {

struct Commit {
    std::string commit_id; ///< Hex
    std::string change_id; ///< Hex
    std::string description;
    types::Signature author;
    types::Signature committer;
    std::string working_copies; ///< e.g. "default@"
    bool current_working_copy = false;
    std::string branches;
    std::string tags;
    std::string git_refs;
    std::string git_head;
    bool divergent = false;
    bool conflict = false;
    bool empty = false;
};

/// Id indexes used to compute shortest unique prefixes.
struct CommitIndex {
    Rc<const types::IdIndex> commit_ids;
    Rc<const types::IdIndex> change_ids;
};

/// Indexes the ids of `commits`.
[[nodiscard]] auto build_commit_index(const std::vector<Commit>& commits) -> CommitIndex;

/// Resolves commit keywords. Ids are shortened against `index`.
[[nodiscard]] auto commit_keyword_resolver(CommitIndex index) -> builder::KeywordResolver<Commit>;

/// Names of all commit keywords.
[[nodiscard]] auto commit_keywords() -> const std::vector<std::string>&;

/// `text` with a trailing newline added when it is non-empty and lacks one.
[[nodiscard]] auto complete_newline(std::string text) -> std::string;

/// Reads the `[[commit]]` tables of a records file.
[[nodiscard]] auto parse_commits(std::string_view content)
    -> Result<std::vector<Commit>, config::ConfigError>;

[[nodiscard]] auto load_commits(const std::string& path)
    -> Result<std::vector<Commit>, config::ConfigError>;

} // namespace stencil::record

#endif // STENCIL_RECORD_COMMIT_HPP
