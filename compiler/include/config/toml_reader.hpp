//! # TOML Subset Reader
//!
//! A line-oriented reader for the small TOML subset used by style and record
//! files.
//!
//! ## Supported Syntax
//!
//! ```toml
//! # comment
//! [colors]                  # table
//! commit_id = "blue"        # bare key, string value
//! "author name" = "yellow"  # quoted key
//!
//! [[commit]]                # array-of-tables element
//! empty = true              # boolean
//! author_timestamp = 1700000000000  # integer
//! ```
//!
//! Values are kept as text; quoted strings are unquoted and their `\"`,
//! `\\`, `\n` and `\t` escapes decoded. Multi-line values, inline tables and
//! arrays are not supported.

#ifndef STENCIL_CONFIG_TOML_READER_HPP
#define STENCIL_CONFIG_TOML_READER_HPP

#include "common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stencil::config {

/// An error in a configuration file.
struct ConfigError {
    std::string message;
    uint32_t line = 0; ///< 1-based; 0 when the error is not tied to a line

    [[nodiscard]] auto to_string() const -> std::string;
};

struct TomlEntry {
    std::string key;
    std::string value;
    bool quoted = false; ///< The value was a string literal
    uint32_t line = 0;
};

/// A `[name]` table or one `[[name]]` array element.
struct TomlTable {
    std::string name;
    bool is_array_element = false;
    std::vector<TomlEntry> entries;
    uint32_t line = 0;

    /// The value of `key`, if present. Later entries win.
    [[nodiscard]] auto get(std::string_view key) const -> const TomlEntry*;
};

/// Splits `content` into tables. Entries before the first header go into a
/// table with an empty name.
[[nodiscard]] auto parse_toml(std::string_view content)
    -> Result<std::vector<TomlTable>, ConfigError>;

/// Reads and parses a file.
[[nodiscard]] auto load_toml_file(const std::string& path)
    -> Result<std::vector<TomlTable>, ConfigError>;

/// Parses an entry as a boolean (`true` / `false`).
[[nodiscard]] auto entry_as_bool(const TomlEntry& entry) -> Result<bool, ConfigError>;

/// Parses an entry as a signed 64-bit integer.
[[nodiscard]] auto entry_as_int(const TomlEntry& entry) -> Result<int64_t, ConfigError>;

} // namespace stencil::config

#endif // STENCIL_CONFIG_TOML_READER_HPP
