//! # TOML Subset Reader
//!
//! Each line is trimmed, then classified as blank, comment, table header or
//! `key = value` entry. Anything else is an error carrying the line number.

#include "config/toml_reader.hpp"

#include "log/log.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

namespace stencil::config {

namespace {

auto trim(std::string_view s) -> std::string_view {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

/// Decodes a quoted string starting at `s[0] == '"'`. On success `consumed`
/// is the number of bytes including both quotes.
auto parse_quoted(std::string_view s, size_t& consumed) -> std::optional<std::string> {
    std::string out;
    size_t i = 1;
    while (i < s.size()) {
        char c = s[i];
        if (c == '"') {
            consumed = i + 1;
            return out;
        }
        if (c == '\\' && i + 1 < s.size()) {
            char escaped = s[i + 1];
            switch (escaped) {
            case '"':
                out.push_back('"');
                break;
            case '\\':
                out.push_back('\\');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 't':
                out.push_back('\t');
                break;
            default:
                return std::nullopt;
            }
            i += 2;
            continue;
        }
        out.push_back(c);
        ++i;
    }
    return std::nullopt;
}

/// Strips a trailing `# comment` from an unquoted value.
auto strip_comment(std::string_view s) -> std::string_view {
    size_t hash = s.find('#');
    if (hash != std::string_view::npos) {
        s = s.substr(0, hash);
    }
    return trim(s);
}

} // namespace

auto ConfigError::to_string() const -> std::string {
    if (line == 0) {
        return message;
    }
    return "line " + std::to_string(line) + ": " + message;
}

auto TomlTable::get(std::string_view key) const -> const TomlEntry* {
    const TomlEntry* found = nullptr;
    for (const auto& entry : entries) {
        if (entry.key == key) {
            found = &entry;
        }
    }
    return found;
}

auto parse_toml(std::string_view content) -> Result<std::vector<TomlTable>, ConfigError> {
    std::vector<TomlTable> tables;
    tables.push_back(TomlTable{.name = "", .is_array_element = false, .entries = {}, .line = 0});

    uint32_t line_num = 0;
    size_t pos = 0;
    while (pos <= content.size()) {
        size_t eol = content.find('\n', pos);
        if (eol == std::string_view::npos) {
            eol = content.size();
        }
        std::string_view line = trim(content.substr(pos, eol - pos));
        pos = eol + 1;
        ++line_num;

        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Table headers
        if (line[0] == '[') {
            bool is_array = line.size() >= 2 && line[1] == '[';
            std::string_view close = is_array ? "]]" : "]";
            size_t open_len = is_array ? 2 : 1;
            size_t close_pos = line.find(close, open_len);
            if (close_pos == std::string_view::npos ||
                !strip_comment(line.substr(close_pos + close.size())).empty()) {
                return ConfigError{.message = "malformed table header", .line = line_num};
            }
            std::string_view name = trim(line.substr(open_len, close_pos - open_len));
            if (name.empty()) {
                return ConfigError{.message = "empty table name", .line = line_num};
            }
            tables.push_back(TomlTable{.name = std::string(name),
                                       .is_array_element = is_array,
                                       .entries = {},
                                       .line = line_num});
            continue;
        }

        // Key
        std::string key;
        size_t rest_start = 0;
        if (line[0] == '"') {
            size_t consumed = 0;
            auto quoted = parse_quoted(line, consumed);
            if (!quoted) {
                return ConfigError{.message = "unterminated quoted key", .line = line_num};
            }
            key = std::move(*quoted);
            rest_start = consumed;
        } else {
            size_t eq = line.find('=');
            if (eq == std::string_view::npos) {
                return ConfigError{.message = "expected `key = value`", .line = line_num};
            }
            key = std::string(trim(line.substr(0, eq)));
            rest_start = eq;
        }

        std::string_view rest = trim(line.substr(rest_start));
        if (rest.empty() || rest[0] != '=') {
            return ConfigError{.message = "expected '=' after key \"" + key + "\"",
                               .line = line_num};
        }
        if (key.empty()) {
            return ConfigError{.message = "empty key", .line = line_num};
        }
        rest = trim(rest.substr(1));

        // Value
        TomlEntry entry{.key = std::move(key), .value = "", .quoted = false, .line = line_num};
        if (!rest.empty() && rest[0] == '"') {
            size_t consumed = 0;
            auto quoted = parse_quoted(rest, consumed);
            if (!quoted) {
                return ConfigError{.message = "invalid string value", .line = line_num};
            }
            if (!strip_comment(rest.substr(consumed)).empty()) {
                return ConfigError{.message = "unexpected text after string value",
                                   .line = line_num};
            }
            entry.value = std::move(*quoted);
            entry.quoted = true;
        } else {
            std::string_view bare = strip_comment(rest);
            if (bare.empty()) {
                return ConfigError{.message = "missing value", .line = line_num};
            }
            entry.value = std::string(bare);
        }

        tables.back().entries.push_back(std::move(entry));
    }

    return tables;
}

auto load_toml_file(const std::string& path) -> Result<std::vector<TomlTable>, ConfigError> {
    std::ifstream file(path);
    if (!file) {
        return ConfigError{.message = "cannot open " + path, .line = 0};
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    STENCIL_LOG_DEBUG("config", "loading " << path);
    auto result = parse_toml(buffer.str());
    if (is_err(result)) {
        auto& err = unwrap_err(result);
        err.message = path + ": " + err.message;
    }
    return result;
}

auto entry_as_bool(const TomlEntry& entry) -> Result<bool, ConfigError> {
    if (!entry.quoted) {
        if (entry.value == "true") {
            return true;
        }
        if (entry.value == "false") {
            return false;
        }
    }
    return ConfigError{.message = "expected true or false for \"" + entry.key + "\"",
                       .line = entry.line};
}

auto entry_as_int(const TomlEntry& entry) -> Result<int64_t, ConfigError> {
    int64_t value = 0;
    const char* first = entry.value.data();
    const char* last = first + entry.value.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (entry.quoted || ec != std::errc{} || ptr != last) {
        return ConfigError{.message = "expected an integer for \"" + entry.key + "\"",
                           .line = entry.line};
    }
    return value;
}

} // namespace stencil::config
