//! # Template Source Text
//!
//! This module provides the source representation shared by the lexer, the
//! parser and the diagnostic emitter. It owns the template text, tracks line
//! starts and converts byte offsets into line/column locations.
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("commit_id.short()");
//! SourceLocation loc = source.location(10); // line 1, column 11
//! SourceSpan span = source.span(0, 9);      // `commit_id`
//! ```

#ifndef STENCIL_LEXER_SOURCE_HPP
#define STENCIL_LEXER_SOURCE_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace stencil::lexer {

/// Template source text with efficient location tracking.
///
/// # Memory Model
///
/// The source owns its content string. String views returned by `content()`,
/// `slice()` and `line()` are valid as long as the Source object exists.
class Source {
public:
    /// Constructs a source from a name and content. Builds the line index.
    Source(std::string filename, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Returns the byte at the given offset, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Returns the text from `start` to `end` (exclusive), clamped to bounds.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// Converts a byte offset to a 1-based line/column location.
    ///
    /// Offsets past the end map to the location just after the last byte.
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Builds the span covering `[start, end)`.
    [[nodiscard]] auto span(size_t start, size_t end) const -> SourceSpan;

    /// Returns the content of a line (1-indexed) without its line terminator.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    [[nodiscard]] auto line_count() const -> uint32_t;

    /// Loads a template from disk.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    /// Creates a source from an in-memory string.
    [[nodiscard]] static auto from_string(std::string content,
                                          std::string name = "<template>") -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_;

    void build_line_index();
};

} // namespace stencil::lexer

#endif // STENCIL_LEXER_SOURCE_HPP
