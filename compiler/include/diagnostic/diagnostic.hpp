//! # Diagnostic Rendering
//!
//! Formats template errors for people and tools.
//!
//! ## Text Format
//!
//! ```text
//! error[T002]: Function "lable" doesn't exist
//!   --> <template>:1:1
//!      |
//!    1 | lable("x", commit_id)
//!      | ^^^^^
//!      |
//!   = help: did you mean `label`?
//! ```
//!
//! ## Error Code Categories
//!
//! | Prefix | Category   | Example                  |
//! |--------|------------|--------------------------|
//! | L      | Lexer      | L002 - Unterminated string |
//! | P      | Parser     | P001 - Unexpected token  |
//! | T      | Builder    | T003 - Unknown method    |
//!
//! ## JSON Format
//!
//! One object per line with `severity`, `code`, `message`, `span`, `notes`
//! and `help`, for editor integration.

#ifndef STENCIL_DIAGNOSTIC_DIAGNOSTIC_HPP
#define STENCIL_DIAGNOSTIC_DIAGNOSTIC_HPP

#include "common.hpp"
#include "error.hpp"
#include "lexer/source.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace stencil::diagnostic {

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";

    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightGreen = "\033[92m";
    static constexpr const char* BrightBlue = "\033[94m";
    static constexpr const char* BrightCyan = "\033[96m";
};

enum class DiagnosticFormat {
    Text,
    Json,
};

struct Diagnostic {
    std::string code;    // Error code (e.g. "P001", "T003")
    std::string message; // Main error message
    SourceSpan span;
    std::vector<std::string> notes; // Additional notes
    std::vector<std::string> help;  // Suggestions
};

/// Converts a template error into a diagnostic.
///
/// "Did you mean" notes of the error become help lines.
[[nodiscard]] auto to_diagnostic(const TemplateError& error) -> Diagnostic;

// ============================================================================
// Diagnostic Emitter
// ============================================================================

class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::ostream& out = std::cerr);

    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }
    void set_format(DiagnosticFormat format) {
        format_ = format;
    }

    /// Emits `diag`, quoting the offending line of `source`.
    void emit(const Diagnostic& diag, const lexer::Source& source);

    void emit_template_error(const TemplateError& error, const lexer::Source& source);

    [[nodiscard]] auto error_count() const -> size_t {
        return error_count_;
    }
    void reset_counts() {
        error_count_ = 0;
    }

private:
    std::ostream& out_;
    bool use_colors_ = true;
    DiagnosticFormat format_ = DiagnosticFormat::Text;
    size_t error_count_ = 0;

    auto color(const char* code) const -> const char* {
        return use_colors_ ? code : "";
    }

    void emit_header(const Diagnostic& diag);
    void emit_source_snippet(const SourceSpan& span, const lexer::Source& source);
    void emit_notes(const std::vector<std::string>& notes);
    void emit_help(const std::vector<std::string>& help);

    void emit_json(const Diagnostic& diag, const lexer::Source& source);
};

/// Whether stderr is a terminal that understands ANSI colors.
[[nodiscard]] auto terminal_supports_colors() -> bool;

/// Escapes `s` for use inside a JSON string literal.
[[nodiscard]] auto escape_json_string(const std::string& s) -> std::string;

} // namespace stencil::diagnostic

#endif // STENCIL_DIAGNOSTIC_DIAGNOSTIC_HPP
