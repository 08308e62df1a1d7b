//! # Template Errors
//!
//! Every failure of template compilation is reported as a single
//! `TemplateError`. Compilation is fail-fast: the first error aborts the
//! build and no partial tree is produced. Rendering a compiled template has
//! no error path.
//!
//! ## Error Kinds
//!
//! | Kind                            | Code | Raised by      |
//! |---------------------------------|------|----------------|
//! | `SyntaxError`                   | L/P  | lexer, parser  |
//! | `ParseIntError`                 | P002 | AST builder    |
//! | `NoSuchKeyword`                 | T001 | resolver       |
//! | `NoSuchFunction`                | T002 | builder        |
//! | `NoSuchMethod`                  | T003 | builder        |
//! | `InvalidArgumentCount*`         | T004 | builder        |
//! | `InvalidArgumentType`           | T005 | builder        |

#ifndef STENCIL_ERROR_HPP
#define STENCIL_ERROR_HPP

#include "common.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace stencil {

namespace ErrorCodes {
// Lexer errors
constexpr const char* LEX_INVALID_CHAR = "L001";
constexpr const char* LEX_UNTERMINATED_STRING = "L002";
constexpr const char* LEX_INVALID_NUMBER = "L003";
constexpr const char* LEX_INVALID_ESCAPE = "L004";

// Parser errors
constexpr const char* PARSE_UNEXPECTED_TOKEN = "P001";
constexpr const char* PARSE_INT_OVERFLOW = "P002";

// Build errors
constexpr const char* KEYWORD_UNKNOWN = "T001";
constexpr const char* FUNC_UNKNOWN = "T002";
constexpr const char* METHOD_UNKNOWN = "T003";
constexpr const char* ARG_COUNT_MISMATCH = "T004";
constexpr const char* ARG_TYPE_MISMATCH = "T005";
} // namespace ErrorCodes

enum class TemplateErrorKind {
    SyntaxError,
    ParseIntError,
    NoSuchKeyword,
    NoSuchFunction,
    NoSuchMethod,
    InvalidArgumentCountExact,
    InvalidArgumentCountRange,
    InvalidArgumentCountRangeFrom,
    InvalidArgumentType,
};

/// A template compilation error with the span it applies to.
///
/// The kind-specific payload lives in `name`, `type_name` and the count
/// bounds; `message()` renders it. `notes` carry extra hints such as
/// "did you mean" suggestions and are never part of `message()`.
struct TemplateError {
    TemplateErrorKind kind;
    SourceSpan span;
    std::string detail;    ///< SyntaxError / ParseIntError: underlying diagnostic
    std::string name;      ///< Keyword, function or method name
    std::string type_name; ///< NoSuchMethod receiver kind, or expected argument kind
    size_t count_min = 0;
    size_t count_max = 0;
    std::string code;
    std::vector<std::string> notes;

    static auto syntax_error(std::string detail, SourceSpan span, std::string code)
        -> TemplateError;
    static auto parse_int_error(std::string detail, SourceSpan span) -> TemplateError;
    static auto no_such_keyword(std::string name, SourceSpan span) -> TemplateError;
    static auto no_such_function(std::string name, SourceSpan span) -> TemplateError;
    static auto no_such_method(std::string type_name, std::string name, SourceSpan span)
        -> TemplateError;
    static auto invalid_argument_count_exact(size_t count, SourceSpan span) -> TemplateError;
    static auto invalid_argument_count_range(size_t min, size_t max, SourceSpan span)
        -> TemplateError;
    static auto invalid_argument_count_range_from(size_t min, SourceSpan span) -> TemplateError;
    static auto invalid_argument_type(std::string expected_type_name, SourceSpan span)
        -> TemplateError;

    /// Human-readable message, e.g. `Function "foo" doesn't exist`.
    [[nodiscard]] auto message() const -> std::string;

    /// One-line form: `line N, column M: <message>`.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Returns a copy with `note` appended.
    [[nodiscard]] auto with_note(std::string note) const -> TemplateError;
};

[[nodiscard]] auto error_kind_name(TemplateErrorKind kind) -> const char*;

} // namespace stencil

#endif // STENCIL_ERROR_HPP
