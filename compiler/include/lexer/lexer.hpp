//! # Template Lexer
//!
//! Converts template source text into a stream of tokens for the parser.
//!
//! ## Lexical Rules
//!
//! - Whitespace (space, tab, CR, LF) separates tokens and is otherwise ignored
//! - Identifiers start with an ASCII letter and continue with letters, digits
//!   or underscores
//! - Integer literals are `0` or a digit run that does not start with `0`;
//!   `00` and `007` are rejected here, before any value is computed
//! - String literals are double-quoted; the only escapes are `\"`, `\\` and
//!   `\n`, and a literal may span lines
//!
//! ## Error Recovery
//!
//! The lexer continues after errors, producing `TokenKind::Error` tokens.
//! All errors are collected and can be retrieved via `errors()`. The parser
//! stops at the first error token, since template compilation is fail-fast.
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("label(\"red\", description)");
//! Lexer lexer(source);
//! std::vector<Token> tokens = lexer.tokenize();
//! ```

#ifndef STENCIL_LEXER_LEXER_HPP
#define STENCIL_LEXER_LEXER_HPP

#include "common.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <string>
#include <vector>

namespace stencil::lexer {

/// An error encountered during lexical analysis.
struct LexerError {
    std::string message; ///< Human-readable error description.
    SourceSpan span;     ///< Location of the error in source.
    std::string code;    ///< Diagnostic code (e.g. "L002").
};

/// Lexical analyzer for template source text.
class Lexer {
public:
    /// The source must outlive the lexer and every token it returns.
    explicit Lexer(const Source& source);

    /// Returns the next token; `TokenKind::Eof` at the end of input.
    [[nodiscard]] auto next_token() -> Token;

    /// Tokenizes the whole source. The returned vector ends with `Eof`.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

    [[nodiscard]] auto errors() const -> const std::vector<LexerError>& {
        return errors_;
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

private:
    const Source& source_;
    size_t pos_ = 0;
    size_t token_start_ = 0;
    std::vector<LexerError> errors_;

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_next() const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;

    [[nodiscard]] auto make_token(TokenKind kind) -> Token;
    [[nodiscard]] auto make_error_token(const std::string& message, const std::string& code)
        -> Token;

    void skip_whitespace();

    [[nodiscard]] auto lex_identifier() -> Token;
    [[nodiscard]] auto lex_number() -> Token;
    [[nodiscard]] auto lex_string() -> Token;
};

/// Character classes shared with the parser's string-literal splitter.
[[nodiscard]] auto is_ident_start(char c) -> bool;
[[nodiscard]] auto is_ident_continue(char c) -> bool;

} // namespace stencil::lexer

#endif // STENCIL_LEXER_LEXER_HPP
