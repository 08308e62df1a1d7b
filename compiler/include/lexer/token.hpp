//! # Token Definitions
//!
//! This module defines the tokens produced by the template lexer.
//!
//! The template language has a deliberately tiny lexical surface:
//!
//! | Kind            | Examples                 |
//! |-----------------|--------------------------|
//! | Identifier      | `commit_id`, `if`, `a1`  |
//! | IntLiteral      | `0`, `42`                |
//! | StringLiteral   | `"text"`, `"a\"b\n"`     |
//! | Punctuation     | `(` `)` `,` `.`          |
//!
//! There are no keywords: builtin function names such as `if` and `label`
//! are ordinary identifiers resolved by the expression builder.

#ifndef STENCIL_LEXER_TOKEN_HPP
#define STENCIL_LEXER_TOKEN_HPP

#include "common.hpp"

#include <cstdint>
#include <string_view>

namespace stencil::lexer {

enum class TokenKind : uint8_t {
    Eof,           ///< End of input stream
    Identifier,    ///< `letter (letter | digit | '_')*`
    IntLiteral,    ///< `0` or a digit run without a leading zero
    StringLiteral, ///< `"..."`; the lexeme keeps the quotes and escapes verbatim
    LParen,        ///< `(`
    RParen,        ///< `)`
    Comma,         ///< `,`
    Dot,           ///< `.`
    Error,         ///< Malformed input; see `Lexer::errors()`
};

/// A lexical token.
///
/// `lexeme` is a view into the `Source` the token was produced from.
struct Token {
    TokenKind kind = TokenKind::Eof;
    SourceSpan span;
    std::string_view lexeme;

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    /// True for tokens that can begin a template term.
    [[nodiscard]] auto starts_term() const -> bool {
        return kind == TokenKind::Identifier || kind == TokenKind::IntLiteral ||
               kind == TokenKind::StringLiteral || kind == TokenKind::LParen;
    }
};

/// Returns a human-readable name for a token kind (used in syntax errors).
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

} // namespace stencil::lexer

#endif // STENCIL_LEXER_TOKEN_HPP
