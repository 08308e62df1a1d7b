//! # Lexer - Identifiers and Literals
//!
//! ## Integer Literals
//!
//! Only decimal literals exist. A literal is either the single digit `0` or a
//! digit run starting with `1`-`9`. The lexer validates the shape; the value
//! (and its 64-bit range) is checked when the AST is built.
//!
//! ## String Literals
//!
//! | Escape | Character    |
//! |--------|--------------|
//! | `\"`   | Double quote |
//! | `\\`   | Backslash    |
//! | `\n`   | Newline      |
//!
//! Any other escape is a syntax error. The token lexeme keeps the quotes and
//! escapes verbatim; the parser splits it into raw and escape segments.

#include "lexer/lexer.hpp"

namespace stencil::lexer {

auto Lexer::lex_identifier() -> Token {
    while (!is_at_end() && is_ident_continue(peek())) {
        advance();
    }
    return make_token(TokenKind::Identifier);
}

auto Lexer::lex_number() -> Token {
    char first = advance();

    while (!is_at_end() && peek() >= '0' && peek() <= '9') {
        advance();
    }

    if (first == '0' && pos_ - token_start_ > 1) {
        return make_error_token("Integer literal cannot have a leading zero", "L003");
    }

    return make_token(TokenKind::IntLiteral);
}

auto Lexer::lex_string() -> Token {
    // Skip opening quote
    advance();

    while (!is_at_end() && peek() != '"') {
        if (peek() == '\\') {
            size_t escape_start = pos_;
            advance();
            if (is_at_end()) {
                break;
            }
            char escaped = advance();
            if (escaped != '"' && escaped != '\\' && escaped != 'n') {
                // Report only the escape sequence, then resynchronize after the
                // closing quote so a single bad escape yields a single error.
                auto span = source_.span(escape_start, pos_);
                errors_.push_back(LexerError{
                    .message = "Invalid escape sequence '" +
                               std::string(source_.slice(escape_start, pos_)) + "'",
                    .span = span,
                    .code = "L004"});
                while (!is_at_end() && peek() != '"') {
                    if (advance() == '\\' && !is_at_end()) {
                        advance();
                    }
                }
                if (!is_at_end()) {
                    advance();
                }
                return Token{.kind = TokenKind::Error,
                             .span = span,
                             .lexeme = source_.slice(token_start_, pos_)};
            }
            continue;
        }
        advance();
    }

    if (is_at_end()) {
        return make_error_token("Unterminated string literal", "L002");
    }

    // Closing quote
    advance();
    return make_token(TokenKind::StringLiteral);
}

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Eof:
        return "end of input";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::IntLiteral:
        return "integer literal";
    case TokenKind::StringLiteral:
        return "string literal";
    case TokenKind::LParen:
        return "'('";
    case TokenKind::RParen:
        return "')'";
    case TokenKind::Comma:
        return "','";
    case TokenKind::Dot:
        return "'.'";
    case TokenKind::Error:
        return "invalid token";
    }
    return "unknown token";
}

} // namespace stencil::lexer
