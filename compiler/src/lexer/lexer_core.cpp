//! # Lexer Core
//!
//! This file implements core lexer functionality:
//!
//! - **Character access**: `peek()`, `advance()`, `is_at_end()`
//! - **Token creation**: `make_token()`, `make_error_token()`
//! - **Whitespace**: spaces, tabs and line breaks are insignificant
//! - **Dispatch**: `next_token()` and `tokenize()`

#include "lexer/lexer.hpp"
#include "log/log.hpp"

namespace stencil::lexer {

auto is_ident_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

auto is_ident_continue(char c) -> bool {
    return is_ident_start(c) || (c >= '0' && c <= '9') || c == '_';
}

Lexer::Lexer(const Source& source) : source_(source) {}

auto Lexer::peek() const -> char {
    return source_.at(pos_);
}

auto Lexer::peek_next() const -> char {
    return source_.at(pos_ + 1);
}

auto Lexer::advance() -> char {
    char c = peek();
    ++pos_;
    return c;
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

auto Lexer::make_token(TokenKind kind) -> Token {
    return Token{.kind = kind,
                 .span = source_.span(token_start_, pos_),
                 .lexeme = source_.slice(token_start_, pos_)};
}

auto Lexer::make_error_token(const std::string& message, const std::string& code) -> Token {
    auto span = source_.span(token_start_, pos_);
    errors_.push_back(LexerError{.message = message, .span = span, .code = code});
    STENCIL_LOG_TRACE("lexer", "error at offset " << token_start_ << ": " << message);

    return Token{.kind = TokenKind::Error,
                 .span = span,
                 .lexeme = source_.slice(token_start_, pos_)};
}

void Lexer::skip_whitespace() {
    while (!is_at_end()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
        } else {
            break;
        }
    }
}

auto Lexer::next_token() -> Token {
    skip_whitespace();
    token_start_ = pos_;

    if (is_at_end()) {
        return make_token(TokenKind::Eof);
    }

    char c = peek();

    if (is_ident_start(c)) {
        return lex_identifier();
    }

    if (c >= '0' && c <= '9') {
        return lex_number();
    }

    if (c == '"') {
        return lex_string();
    }

    advance();
    switch (c) {
    case '(':
        return make_token(TokenKind::LParen);
    case ')':
        return make_token(TokenKind::RParen);
    case ',':
        return make_token(TokenKind::Comma);
    case '.':
        return make_token(TokenKind::Dot);
    default:
        break;
    }

    // Consume the rest of a multi-byte UTF-8 sequence so the error span covers
    // the whole character.
    while (!is_at_end() && (static_cast<unsigned char>(peek()) & 0xC0) == 0x80) {
        advance();
    }
    std::string text(source_.slice(token_start_, pos_));
    return make_error_token("Unexpected character '" + text + "'", "L001");
}

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;

    while (true) {
        Token token = next_token();
        bool done = token.is_eof();
        tokens.push_back(token);
        if (done) {
            break;
        }
    }

    STENCIL_LOG_TRACE("lexer", "tokenized " << tokens.size() << " tokens, " << errors_.size()
                                            << " errors");
    return tokens;
}

} // namespace stencil::lexer
