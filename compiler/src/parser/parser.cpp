//! # Parser
//!
//! ## Token Navigation
//!
//! | Method        | Description                           |
//! |---------------|---------------------------------------|
//! | `peek()`      | Look at current token                 |
//! | `peek_next()` | Look at next token                    |
//! | `advance()`   | Consume and return current token      |
//! | `match()`     | Consume token if it matches           |
//! | `check()`     | Check current token without consuming |
//! | `expect()`    | Require specific token or error       |
//!
//! ## Calls and Identifiers
//!
//! Whitespace is not a token, so `f (x)` and `f(x)` both reach the parser as
//! `Identifier LParen`. An identifier directly followed by `(` is always a
//! call; a bare identifier is a keyword reference.
//!
//! ## Argument Lists
//!
//! Arguments are templates separated by commas. One trailing comma is
//! allowed; an empty slot (`f(,)`, `f(a,,b)`) is a syntax error.

#include "parser/parser.hpp"

#include "log/log.hpp"

namespace stencil::parser {

using lexer::Token;
using lexer::TokenKind;

Parser::Parser(const lexer::Source& source) : source_(source) {
    lexer::Lexer lex(source_);
    tokens_ = lex.tokenize();
    lexer_errors_ = lex.errors();
}

// ============================================================================
// Token Navigation
// ============================================================================

auto Parser::peek() const -> const Token& {
    if (pos_ >= tokens_.size()) {
        return tokens_.back(); // Eof
    }
    return tokens_[pos_];
}

auto Parser::peek_next() const -> const Token& {
    if (pos_ + 1 >= tokens_.size()) {
        return tokens_.back();
    }
    return tokens_[pos_ + 1];
}

auto Parser::advance() -> const Token& {
    const Token& token = peek();
    if (pos_ < tokens_.size() - 1) {
        ++pos_;
    }
    return token;
}

auto Parser::check(TokenKind kind) const -> bool {
    return peek().is(kind);
}

auto Parser::match(TokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto Parser::expect(TokenKind kind, const std::string& context) -> Result<Token, TemplateError> {
    if (check(kind)) {
        return advance();
    }
    return unexpected(std::string(lexer::token_kind_to_string(kind)) + context);
}

// ============================================================================
// Grammar Rules
// ============================================================================

auto Parser::parse_program() -> Result<SyntaxNode, TemplateError> {
    SyntaxNode program{.rule = SyntaxRule::Program,
                       .span = source_.span(0, source_.length()),
                       .text = source_.content(),
                       .children = {}};

    if (check(TokenKind::Eof)) {
        return program;
    }

    auto tmpl = parse_template();
    if (is_err(tmpl)) {
        return unwrap_err(tmpl);
    }

    if (!check(TokenKind::Eof)) {
        return unexpected("term or end of input");
    }

    program.children.push_back(std::move(unwrap(tmpl)));
    return program;
}

auto Parser::parse_template() -> Result<SyntaxNode, TemplateError> {
    std::vector<SyntaxNode> terms;

    while (peek().starts_term()) {
        auto term = parse_term();
        if (is_err(term)) {
            return unwrap_err(term);
        }
        terms.push_back(std::move(unwrap(term)));
    }

    if (terms.empty()) {
        return unexpected("template term");
    }

    auto start = terms.front().span.start.offset;
    auto end = terms.back().span.end.offset;
    return SyntaxNode{.rule = SyntaxRule::Template,
                      .span = source_.span(start, end),
                      .text = source_.slice(start, end),
                      .children = std::move(terms)};
}

auto Parser::parse_term() -> Result<SyntaxNode, TemplateError> {
    auto primary = parse_primary();
    if (is_err(primary)) {
        return unwrap_err(primary);
    }

    std::vector<SyntaxNode> children;
    children.push_back(std::move(unwrap(primary)));

    while (match(TokenKind::Dot)) {
        if (!check(TokenKind::Identifier)) {
            return unexpected("method name after '.'");
        }
        auto call = parse_call();
        if (is_err(call)) {
            return unwrap_err(call);
        }
        children.push_back(std::move(unwrap(call)));
    }

    auto start = children.front().span.start.offset;
    auto end = children.back().span.end.offset;
    return SyntaxNode{.rule = SyntaxRule::Term,
                      .span = source_.span(start, end),
                      .text = source_.slice(start, end),
                      .children = std::move(children)};
}

auto Parser::parse_primary() -> Result<SyntaxNode, TemplateError> {
    const Token& token = peek();

    switch (token.kind) {
    case TokenKind::StringLiteral:
        advance();
        return split_string_literal(token);

    case TokenKind::IntLiteral:
        advance();
        return make_leaf(SyntaxRule::IntegerLiteral, token);

    case TokenKind::Identifier:
        if (peek_next().is(TokenKind::LParen)) {
            return parse_call();
        }
        advance();
        return make_leaf(SyntaxRule::Identifier, token);

    case TokenKind::LParen: {
        advance();
        auto inner = parse_template();
        if (is_err(inner)) {
            return inner;
        }
        auto rparen = expect(TokenKind::RParen, " to close parenthesized template");
        if (is_err(rparen)) {
            return unwrap_err(rparen);
        }
        return inner;
    }

    default:
        return unexpected("template term");
    }
}

auto Parser::parse_call() -> Result<SyntaxNode, TemplateError> {
    Token name = advance();

    auto lparen = expect(TokenKind::LParen, " after function name");
    if (is_err(lparen)) {
        return unwrap_err(lparen);
    }

    auto args = parse_arguments();
    if (is_err(args)) {
        return unwrap_err(args);
    }

    auto rparen = expect(TokenKind::RParen, " to close argument list");
    if (is_err(rparen)) {
        return unwrap_err(rparen);
    }

    auto start = name.span.start.offset;
    auto end = unwrap(rparen).span.end.offset;

    std::vector<SyntaxNode> children;
    children.push_back(make_leaf(SyntaxRule::Identifier, name));
    children.push_back(std::move(unwrap(args)));

    return SyntaxNode{.rule = SyntaxRule::Function,
                      .span = source_.span(start, end),
                      .text = source_.slice(start, end),
                      .children = std::move(children)};
}

auto Parser::parse_arguments() -> Result<SyntaxNode, TemplateError> {
    std::vector<SyntaxNode> args;
    size_t start = peek().span.start.offset;
    size_t end = start;

    if (!check(TokenKind::RParen)) {
        while (true) {
            auto arg = parse_template();
            if (is_err(arg)) {
                return unwrap_err(arg);
            }
            args.push_back(std::move(unwrap(arg)));

            if (!match(TokenKind::Comma)) {
                break;
            }
            // Trailing comma
            if (check(TokenKind::RParen)) {
                break;
            }
        }
        end = tokens_[pos_ - 1].span.end.offset;
    }

    if (!check(TokenKind::RParen)) {
        return unexpected("',' or ')' in argument list");
    }

    return SyntaxNode{.rule = SyntaxRule::FunctionArguments,
                      .span = source_.span(start, end),
                      .text = source_.slice(start, end),
                      .children = std::move(args)};
}

// ============================================================================
// Leaves
// ============================================================================

auto Parser::make_leaf(SyntaxRule rule, const Token& token) const -> SyntaxNode {
    return SyntaxNode{.rule = rule, .span = token.span, .text = token.lexeme, .children = {}};
}

auto Parser::split_string_literal(const Token& token) const -> SyntaxNode {
    SyntaxNode literal = make_leaf(SyntaxRule::StringLiteral, token);

    // Strip the quotes; the lexer guarantees both are present.
    size_t base = token.span.start.offset + 1;
    std::string_view body = token.lexeme.substr(1, token.lexeme.size() - 2);

    size_t run_start = 0;
    auto flush_raw = [&](size_t run_end) {
        if (run_end > run_start) {
            literal.children.push_back(
                SyntaxNode{.rule = SyntaxRule::RawText,
                           .span = source_.span(base + run_start, base + run_end),
                           .text = body.substr(run_start, run_end - run_start),
                           .children = {}});
        }
    };

    size_t i = 0;
    while (i < body.size()) {
        if (body[i] == '\\' && i + 1 < body.size()) {
            flush_raw(i);
            literal.children.push_back(SyntaxNode{.rule = SyntaxRule::Escape,
                                                  .span = source_.span(base + i, base + i + 2),
                                                  .text = body.substr(i, 2),
                                                  .children = {}});
            i += 2;
            run_start = i;
        } else {
            ++i;
        }
    }
    flush_raw(body.size());

    return literal;
}

// ============================================================================
// Errors
// ============================================================================

auto Parser::unexpected(const std::string& expected) const -> TemplateError {
    const Token& token = peek();
    if (token.is(TokenKind::Error)) {
        return lexer_error_at(token);
    }

    std::string found(lexer::token_kind_to_string(token.kind));
    if (token.is(TokenKind::Identifier) || token.is(TokenKind::IntLiteral)) {
        found += " '" + std::string(token.lexeme) + "'";
    }

    return TemplateError::syntax_error("expected " + expected + ", found " + found, token.span,
                                       ErrorCodes::PARSE_UNEXPECTED_TOKEN);
}

auto Parser::lexer_error_at(const Token& token) const -> TemplateError {
    for (const auto& err : lexer_errors_) {
        if (err.span.start.offset >= token.span.start.offset &&
            err.span.start.offset <= token.span.end.offset) {
            return TemplateError::syntax_error(err.message, err.span, err.code);
        }
    }
    if (!lexer_errors_.empty()) {
        const auto& first = lexer_errors_.front();
        return TemplateError::syntax_error(first.message, first.span, first.code);
    }
    return TemplateError::syntax_error("invalid token", token.span,
                                       ErrorCodes::PARSE_UNEXPECTED_TOKEN);
}

auto parse_syntax(const lexer::Source& source) -> Result<SyntaxNode, TemplateError> {
    Parser parser(source);
    auto result = parser.parse_program();
    if (is_err(result)) {
        STENCIL_LOG_DEBUG("parser", "syntax error: " << unwrap_err(result).to_string());
    } else {
        STENCIL_LOG_TRACE("parser", "parsed " << source.filename() << " ("
                                              << source.length() << " bytes)");
    }
    return result;
}

} // namespace stencil::parser
