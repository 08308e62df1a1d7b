//! # Template Parser
//!
//! Recursive-descent parser from tokens to the concrete syntax tree.
//!
//! Parsing is fail-fast: the first lexer error token or grammar violation
//! ends the parse with a `SyntaxError`. Lexer errors keep their own
//! diagnostic code; grammar violations use `P001`.
//!
//! ## Example
//!
//! ```cpp
//! auto source = lexer::Source::from_string("author.name() \" \" commit_id");
//! auto tree = parser::parse_syntax(source);
//! if (is_err(tree)) {
//!     std::cerr << unwrap_err(tree).to_string() << "\n";
//! }
//! ```

#ifndef STENCIL_PARSER_PARSER_HPP
#define STENCIL_PARSER_PARSER_HPP

#include "common.hpp"
#include "error.hpp"
#include "lexer/lexer.hpp"
#include "parser/syntax.hpp"

#include <string>
#include <vector>

namespace stencil::parser {

/// Parser for template source text.
class Parser {
public:
    /// Tokenizes `source` up front. The source must outlive the parser and
    /// the syntax tree it returns.
    explicit Parser(const lexer::Source& source);

    /// Parses the whole input as a `Program`.
    [[nodiscard]] auto parse_program() -> Result<SyntaxNode, TemplateError>;

private:
    const lexer::Source& source_;
    std::vector<lexer::Token> tokens_;
    std::vector<lexer::LexerError> lexer_errors_;
    size_t pos_ = 0;

    // Token navigation
    [[nodiscard]] auto peek() const -> const lexer::Token&;
    [[nodiscard]] auto peek_next() const -> const lexer::Token&;
    auto advance() -> const lexer::Token&;
    [[nodiscard]] auto check(lexer::TokenKind kind) const -> bool;
    auto match(lexer::TokenKind kind) -> bool;
    auto expect(lexer::TokenKind kind, const std::string& context)
        -> Result<lexer::Token, TemplateError>;

    // Grammar rules
    [[nodiscard]] auto parse_template() -> Result<SyntaxNode, TemplateError>;
    [[nodiscard]] auto parse_term() -> Result<SyntaxNode, TemplateError>;
    [[nodiscard]] auto parse_primary() -> Result<SyntaxNode, TemplateError>;
    [[nodiscard]] auto parse_call() -> Result<SyntaxNode, TemplateError>;
    [[nodiscard]] auto parse_arguments() -> Result<SyntaxNode, TemplateError>;

    [[nodiscard]] auto make_leaf(SyntaxRule rule, const lexer::Token& token) const -> SyntaxNode;
    [[nodiscard]] auto split_string_literal(const lexer::Token& token) const -> SyntaxNode;

    // Errors
    [[nodiscard]] auto unexpected(const std::string& expected) const -> TemplateError;
    [[nodiscard]] auto lexer_error_at(const lexer::Token& token) const -> TemplateError;
};

/// Lexes and parses `source` into a `Program` node.
[[nodiscard]] auto parse_syntax(const lexer::Source& source) -> Result<SyntaxNode, TemplateError>;

} // namespace stencil::parser

#endif // STENCIL_PARSER_PARSER_HPP
