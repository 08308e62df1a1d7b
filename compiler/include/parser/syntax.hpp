//! # Concrete Syntax Tree
//!
//! The parser produces a concrete tree that mirrors the grammar rules one to
//! one. It keeps every source slice and span so the AST builder can decode
//! literals and report errors at exact locations.
//!
//! ## Grammar
//!
//! ```text
//! program          := template? EOI
//! template         := term+
//! term             := primary ("." call)*
//! primary          := string_literal | integer_literal
//!                   | call | identifier | "(" template ")"
//! call             := identifier "(" arg_list? ")"
//! arg_list         := template ("," template)* ","?
//! string_literal   := '"' (raw_char | escape)* '"'
//! escape           := "\" ( '"' | "\\" | "n" )
//! integer_literal  := "0" | nonzero_digit digit*
//! identifier       := letter (letter | digit | "_")*
//! ```
//!
//! ## Node Shapes
//!
//! | Rule                | Children                                   |
//! |---------------------|--------------------------------------------|
//! | `Program`           | zero or one `Template`                     |
//! | `Template`          | one or more `Term`                         |
//! | `Term`              | primary, then one `Function` per `.call`   |
//! | `StringLiteral`     | `RawText` and `Escape` segments            |
//! | `Function`          | `Identifier`, `FunctionArguments`          |
//! | `FunctionArguments` | zero or more `Template`                    |
//!
//! A parenthesized template appears as a nested `Template` primary.

#ifndef STENCIL_PARSER_SYNTAX_HPP
#define STENCIL_PARSER_SYNTAX_HPP

#include "common.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace stencil::parser {

enum class SyntaxRule : uint8_t {
    Program,
    Template,
    Term,
    StringLiteral,
    RawText,
    Escape,
    IntegerLiteral,
    Identifier,
    Function,
    FunctionArguments,
};

/// A node of the concrete syntax tree.
///
/// `text` views the source the tree was parsed from; the tree must not
/// outlive that source. It is consumed by the AST builder and discarded.
struct SyntaxNode {
    SyntaxRule rule;
    SourceSpan span;
    std::string_view text;
    std::vector<SyntaxNode> children;
};

[[nodiscard]] auto syntax_rule_name(SyntaxRule rule) -> std::string_view;

/// Renders the tree as an indented outline, one node per line.
[[nodiscard]] auto dump_syntax(const SyntaxNode& node) -> std::string;

} // namespace stencil::parser

#endif // STENCIL_PARSER_SYNTAX_HPP
