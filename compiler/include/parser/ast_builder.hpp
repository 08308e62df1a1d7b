//! # AST Builder
//!
//! Lowers the concrete syntax tree into the template AST.
//!
//! ## Lowering Rules
//!
//! - String literals concatenate their raw segments and decode `\"`, `\\`
//!   and `\n`
//! - Integer literals are parsed as signed 64-bit decimal; values that do not
//!   fit raise `ParseIntError` at the literal
//! - A template with a single term collapses to that term; several terms
//!   become a `List`
//! - Parentheses leave no trace in the AST
//! - `p.f(...).g(...)` nests left-associatively into `MethodCall`s
//! - An empty program is an empty `List`

#ifndef STENCIL_PARSER_AST_BUILDER_HPP
#define STENCIL_PARSER_AST_BUILDER_HPP

#include "common.hpp"
#include "error.hpp"
#include "lexer/source.hpp"
#include "parser/ast.hpp"
#include "parser/syntax.hpp"

namespace stencil::parser {

/// Lowers a `Program` syntax node to an expression.
[[nodiscard]] auto build_ast(const SyntaxNode& program) -> Result<ExpressionNode, TemplateError>;

/// Parses template source text all the way to the AST.
///
/// # Example
///
/// ```cpp
/// auto source = lexer::Source::from_string("\"a\" \"b\"");
/// auto ast = parser::parse_template(source);
/// // unwrap(ast).is<ListExpr>() == true
/// ```
[[nodiscard]] auto parse_template(const lexer::Source& source)
    -> Result<ExpressionNode, TemplateError>;

} // namespace stencil::parser

#endif // STENCIL_PARSER_AST_BUILDER_HPP
