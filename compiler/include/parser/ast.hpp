//! # Template AST
//!
//! The abstract syntax tree of a template. It is the input of the expression
//! builder and is independent of the source text: every string is copied out
//! of the source, so the tree may outlive it.
//!
//! ## Node Kinds
//!
//! | Kind           | Example             |
//! |----------------|---------------------|
//! | Identifier     | `description`       |
//! | Integer        | `42`                |
//! | String         | `"a\nb"` (decoded)  |
//! | List           | `a " " b`           |
//! | FunctionCall   | `label("red", x)`   |
//! | MethodCall     | `commit_id.short()` |
//!
//! Method chains nest to the left: `a.f().g()` is `MethodCall(g)` whose
//! receiver is `MethodCall(f)` whose receiver is `Identifier(a)`.

#ifndef STENCIL_PARSER_AST_HPP
#define STENCIL_PARSER_AST_HPP

#include "common.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace stencil::parser {

struct ExpressionNode;

/// Owned pointer to an expression node.
using ExpressionPtr = Box<ExpressionNode>;

/// Keyword reference: `commit_id`.
struct IdentifierExpr {
    std::string name;
};

/// Integer literal, already decoded to a signed 64-bit value.
struct IntegerExpr {
    int64_t value;
};

/// String literal with escapes decoded.
struct StringExpr {
    std::string value;
};

/// Concatenation of several terms: `a " " b`.
struct ListExpr {
    std::vector<ExpressionNode> items;
};

/// Function call: `name(args...)`.
///
/// `args_span` covers the argument list between the parentheses and is where
/// argument count errors are reported.
struct FunctionCallNode {
    std::string name;
    SourceSpan name_span;
    std::vector<ExpressionNode> args;
    SourceSpan args_span;
};

/// Method call: `receiver.name(args...)`.
struct MethodCallNode {
    ExpressionPtr receiver;
    FunctionCallNode call;
};

/// A template expression with its source span.
///
/// The span of a method call covers `name(args...)` only, not the receiver.
struct ExpressionNode {
    std::variant<IdentifierExpr, IntegerExpr, StringExpr, ListExpr, FunctionCallNode,
                 MethodCallNode>
        kind;
    SourceSpan span;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() -> T& {
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

} // namespace stencil::parser

#endif // STENCIL_PARSER_AST_HPP
