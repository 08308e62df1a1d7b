//! # AST Printer
//!
//! Prints the template AST as an indented outline, one node per line with
//! its byte span. Used by `stencil parse` and by tests.
//!
//! ## Example Output
//!
//! For `"id: " commit_id.short(8)`:
//!
//! ```text
//! List 0..25
//!   String "id: " 0..6
//!   MethodCall short 17..25
//!     Identifier commit_id 7..16
//!     Integer 8 23..24
//! ```
//!
//! The method call line shows the span of `short(8)`; its first child is the
//! receiver and the rest are the arguments.

#ifndef STENCIL_PARSER_AST_PRINTER_HPP
#define STENCIL_PARSER_AST_PRINTER_HPP

#include "parser/ast.hpp"

#include <string>

namespace stencil::parser {

/// Pretty prints template ASTs.
///
/// When colors are enabled, node kinds are magenta bold, names are yellow
/// bold, literals are cyan and spans are gray.
class AstPrinter {
public:
    explicit AstPrinter(bool use_colors = false);

    auto print(const ExpressionNode& node) -> std::string;

private:
    bool use_colors_;
    int indent_ = 0;
    std::string out_;

    void print_node(const ExpressionNode& node);
    void print_call(const char* kind, const FunctionCallNode& call, const SourceSpan& span,
                    const ExpressionNode* receiver);
    void line(const std::string& text, const SourceSpan& span);

    auto keyword(const std::string& s) -> std::string;
    auto name(const std::string& s) -> std::string;
    auto literal(const std::string& s) -> std::string;
    auto comment(const std::string& s) -> std::string;
};

/// Convenience function for printing a single tree.
inline auto print_ast(const ExpressionNode& node, bool use_colors = false) -> std::string {
    AstPrinter printer(use_colors);
    return printer.print(node);
}

/// Quotes `text` with `"` and escapes `"`, `\` and newlines.
[[nodiscard]] auto quote_string(const std::string& text) -> std::string;

} // namespace stencil::parser

#endif // STENCIL_PARSER_AST_PRINTER_HPP
