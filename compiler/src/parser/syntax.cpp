#include "parser/syntax.hpp"

#include <sstream>

namespace stencil::parser {

auto syntax_rule_name(SyntaxRule rule) -> std::string_view {
    switch (rule) {
    case SyntaxRule::Program:
        return "Program";
    case SyntaxRule::Template:
        return "Template";
    case SyntaxRule::Term:
        return "Term";
    case SyntaxRule::StringLiteral:
        return "StringLiteral";
    case SyntaxRule::RawText:
        return "RawText";
    case SyntaxRule::Escape:
        return "Escape";
    case SyntaxRule::IntegerLiteral:
        return "IntegerLiteral";
    case SyntaxRule::Identifier:
        return "Identifier";
    case SyntaxRule::Function:
        return "Function";
    case SyntaxRule::FunctionArguments:
        return "FunctionArguments";
    }
    return "Unknown";
}

namespace {

void dump_node(std::ostringstream& out, const SyntaxNode& node, int depth) {
    out << std::string(static_cast<size_t>(depth) * 2, ' ') << syntax_rule_name(node.rule) << " "
        << node.span.start.offset << ".." << node.span.end.offset;
    if (node.children.empty()) {
        out << " \"" << node.text << "\"";
    }
    out << "\n";
    for (const auto& child : node.children) {
        dump_node(out, child, depth + 1);
    }
}

} // namespace

auto dump_syntax(const SyntaxNode& node) -> std::string {
    std::ostringstream out;
    dump_node(out, node, 0);
    return out.str();
}

} // namespace stencil::parser
