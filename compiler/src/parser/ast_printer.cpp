#include "parser/ast_printer.hpp"

#include <type_traits>
#include <variant>

namespace stencil::parser {

AstPrinter::AstPrinter(bool use_colors) : use_colors_(use_colors) {}

// ============================================================================
// Color Helpers
// ============================================================================

auto AstPrinter::keyword(const std::string& s) -> std::string {
    if (use_colors_) {
        return "\033[1;35m" + s + "\033[0m"; // Magenta bold
    }
    return s;
}

auto AstPrinter::name(const std::string& s) -> std::string {
    if (use_colors_) {
        return "\033[1;33m" + s + "\033[0m"; // Yellow bold
    }
    return s;
}

auto AstPrinter::literal(const std::string& s) -> std::string {
    if (use_colors_) {
        return "\033[0;36m" + s + "\033[0m"; // Cyan
    }
    return s;
}

auto AstPrinter::comment(const std::string& s) -> std::string {
    if (use_colors_) {
        return "\033[0;90m" + s + "\033[0m"; // Gray
    }
    return s;
}

// ============================================================================
// Printing
// ============================================================================

auto AstPrinter::print(const ExpressionNode& node) -> std::string {
    out_.clear();
    indent_ = 0;
    print_node(node);
    return out_;
}

void AstPrinter::line(const std::string& text, const SourceSpan& span) {
    out_ += std::string(static_cast<size_t>(indent_) * 2, ' ');
    out_ += text;
    out_ += " ";
    out_ += comment(std::to_string(span.start.offset) + ".." + std::to_string(span.end.offset));
    out_ += "\n";
}

void AstPrinter::print_call(const char* kind, const FunctionCallNode& call, const SourceSpan& span,
                            const ExpressionNode* receiver) {
    line(keyword(kind) + " " + name(call.name), span);
    ++indent_;
    if (receiver != nullptr) {
        print_node(*receiver);
    }
    for (const auto& arg : call.args) {
        print_node(arg);
    }
    --indent_;
}

void AstPrinter::print_node(const ExpressionNode& node) {
    std::visit(
        [&](const auto& kind) {
            using T = std::decay_t<decltype(kind)>;
            if constexpr (std::is_same_v<T, IdentifierExpr>) {
                line(keyword("Identifier") + " " + name(kind.name), node.span);
            } else if constexpr (std::is_same_v<T, IntegerExpr>) {
                line(keyword("Integer") + " " + literal(std::to_string(kind.value)), node.span);
            } else if constexpr (std::is_same_v<T, StringExpr>) {
                line(keyword("String") + " " + literal(quote_string(kind.value)), node.span);
            } else if constexpr (std::is_same_v<T, ListExpr>) {
                line(keyword("List"), node.span);
                ++indent_;
                for (const auto& item : kind.items) {
                    print_node(item);
                }
                --indent_;
            } else if constexpr (std::is_same_v<T, FunctionCallNode>) {
                print_call("FunctionCall", kind, node.span, nullptr);
            } else if constexpr (std::is_same_v<T, MethodCallNode>) {
                print_call("MethodCall", kind.call, node.span, kind.receiver.get());
            }
        },
        node.kind);
}

auto quote_string(const std::string& text) -> std::string {
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        default:
            out += c;
            break;
        }
    }
    out += "\"";
    return out;
}

} // namespace stencil::parser
