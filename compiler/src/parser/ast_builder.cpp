//! # AST Builder
//!
//! Walks the concrete tree produced by the parser. Shapes that the parser
//! guarantees (a `Function` always has an identifier and an argument list,
//! an `Escape` is always two bytes) are relied on rather than re-checked.

#include "parser/ast_builder.hpp"

#include "log/log.hpp"
#include "parser/parser.hpp"

#include <charconv>
#include <cstdlib>

namespace stencil::parser {

namespace {

auto build_template(const SyntaxNode& node) -> Result<ExpressionNode, TemplateError>;

auto decode_string(const SyntaxNode& node) -> std::string {
    std::string value;
    for (const auto& segment : node.children) {
        if (segment.rule == SyntaxRule::RawText) {
            value.append(segment.text);
            continue;
        }
        switch (segment.text[1]) {
        case '"':
            value.push_back('"');
            break;
        case '\\':
            value.push_back('\\');
            break;
        case 'n':
            value.push_back('\n');
            break;
        default:
            // The lexer rejects every other escape.
            STENCIL_LOG_FATAL("parser", "unexpected escape reached the AST builder: "
                                            << segment.text);
            std::abort();
        }
    }
    return value;
}

auto build_integer(const SyntaxNode& node) -> Result<ExpressionNode, TemplateError> {
    int64_t value = 0;
    const char* first = node.text.data();
    const char* last = first + node.text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);

    if (ec == std::errc::result_out_of_range) {
        return TemplateError::parse_int_error("number too large to fit in target type", node.span);
    }
    if (ec != std::errc{} || ptr != last) {
        return TemplateError::parse_int_error("invalid digit found in string", node.span);
    }
    return ExpressionNode{.kind = IntegerExpr{value}, .span = node.span};
}

auto build_function(const SyntaxNode& node) -> Result<FunctionCallNode, TemplateError> {
    const SyntaxNode& name = node.children[0];
    const SyntaxNode& arguments = node.children[1];

    FunctionCallNode call{.name = std::string(name.text),
                          .name_span = name.span,
                          .args = {},
                          .args_span = arguments.span};

    call.args.reserve(arguments.children.size());
    for (const auto& arg : arguments.children) {
        auto expr = build_template(arg);
        if (is_err(expr)) {
            return unwrap_err(expr);
        }
        call.args.push_back(std::move(unwrap(expr)));
    }
    return call;
}

auto build_primary(const SyntaxNode& node) -> Result<ExpressionNode, TemplateError> {
    switch (node.rule) {
    case SyntaxRule::StringLiteral:
        return ExpressionNode{.kind = StringExpr{decode_string(node)}, .span = node.span};

    case SyntaxRule::IntegerLiteral:
        return build_integer(node);

    case SyntaxRule::Identifier:
        return ExpressionNode{.kind = IdentifierExpr{std::string(node.text)}, .span = node.span};

    case SyntaxRule::Function: {
        auto call = build_function(node);
        if (is_err(call)) {
            return unwrap_err(call);
        }
        return ExpressionNode{.kind = std::move(unwrap(call)), .span = node.span};
    }

    case SyntaxRule::Template:
        return build_template(node);

    default:
        break;
    }
    return TemplateError::syntax_error("unexpected " + std::string(syntax_rule_name(node.rule)) +
                                           " in term",
                                       node.span, ErrorCodes::PARSE_UNEXPECTED_TOKEN);
}

auto build_term(const SyntaxNode& node) -> Result<ExpressionNode, TemplateError> {
    auto primary = build_primary(node.children[0]);
    if (is_err(primary)) {
        return primary;
    }

    ExpressionNode expr = std::move(unwrap(primary));
    for (size_t i = 1; i < node.children.size(); ++i) {
        const SyntaxNode& chain = node.children[i];
        auto call = build_function(chain);
        if (is_err(call)) {
            return unwrap_err(call);
        }
        MethodCallNode method{.receiver = make_box<ExpressionNode>(std::move(expr)),
                              .call = std::move(unwrap(call))};
        expr = ExpressionNode{.kind = std::move(method), .span = chain.span};
    }
    return expr;
}

auto build_template(const SyntaxNode& node) -> Result<ExpressionNode, TemplateError> {
    if (node.children.size() == 1) {
        return build_term(node.children[0]);
    }

    ListExpr list;
    list.items.reserve(node.children.size());
    for (const auto& term : node.children) {
        auto expr = build_term(term);
        if (is_err(expr)) {
            return expr;
        }
        list.items.push_back(std::move(unwrap(expr)));
    }
    return ExpressionNode{.kind = std::move(list), .span = node.span};
}

} // namespace

auto build_ast(const SyntaxNode& program) -> Result<ExpressionNode, TemplateError> {
    if (program.children.empty()) {
        return ExpressionNode{.kind = ListExpr{}, .span = program.span};
    }
    return build_template(program.children[0]);
}

auto parse_template(const lexer::Source& source) -> Result<ExpressionNode, TemplateError> {
    auto syntax = parse_syntax(source);
    if (is_err(syntax)) {
        return unwrap_err(syntax);
    }
    return build_ast(unwrap(syntax));
}

} // namespace stencil::parser
