//! # Builtin Functions
//!
//! Global functions always produce template nodes, so their results have no
//! methods.
//!
//! | Function                          | Node                  |
//! |-----------------------------------|-----------------------|
//! | `label(labels, content)`          | `LabelTemplate`       |
//! | `if(cond, then[, else])`          | `ConditionalTemplate` |
//! | `separate(sep, contents...)`      | `SeparateTemplate`    |
//!
//! `label` evaluates its first argument as plain text per record and splits
//! it on whitespace, so `label("a b", x)` pushes two labels.

#ifndef STENCIL_BUILDER_FUNCTIONS_HPP
#define STENCIL_BUILDER_FUNCTIONS_HPP

#include "builder/arguments.hpp"
#include "builder/expression.hpp"
#include "diagnostic/suggest.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace stencil::builder {

/// Splits label text on ASCII whitespace, dropping empty pieces.
[[nodiscard]] auto split_label_text(std::string_view text) -> std::vector<std::string>;

/// Names of the builtin functions, for suggestions.
[[nodiscard]] auto builtin_function_names() -> const std::vector<std::string>&;

template <typename C>
using FunctionBuilder = std::function<Result<Expression<C>, TemplateError>(
    const FunctionCallNode& function, const KeywordResolver<C>& resolve)>;

namespace detail {

template <typename C>
auto build_template_arg(const ExpressionNode& node, const KeywordResolver<C>& resolve)
    -> Result<TemplatePtr<C>, TemplateError> {
    auto expr = build_expression<C>(node, resolve);
    if (is_err(expr)) {
        return unwrap_err(expr);
    }
    return unwrap(expr).into_template();
}

template <typename C>
auto build_label(const FunctionCallNode& function, const KeywordResolver<C>& resolve)
    -> Result<Expression<C>, TemplateError> {
    auto args = expect_exact_arguments<2>(function);
    if (is_err(args)) {
        return unwrap_err(args);
    }
    auto [label_node, content_node] = unwrap(args);

    auto label = build_expression<C>(*label_node, resolve);
    if (is_err(label)) {
        return unwrap_err(label);
    }
    auto content = build_template_arg<C>(*content_node, resolve);
    if (is_err(content)) {
        return unwrap_err(content);
    }

    auto labels = types::map_property<C>(unwrap(label).into_plain_text(),
                                         [](const std::string& s) { return split_label_text(s); });
    return Expression<C>::from_template(
        make_rc<render::LabelTemplate<C>>(std::move(unwrap(content)), std::move(labels)));
}

template <typename C>
auto build_if(const FunctionCallNode& function, const KeywordResolver<C>& resolve)
    -> Result<Expression<C>, TemplateError> {
    auto args = expect_arguments<2, 1>(function);
    if (is_err(args)) {
        return unwrap_err(args);
    }
    const auto& [required, optional] = unwrap(args);
    const ExpressionNode* condition_node = required[0];

    auto condition_expr = build_expression<C>(*condition_node, resolve);
    if (is_err(condition_expr)) {
        return unwrap_err(condition_expr);
    }
    auto condition = unwrap(condition_expr).try_into_boolean();
    if (!condition) {
        return TemplateError::invalid_argument_type("Boolean", condition_node->span);
    }

    auto true_template = build_template_arg<C>(*required[1], resolve);
    if (is_err(true_template)) {
        return unwrap_err(true_template);
    }
    TemplatePtr<C> false_template;
    if (optional[0] != nullptr) {
        auto built = build_template_arg<C>(*optional[0], resolve);
        if (is_err(built)) {
            return unwrap_err(built);
        }
        false_template = std::move(unwrap(built));
    }

    return Expression<C>::from_template(make_rc<render::ConditionalTemplate<C>>(
        std::move(*condition), std::move(unwrap(true_template)), std::move(false_template)));
}

template <typename C>
auto build_separate(const FunctionCallNode& function, const KeywordResolver<C>& resolve)
    -> Result<Expression<C>, TemplateError> {
    auto args = expect_some_arguments<1>(function);
    if (is_err(args)) {
        return unwrap_err(args);
    }
    const auto& [required, rest] = unwrap(args);

    auto separator = build_template_arg<C>(*required[0], resolve);
    if (is_err(separator)) {
        return unwrap_err(separator);
    }
    std::vector<TemplatePtr<C>> contents;
    contents.reserve(rest.size());
    for (const ExpressionNode* node : rest) {
        auto content = build_template_arg<C>(*node, resolve);
        if (is_err(content)) {
            return unwrap_err(content);
        }
        contents.push_back(std::move(unwrap(content)));
    }

    return Expression<C>::from_template(make_rc<render::SeparateTemplate<C>>(
        std::move(unwrap(separator)), std::move(contents)));
}

} // namespace detail

/// The builtin function table.
template <typename C>
auto builtin_functions() -> const std::map<std::string, FunctionBuilder<C>, std::less<>>& {
    static const std::map<std::string, FunctionBuilder<C>, std::less<>> table = {
        {"if", &detail::build_if<C>},
        {"label", &detail::build_label<C>},
        {"separate", &detail::build_separate<C>},
    };
    return table;
}

/// Builds a call to a builtin function.
template <typename C>
auto build_global_function(const FunctionCallNode& function, const KeywordResolver<C>& resolve)
    -> Result<Expression<C>, TemplateError> {
    const auto& table = builtin_functions<C>();
    auto it = table.find(function.name);
    if (it == table.end()) {
        return diagnostic::with_suggestion(
            TemplateError::no_such_function(function.name, function.name_span),
            builtin_function_names());
    }
    return it->second(function, resolve);
}

} // namespace stencil::builder

#endif // STENCIL_BUILDER_FUNCTIONS_HPP
