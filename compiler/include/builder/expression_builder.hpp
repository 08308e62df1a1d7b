//! # Expression Builder
//!
//! Turns an AST into an evaluation tree for a record type `C`. Keywords are
//! looked up through a `KeywordResolver<C>`; functions and methods through
//! the static tables in `builder/functions.hpp` and `builder/methods.hpp`.
//!
//! ## Pipeline
//!
//! ```text
//! Source --parse_template--> ExpressionNode --build_template--> TemplatePtr<C>
//! ```
//!
//! `compile` runs both steps. The first error stops the build.
//!
//! ## Example
//!
//! ```cpp
//! auto tmpl = builder::compile<Commit>("commit_id.short() \" \" author.name()",
//!                                      record::commit_keyword_resolver(index));
//! if (is_ok(tmpl)) {
//!     std::cout << render::render_plain(*unwrap(tmpl), commit);
//! }
//! ```

#ifndef STENCIL_BUILDER_EXPRESSION_BUILDER_HPP
#define STENCIL_BUILDER_EXPRESSION_BUILDER_HPP

#include "builder/expression.hpp"
#include "builder/functions.hpp"
#include "builder/methods.hpp"
#include "lexer/source.hpp"
#include "log/log.hpp"
#include "parser/ast_builder.hpp"

#include <string>
#include <vector>

namespace stencil::builder {

template <typename C>
auto build_expression(const parser::ExpressionNode& node, const KeywordResolver<C>& resolve)
    -> Result<Expression<C>, TemplateError> {
    return std::visit(
        [&](const auto& kind) -> Result<Expression<C>, TemplateError> {
            using K = std::decay_t<decltype(kind)>;

            if constexpr (std::is_same_v<K, parser::IdentifierExpr>) {
                auto value = resolve(kind.name, node.span);
                if (is_err(value)) {
                    return unwrap_err(value);
                }
                return Expression<C>::from_value(std::move(unwrap(value)));
            } else if constexpr (std::is_same_v<K, parser::IntegerExpr>) {
                return Expression<C>::from_value(LabeledValue<C>{
                    .value = Value<C>::template of<int64_t>(
                        types::constant<C, int64_t>(kind.value)),
                    .labels = {},
                });
            } else if constexpr (std::is_same_v<K, parser::StringExpr>) {
                return Expression<C>::from_value(LabeledValue<C>{
                    .value = Value<C>::template of<std::string>(
                        types::constant<C, std::string>(kind.value)),
                    .labels = {},
                });
            } else if constexpr (std::is_same_v<K, parser::ListExpr>) {
                std::vector<TemplatePtr<C>> items;
                items.reserve(kind.items.size());
                for (const auto& item : kind.items) {
                    auto expr = build_expression<C>(item, resolve);
                    if (is_err(expr)) {
                        return unwrap_err(expr);
                    }
                    items.push_back(unwrap(expr).into_template());
                }
                return Expression<C>::from_template(
                    make_rc<render::ListTemplate<C>>(std::move(items)));
            } else if constexpr (std::is_same_v<K, parser::FunctionCallNode>) {
                return build_global_function<C>(kind, resolve);
            } else {
                static_assert(std::is_same_v<K, parser::MethodCallNode>, "unhandled node kind");
                return build_method_call<C>(kind, resolve);
            }
        },
        node.kind);
}

/// Builds the evaluation tree for a whole template.
template <typename C>
[[nodiscard]] auto build_template(const parser::ExpressionNode& node,
                                  const KeywordResolver<C>& resolve)
    -> Result<TemplatePtr<C>, TemplateError> {
    auto expr = build_expression<C>(node, resolve);
    if (is_err(expr)) {
        return unwrap_err(expr);
    }
    return unwrap(expr).into_template();
}

/// Parses and builds `source` in one step.
template <typename C>
[[nodiscard]] auto compile(const lexer::Source& source, const KeywordResolver<C>& resolve)
    -> Result<TemplatePtr<C>, TemplateError> {
    auto ast = parser::parse_template(source);
    if (is_err(ast)) {
        return unwrap_err(ast);
    }

    auto tmpl = build_template<C>(unwrap(ast), resolve);
    if (is_err(tmpl)) {
        const auto& err = unwrap_err(tmpl);
        STENCIL_LOG_DEBUG("build", source.filename() << ": " << err.to_string());
        return err;
    }
    STENCIL_LOG_DEBUG("build", "compiled " << source.filename() << " (" << source.length()
                                           << " bytes)");
    return tmpl;
}

/// Compiles an in-memory template.
template <typename C>
[[nodiscard]] auto compile(std::string text, const KeywordResolver<C>& resolve)
    -> Result<TemplatePtr<C>, TemplateError> {
    return compile<C>(lexer::Source::from_string(std::move(text)), resolve);
}

} // namespace stencil::builder

#endif // STENCIL_BUILDER_EXPRESSION_BUILDER_HPP
