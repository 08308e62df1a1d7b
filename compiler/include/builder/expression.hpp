//! # Built Expressions
//!
//! The result of building one AST node is either a typed value (with the
//! labels gathered so far) or an already formed template node. Builtin
//! functions always produce templates; keywords, literals and method calls
//! produce values.
//!
//! ## Conversions
//!
//! | Method              | Value                          | Template          |
//! |---------------------|--------------------------------|-------------------|
//! | `into_template`     | display form, then labels      | itself            |
//! | `into_plain_text`   | String as is, else display form| rendered text     |
//! | `try_into_boolean`  | Boolean, or String non-empty   | none              |
//! | `try_into_integer`  | Integer                        | none              |

#ifndef STENCIL_BUILDER_EXPRESSION_HPP
#define STENCIL_BUILDER_EXPRESSION_HPP

#include "common.hpp"
#include "error.hpp"
#include "parser/ast.hpp"
#include "render/template.hpp"
#include "types/value.hpp"

#include <functional>
#include <optional>
#include <string_view>
#include <type_traits>
#include <variant>

namespace stencil::builder {

using render::TemplatePtr;
using types::LabeledValue;
using types::Property;
using types::Value;
using types::ValueKind;

/// Maps a keyword to the value it denotes for the record type `C`.
///
/// Unknown keywords must be reported as `TemplateError::no_such_keyword`
/// at `span`.
template <typename C>
using KeywordResolver = std::function<Result<LabeledValue<C>, TemplateError>(
    std::string_view name, const SourceSpan& span)>;

/// Wraps a value in the node that writes its display form.
template <typename C>
[[nodiscard]] auto value_to_template(const Value<C>& value) -> TemplatePtr<C> {
    return std::visit(
        [](const auto& property) -> TemplatePtr<C> {
            using T = std::decay_t<std::invoke_result_t<decltype(property), const C&>>;
            return make_rc<render::FormattablePropertyTemplate<C, T>>(property);
        },
        value.variant());
}

template <typename C> class Expression {
public:
    [[nodiscard]] static auto from_value(LabeledValue<C> value) -> Expression {
        return Expression(Variant(std::in_place_index<0>, std::move(value)));
    }

    [[nodiscard]] static auto from_template(TemplatePtr<C> tmpl) -> Expression {
        return Expression(Variant(std::in_place_index<1>, std::move(tmpl)));
    }

    [[nodiscard]] auto is_template() const -> bool {
        return inner_.index() == 1;
    }

    /// The value; only valid when `!is_template()`.
    [[nodiscard]] auto labeled_value() const -> const LabeledValue<C>& {
        return std::get<0>(inner_);
    }

    [[nodiscard]] auto into_template() const -> TemplatePtr<C> {
        if (is_template()) {
            return std::get<1>(inner_);
        }
        const auto& labeled = labeled_value();
        auto tmpl = value_to_template(labeled.value);
        if (labeled.labels.empty()) {
            return tmpl;
        }
        return make_rc<render::LabelTemplate<C>>(
            std::move(tmpl), types::constant<C, std::vector<std::string>>(labeled.labels));
    }

    [[nodiscard]] auto into_plain_text() const -> Property<C, std::string> {
        if (is_template()) {
            return render::plain_text_property<C>(std::get<1>(inner_));
        }
        const auto& value = labeled_value().value;
        if (value.template is<std::string>()) {
            return value.template get<std::string>();
        }
        return render::plain_text_property<C>(value_to_template(value));
    }

    [[nodiscard]] auto try_into_boolean() const -> std::optional<Property<C, bool>> {
        if (is_template()) {
            return std::nullopt;
        }
        const auto& value = labeled_value().value;
        if (value.template is<bool>()) {
            return value.template get<bool>();
        }
        if (value.template is<std::string>()) {
            return types::map_property<C>(value.template get<std::string>(),
                                          [](const std::string& s) { return !s.empty(); });
        }
        return std::nullopt;
    }

    [[nodiscard]] auto try_into_integer() const -> std::optional<Property<C, int64_t>> {
        if (is_template()) {
            return std::nullopt;
        }
        const auto& value = labeled_value().value;
        if (value.template is<int64_t>()) {
            return value.template get<int64_t>();
        }
        return std::nullopt;
    }

private:
    using Variant = std::variant<LabeledValue<C>, TemplatePtr<C>>;

    explicit Expression(Variant inner) : inner_(std::move(inner)) {}

    Variant inner_;
};

/// Builds the expression for `node`, resolving keywords with `resolve`.
///
/// Defined in `builder/expression_builder.hpp`.
template <typename C>
auto build_expression(const parser::ExpressionNode& node, const KeywordResolver<C>& resolve)
    -> Result<Expression<C>, TemplateError>;

} // namespace stencil::builder

#endif // STENCIL_BUILDER_EXPRESSION_HPP
