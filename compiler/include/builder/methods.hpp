//! # Method Tables
//!
//! Each value kind has a static table from method name to builder. A builder
//! checks its own arguments and returns the new value; the caller appends
//! the method name to the receiver's labels.
//!
//! | Kind               | Methods                                     |
//! |--------------------|---------------------------------------------|
//! | `String`           | `contains(needle)`, `first_line()`          |
//! | `Boolean`          | none                                        |
//! | `Integer`          | none                                        |
//! | `CommitOrChangeId` | `short([len])`, `shortest([len])`           |
//! | `ShortestIdPrefix` | `with_brackets()`                           |
//! | `Signature`        | `name()`, `email()`, `username()`, `timestamp()` |
//! | `Timestamp`        | `ago()`                                     |
//!
//! Calling a method on a template (the result of a builtin function) is
//! always `NoSuchMethod` with type `"Template"`.

#ifndef STENCIL_BUILDER_METHODS_HPP
#define STENCIL_BUILDER_METHODS_HPP

#include "builder/arguments.hpp"
#include "builder/expression.hpp"
#include "diagnostic/suggest.hpp"
#include "types/time_format.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stencil::builder {

using types::CommitOrChangeId;
using types::ShortestIdPrefix;
using types::Signature;
using types::Timestamp;

template <typename C, typename T>
using MethodBuilder = std::function<Result<Value<C>, TemplateError>(
    const Property<C, T>& self, const FunctionCallNode& function,
    const KeywordResolver<C>& resolve)>;

template <typename C, typename T>
using MethodTable = std::map<std::string, MethodBuilder<C, T>, std::less<>>;

namespace detail {

// ============================================================================
// String
// ============================================================================

template <typename C>
auto string_contains(const Property<C, std::string>& self, const FunctionCallNode& function,
                     const KeywordResolver<C>& resolve) -> Result<Value<C>, TemplateError> {
    auto args = expect_exact_arguments<1>(function);
    if (is_err(args)) {
        return unwrap_err(args);
    }
    auto needle = build_expression<C>(*unwrap(args)[0], resolve);
    if (is_err(needle)) {
        return unwrap_err(needle);
    }
    return Value<C>::template of<bool>(
        [self, needle = unwrap(needle).into_plain_text()](const C& context) {
            return self(context).find(needle(context)) != std::string::npos;
        });
}

template <typename C>
auto string_first_line(const Property<C, std::string>& self, const FunctionCallNode& function,
                       const KeywordResolver<C>&) -> Result<Value<C>, TemplateError> {
    auto args = expect_no_arguments(function);
    if (is_err(args)) {
        return unwrap_err(args);
    }
    return Value<C>::template of<std::string>(types::map_property<C>(
        self, [](const std::string& s) { return s.substr(0, s.find('\n')); }));
}

// ============================================================================
// CommitOrChangeId
// ============================================================================

/// The optional length argument of `short` and `shortest`.
template <typename C>
auto optional_length(const FunctionCallNode& function, const KeywordResolver<C>& resolve)
    -> Result<std::optional<Property<C, int64_t>>, TemplateError> {
    auto args = expect_arguments<0, 1>(function);
    if (is_err(args)) {
        return unwrap_err(args);
    }
    const ExpressionNode* len_node = unwrap(args).optional[0];
    if (len_node == nullptr) {
        return std::optional<Property<C, int64_t>>{};
    }

    auto expr = build_expression<C>(*len_node, resolve);
    if (is_err(expr)) {
        return unwrap_err(expr);
    }
    auto len = unwrap(expr).try_into_integer();
    if (!len) {
        return TemplateError::invalid_argument_type("Integer", len_node->span);
    }
    return len;
}

/// Evaluates an optional length; absent or negative lengths give `fallback`.
template <typename C>
auto length_or(const std::optional<Property<C, int64_t>>& len, const C& context, size_t fallback)
    -> size_t {
    if (!len) {
        return fallback;
    }
    int64_t value = (*len)(context);
    return value < 0 ? fallback : static_cast<size_t>(value);
}

template <typename C>
auto id_short(const Property<C, CommitOrChangeId>& self, const FunctionCallNode& function,
              const KeywordResolver<C>& resolve) -> Result<Value<C>, TemplateError> {
    auto len = optional_length<C>(function, resolve);
    if (is_err(len)) {
        return unwrap_err(len);
    }
    return Value<C>::template of<std::string>(
        [self, len = unwrap(len)](const C& context) {
            return self(context).short_hex(length_or(len, context, 12));
        });
}

template <typename C>
auto id_shortest(const Property<C, CommitOrChangeId>& self, const FunctionCallNode& function,
                 const KeywordResolver<C>& resolve) -> Result<Value<C>, TemplateError> {
    auto len = optional_length<C>(function, resolve);
    if (is_err(len)) {
        return unwrap_err(len);
    }
    return Value<C>::template of<ShortestIdPrefix>(
        [self, len = unwrap(len)](const C& context) {
            return self(context).shortest(length_or(len, context, 0));
        });
}

// ============================================================================
// Nullary accessors
// ============================================================================

/// A method without arguments that maps the receiver with `f`.
template <typename C, typename T, typename F>
auto nullary_method(F f) -> MethodBuilder<C, T> {
    return [f](const Property<C, T>& self, const FunctionCallNode& function,
               const KeywordResolver<C>&) -> Result<Value<C>, TemplateError> {
        auto args = expect_no_arguments(function);
        if (is_err(args)) {
            return unwrap_err(args);
        }
        auto mapped = types::map_property<C>(self, f);
        using R = std::invoke_result_t<F, const T&>;
        return Value<C>::template of<R>(std::move(mapped));
    };
}

} // namespace detail

// ============================================================================
// Tables
// ============================================================================

template <typename C> auto string_methods() -> const MethodTable<C, std::string>& {
    static const MethodTable<C, std::string> table = {
        {"contains", &detail::string_contains<C>},
        {"first_line", &detail::string_first_line<C>},
    };
    return table;
}

template <typename C> auto boolean_methods() -> const MethodTable<C, bool>& {
    static const MethodTable<C, bool> table;
    return table;
}

template <typename C> auto integer_methods() -> const MethodTable<C, int64_t>& {
    static const MethodTable<C, int64_t> table;
    return table;
}

template <typename C> auto id_methods() -> const MethodTable<C, CommitOrChangeId>& {
    static const MethodTable<C, CommitOrChangeId> table = {
        {"short", &detail::id_short<C>},
        {"shortest", &detail::id_shortest<C>},
    };
    return table;
}

template <typename C> auto shortest_id_prefix_methods() -> const MethodTable<C, ShortestIdPrefix>& {
    static const MethodTable<C, ShortestIdPrefix> table = {
        {"with_brackets", detail::nullary_method<C, ShortestIdPrefix>(
                              [](const ShortestIdPrefix& id) { return id.with_brackets(); })},
    };
    return table;
}

template <typename C> auto signature_methods() -> const MethodTable<C, Signature>& {
    static const MethodTable<C, Signature> table = {
        {"name", detail::nullary_method<C, Signature>(
                     [](const Signature& sig) { return sig.name; })},
        {"email", detail::nullary_method<C, Signature>(
                      [](const Signature& sig) { return sig.email; })},
        {"username", detail::nullary_method<C, Signature>(
                         [](const Signature& sig) { return sig.username(); })},
        {"timestamp", detail::nullary_method<C, Signature>(
                          [](const Signature& sig) { return sig.timestamp; })},
    };
    return table;
}

template <typename C> auto timestamp_methods() -> const MethodTable<C, Timestamp>& {
    static const MethodTable<C, Timestamp> table = {
        {"ago", detail::nullary_method<C, Timestamp>([](const Timestamp& ts) {
             return types::format_timestamp_relative_to_now(ts);
         })},
    };
    return table;
}

/// The method table for values of type `T`.
template <typename C, typename T> auto method_table() -> const MethodTable<C, T>& {
    if constexpr (std::is_same_v<T, std::string>) {
        return string_methods<C>();
    } else if constexpr (std::is_same_v<T, bool>) {
        return boolean_methods<C>();
    } else if constexpr (std::is_same_v<T, int64_t>) {
        return integer_methods<C>();
    } else if constexpr (std::is_same_v<T, CommitOrChangeId>) {
        return id_methods<C>();
    } else if constexpr (std::is_same_v<T, ShortestIdPrefix>) {
        return shortest_id_prefix_methods<C>();
    } else if constexpr (std::is_same_v<T, Signature>) {
        return signature_methods<C>();
    } else {
        static_assert(std::is_same_v<T, Timestamp>, "not a value type");
        return timestamp_methods<C>();
    }
}

/// Names in a method table, for suggestions.
template <typename C, typename T> auto method_names() -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& [name, builder] : method_table<C, T>()) {
        names.push_back(name);
    }
    return names;
}

/// Builds `receiver.name(args...)`.
template <typename C>
auto build_method_call(const parser::MethodCallNode& method, const KeywordResolver<C>& resolve)
    -> Result<Expression<C>, TemplateError> {
    const FunctionCallNode& function = method.call;

    auto receiver = build_expression<C>(*method.receiver, resolve);
    if (is_err(receiver)) {
        return unwrap_err(receiver);
    }
    const Expression<C>& expr = unwrap(receiver);
    if (expr.is_template()) {
        return TemplateError::no_such_method("Template", function.name, function.name_span);
    }

    const LabeledValue<C>& self = expr.labeled_value();
    auto built = std::visit(
        [&](const auto& property) -> Result<Value<C>, TemplateError> {
            using T = std::decay_t<std::invoke_result_t<decltype(property), const C&>>;
            const auto& table = method_table<C, T>();
            auto it = table.find(function.name);
            if (it == table.end()) {
                auto err = TemplateError::no_such_method(
                    std::string(types::kind_name(self.value.kind())), function.name,
                    function.name_span);
                return diagnostic::with_suggestion(std::move(err), method_names<C, T>());
            }
            return it->second(property, function, resolve);
        },
        self.value.variant());
    if (is_err(built)) {
        return unwrap_err(built);
    }

    // Labels are copied, never shared with the receiver.
    std::vector<std::string> labels = self.labels;
    labels.push_back(function.name);
    return Expression<C>::from_value(
        LabeledValue<C>{.value = std::move(unwrap(built)), .labels = std::move(labels)});
}

} // namespace stencil::builder

#endif // STENCIL_BUILDER_METHODS_HPP
