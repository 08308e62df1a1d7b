//! # Template Values
//!
//! A value is a typed, lazily evaluated extractor: a pure function from the
//! record being rendered (the context `C`) to a result of one of exactly
//! seven kinds. Values are built once at compile time and invoked once per
//! rendered record.
//!
//! | Kind               | Result type              |
//! |--------------------|--------------------------|
//! | `String`           | `std::string`            |
//! | `Boolean`          | `bool`                   |
//! | `Integer`          | `int64_t`                |
//! | `CommitOrChangeId` | `types::CommitOrChangeId`|
//! | `ShortestIdPrefix` | `types::ShortestIdPrefix`|
//! | `Signature`        | `types::Signature`       |
//! | `Timestamp`        | `types::Timestamp`       |
//!
//! ## Example
//!
//! ```cpp
//! auto id = Value<Commit>::of<CommitOrChangeId>(
//!     [](const Commit& c) { return CommitOrChangeId(c.commit_id); });
//! auto short_id = map_property<Commit>(id.get<CommitOrChangeId>(),
//!     [](const CommitOrChangeId& id) { return id.short_hex(12); });
//! ```

#ifndef STENCIL_TYPES_VALUE_HPP
#define STENCIL_TYPES_VALUE_HPP

#include "types/value_types.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace stencil::types {

/// A pure extractor from the context `C` to a `T`.
template <typename C, typename T> using Property = std::function<T(const C&)>;

enum class ValueKind : uint8_t {
    String,
    Boolean,
    Integer,
    CommitOrChangeId,
    ShortestIdPrefix,
    Signature,
    Timestamp,
};

/// The type name used in error messages, e.g. `"CommitOrChangeId"`.
[[nodiscard]] auto kind_name(ValueKind kind) -> std::string_view;

/// A property of one of the seven value kinds.
template <typename C> class Value {
public:
    using Variant =
        std::variant<Property<C, std::string>, Property<C, bool>, Property<C, int64_t>,
                     Property<C, CommitOrChangeId>, Property<C, ShortestIdPrefix>,
                     Property<C, Signature>, Property<C, Timestamp>>;

    /// Wraps an extractor producing a `T`.
    template <typename T> [[nodiscard]] static auto of(Property<C, T> property) -> Value {
        return Value(Variant(std::in_place_type<Property<C, T>>, std::move(property)));
    }

    [[nodiscard]] auto kind() const -> ValueKind {
        return static_cast<ValueKind>(property_.index());
    }

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<Property<C, T>>(property_);
    }

    /// The extractor, which must be of kind `T`.
    template <typename T> [[nodiscard]] auto get() const -> const Property<C, T>& {
        return std::get<Property<C, T>>(property_);
    }

    [[nodiscard]] auto variant() const -> const Variant& {
        return property_;
    }

private:
    explicit Value(Variant property) : property_(std::move(property)) {}

    Variant property_;
};

/// A value with the style labels accumulated while building it.
///
/// Labels are ordered outermost first: `author.name()` carries
/// `["author", "name"]`.
template <typename C> struct LabeledValue {
    Value<C> value;
    std::vector<std::string> labels;
};

/// An extractor that ignores the context and returns `value`.
template <typename C, typename T> [[nodiscard]] auto constant(T value) -> Property<C, T> {
    return [value = std::move(value)](const C&) -> T { return value; };
}

/// Composes `f` after `property`.
template <typename C, typename A, typename F>
[[nodiscard]] auto map_property(Property<C, A> property, F f)
    -> Property<C, std::invoke_result_t<F, const A&>> {
    return [property = std::move(property), f = std::move(f)](const C& context) {
        return f(property(context));
    };
}

} // namespace stencil::types

#endif // STENCIL_TYPES_VALUE_HPP
