//! # Common Definitions
//!
//! This module provides common types, utilities, and constants used throughout
//! the Stencil template compiler. It establishes the foundational abstractions
//! that all other components depend on.
//!
//! ## Overview
//!
//! The common module includes:
//!
//! - **Version Information**: Compiler version constants
//! - **Options**: Process-wide configuration
//! - **Source Locations**: Types for tracking source code positions
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors are returned via `Result<T, E>`
//! - **Explicit Ownership**: `Box<T>` for unique ownership, `Rc<T>` for shared
//! - **Immutable Trees**: Compiled templates are never mutated after build

#ifndef STENCIL_COMMON_HPP
#define STENCIL_COMMON_HPP

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace stencil {

// ============================================================================
// Version Information
// ============================================================================

/// The compiler version string (e.g., "0.3.0").
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Configuration
// ============================================================================

/// When ANSI colors are written to the output.
enum class ColorMode {
    Auto,   ///< Colors when the output is a terminal
    Always, ///< Always emit escape codes
    Never   ///< Plain text only
};

/// Process-wide options.
///
/// These are set once by the command-line front end and read by the
/// diagnostic and output layers. The compiler core never writes them.
struct StencilOptions {
    /// Color mode for rendered output and diagnostics.
    static inline ColorMode color = ColorMode::Auto;

    /// Name used for template sources that do not come from a file.
    static inline std::string default_source_name = "<template>";
};

// ============================================================================
// Source Location Types
// ============================================================================

/// A precise location in template source text.
///
/// Locations do not reference the source name, so spans stay valid after
/// the `Source` they came from is gone.
///
/// # Fields
///
/// - `line`: 1-based line number
/// - `column`: 1-based column number (in bytes)
/// - `offset`: 0-based byte offset from the start of the source
struct SourceLocation {
    uint32_t line = 1;
    uint32_t column = 1;
    uint32_t offset = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A half-open byte range `[start.offset, end.offset)` of source text.
///
/// `end` is the location just past the last byte covered, so an empty span
/// has `start.offset == end.offset`.
struct SourceSpan {
    SourceLocation start;
    SourceLocation end;

    /// Number of bytes covered by the span.
    [[nodiscard]] auto length() const -> uint32_t {
        return end.offset > start.offset ? end.offset - start.offset : 0;
    }

    [[nodiscard]] auto empty() const -> bool {
        return length() == 0;
    }

    /// Merges two spans into one that covers both.
    ///
    /// The result spans from the start of `a` to the end of `b`.
    [[nodiscard]] static auto merge(const SourceSpan& a, const SourceSpan& b) -> SourceSpan {
        return {a.start, b.end};
    }
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// `Result<T, E>` is used for operations that can fail, allowing error
/// handling without exceptions.
///
/// # Example
///
/// ```cpp
/// auto result = parse_template(source);
/// if (is_err(result)) {
///     report(unwrap_err(result));
///     return;
/// }
/// auto& node = unwrap(result);
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace stencil

#endif // STENCIL_COMMON_HPP
