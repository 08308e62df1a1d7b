//! # Argument Count Checks
//!
//! Every function and method checks its argument list with one of three
//! shapes. Errors are reported at the span of the argument list.
//!
//! | Helper                          | Accepts         | Error                            |
//! |---------------------------------|-----------------|----------------------------------|
//! | `expect_exact_arguments<N>`     | exactly N       | `InvalidArgumentCountExact`      |
//! | `expect_some_arguments<N>`      | N or more       | `InvalidArgumentCountRangeFrom`  |
//! | `expect_arguments<N, M>`        | N to N + M      | `InvalidArgumentCountRange`      |

#ifndef STENCIL_BUILDER_ARGUMENTS_HPP
#define STENCIL_BUILDER_ARGUMENTS_HPP

#include "common.hpp"
#include "error.hpp"
#include "parser/ast.hpp"

#include <array>
#include <cstddef>
#include <vector>

namespace stencil::builder {

using parser::ExpressionNode;
using parser::FunctionCallNode;

template <size_t N> using RequiredArguments = std::array<const ExpressionNode*, N>;

/// N required arguments followed by any number of others.
template <size_t N> struct SomeArguments {
    RequiredArguments<N> required;
    std::vector<const ExpressionNode*> rest;
};

/// N required arguments and M optional ones; absent optionals are null.
template <size_t N, size_t M> struct Arguments {
    RequiredArguments<N> required;
    std::array<const ExpressionNode*, M> optional;
};

template <size_t N>
[[nodiscard]] auto expect_exact_arguments(const FunctionCallNode& function)
    -> Result<RequiredArguments<N>, TemplateError> {
    if (function.args.size() != N) {
        return TemplateError::invalid_argument_count_exact(N, function.args_span);
    }
    RequiredArguments<N> required{};
    for (size_t i = 0; i < N; ++i) {
        required[i] = &function.args[i];
    }
    return required;
}

template <size_t N>
[[nodiscard]] auto expect_some_arguments(const FunctionCallNode& function)
    -> Result<SomeArguments<N>, TemplateError> {
    if (function.args.size() < N) {
        return TemplateError::invalid_argument_count_range_from(N, function.args_span);
    }
    SomeArguments<N> args{};
    for (size_t i = 0; i < function.args.size(); ++i) {
        if (i < N) {
            args.required[i] = &function.args[i];
        } else {
            args.rest.push_back(&function.args[i]);
        }
    }
    return args;
}

template <size_t N, size_t M>
[[nodiscard]] auto expect_arguments(const FunctionCallNode& function)
    -> Result<Arguments<N, M>, TemplateError> {
    if (function.args.size() < N || function.args.size() > N + M) {
        return TemplateError::invalid_argument_count_range(N, N + M, function.args_span);
    }
    Arguments<N, M> args{};
    args.optional.fill(nullptr);
    for (size_t i = 0; i < function.args.size(); ++i) {
        if (i < N) {
            args.required[i] = &function.args[i];
        } else {
            args.optional[i - N] = &function.args[i];
        }
    }
    return args;
}

/// `expect_exact_arguments<0>`, for methods without parameters.
[[nodiscard]] inline auto expect_no_arguments(const FunctionCallNode& function)
    -> Result<RequiredArguments<0>, TemplateError> {
    return expect_exact_arguments<0>(function);
}

} // namespace stencil::builder

#endif // STENCIL_BUILDER_ARGUMENTS_HPP
