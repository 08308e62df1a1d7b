#include "error.hpp"

#include <sstream>

namespace stencil {

auto TemplateError::syntax_error(std::string detail, SourceSpan span, std::string code)
    -> TemplateError {
    return TemplateError{.kind = TemplateErrorKind::SyntaxError,
                         .span = span,
                         .detail = std::move(detail),
                         .code = std::move(code)};
}

auto TemplateError::parse_int_error(std::string detail, SourceSpan span) -> TemplateError {
    return TemplateError{.kind = TemplateErrorKind::ParseIntError,
                         .span = span,
                         .detail = std::move(detail),
                         .code = ErrorCodes::PARSE_INT_OVERFLOW};
}

auto TemplateError::no_such_keyword(std::string name, SourceSpan span) -> TemplateError {
    return TemplateError{.kind = TemplateErrorKind::NoSuchKeyword,
                         .span = span,
                         .name = std::move(name),
                         .code = ErrorCodes::KEYWORD_UNKNOWN};
}

auto TemplateError::no_such_function(std::string name, SourceSpan span) -> TemplateError {
    return TemplateError{.kind = TemplateErrorKind::NoSuchFunction,
                         .span = span,
                         .name = std::move(name),
                         .code = ErrorCodes::FUNC_UNKNOWN};
}

auto TemplateError::no_such_method(std::string type_name, std::string name, SourceSpan span)
    -> TemplateError {
    return TemplateError{.kind = TemplateErrorKind::NoSuchMethod,
                         .span = span,
                         .name = std::move(name),
                         .type_name = std::move(type_name),
                         .code = ErrorCodes::METHOD_UNKNOWN};
}

auto TemplateError::invalid_argument_count_exact(size_t count, SourceSpan span) -> TemplateError {
    return TemplateError{.kind = TemplateErrorKind::InvalidArgumentCountExact,
                         .span = span,
                         .count_min = count,
                         .count_max = count,
                         .code = ErrorCodes::ARG_COUNT_MISMATCH};
}

auto TemplateError::invalid_argument_count_range(size_t min, size_t max, SourceSpan span)
    -> TemplateError {
    return TemplateError{.kind = TemplateErrorKind::InvalidArgumentCountRange,
                         .span = span,
                         .count_min = min,
                         .count_max = max,
                         .code = ErrorCodes::ARG_COUNT_MISMATCH};
}

auto TemplateError::invalid_argument_count_range_from(size_t min, SourceSpan span)
    -> TemplateError {
    return TemplateError{.kind = TemplateErrorKind::InvalidArgumentCountRangeFrom,
                         .span = span,
                         .count_min = min,
                         .code = ErrorCodes::ARG_COUNT_MISMATCH};
}

auto TemplateError::invalid_argument_type(std::string expected_type_name, SourceSpan span)
    -> TemplateError {
    return TemplateError{.kind = TemplateErrorKind::InvalidArgumentType,
                         .span = span,
                         .type_name = std::move(expected_type_name),
                         .code = ErrorCodes::ARG_TYPE_MISMATCH};
}

auto TemplateError::message() const -> std::string {
    std::ostringstream oss;
    switch (kind) {
    case TemplateErrorKind::SyntaxError:
        oss << "Syntax error";
        if (!detail.empty()) {
            oss << ": " << detail;
        }
        break;
    case TemplateErrorKind::ParseIntError:
        oss << "Invalid integer literal: " << detail;
        break;
    case TemplateErrorKind::NoSuchKeyword:
        oss << "Keyword \"" << name << "\" doesn't exist";
        break;
    case TemplateErrorKind::NoSuchFunction:
        oss << "Function \"" << name << "\" doesn't exist";
        break;
    case TemplateErrorKind::NoSuchMethod:
        oss << "Method \"" << name << "\" doesn't exist for type \"" << type_name << "\"";
        break;
    case TemplateErrorKind::InvalidArgumentCountExact:
        oss << "Expected " << count_min << " arguments";
        break;
    case TemplateErrorKind::InvalidArgumentCountRange:
        oss << "Expected " << count_min << " to " << count_max << " arguments";
        break;
    case TemplateErrorKind::InvalidArgumentCountRangeFrom:
        oss << "Expected at least " << count_min << " arguments";
        break;
    case TemplateErrorKind::InvalidArgumentType:
        oss << "Expected argument of type \"" << type_name << "\"";
        break;
    }
    return oss.str();
}

auto TemplateError::to_string() const -> std::string {
    std::ostringstream oss;
    oss << "line " << span.start.line << ", column " << span.start.column << ": " << message();
    return oss.str();
}

auto TemplateError::with_note(std::string note) const -> TemplateError {
    TemplateError copy = *this;
    copy.notes.push_back(std::move(note));
    return copy;
}

auto error_kind_name(TemplateErrorKind kind) -> const char* {
    switch (kind) {
    case TemplateErrorKind::SyntaxError:
        return "SyntaxError";
    case TemplateErrorKind::ParseIntError:
        return "ParseIntError";
    case TemplateErrorKind::NoSuchKeyword:
        return "NoSuchKeyword";
    case TemplateErrorKind::NoSuchFunction:
        return "NoSuchFunction";
    case TemplateErrorKind::NoSuchMethod:
        return "NoSuchMethod";
    case TemplateErrorKind::InvalidArgumentCountExact:
        return "InvalidArgumentCountExact";
    case TemplateErrorKind::InvalidArgumentCountRange:
        return "InvalidArgumentCountRange";
    case TemplateErrorKind::InvalidArgumentCountRangeFrom:
        return "InvalidArgumentCountRangeFrom";
    case TemplateErrorKind::InvalidArgumentType:
        return "InvalidArgumentType";
    }
    return "Unknown";
}

} // namespace stencil
