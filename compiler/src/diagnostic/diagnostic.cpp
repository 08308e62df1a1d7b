#include "diagnostic/diagnostic.hpp"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <sstream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <windows.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace stencil::diagnostic {

// ============================================================================
// Terminal Detection
// ============================================================================

auto terminal_supports_colors() -> bool {
#ifdef _WIN32
    HANDLE hOut = GetStdHandle(STD_ERROR_HANDLE);
    if (hOut == INVALID_HANDLE_VALUE)
        return false;

    DWORD dwMode = 0;
    if (!GetConsoleMode(hOut, &dwMode))
        return false;

    dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    if (SetConsoleMode(hOut, dwMode))
        return true;

    return isatty(fileno(stderr)) != 0;
#else
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
#endif
}

// ============================================================================
// Conversion
// ============================================================================

auto to_diagnostic(const TemplateError& error) -> Diagnostic {
    Diagnostic diag{.code = error.code, .message = error.message(), .span = error.span};
    for (const auto& note : error.notes) {
        if (note.rfind("did you mean", 0) == 0) {
            diag.help.push_back(note);
        } else {
            diag.notes.push_back(note);
        }
    }
    if (error.kind == TemplateErrorKind::NoSuchMethod && error.type_name == "Template") {
        diag.notes.push_back("functions return templates, which have no methods");
    }
    return diag;
}

// ============================================================================
// DiagnosticEmitter Implementation
// ============================================================================

DiagnosticEmitter::DiagnosticEmitter(std::ostream& out) : out_(out) {
    use_colors_ = terminal_supports_colors();
}

void DiagnosticEmitter::emit_header(const Diagnostic& diag) {
    // Format: error[P001]: message
    out_ << color(Colors::Bold) << color(Colors::BrightRed) << "error";

    if (!diag.code.empty()) {
        out_ << "[" << diag.code << "]";
    }

    out_ << color(Colors::Reset) << color(Colors::Bold) << ": " << diag.message
         << color(Colors::Reset) << "\n";
}

void DiagnosticEmitter::emit_source_snippet(const SourceSpan& span, const lexer::Source& source) {
    out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset) << source.filename()
         << ":" << span.start.line << ":" << span.start.column << "\n";

    if (span.start.line > source.line_count()) {
        return;
    }
    std::string_view source_line = source.line(span.start.line);

    int line_width = static_cast<int>(std::to_string(span.start.line).length());
    line_width = std::max(line_width, 4);

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << span.start.line << " | "
         << color(Colors::Reset) << source_line << "\n";

    // Underline to the end of the span, or of the line if the span continues.
    size_t start_col = span.start.column > 0 ? span.start.column - 1 : 0;
    size_t end_col = source_line.length();
    if (span.end.line == span.start.line) {
        end_col = span.end.column > 0 ? span.end.column - 1 : 0;
    }
    end_col = std::max(end_col, start_col + 1);

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " | "
         << color(Colors::Reset);
    for (size_t i = 0; i < start_col; ++i) {
        out_ << (i < source_line.length() && source_line[i] == '\t' ? '\t' : ' ');
    }
    out_ << color(Colors::BrightRed);
    for (size_t i = start_col; i < end_col; ++i) {
        out_ << '^';
    }
    out_ << color(Colors::Reset) << "\n";

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";
}

void DiagnosticEmitter::emit_notes(const std::vector<std::string>& notes) {
    for (const auto& note : notes) {
        out_ << color(Colors::BrightCyan) << "  = note" << color(Colors::Reset) << ": " << note
             << "\n";
    }
}

void DiagnosticEmitter::emit_help(const std::vector<std::string>& help) {
    for (const auto& h : help) {
        out_ << color(Colors::BrightGreen) << "  = help" << color(Colors::Reset) << ": " << h
             << "\n";
    }
}

void DiagnosticEmitter::emit(const Diagnostic& diag, const lexer::Source& source) {
    error_count_++;

    if (format_ == DiagnosticFormat::Json) {
        emit_json(diag, source);
        return;
    }

    emit_header(diag);
    emit_source_snippet(diag.span, source);
    emit_notes(diag.notes);
    emit_help(diag.help);
}

void DiagnosticEmitter::emit_template_error(const TemplateError& error,
                                            const lexer::Source& source) {
    emit(to_diagnostic(error), source);
}

// ============================================================================
// JSON Output
// ============================================================================

auto escape_json_string(const std::string& s) -> std::string {
    std::ostringstream result;
    for (char c : s) {
        switch (c) {
        case '"':
            result << "\\\"";
            break;
        case '\\':
            result << "\\\\";
            break;
        case '\b':
            result << "\\b";
            break;
        case '\f':
            result << "\\f";
            break;
        case '\n':
            result << "\\n";
            break;
        case '\r':
            result << "\\r";
            break;
        case '\t':
            result << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                // Control character - emit as \uXXXX
                result << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec << std::setfill(' ');
            } else {
                result << c;
            }
            break;
        }
    }
    return result.str();
}

void DiagnosticEmitter::emit_json(const Diagnostic& diag, const lexer::Source& source) {
    out_ << "{";
    out_ << "\"severity\":\"error\",";
    out_ << "\"code\":\"" << escape_json_string(diag.code) << "\",";
    out_ << "\"message\":\"" << escape_json_string(diag.message) << "\",";

    out_ << "\"span\":{";
    out_ << "\"file\":\"" << escape_json_string(std::string(source.filename())) << "\",";
    out_ << "\"start\":{\"line\":" << diag.span.start.line
         << ",\"column\":" << diag.span.start.column << "},";
    out_ << "\"end\":{\"line\":" << diag.span.end.line << ",\"column\":" << diag.span.end.column
         << "}";
    out_ << "},";

    out_ << "\"notes\":[";
    bool first = true;
    for (const auto& note : diag.notes) {
        if (!first)
            out_ << ",";
        first = false;
        out_ << "\"" << escape_json_string(note) << "\"";
    }
    out_ << "],";

    out_ << "\"help\":[";
    first = true;
    for (const auto& h : diag.help) {
        if (!first)
            out_ << ",";
        first = false;
        out_ << "\"" << escape_json_string(h) << "\"";
    }
    out_ << "]";

    out_ << "}\n";
}

} // namespace stencil::diagnostic
