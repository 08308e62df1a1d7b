#include "render/formatter.hpp"

#include "types/time_format.hpp"

namespace stencil::render {

// ============================================================================
// StyledText
// ============================================================================

auto StyledText::plain_text() const -> std::string {
    std::string text;
    for (const auto& segment : segments) {
        text += segment.text;
    }
    return text;
}

auto StyledText::empty() const -> bool {
    for (const auto& segment : segments) {
        if (!segment.text.empty()) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// PlainTextFormatter
// ============================================================================

void PlainTextFormatter::write_str(std::string_view text) {
    text_.append(text);
}

void PlainTextFormatter::push_label(const std::string&) {}

void PlainTextFormatter::pop_label() {}

// ============================================================================
// FormatRecorder
// ============================================================================

void FormatRecorder::write_str(std::string_view text) {
    if (text.empty()) {
        return;
    }
    auto& segments = styled_.segments;
    if (!segments.empty() && segments.back().labels == labels_) {
        segments.back().text.append(text);
        return;
    }
    segments.push_back(StyledSegment{.text = std::string(text), .labels = labels_});
}

void FormatRecorder::push_label(const std::string& label) {
    labels_.push_back(label);
}

void FormatRecorder::pop_label() {
    if (!labels_.empty()) {
        labels_.pop_back();
    }
}

void FormatRecorder::replay(Formatter& out) const {
    for (const auto& segment : styled_.segments) {
        for (const auto& label : segment.labels) {
            out.push_label(label);
        }
        out.write_str(segment.text);
        for (size_t i = 0; i < segment.labels.size(); ++i) {
            out.pop_label();
        }
    }
}

// ============================================================================
// Value Display Forms
// ============================================================================

void write_value(Formatter& out, const std::string& value) {
    out.write_str(value);
}

void write_value(Formatter& out, bool value) {
    out.write_str(value ? "true" : "false");
}

void write_value(Formatter& out, int64_t value) {
    out.write_str(std::to_string(value));
}

void write_value(Formatter& out, const types::CommitOrChangeId& value) {
    out.write_str(value.hex());
}

void write_value(Formatter& out, const types::ShortestIdPrefix& value) {
    out.push_label("prefix");
    out.write_str(value.prefix);
    out.pop_label();
    out.push_label("rest");
    out.write_str(value.rest);
    out.pop_label();
}

void write_value(Formatter& out, const types::Signature& value) {
    out.write_str(value.name);
    out.write_str(" <");
    out.write_str(value.email);
    out.write_str(">");
}

void write_value(Formatter& out, const types::Timestamp& value) {
    out.write_str(types::format_timestamp(value));
}

} // namespace stencil::render
