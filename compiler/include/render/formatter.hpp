//! # Formatters
//!
//! Rendering writes text through a `Formatter`, interleaved with label
//! pushes and pops. Labels are metadata: how (or whether) they show up is
//! up to the formatter.
//!
//! | Formatter            | Output                                       |
//! |----------------------|----------------------------------------------|
//! | `PlainTextFormatter` | text only, labels dropped                    |
//! | `FormatRecorder`     | `StyledText` segments, replayable            |
//! | `ColorFormatter`     | ANSI-styled text on a stream (see `color_formatter.hpp`) |
//!
//! This header also defines the canonical display form of every value
//! kind, via the `write_value` overloads.

#ifndef STENCIL_RENDER_FORMATTER_HPP
#define STENCIL_RENDER_FORMATTER_HPP

#include "types/value_types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace stencil::render {

/// Sink for rendered text and style labels.
class Formatter {
public:
    virtual ~Formatter() = default;

    virtual void write_str(std::string_view text) = 0;

    /// Starts a labeled region; regions nest.
    virtual void push_label(const std::string& label) = 0;

    /// Ends the innermost labeled region.
    virtual void pop_label() = 0;
};

// ============================================================================
// Styled Text
// ============================================================================

/// A run of text and the labels active over it (outermost first).
struct StyledSegment {
    std::string text;
    std::vector<std::string> labels;

    [[nodiscard]] auto operator==(const StyledSegment& other) const -> bool = default;
};

/// The result of rendering: ordered segments of labeled text.
struct StyledText {
    std::vector<StyledSegment> segments;

    /// All segment texts concatenated.
    [[nodiscard]] auto plain_text() const -> std::string;

    [[nodiscard]] auto empty() const -> bool;
};

// ============================================================================
// Formatters
// ============================================================================

/// Collects text and ignores labels.
class PlainTextFormatter : public Formatter {
public:
    void write_str(std::string_view text) override;
    void push_label(const std::string& label) override;
    void pop_label() override;

    [[nodiscard]] auto text() const -> const std::string& {
        return text_;
    }

    [[nodiscard]] auto take_text() -> std::string {
        return std::move(text_);
    }

private:
    std::string text_;
};

/// Records output as styled segments so it can be inspected or replayed.
///
/// Adjacent writes under the same label stack are merged into one segment;
/// empty writes are dropped.
class FormatRecorder : public Formatter {
public:
    void write_str(std::string_view text) override;
    void push_label(const std::string& label) override;
    void pop_label() override;

    [[nodiscard]] auto segments() const -> const std::vector<StyledSegment>& {
        return styled_.segments;
    }

    /// True when nothing but empty text was written.
    [[nodiscard]] auto empty() const -> bool {
        return styled_.empty();
    }

    /// Writes the recorded segments to `out`, each under its own labels.
    void replay(Formatter& out) const;

    [[nodiscard]] auto take_styled_text() -> StyledText {
        return std::move(styled_);
    }

private:
    StyledText styled_;
    std::vector<std::string> labels_;
};

// ============================================================================
// Value Display Forms
// ============================================================================

void write_value(Formatter& out, const std::string& value);
void write_value(Formatter& out, bool value);
void write_value(Formatter& out, int64_t value);
void write_value(Formatter& out, const types::CommitOrChangeId& value);

/// Writes the prefix under the label `prefix`, then the rest under `rest`.
void write_value(Formatter& out, const types::ShortestIdPrefix& value);

/// `name <email>`
void write_value(Formatter& out, const types::Signature& value);

/// `YYYY-MM-DD HH:MM:SS.mmm +HH:MM` in the timestamp's own offset.
void write_value(Formatter& out, const types::Timestamp& value);

} // namespace stencil::render

#endif // STENCIL_RENDER_FORMATTER_HPP
