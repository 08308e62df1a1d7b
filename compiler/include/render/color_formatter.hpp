//! # Color Formatter
//!
//! Writes rendered text to a stream, switching ANSI styles as the active
//! label stack changes. The style for a stack comes from a `StyleConfig`.
//!
//! Escape sequences are only emitted when the style actually changes, and a
//! reset is written before the formatter is flushed or destroyed if a style
//! is still active.

#ifndef STENCIL_RENDER_COLOR_FORMATTER_HPP
#define STENCIL_RENDER_COLOR_FORMATTER_HPP

#include "config/style_config.hpp"
#include "render/formatter.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace stencil::render {

class ColorFormatter : public Formatter {
public:
    /// `out` and `config` must outlive the formatter.
    ColorFormatter(std::ostream& out, const config::StyleConfig& config);
    ~ColorFormatter() override;

    ColorFormatter(const ColorFormatter&) = delete;
    ColorFormatter& operator=(const ColorFormatter&) = delete;

    void write_str(std::string_view text) override;
    void push_label(const std::string& label) override;
    void pop_label() override;

    /// Resets the terminal style if one is active.
    void flush();

private:
    std::ostream& out_;
    const config::StyleConfig& config_;
    std::vector<std::string> labels_;
    config::Style current_;
};

} // namespace stencil::render

#endif // STENCIL_RENDER_COLOR_FORMATTER_HPP
