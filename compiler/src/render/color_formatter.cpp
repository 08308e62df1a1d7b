#include "render/color_formatter.hpp"

namespace stencil::render {

namespace {
constexpr const char* RESET = "\033[0m";
}

ColorFormatter::ColorFormatter(std::ostream& out, const config::StyleConfig& config)
    : out_(out), config_(config) {}

ColorFormatter::~ColorFormatter() {
    flush();
}

void ColorFormatter::write_str(std::string_view text) {
    if (text.empty()) {
        return;
    }

    config::Style wanted = config_.style_for(labels_);
    if (wanted != current_) {
        if (!current_.is_plain()) {
            out_ << RESET;
        }
        out_ << wanted.to_ansi();
        current_ = std::move(wanted);
    }
    out_ << text;
}

void ColorFormatter::push_label(const std::string& label) {
    labels_.push_back(label);
}

void ColorFormatter::pop_label() {
    if (!labels_.empty()) {
        labels_.pop_back();
    }
}

void ColorFormatter::flush() {
    if (!current_.is_plain()) {
        out_ << RESET;
        current_ = config::Style{};
    }
    out_.flush();
}

} // namespace stencil::render
