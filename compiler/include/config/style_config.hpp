//! # Style Configuration
//!
//! Maps label sets to terminal styles. Rules are read from the `[colors]`
//! table of a style file:
//!
//! ```toml
//! [colors]
//! commit_id = "blue"
//! "author email" = "yellow underline"
//! "working_copy commit_id" = "bold bright_blue"
//! conflict = "red on black"
//! ```
//!
//! A key is a whitespace-separated label list. A value lists a foreground
//! color, optionally `on <color>` for the background, plus the `bold` and
//! `underline` attributes.
//!
//! ## Matching
//!
//! A rule applies when its labels appear, in order, in the stack of active
//! labels. Among applicable rules the one whose last label sits deepest in
//! the stack wins; ties go to the rule with more labels, then to the rule
//! declared last.

#ifndef STENCIL_CONFIG_STYLE_CONFIG_HPP
#define STENCIL_CONFIG_STYLE_CONFIG_HPP

#include "common.hpp"
#include "config/toml_reader.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace stencil::config {

/// A terminal text style. Empty colors mean "terminal default".
struct Style {
    std::string fg;
    std::string bg;
    bool bold = false;
    bool underline = false;

    [[nodiscard]] auto is_plain() const -> bool {
        return fg.empty() && bg.empty() && !bold && !underline;
    }

    /// The SGR escape sequence that switches to this style from a reset state.
    [[nodiscard]] auto to_ansi() const -> std::string;

    [[nodiscard]] auto operator==(const Style& other) const -> bool = default;
};

struct StyleRule {
    std::vector<std::string> labels;
    Style style;
};

class StyleConfig {
public:
    StyleConfig() = default;

    /// The built-in rules for the commit keywords.
    [[nodiscard]] static auto defaults() -> StyleConfig;

    /// Parses the `[colors]` table of a style file. Other tables are ignored.
    [[nodiscard]] static auto parse(std::string_view content) -> Result<StyleConfig, ConfigError>;

    [[nodiscard]] static auto load(const std::string& path) -> Result<StyleConfig, ConfigError>;

    /// Adds a rule; it takes priority over earlier rules with the same score.
    void add_rule(std::vector<std::string> labels, Style style);

    /// Adds all rules of `other` after this config's rules.
    void merge(const StyleConfig& other);

    /// The style for a stack of active labels (outermost first).
    [[nodiscard]] auto style_for(const std::vector<std::string>& label_stack) const -> Style;

    [[nodiscard]] auto rules() const -> const std::vector<StyleRule>& {
        return rules_;
    }

private:
    std::vector<StyleRule> rules_;
};

/// Parses a style value such as `"bold bright_red on black"`.
[[nodiscard]] auto parse_style(std::string_view text) -> Result<Style, std::string>;

} // namespace stencil::config

#endif // STENCIL_CONFIG_STYLE_CONFIG_HPP
