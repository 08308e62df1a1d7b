#include "config/style_config.hpp"

#include "log/log.hpp"

#include <optional>
#include <sstream>
#include <tuple>

namespace stencil::config {

namespace {

struct ColorName {
    std::string_view name;
    int code; ///< Foreground SGR code; background is code + 10
};

constexpr ColorName COLOR_NAMES[] = {
    {"black", 30},         {"red", 31},           {"green", 32},
    {"yellow", 33},        {"blue", 34},          {"magenta", 35},
    {"cyan", 36},          {"white", 37},         {"bright_black", 90},
    {"bright_red", 91},    {"bright_green", 92},  {"bright_yellow", 93},
    {"bright_blue", 94},   {"bright_magenta", 95}, {"bright_cyan", 96},
    {"bright_white", 97},
};

auto color_code(std::string_view name) -> int {
    for (const auto& color : COLOR_NAMES) {
        if (color.name == name) {
            return color.code;
        }
    }
    return -1;
}

auto split_whitespace(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> words;
    std::istringstream iss{std::string(text)};
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

} // namespace

// ============================================================================
// Style
// ============================================================================

auto Style::to_ansi() const -> std::string {
    std::vector<int> params;
    if (bold) {
        params.push_back(1);
    }
    if (underline) {
        params.push_back(4);
    }
    if (!fg.empty()) {
        params.push_back(color_code(fg));
    }
    if (!bg.empty()) {
        params.push_back(color_code(bg) + 10);
    }
    if (params.empty()) {
        return "";
    }

    std::string out = "\033[";
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) {
            out += ";";
        }
        out += std::to_string(params[i]);
    }
    out += "m";
    return out;
}

auto parse_style(std::string_view text) -> Result<Style, std::string> {
    Style style;
    auto words = split_whitespace(text);

    for (size_t i = 0; i < words.size(); ++i) {
        const auto& word = words[i];
        if (word == "bold") {
            style.bold = true;
        } else if (word == "underline") {
            style.underline = true;
        } else if (word == "on") {
            if (i + 1 >= words.size() || color_code(words[i + 1]) < 0) {
                return std::string("expected a color after \"on\"");
            }
            style.bg = words[++i];
        } else if (color_code(word) >= 0) {
            if (!style.fg.empty()) {
                return "more than one foreground color in \"" + std::string(text) + "\"";
            }
            style.fg = word;
        } else {
            return "unknown color or attribute \"" + word + "\"";
        }
    }
    return style;
}

// ============================================================================
// StyleConfig
// ============================================================================

auto StyleConfig::defaults() -> StyleConfig {
    StyleConfig config;
    auto add = [&config](std::string_view labels, Style style) {
        config.add_rule(split_whitespace(labels), std::move(style));
    };

    add("commit_id", Style{.fg = "blue"});
    add("change_id", Style{.fg = "magenta"});
    add("author", Style{.fg = "yellow"});
    add("committer", Style{.fg = "yellow"});
    add("timestamp", Style{.fg = "cyan"});
    add("branches", Style{.fg = "magenta"});
    add("tags", Style{.fg = "magenta"});
    add("git_refs", Style{.fg = "magenta"});
    add("git_head", Style{.fg = "magenta"});
    add("working_copies", Style{.fg = "magenta"});
    add("divergent", Style{.fg = "red"});
    add("conflict", Style{.fg = "red"});
    add("empty", Style{.fg = "green"});
    add("prefix", Style{.bold = true});
    add("rest", Style{.fg = "bright_black"});
    add("divergent change_id", Style{.fg = "red"});
    return config;
}

namespace {

auto read_color_rules(const std::vector<TomlTable>& tables, StyleConfig& config)
    -> std::optional<ConfigError> {
    for (const auto& table : tables) {
        if (table.name != "colors" || table.is_array_element) {
            continue;
        }
        for (const auto& entry : table.entries) {
            auto labels = split_whitespace(entry.key);
            if (labels.empty()) {
                return ConfigError{.message = "empty label list", .line = entry.line};
            }
            auto style = parse_style(entry.value);
            if (is_err(style)) {
                return ConfigError{.message = unwrap_err(style), .line = entry.line};
            }
            config.add_rule(std::move(labels), unwrap(style));
        }
    }
    return std::nullopt;
}

} // namespace

auto StyleConfig::parse(std::string_view content) -> Result<StyleConfig, ConfigError> {
    auto tables = parse_toml(content);
    if (is_err(tables)) {
        return unwrap_err(tables);
    }

    StyleConfig config;
    if (auto err = read_color_rules(unwrap(tables), config)) {
        return *err;
    }
    return config;
}

auto StyleConfig::load(const std::string& path) -> Result<StyleConfig, ConfigError> {
    auto tables = load_toml_file(path);
    if (is_err(tables)) {
        return unwrap_err(tables);
    }

    StyleConfig config;
    if (auto err = read_color_rules(unwrap(tables), config)) {
        err->message = path + ": " + err->message;
        return *err;
    }

    STENCIL_LOG_DEBUG("config", "loaded " << config.rules_.size() << " style rules from "
                                          << path);
    return config;
}

void StyleConfig::add_rule(std::vector<std::string> labels, Style style) {
    rules_.push_back(StyleRule{.labels = std::move(labels), .style = std::move(style)});
}

void StyleConfig::merge(const StyleConfig& other) {
    rules_.insert(rules_.end(), other.rules_.begin(), other.rules_.end());
}

auto StyleConfig::style_for(const std::vector<std::string>& label_stack) const -> Style {
    const StyleRule* best = nullptr;
    std::tuple<size_t, size_t, size_t> best_score{0, 0, 0};

    for (size_t r = 0; r < rules_.size(); ++r) {
        const auto& rule = rules_[r];
        if (rule.labels.empty() || rule.labels.size() > label_stack.size()) {
            continue;
        }

        // Match the rule's labels as a subsequence, from the innermost end so
        // the last label binds to the deepest possible position.
        size_t want = rule.labels.size();
        size_t deepest = 0;
        for (size_t i = label_stack.size(); i > 0 && want > 0; --i) {
            if (label_stack[i - 1] == rule.labels[want - 1]) {
                if (want == rule.labels.size()) {
                    deepest = i;
                }
                --want;
            }
        }
        if (want > 0) {
            continue;
        }

        std::tuple<size_t, size_t, size_t> score{deepest, rule.labels.size(), r + 1};
        if (best == nullptr || score > best_score) {
            best = &rule;
            best_score = score;
        }
    }

    return best != nullptr ? best->style : Style{};
}

} // namespace stencil::config
