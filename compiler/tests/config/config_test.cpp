//! # Configuration Tests
//!
//! The TOML subset reader and style configuration.

#include "config/style_config.hpp"
#include "config/toml_reader.hpp"

#include <gtest/gtest.h>

using namespace stencil;
using namespace stencil::config;

// ============================================================================
// TOML Reader
// ============================================================================

class TomlReaderTest : public ::testing::Test {
protected:
    auto parse_ok(std::string_view content) -> std::vector<TomlTable> {
        auto result = parse_toml(content);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
        if (is_err(result)) {
            return {};
        }
        return std::move(unwrap(result));
    }

    auto parse_err(std::string_view content) -> ConfigError {
        auto result = parse_toml(content);
        EXPECT_TRUE(is_err(result)) << content;
        if (is_ok(result)) {
            return {};
        }
        return unwrap_err(result);
    }
};

TEST_F(TomlReaderTest, TablesAndEntries) {
    auto tables = parse_ok(R"(top = 1

[colors]
commit_id = "blue"

[[commit]]
commit_id = "a"

[[commit]]
commit_id = "b"
)");
    ASSERT_EQ(tables.size(), 4u);

    EXPECT_EQ(tables[0].name, "");
    ASSERT_EQ(tables[0].entries.size(), 1u);
    EXPECT_EQ(tables[0].entries[0].key, "top");
    EXPECT_EQ(tables[0].entries[0].value, "1");
    EXPECT_FALSE(tables[0].entries[0].quoted);

    EXPECT_EQ(tables[1].name, "colors");
    EXPECT_FALSE(tables[1].is_array_element);
    EXPECT_EQ(tables[1].line, 3u);

    EXPECT_EQ(tables[2].name, "commit");
    EXPECT_TRUE(tables[2].is_array_element);
    EXPECT_EQ(tables[3].get("commit_id")->value, "b");
    EXPECT_TRUE(tables[3].get("commit_id")->quoted);
    EXPECT_EQ(tables[3].get("commit_id")->line, 10u);
}

TEST_F(TomlReaderTest, QuotedKeysAndEscapes) {
    auto tables = parse_ok(R"("divergent change_id" = "say \"hi\"\n\ttab\\")");
    ASSERT_EQ(tables[0].entries.size(), 1u);
    EXPECT_EQ(tables[0].entries[0].key, "divergent change_id");
    EXPECT_EQ(tables[0].entries[0].value, "say \"hi\"\n\ttab\\");
}

TEST_F(TomlReaderTest, CommentsAreSkipped) {
    auto tables = parse_ok("# header\n  x = 5   # five\ny = \"#not a comment\" # comment\n");
    EXPECT_EQ(tables[0].get("x")->value, "5");
    EXPECT_EQ(tables[0].get("y")->value, "#not a comment");
}

TEST_F(TomlReaderTest, LaterEntriesWin) {
    auto tables = parse_ok("x = 1\nx = 2\n");
    EXPECT_EQ(tables[0].get("x")->value, "2");
    EXPECT_EQ(tables[0].get("missing"), nullptr);
}

TEST_F(TomlReaderTest, Errors) {
    struct Case {
        const char* content;
        const char* message;
        uint32_t line;
    };
    const Case cases[] = {
        {"\n[colors", "malformed table header", 2},
        {"[colors] junk", "malformed table header", 1},
        {"[ ]", "empty table name", 1},
        {"just words", "expected `key = value`", 1},
        {"x =", "missing value", 1},
        {"x = # nothing", "missing value", 1},
        {"x = \"abc", "invalid string value", 1},
        {"x = \"\\q\"", "invalid string value", 1},
        {"x = \"a\" b", "unexpected text after string value", 1},
        {"= 1", "empty key", 1},
        {"\"key", "unterminated quoted key", 1},
        {"\"key\" 1", "expected '=' after key \"key\"", 1},
    };
    for (const auto& c : cases) {
        auto err = parse_err(c.content);
        EXPECT_EQ(err.message, c.message) << c.content;
        EXPECT_EQ(err.line, c.line) << c.content;
    }
}

TEST_F(TomlReaderTest, ErrorToString) {
    EXPECT_EQ((ConfigError{.message = "bad", .line = 3}).to_string(), "line 3: bad");
    EXPECT_EQ((ConfigError{.message = "bad", .line = 0}).to_string(), "bad");
}

TEST_F(TomlReaderTest, MissingFile) {
    auto result = load_toml_file("/nonexistent/stencil/style.toml");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "cannot open /nonexistent/stencil/style.toml");
}

TEST(TomlEntryTest, Booleans) {
    EXPECT_TRUE(unwrap(entry_as_bool({.key = "k", .value = "true"})));
    EXPECT_FALSE(unwrap(entry_as_bool({.key = "k", .value = "false"})));
    EXPECT_TRUE(is_err(entry_as_bool({.key = "k", .value = "true", .quoted = true})));

    auto err = entry_as_bool({.key = "flag", .value = "yes", .quoted = false, .line = 4});
    ASSERT_TRUE(is_err(err));
    EXPECT_EQ(unwrap_err(err).to_string(), "line 4: expected true or false for \"flag\"");
}

TEST(TomlEntryTest, Integers) {
    EXPECT_EQ(unwrap(entry_as_int({.key = "k", .value = "-42"})), -42);
    EXPECT_EQ(unwrap(entry_as_int({.key = "k", .value = "1700000000000"})), 1700000000000);
    EXPECT_TRUE(is_err(entry_as_int({.key = "k", .value = "4x"})));
    EXPECT_TRUE(is_err(entry_as_int({.key = "k", .value = "42", .quoted = true})));
    EXPECT_TRUE(is_err(entry_as_int({.key = "k", .value = "99999999999999999999"})));
}

// ============================================================================
// Styles
// ============================================================================

TEST(ParseStyleTest, Words) {
    auto style = parse_style("bold bright_red on black");
    ASSERT_TRUE(is_ok(style));
    EXPECT_EQ(unwrap(style), (Style{.fg = "bright_red", .bg = "black", .bold = true}));
    EXPECT_EQ(unwrap(style).to_ansi(), "\033[1;91;40m");
}

TEST(ParseStyleTest, EmptyIsPlain) {
    auto style = parse_style("  ");
    ASSERT_TRUE(is_ok(style));
    EXPECT_TRUE(unwrap(style).is_plain());
    EXPECT_EQ(unwrap(style).to_ansi(), "");
}

TEST(ParseStyleTest, Underline) {
    auto style = parse_style("underline cyan");
    ASSERT_TRUE(is_ok(style));
    EXPECT_EQ(unwrap(style).to_ansi(), "\033[4;36m");
}

TEST(ParseStyleTest, Errors) {
    EXPECT_EQ(unwrap_err(parse_style("red blue")),
              "more than one foreground color in \"red blue\"");
    EXPECT_EQ(unwrap_err(parse_style("red on")), "expected a color after \"on\"");
    EXPECT_EQ(unwrap_err(parse_style("on bold")), "expected a color after \"on\"");
    EXPECT_EQ(unwrap_err(parse_style("sparkly")), "unknown color or attribute \"sparkly\"");
}

class StyleConfigTest : public ::testing::Test {
protected:
    static auto blue() -> Style {
        return Style{.fg = "blue"};
    }
    static auto red() -> Style {
        return Style{.fg = "red"};
    }
    static auto green() -> Style {
        return Style{.fg = "green"};
    }
};

TEST_F(StyleConfigTest, InnermostMatchWins) {
    StyleConfig config;
    config.add_rule({"a"}, red());
    config.add_rule({"b"}, blue());
    EXPECT_EQ(config.style_for({"a", "b"}), blue());
    EXPECT_EQ(config.style_for({"b", "a"}), red());
    EXPECT_EQ(config.style_for({"a", "x"}), red());
}

TEST_F(StyleConfigTest, LongerRuleWinsAtSameDepth) {
    StyleConfig config;
    config.add_rule({"a", "b"}, green());
    config.add_rule({"b"}, blue());
    EXPECT_EQ(config.style_for({"a", "b"}), green());
    EXPECT_EQ(config.style_for({"a", "x", "b"}), green());
    EXPECT_EQ(config.style_for({"b"}), blue());
    EXPECT_EQ(config.style_for({"b", "a"}), blue());
}

TEST_F(StyleConfigTest, LaterRuleWinsTies) {
    StyleConfig config;
    config.add_rule({"a"}, red());
    config.add_rule({"a"}, blue());
    EXPECT_EQ(config.style_for({"a"}), blue());
}

TEST_F(StyleConfigTest, NoMatchIsPlain) {
    StyleConfig config;
    config.add_rule({"a"}, red());
    EXPECT_TRUE(config.style_for({}).is_plain());
    EXPECT_TRUE(config.style_for({"z"}).is_plain());
}

TEST_F(StyleConfigTest, Defaults) {
    auto config = StyleConfig::defaults();
    EXPECT_EQ(config.style_for({"commit_id"}), blue());
    EXPECT_EQ(config.style_for({"change_id"}), (Style{.fg = "magenta"}));
    EXPECT_EQ(config.style_for({"divergent", "change_id"}), red());
    EXPECT_EQ(config.style_for({"commit_id", "shortest", "prefix"}), (Style{.bold = true}));
    EXPECT_EQ(config.style_for({"commit_id", "shortest", "rest"}), (Style{.fg = "bright_black"}));
}

TEST_F(StyleConfigTest, ParseColorsTable) {
    auto config = StyleConfig::parse(R"(
[colors]
commit_id = "green"
"divergent change_id" = "bold red on white"

[other]
anything = "not a style"
)");
    ASSERT_TRUE(is_ok(config)) << unwrap_err(config).to_string();
    const auto& rules = unwrap(config).rules();
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(rules[0].labels, (std::vector<std::string>{"commit_id"}));
    EXPECT_EQ(rules[1].labels, (std::vector<std::string>{"divergent", "change_id"}));
    EXPECT_EQ(rules[1].style, (Style{.fg = "red", .bg = "white", .bold = true}));
}

TEST_F(StyleConfigTest, ParseErrorsCarryLine) {
    auto config = StyleConfig::parse("[colors]\ncommit_id = \"sparkly\"\n");
    ASSERT_TRUE(is_err(config));
    EXPECT_EQ(unwrap_err(config).to_string(), "line 2: unknown color or attribute \"sparkly\"");
}

TEST_F(StyleConfigTest, MergeOverridesDefaults) {
    auto config = StyleConfig::defaults();
    auto user = StyleConfig::parse("[colors]\ncommit_id = \"green\"\n");
    ASSERT_TRUE(is_ok(user));
    config.merge(unwrap(user));
    EXPECT_EQ(config.style_for({"commit_id"}), green());
    EXPECT_EQ(config.style_for({"change_id"}), (Style{.fg = "magenta"}));
}
