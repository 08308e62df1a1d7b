//! # Color Formatter Tests

#include "render/color_formatter.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace stencil;
using config::Style;
using config::StyleConfig;
using render::ColorFormatter;

class ColorFormatterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.add_rule({"commit_id"}, Style{.fg = "blue"});
        config_.add_rule({"branches"}, Style{.fg = "magenta"});
        config_.add_rule({"conflict"}, Style{.fg = "red", .bold = true});
        config_.add_rule({"prefix"}, Style{.bold = true});
    }

    /// Runs `f` against a fresh formatter and returns everything it wrote,
    /// including the final reset.
    template <typename F> auto capture(F f) -> std::string {
        std::ostringstream out;
        {
            ColorFormatter formatter(out, config_);
            f(formatter);
        }
        return out.str();
    }

    StyleConfig config_;
};

TEST_F(ColorFormatterTest, UnlabeledTextIsUnstyled) {
    EXPECT_EQ(capture([](ColorFormatter& f) { f.write_str("plain"); }), "plain");
}

TEST_F(ColorFormatterTest, LabeledTextIsWrapped) {
    auto out = capture([](ColorFormatter& f) {
        f.push_label("commit_id");
        f.write_str("abc");
        f.pop_label();
        f.write_str(" x");
    });
    EXPECT_EQ(out, "\033[34mabc\033[0m x");
}

TEST_F(ColorFormatterTest, StyleResetAtEnd) {
    auto out = capture([](ColorFormatter& f) {
        f.push_label("conflict");
        f.write_str("!");
    });
    EXPECT_EQ(out, "\033[1;31m!\033[0m");
}

TEST_F(ColorFormatterTest, SameStyleIsNotRepeated) {
    auto out = capture([](ColorFormatter& f) {
        f.push_label("branches");
        f.write_str("a");
        f.pop_label();
        f.push_label("branches");
        f.write_str("b");
        f.pop_label();
    });
    EXPECT_EQ(out, "\033[35mab\033[0m");
}

TEST_F(ColorFormatterTest, SwitchingStylesResetsFirst) {
    auto out = capture([](ColorFormatter& f) {
        f.push_label("commit_id");
        f.write_str("a");
        f.pop_label();
        f.push_label("branches");
        f.write_str("b");
        f.pop_label();
    });
    EXPECT_EQ(out, "\033[34ma\033[0m\033[35mb\033[0m");
}

TEST_F(ColorFormatterTest, InnermostLabelWins) {
    auto out = capture([](ColorFormatter& f) {
        f.push_label("commit_id");
        f.push_label("shortest");
        f.push_label("prefix");
        f.write_str("8a");
        f.pop_label();
        f.push_label("rest");
        f.write_str("3f");
        f.pop_label();
        f.pop_label();
        f.pop_label();
    });
    EXPECT_EQ(out, "\033[1m8a\033[0m\033[34m3f\033[0m");
}

TEST_F(ColorFormatterTest, EmptyWritesEmitNothing) {
    auto out = capture([](ColorFormatter& f) {
        f.push_label("commit_id");
        f.write_str("");
        f.pop_label();
    });
    EXPECT_EQ(out, "");
}

TEST_F(ColorFormatterTest, UnknownLabelsAreUnstyled) {
    auto out = capture([](ColorFormatter& f) {
        f.push_label("something_else");
        f.write_str("x");
        f.pop_label();
    });
    EXPECT_EQ(out, "x");
}
