//! # Diagnostic Tests
//!
//! Rendering of template errors and "did you mean" suggestions.

#include "builder/expression_builder.hpp"
#include "diagnostic/diagnostic.hpp"
#include "diagnostic/suggest.hpp"
#include "record/commit.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace stencil;
using namespace stencil::diagnostic;

class DiagnosticTest : public ::testing::Test {
protected:
    void SetUp() override {
        emitter_.set_color_enabled(false);
    }

    auto compile_err(const lexer::Source& source) -> TemplateError {
        auto resolver = record::commit_keyword_resolver(record::build_commit_index({}));
        auto result = builder::compile<record::Commit>(source, resolver);
        EXPECT_TRUE(is_err(result)) << source.content();
        if (is_ok(result)) {
            return TemplateError::syntax_error("", {}, "");
        }
        return unwrap_err(result);
    }

    /// Compiles `code` and emits its error.
    auto emit(const std::string& code) -> std::string {
        auto source = lexer::Source::from_string(code);
        emitter_.emit_template_error(compile_err(source), source);
        return out_.str();
    }

    std::ostringstream out_;
    DiagnosticEmitter emitter_{out_};
};

// ============================================================================
// Text Format
// ============================================================================

TEST_F(DiagnosticTest, UnknownFunctionWithHelp) {
    EXPECT_EQ(emit(R"(lable("x", commit_id))"),
              "error[T002]: Function \"lable\" doesn't exist\n"
              "  --> <template>:1:1\n"
              "     |\n"
              "   1 | lable(\"x\", commit_id)\n"
              "     | ^^^^^\n"
              "     |\n"
              "  = help: did you mean `label`?\n");
}

TEST_F(DiagnosticTest, UnderlineStartsAtColumn) {
    EXPECT_EQ(emit("commit_id.shortest(\"8\")"),
              "error[T005]: Expected argument of type \"Integer\"\n"
              "  --> <template>:1:20\n"
              "     |\n"
              "   1 | commit_id.shortest(\"8\")\n"
              "     |                    ^^^\n"
              "     |\n");
}

TEST_F(DiagnosticTest, EmptySpanGetsOneCaret) {
    EXPECT_EQ(emit("separate()"),
              "error[T004]: Expected at least 1 arguments\n"
              "  --> <template>:1:10\n"
              "     |\n"
              "   1 | separate()\n"
              "     |          ^\n"
              "     |\n");
}

TEST_F(DiagnosticTest, SecondLine) {
    auto out = emit("description\n  \"a\" nope");
    EXPECT_NE(out.find("  --> <template>:2:7\n"), std::string::npos) << out;
    EXPECT_NE(out.find("   2 |   \"a\" nope\n"), std::string::npos) << out;
    EXPECT_NE(out.find("     |       ^^^^\n"), std::string::npos) << out;
}

TEST_F(DiagnosticTest, SpanAcrossLinesUnderlinesToEndOfLine) {
    auto out = emit("if(\n  description,\n  \"a\")  .x()");
    // The method name is on line 3; the receiver covers lines 1 to 3.
    EXPECT_NE(out.find("Method \"x\" doesn't exist for type \"Template\""), std::string::npos)
        << out;

    auto source = lexer::Source::from_string("abc\ndef");
    Diagnostic diag{.code = "T000",
                    .message = "m",
                    .span = source.span(1, 6),
                    .notes = {},
                    .help = {}};
    std::ostringstream out2;
    DiagnosticEmitter emitter(out2);
    emitter.set_color_enabled(false);
    emitter.emit(diag, source);
    EXPECT_NE(out2.str().find("     |  ^^\n"), std::string::npos) << out2.str();
}

TEST_F(DiagnosticTest, TemplateReceiverNote) {
    auto out = emit(R"(label("x", "y").name())");
    EXPECT_NE(out.find("  = note: functions return templates, which have no methods\n"),
              std::string::npos)
        << out;
}

TEST_F(DiagnosticTest, SyntaxErrorCode) {
    auto out = emit("commit_id.");
    EXPECT_EQ(out.rfind("error[P001]: Syntax error", 0), 0u) << out;
}

TEST_F(DiagnosticTest, ColorsWrapHeader) {
    emitter_.set_color_enabled(true);
    auto out = emit("nope");
    EXPECT_EQ(out.rfind(std::string(Colors::Bold) + Colors::BrightRed + "error[T001]", 0), 0u);
}

TEST_F(DiagnosticTest, CountsErrors) {
    (void)emit("nope");
    (void)emit("nope2");
    EXPECT_EQ(emitter_.error_count(), 2u);
    emitter_.reset_counts();
    EXPECT_EQ(emitter_.error_count(), 0u);
}

// ============================================================================
// Conversion
// ============================================================================

TEST(ToDiagnosticTest, SuggestionsBecomeHelp) {
    auto err = TemplateError::no_such_keyword("autor", {})
                   .with_note("keywords are listed in the manual")
                   .with_note("did you mean `author`?");
    auto diag = to_diagnostic(err);
    EXPECT_EQ(diag.code, "T001");
    EXPECT_EQ(diag.message, R"(Keyword "autor" doesn't exist)");
    EXPECT_EQ(diag.notes, (std::vector<std::string>{"keywords are listed in the manual"}));
    EXPECT_EQ(diag.help, (std::vector<std::string>{"did you mean `author`?"}));
}

// ============================================================================
// JSON Format
// ============================================================================

TEST_F(DiagnosticTest, JsonFormat) {
    emitter_.set_format(DiagnosticFormat::Json);
    EXPECT_EQ(emit(R"(lable("x", commit_id))"),
              R"({"severity":"error","code":"T002","message":"Function \"lable\" doesn't exist",)"
              R"("span":{"file":"<template>","start":{"line":1,"column":1},)"
              R"("end":{"line":1,"column":6}},"notes":[],"help":["did you mean `label`?"]})"
              "\n");
}

TEST(EscapeJsonTest, EscapesSpecialCharacters) {
    EXPECT_EQ(escape_json_string("a\"b\\c"), R"(a\"b\\c)");
    EXPECT_EQ(escape_json_string("line\nnext\ttab\r"), R"(line\nnext\ttab\r)");
    EXPECT_EQ(escape_json_string(std::string("\x01", 1)), R"(\u0001)");
    EXPECT_EQ(escape_json_string("plain"), "plain");
}

// ============================================================================
// Suggestions
// ============================================================================

TEST(SuggestTest, LevenshteinDistance) {
    EXPECT_EQ(levenshtein_distance("kitten", "sitting"), 3u);
    EXPECT_EQ(levenshtein_distance("", "abc"), 3u);
    EXPECT_EQ(levenshtein_distance("abc", ""), 3u);
    EXPECT_EQ(levenshtein_distance("Label", "label"), 0u);
}

TEST(SuggestTest, FindSimilar) {
    std::vector<std::string> names = {"commit_id", "change_id", "committer", "conflict"};
    EXPECT_EQ(find_similar("comit_id", names), "commit_id");
    EXPECT_EQ(find_similar("zzzzzzzz", names), "");
    EXPECT_EQ(find_similar("", names), "");
}

TEST(SuggestTest, FindSimilarCandidatesSortedByDistance) {
    std::vector<std::string> names = {"short", "shortest", "sort"};
    EXPECT_EQ(find_similar_candidates("shortst", names),
              (std::vector<std::string>{"shortest", "short", "sort"}));
    EXPECT_EQ(find_similar_candidates("shor", names, 1),
              (std::vector<std::string>{"short"}));
}

TEST(SuggestTest, WithSuggestion) {
    auto noted = with_suggestion(TemplateError::no_such_function("separat", {}),
                                 {"if", "label", "separate"});
    EXPECT_EQ(noted.notes, (std::vector<std::string>{"did you mean `separate`?"}));

    auto far = with_suggestion(TemplateError::no_such_function("xyz", {}), {"if", "label"});
    EXPECT_TRUE(far.notes.empty());
}
