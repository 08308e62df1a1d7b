//! # AST Builder Tests

#include "lexer/source.hpp"
#include "parser/ast_builder.hpp"
#include "parser/ast_printer.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <regex>

using namespace stencil;
using namespace stencil::parser;

class AstBuilderTest : public ::testing::Test {
protected:
    auto build(const std::string& code) -> Result<ExpressionNode, TemplateError> {
        return parse_template(lexer::Source::from_string(code));
    }

    auto build_ok(const std::string& code) -> ExpressionNode {
        auto result = build(code);
        EXPECT_TRUE(is_ok(result)) << code << ": "
                                   << (is_err(result) ? unwrap_err(result).to_string() : "");
        if (is_err(result)) {
            return ExpressionNode{.kind = ListExpr{}, .span = {}};
        }
        return std::move(unwrap(result));
    }

    /// The AST dump without source offsets, for comparing shapes.
    auto shape(const std::string& code) -> std::string {
        static const std::regex offsets(R"( \d+\.\.\d+)");
        return std::regex_replace(print_ast(build_ok(code)), offsets, "");
    }
};

// ============================================================================
// Literals
// ============================================================================

TEST_F(AstBuilderTest, IntegerLiterals) {
    auto zero = build_ok("0");
    ASSERT_TRUE(zero.is<IntegerExpr>());
    EXPECT_EQ(zero.as<IntegerExpr>().value, 0);

    auto paren = build_ok("(42)");
    ASSERT_TRUE(paren.is<IntegerExpr>());
    EXPECT_EQ(paren.as<IntegerExpr>().value, 42);
}

TEST_F(AstBuilderTest, IntegerMaxParsesExactly) {
    auto max = std::numeric_limits<int64_t>::max();
    auto node = build_ok(std::to_string(max));
    ASSERT_TRUE(node.is<IntegerExpr>());
    EXPECT_EQ(node.as<IntegerExpr>().value, max);
}

TEST_F(AstBuilderTest, IntegerOverflow) {
    auto too_big = std::to_string(static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1);
    auto result = build(too_big);
    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.kind, TemplateErrorKind::ParseIntError);
    EXPECT_EQ(err.code, "P002");
    EXPECT_EQ(err.message(), "Invalid integer literal: number too large to fit in target type");
    EXPECT_EQ(err.span.start.offset, 0u);
    EXPECT_EQ(err.span.end.offset, too_big.size());
}

TEST_F(AstBuilderTest, LeadingZeroFails) {
    auto result = build("00");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, TemplateErrorKind::SyntaxError);
}

TEST_F(AstBuilderTest, StringEscapesAreDecoded) {
    auto node = build_ok(R"("a\"b\\c\nd")");
    ASSERT_TRUE(node.is<StringExpr>());
    EXPECT_EQ(node.as<StringExpr>().value, "a\"b\\c\nd");
}

TEST_F(AstBuilderTest, AdjacentStringsStayApart) {
    auto joined = build_ok(R"("ab")");
    ASSERT_TRUE(joined.is<StringExpr>());
    EXPECT_EQ(joined.as<StringExpr>().value, "ab");

    auto split = build_ok(R"("a" "b")");
    ASSERT_TRUE(split.is<ListExpr>());
    const auto& items = split.as<ListExpr>().items;
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].as<StringExpr>().value, "a");
    EXPECT_EQ(items[1].as<StringExpr>().value, "b");
}

TEST_F(AstBuilderTest, QuotedDigitsAreStrings) {
    auto node = build_ok(R"("foo" "0")");
    const auto& items = node.as<ListExpr>().items;
    ASSERT_EQ(items.size(), 2u);
    EXPECT_TRUE(items[1].is<StringExpr>());

    auto node2 = build_ok(R"("foo" 0)");
    const auto& items2 = node2.as<ListExpr>().items;
    ASSERT_EQ(items2.size(), 2u);
    EXPECT_TRUE(items2[1].is<IntegerExpr>());
}

// ============================================================================
// Structure
// ============================================================================

TEST_F(AstBuilderTest, EmptyTemplateIsEmptyList) {
    auto node = build_ok("");
    ASSERT_TRUE(node.is<ListExpr>());
    EXPECT_TRUE(node.as<ListExpr>().items.empty());
}

TEST_F(AstBuilderTest, WhitespaceAndParenthesesAreTransparent) {
    EXPECT_EQ(shape(R"(label("x",commit_id))"), shape(R"( label ( "x" , ((commit_id)) ) )"));
    EXPECT_EQ(shape("a.f(1).g()"), shape("(a).f( (1) ).g( )"));
    EXPECT_EQ(shape("commit_id"), shape("\n\t(commit_id)\r\n"));
}

TEST_F(AstBuilderTest, TrailingCommaDoesNotAddAnArgument) {
    EXPECT_EQ(shape(R"(label("",""))"), shape(R"(label("","",))"));
}

TEST_F(AstBuilderTest, FunctionCall) {
    auto node = build_ok(R"(if(conflict, "x"))");
    ASSERT_TRUE(node.is<FunctionCallNode>());
    const auto& call = node.as<FunctionCallNode>();
    EXPECT_EQ(call.name, "if");
    EXPECT_EQ(call.name_span.start.offset, 0u);
    EXPECT_EQ(call.name_span.end.offset, 2u);
    ASSERT_EQ(call.args.size(), 2u);
    EXPECT_TRUE(call.args[0].is<IdentifierExpr>());
    EXPECT_EQ(call.args_span.start.offset, 3u);
    EXPECT_EQ(call.args_span.end.offset, 16u);
}

TEST_F(AstBuilderTest, MethodChainsNestLeft) {
    auto node = build_ok("author.email().first_line()");
    ASSERT_TRUE(node.is<MethodCallNode>());
    const auto& outer = node.as<MethodCallNode>();
    EXPECT_EQ(outer.call.name, "first_line");
    // The span covers the call, not the receiver
    EXPECT_EQ(node.span.start.offset, 15u);

    ASSERT_TRUE(outer.receiver->is<MethodCallNode>());
    const auto& inner = outer.receiver->as<MethodCallNode>();
    EXPECT_EQ(inner.call.name, "email");
    ASSERT_TRUE(inner.receiver->is<IdentifierExpr>());
    EXPECT_EQ(inner.receiver->as<IdentifierExpr>().name, "author");
}

TEST_F(AstBuilderTest, ErrorsInsideArgumentsPropagate) {
    auto result = build("f(g(99999999999999999999))");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, TemplateErrorKind::ParseIntError);
    EXPECT_EQ(unwrap_err(result).span.start.offset, 4u);
}

// ============================================================================
// Printer
// ============================================================================

TEST_F(AstBuilderTest, PrintAst) {
    auto node = build_ok(R"("id: " commit_id.short(8))");
    EXPECT_EQ(print_ast(node), "List 0..25\n"
                               "  String \"id: \" 0..6\n"
                               "  MethodCall short 17..25\n"
                               "    Identifier commit_id 7..16\n"
                               "    Integer 8 23..24\n");
}

TEST_F(AstBuilderTest, PrintAstWithColors) {
    auto node = build_ok("x");
    EXPECT_EQ(print_ast(node, true),
              "\033[1;35mIdentifier\033[0m \033[1;33mx\033[0m \033[0;90m0..1\033[0m\n");
}

TEST_F(AstBuilderTest, QuoteString) {
    EXPECT_EQ(quote_string("a\"b\n"), R"("a\"b\n")");
}

// A tree the parser never produces: an escape the lexer would have rejected.
TEST(AstBuilderDeathTest, UnknownEscapeIsFatal) {
    static constexpr std::string_view code = R"("\t")";
    SyntaxNode escape{.rule = SyntaxRule::Escape, .span = {}, .text = code.substr(1, 2),
                      .children = {}};
    SyntaxNode literal{.rule = SyntaxRule::StringLiteral, .span = {}, .text = code,
                       .children = {escape}};
    SyntaxNode term{.rule = SyntaxRule::Term, .span = {}, .text = code, .children = {literal}};
    SyntaxNode tmpl{.rule = SyntaxRule::Template, .span = {}, .text = code, .children = {term}};
    SyntaxNode program{.rule = SyntaxRule::Program, .span = {}, .text = code, .children = {tmpl}};

    EXPECT_DEATH((void)build_ast(program), "");
}
