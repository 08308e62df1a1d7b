//! # Commit Record Tests
//!
//! Records file loading and the commit keyword resolver.

#include "record/commit.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace stencil;
using namespace stencil::record;

class CommitRecordsTest : public ::testing::Test {
protected:
    auto parse_ok(std::string_view content) -> std::vector<Commit> {
        auto result = parse_commits(content);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
        if (is_err(result)) {
            return {};
        }
        return std::move(unwrap(result));
    }

    auto parse_err(std::string_view content) -> config::ConfigError {
        auto result = parse_commits(content);
        EXPECT_TRUE(is_err(result)) << content;
        if (is_ok(result)) {
            return {};
        }
        return unwrap_err(result);
    }
};

// ============================================================================
// Records File
// ============================================================================

TEST_F(CommitRecordsTest, AllFields) {
    auto commits = parse_ok(R"(
# A full record
[[commit]]
commit_id = "8a3f5c2e"
change_id = "kmqzyvwx"
description = "Fix lexer\n"
author_name = "Ada"
author_email = "ada@example.com"
author_timestamp = 1700000000000
author_tz = 60
committer_name = "Bob"
committer_email = "bob@example.com"
committer_timestamp = 1700000100000
committer_tz = -300
working_copies = "default@"
current_working_copy = true
branches = "main"
tags = "v1.0"
git_refs = "origin/main"
git_head = "HEAD@git"
divergent = true
conflict = false
empty = true
)");
    ASSERT_EQ(commits.size(), 1u);
    const auto& c = commits[0];
    EXPECT_EQ(c.commit_id, "8a3f5c2e");
    EXPECT_EQ(c.change_id, "kmqzyvwx");
    EXPECT_EQ(c.description, "Fix lexer\n");
    EXPECT_EQ(c.author, (types::Signature{.name = "Ada",
                                          .email = "ada@example.com",
                                          .timestamp = {.millis_since_epoch = 1700000000000,
                                                        .tz_offset = 60}}));
    EXPECT_EQ(c.committer, (types::Signature{.name = "Bob",
                                             .email = "bob@example.com",
                                             .timestamp = {.millis_since_epoch = 1700000100000,
                                                           .tz_offset = -300}}));
    EXPECT_EQ(c.working_copies, "default@");
    EXPECT_TRUE(c.current_working_copy);
    EXPECT_EQ(c.branches, "main");
    EXPECT_EQ(c.tags, "v1.0");
    EXPECT_EQ(c.git_refs, "origin/main");
    EXPECT_EQ(c.git_head, "HEAD@git");
    EXPECT_TRUE(c.divergent);
    EXPECT_FALSE(c.conflict);
    EXPECT_TRUE(c.empty);
}

TEST_F(CommitRecordsTest, CommitterDefaultsToAuthor) {
    auto commits = parse_ok(R"([[commit]]
commit_id = "a"
change_id = "b"
author_name = "Ada"
author_tz = 120
)");
    ASSERT_EQ(commits.size(), 1u);
    EXPECT_EQ(commits[0].committer, commits[0].author);
    EXPECT_EQ(commits[0].committer.timestamp.tz_offset, 120);
}

TEST_F(CommitRecordsTest, PartialCommitterDoesNotInherit) {
    auto commits = parse_ok(R"([[commit]]
commit_id = "a"
change_id = "b"
author_name = "Ada"
committer_email = "bot@example.com"
)");
    ASSERT_EQ(commits.size(), 1u);
    EXPECT_EQ(commits[0].committer.name, "");
    EXPECT_EQ(commits[0].committer.email, "bot@example.com");
}

TEST_F(CommitRecordsTest, EmptyFileHasNoCommits) {
    EXPECT_TRUE(parse_ok("").empty());
    EXPECT_TRUE(parse_ok("# only a comment\n").empty());
}

TEST_F(CommitRecordsTest, KeepsFileOrder) {
    auto commits = parse_ok(R"([[commit]]
commit_id = "ff"
change_id = "zz"
[[commit]]
commit_id = "00"
change_id = "kk"
)");
    ASSERT_EQ(commits.size(), 2u);
    EXPECT_EQ(commits[0].commit_id, "ff");
    EXPECT_EQ(commits[1].commit_id, "00");
}

TEST_F(CommitRecordsTest, Errors) {
    struct Case {
        const char* content;
        const char* message;
        uint32_t line;
    };
    const Case cases[] = {
        {"commit_id = \"a\"", "entries must be inside a [[commit]] table", 1},
        {"[commit]\ncommit_id = \"a\"", "unexpected table `commit`, expected [[commit]]", 1},
        {"[[change]]", "unexpected table `change`, expected [[commit]]", 1},
        {"[[commit]]\ncommit_id = \"a\"\nchange_id = \"b\"\nauthor = \"x\"",
         "unknown commit field `author`", 4},
        {"[[commit]]\nchange_id = \"b\"", "commit is missing `commit_id`", 1},
        {"[[commit]]\ncommit_id = \"a\"", "commit is missing `change_id`", 1},
        {"[[commit]]\ncommit_id = \"a\"\nchange_id = \"b\"\nconflict = \"yes\"",
         "expected true or false for \"conflict\"", 4},
        {"[[commit]]\ncommit_id = \"a\"\nchange_id = \"b\"\nauthor_timestamp = soon",
         "expected an integer for \"author_timestamp\"", 4},
        {"[[commit]]\ncommit_id = \"a\"\nchange_id = \"b\"\nauthor_tz = 1440",
         "timezone offset out of range: 1440", 4},
    };
    for (const auto& c : cases) {
        auto err = parse_err(c.content);
        EXPECT_EQ(err.message, c.message) << c.content;
        EXPECT_EQ(err.line, c.line) << c.content;
    }
}

TEST_F(CommitRecordsTest, LoadPrefixesPath) {
    auto result = load_commits("/nonexistent/commits.toml");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "cannot open /nonexistent/commits.toml");
}

TEST(CompleteNewlineTest, AddsMissingNewline) {
    EXPECT_EQ(complete_newline("a"), "a\n");
    EXPECT_EQ(complete_newline("a\n"), "a\n");
    EXPECT_EQ(complete_newline("a\nb"), "a\nb\n");
    EXPECT_EQ(complete_newline(""), "");
}

// ============================================================================
// Keyword Resolver
// ============================================================================

class CommitResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        commit_.commit_id = "8a3f5c2e";
        commit_.change_id = "kmqzyvwx";
        commit_.description = "Fix lexer";
        commit_.author = {.name = "Ada", .email = "ada@example.com", .timestamp = {}};
        commit_.committer = commit_.author;
        commit_.branches = "main";
        commit_.conflict = true;

        resolver_ = commit_keyword_resolver(build_commit_index({commit_}));
    }

    auto resolve(std::string_view name) -> types::LabeledValue<Commit> {
        auto result = resolver_(name, SourceSpan{});
        EXPECT_TRUE(is_ok(result)) << name;
        return std::move(unwrap(result));
    }

    Commit commit_;
    builder::KeywordResolver<Commit> resolver_;
};

TEST_F(CommitResolverTest, EveryKeywordResolves) {
    for (const auto& name : commit_keywords()) {
        auto result = resolver_(name, SourceSpan{});
        ASSERT_TRUE(is_ok(result)) << name;
        EXPECT_EQ(unwrap(result).labels, (std::vector<std::string>{name}));
    }
    EXPECT_EQ(commit_keywords().size(), 14u);
}

TEST_F(CommitResolverTest, KeywordKinds) {
    EXPECT_EQ(resolve("description").value.kind(), types::ValueKind::String);
    EXPECT_EQ(resolve("commit_id").value.kind(), types::ValueKind::CommitOrChangeId);
    EXPECT_EQ(resolve("change_id").value.kind(), types::ValueKind::CommitOrChangeId);
    EXPECT_EQ(resolve("author").value.kind(), types::ValueKind::Signature);
    EXPECT_EQ(resolve("current_working_copy").value.kind(), types::ValueKind::Boolean);
    EXPECT_EQ(resolve("git_head").value.kind(), types::ValueKind::String);
    EXPECT_EQ(resolve("empty").value.kind(), types::ValueKind::Boolean);
}

TEST_F(CommitResolverTest, PropertiesReadTheRecord) {
    EXPECT_EQ(resolve("description").value.get<std::string>()(commit_), "Fix lexer\n");
    EXPECT_EQ(resolve("branches").value.get<std::string>()(commit_), "main");
    EXPECT_TRUE(resolve("conflict").value.get<bool>()(commit_));
    EXPECT_EQ(resolve("author").value.get<types::Signature>()(commit_).name, "Ada");

    auto id = resolve("commit_id").value.get<types::CommitOrChangeId>()(commit_);
    EXPECT_EQ(id.hex(), "8a3f5c2e");
    EXPECT_EQ(id.shortest(0).prefix, "8");
}

TEST_F(CommitResolverTest, UnknownKeyword) {
    auto result = resolver_("autor", SourceSpan{});
    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.kind, TemplateErrorKind::NoSuchKeyword);
    EXPECT_EQ(err.name, "autor");
    EXPECT_EQ(err.notes, (std::vector<std::string>{"did you mean `author`?"}));
}
