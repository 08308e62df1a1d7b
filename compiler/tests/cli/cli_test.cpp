// CLI Command Tests
// Tests for run_parse, run_check, run_render and the stencil_main dispatcher

#include "../../src/cli/commands/cmd_template.hpp"
#include "../../src/cli/driver.hpp"
#include "common.hpp"
#include "log/log.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace stencil;
using namespace stencil::cli;
namespace fs = std::filesystem;

namespace {

constexpr const char* RECORDS = R"(
[[commit]]
commit_id = "8a3f5c2e9b7d4a1c"
change_id = "kmqzyvwxtnrslpou"
description = "Fix lexer"
author_name = "Ada"
author_email = "ada@example.com"

[[commit]]
commit_id = "1111111111111111"
change_id = "zzzzzzzzzzzzzzzz"
author_name = "Bob"
author_email = "bob@example.com"
)";

} // namespace

// ============================================================================
// Fixture
// ============================================================================

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() / "stencil_cli_test";
        fs::create_directories(test_dir);
        records_path = write_file("commits.toml", RECORDS);

        log::LogConfig config;
        config.console = false;
        log::Logger::init(config);

        StencilOptions::color = ColorMode::Never;
        old_out = std::cout.rdbuf(out.rdbuf());
        old_err = std::cerr.rdbuf(err.rdbuf());
    }

    void TearDown() override {
        std::cout.rdbuf(old_out);
        std::cerr.rdbuf(old_err);
        StencilOptions::color = ColorMode::Auto;
        log::Logger::init(log::LogConfig{});
        fs::remove_all(test_dir);
    }

    auto write_file(const std::string& name, const std::string& content) -> std::string {
        fs::path path = test_dir / name;
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path.string();
    }

    /// Runs `stencil_main` with `args` after the program name.
    auto run_main(std::vector<std::string> args) -> int {
        args.insert(args.begin(), "stencil");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        return stencil_main(static_cast<int>(args.size()), argv.data());
    }

    fs::path test_dir;
    std::string records_path;
    std::ostringstream out;
    std::ostringstream err;
    std::streambuf* old_out = nullptr;
    std::streambuf* old_err = nullptr;
};

// ============================================================================
// parse
// ============================================================================

TEST_F(CliTest, ParsePrintsAst) {
    EXPECT_EQ(run_parse("commit_id", CommandOptions{}), 0);
    EXPECT_EQ(out.str(), "Identifier commit_id 0..9\n");
}

TEST_F(CliTest, ParseSyntaxErrorFails) {
    EXPECT_EQ(run_parse("label(", CommandOptions{}), 1);
    EXPECT_EQ(out.str(), "");
    EXPECT_NE(err.str().find("error[P001]"), std::string::npos) << err.str();
}

TEST_F(CliTest, ParseReadsTemplateFile) {
    auto path = write_file("id.tmpl", "commit_id");
    EXPECT_EQ(run_parse("@" + path, CommandOptions{}), 0);
    EXPECT_EQ(out.str(), "Identifier commit_id 0..9\n");
}

// ============================================================================
// check
// ============================================================================

TEST_F(CliTest, CheckAcceptsValidTemplate) {
    auto path = write_file("log.tmpl", R"(commit_id.short(8) " " author.name())");
    EXPECT_EQ(run_check("@" + path, CommandOptions{}), 0);
    EXPECT_EQ(out.str(), path + ": ok\n");
}

TEST_F(CliTest, CheckReportsUnknownKeyword) {
    EXPECT_EQ(run_check("autor.name()", CommandOptions{}), 1);
    EXPECT_NE(err.str().find("error[T001]"), std::string::npos) << err.str();
    EXPECT_NE(err.str().find("did you mean `author`?"), std::string::npos) << err.str();
}

TEST_F(CliTest, CheckJsonDiagnostics) {
    CommandOptions options;
    options.error_format = diagnostic::DiagnosticFormat::Json;
    EXPECT_EQ(run_check("autor", options), 1);
    EXPECT_EQ(err.str().rfind("{\"severity\":\"error\",\"code\":\"T001\"", 0), 0u) << err.str();
}

TEST_F(CliTest, CheckMissingTemplateFileFails) {
    EXPECT_EQ(run_check("@" + (test_dir / "missing.tmpl").string(), CommandOptions{}), 1);
    EXPECT_EQ(out.str(), "");
}

// ============================================================================
// render
// ============================================================================

TEST_F(CliTest, RenderOneLinePerCommit) {
    EXPECT_EQ(run_render(R"(commit_id.short(4) " " author.name())", records_path,
                         CommandOptions{}),
              0);
    EXPECT_EQ(out.str(), "8a3f Ada\n1111 Bob\n");
}

TEST_F(CliTest, RenderWithConfiguredColors) {
    CommandOptions options;
    options.config_path = write_file("style.toml", "[colors]\nhi = \"bold red\"\n");
    StencilOptions::color = ColorMode::Always;

    EXPECT_EQ(run_render(R"(label("hi", "x"))", records_path, options), 0);
    EXPECT_EQ(out.str(), "\033[1;31mx\033[0m\n\033[1;31mx\033[0m\n");
}

TEST_F(CliTest, RenderWithoutColorsIgnoresConfig) {
    CommandOptions options;
    options.config_path = write_file("style.toml", "[colors]\nhi = \"bold red\"\n");

    EXPECT_EQ(run_render(R"(label("hi", "x"))", records_path, options), 0);
    EXPECT_EQ(out.str(), "x\nx\n");
}

TEST_F(CliTest, RenderBadConfigFails) {
    CommandOptions options;
    options.config_path = write_file("style.toml", "[colors]\nhi = \"sparkly\"\n");
    EXPECT_EQ(run_render("commit_id", records_path, options), 1);
    EXPECT_EQ(out.str(), "");
}

TEST_F(CliTest, RenderMissingRecordsFails) {
    EXPECT_EQ(run_render("commit_id", (test_dir / "missing.toml").string(), CommandOptions{}),
              1);
    EXPECT_EQ(out.str(), "");
}

TEST_F(CliTest, RenderTemplateErrorFails) {
    EXPECT_EQ(run_render("commit_id.nope()", records_path, CommandOptions{}), 1);
    EXPECT_EQ(out.str(), "");
    EXPECT_NE(err.str().find("error[T003]"), std::string::npos) << err.str();
}

// ============================================================================
// Dispatcher
// ============================================================================

TEST_F(CliTest, MainRendersWithFlags) {
    auto tmpl = write_file("log.tmpl", R"(author.name())");
    EXPECT_EQ(run_main({"render", "--color=never", "@" + tmpl, records_path}), 0);
    EXPECT_EQ(out.str(), "Ada\nBob\n");
}

TEST_F(CliTest, MainColorAlways) {
    auto style = write_file("style.toml", "[colors]\nhi = \"bold red\"\n");
    EXPECT_EQ(run_main({"render", R"(label("hi", "x"))", records_path, "--color=always",
                        "--config=" + style}),
              0);
    EXPECT_EQ(out.str(), "\033[1;31mx\033[0m\n\033[1;31mx\033[0m\n");
}

TEST_F(CliTest, MainSkipsLogOptions) {
    EXPECT_EQ(run_main({"check", "-q", "commit_id"}), 0);
    EXPECT_EQ(out.str(), "<template>: ok\n");
}

TEST_F(CliTest, MainHelpSucceeds) {
    EXPECT_EQ(run_main({"--help"}), 0);
    EXPECT_NE(out.str().find("Usage: stencil"), std::string::npos);
}

TEST_F(CliTest, MainUsageErrors) {
    EXPECT_EQ(run_main({"frobnicate"}), 1);
    EXPECT_EQ(run_main({"render", "commit_id"}), 1);
    EXPECT_EQ(run_main({"check"}), 1);
    EXPECT_EQ(run_main({"check", "--sparkle", "commit_id"}), 1);
    EXPECT_EQ(out.str(), "");
}

TEST_F(CliTest, MainCheckErrorExitsOne) {
    EXPECT_EQ(run_main({"check", "commit_id.nope()"}), 1);
}
