//! # Template Commands
//!
//! Implements `stencil parse`, `stencil check` and `stencil render`.
//!
//! ## Usage
//!
//! ```bash
//! stencil parse '"id: " commit_id.short(8)'
//! stencil check @log.tmpl --error-format=json
//! stencil render @log.tmpl commits.toml --config=style.toml --color=always
//! ```
//!
//! `check` compiles against the commit keywords without any records, so it
//! catches every error a later `render` would report.

#include "cmd_template.hpp"

#include "builder/expression_builder.hpp"
#include "cli/utils.hpp"
#include "common.hpp"
#include "config/style_config.hpp"
#include "log/log.hpp"
#include "parser/ast_printer.hpp"
#include "parser/parser.hpp"
#include "record/commit.hpp"
#include "render/color_formatter.hpp"

#include <iostream>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace stencil::cli {

namespace {

auto stdout_colors_enabled() -> bool {
    switch (StencilOptions::color) {
    case ColorMode::Always:
        return true;
    case ColorMode::Never:
        return false;
    case ColorMode::Auto:
        return isatty(fileno(stdout)) != 0;
    }
    return false;
}

auto make_emitter(const CommandOptions& options) -> diagnostic::DiagnosticEmitter {
    diagnostic::DiagnosticEmitter emitter(std::cerr);
    switch (StencilOptions::color) {
    case ColorMode::Always:
        emitter.set_color_enabled(true);
        break;
    case ColorMode::Never:
        emitter.set_color_enabled(false);
        break;
    case ColorMode::Auto:
        emitter.set_color_enabled(diagnostic::terminal_supports_colors());
        break;
    }
    emitter.set_format(options.error_format);
    return emitter;
}

/// Compiles `source` against the commit keywords, reporting any error.
auto compile_commit_template(const lexer::Source& source, const record::CommitIndex& index,
                             const CommandOptions& options)
    -> Result<render::TemplatePtr<record::Commit>, TemplateError> {
    auto tmpl =
        builder::compile<record::Commit>(source, record::commit_keyword_resolver(index));
    if (is_err(tmpl)) {
        auto emitter = make_emitter(options);
        emitter.emit_template_error(unwrap_err(tmpl), source);
    }
    return tmpl;
}

} // namespace

int run_parse(const std::string& template_arg, const CommandOptions& options) {
    auto source = load_template_source(template_arg);
    if (is_err(source)) {
        STENCIL_LOG_ERROR("cli", unwrap_err(source));
        return 1;
    }
    const auto& src = unwrap(source);

    if (options.syntax) {
        auto tree = parser::parse_syntax(src);
        if (is_err(tree)) {
            make_emitter(options).emit_template_error(unwrap_err(tree), src);
            return 1;
        }
        std::cout << parser::dump_syntax(unwrap(tree));
        return 0;
    }

    auto ast = parser::parse_template(src);
    if (is_err(ast)) {
        make_emitter(options).emit_template_error(unwrap_err(ast), src);
        return 1;
    }
    std::cout << parser::print_ast(unwrap(ast), stdout_colors_enabled());
    return 0;
}

int run_check(const std::string& template_arg, const CommandOptions& options) {
    auto source = load_template_source(template_arg);
    if (is_err(source)) {
        STENCIL_LOG_ERROR("cli", unwrap_err(source));
        return 1;
    }

    auto tmpl = compile_commit_template(unwrap(source), record::build_commit_index({}), options);
    if (is_err(tmpl)) {
        return 1;
    }
    std::cout << unwrap(source).filename() << ": ok\n";
    return 0;
}

int run_render(const std::string& template_arg, const std::string& records_path,
               const CommandOptions& options) {
    auto source = load_template_source(template_arg);
    if (is_err(source)) {
        STENCIL_LOG_ERROR("cli", unwrap_err(source));
        return 1;
    }

    auto commits = record::load_commits(records_path);
    if (is_err(commits)) {
        STENCIL_LOG_ERROR("cli", unwrap_err(commits).to_string());
        return 1;
    }

    auto style = config::StyleConfig::defaults();
    if (!options.config_path.empty()) {
        auto loaded = config::StyleConfig::load(options.config_path);
        if (is_err(loaded)) {
            STENCIL_LOG_ERROR("cli", unwrap_err(loaded).to_string());
            return 1;
        }
        style.merge(unwrap(loaded));
    }

    const auto& records = unwrap(commits);
    auto tmpl =
        compile_commit_template(unwrap(source), record::build_commit_index(records), options);
    if (is_err(tmpl)) {
        return 1;
    }
    const auto& compiled = *unwrap(tmpl);

    bool colors = stdout_colors_enabled();
    STENCIL_LOG_DEBUG("render", "rendering " << records.size() << " commits"
                                             << (colors ? " with colors" : ""));
    for (const auto& commit : records) {
        if (colors) {
            render::ColorFormatter formatter(std::cout, style);
            render::render_to(compiled, commit, formatter);
        } else {
            std::cout << render::render_plain(compiled, commit);
        }
        std::cout << "\n";
    }
    return 0;
}

} // namespace stencil::cli
