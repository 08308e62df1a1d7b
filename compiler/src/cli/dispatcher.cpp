//! # CLI Command Dispatcher
//!
//! Parses command-line arguments and routes to the command handler.
//!
//! ## Architecture
//!
//! ```text
//! stencil_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ parse          → run_parse()
//!   ├─ check          → run_check()
//!   └─ render         → run_render()
//! ```
//!
//! ## Global Flags
//!
//! - `--color=always|never|auto`: color mode for output and diagnostics
//! - `--config=<path>`: label style file
//! - `--error-format=text|json`: diagnostic format
//! - logging flags, see `log::parse_log_options()`

#include "commands/cmd_template.hpp"
#include "common.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace stencil;

namespace {

/// Applies a global flag. Returns false for unknown flags.
bool apply_flag(const std::string& arg, cli::CommandOptions& options) {
    if (arg.starts_with("--config=")) {
        options.config_path = arg.substr(9);
    } else if (arg == "--color=always") {
        StencilOptions::color = ColorMode::Always;
    } else if (arg == "--color=never") {
        StencilOptions::color = ColorMode::Never;
    } else if (arg == "--color=auto") {
        StencilOptions::color = ColorMode::Auto;
    } else if (arg == "--error-format=json") {
        options.error_format = diagnostic::DiagnosticFormat::Json;
    } else if (arg == "--error-format=text") {
        options.error_format = diagnostic::DiagnosticFormat::Text;
    } else if (arg == "--syntax") {
        options.syntax = true;
    } else {
        return false;
    }
    return true;
}

} // namespace

/// Main entry point for the stencil CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                                  |
/// |------|------------------------------------------|
/// | 0    | Success                                  |
/// | 1    | Usage, template, records or config error |
int stencil_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    if (argc < 2) {
        cli::print_usage();
        return 0;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        cli::print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        cli::print_version();
        return 0;
    }

    cli::CommandOptions options;
    std::vector<std::string> positional;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (log::is_log_option(arg)) {
            continue;
        }
        if (arg.size() > 1 && arg[0] == '-') {
            if (!apply_flag(arg, options)) {
                std::cerr << "error: unknown option '" << arg << "'\n";
                return 1;
            }
            continue;
        }
        positional.push_back(arg);
    }

    STENCIL_LOG_DEBUG("cli", "command " << command << " with " << positional.size()
                                        << " arguments");

    if (command == "parse") {
        if (positional.size() != 1) {
            std::cerr << "Usage: stencil parse <template> [--syntax]\n";
            return 1;
        }
        return cli::run_parse(positional[0], options);
    }

    if (command == "check") {
        if (positional.size() != 1) {
            std::cerr << "Usage: stencil check <template>\n";
            return 1;
        }
        return cli::run_check(positional[0], options);
    }

    if (command == "render") {
        if (positional.size() != 2) {
            std::cerr << "Usage: stencil render <template> <records.toml>"
                      << " [--config=<style.toml>]\n";
            return 1;
        }
        return cli::run_render(positional[0], positional[1], options);
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'stencil --help' for usage information.\n";
    return 1;
}
