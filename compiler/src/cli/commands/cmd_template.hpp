//! # Template Commands Interface
//!
//! | Function       | Command           | Output                          |
//! |----------------|-------------------|---------------------------------|
//! | `run_parse()`  | `stencil parse`   | AST (or syntax tree) dump       |
//! | `run_check()`  | `stencil check`   | Diagnostics only                |
//! | `run_render()` | `stencil render`  | One rendering per commit        |

#pragma once
#include "diagnostic/diagnostic.hpp"

#include <string>

namespace stencil::cli {

struct CommandOptions {
    std::string config_path; // --config, style file for render
    diagnostic::DiagnosticFormat error_format = diagnostic::DiagnosticFormat::Text;
    bool syntax = false; // parse: dump the syntax tree instead of the AST
};

int run_parse(const std::string& template_arg, const CommandOptions& options);
int run_check(const std::string& template_arg, const CommandOptions& options);
int run_render(const std::string& template_arg, const std::string& records_path,
               const CommandOptions& options);

} // namespace stencil::cli
