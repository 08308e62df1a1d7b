//! # CLI Utilities Interface
//!
//! | Function                 | Description                              |
//! |--------------------------|------------------------------------------|
//! | `load_template_source()` | Template text from an argument or `@file` |
//! | `print_usage()`          | Print CLI help text                      |
//! | `print_version()`        | Print tool version                       |

#pragma once
#include "common.hpp"
#include "lexer/source.hpp"

#include <string>

namespace stencil::cli {

/// `@path` reads the template from a file; anything else is the template.
Result<lexer::Source, std::string> load_template_source(const std::string& arg);

// Help text
void print_usage();
void print_version();

} // namespace stencil::cli
