//! # Stencil Entry Point
//!
//! The `stencil` binary compiles commit templates and renders them over
//! records. `main()` delegates to the CLI driver.
//!
//! ## Usage
//!
//! ```bash
//! stencil parse 'commit_id.short() " " description'   # Show the AST
//! stencil check 'author.nmae()'                        # Report errors
//! stencil render @log.tmpl commits.toml               # Render records
//! ```
//!
//! ## See Also
//!
//! - `cli/driver.hpp` - CLI driver
//! - `cli/dispatcher.cpp` - Command dispatching logic

#include "cli/driver.hpp"

/// Main entry point for the stencil tool.
///
/// @return Exit code: 0 for success, 1 for any error
int main(int argc, char* argv[]) {
    return stencil_main(argc, argv);
}
