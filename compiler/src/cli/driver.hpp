//! # CLI Driver Interface
//!
//! `stencil_main()` dispatches to the command handler named by argv[1].

#pragma once

// Main driver entry point
int stencil_main(int argc, char* argv[]);
