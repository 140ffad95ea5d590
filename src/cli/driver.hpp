//! # CLI Driver Interface
//!
//! `jcodec_main()` dispatches to the command handler named by argv[1].

#pragma once

// Command-line entry point
int jcodec_main(int argc, char* argv[]);
