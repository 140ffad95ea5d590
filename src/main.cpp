//! # jcodec Entry Point
//!
//! The `jcodec` binary formats, queries and validates JSON documents with
//! the library's parser, cursors and encoder.
//!
//! ## Usage
//!
//! ```bash
//! jcodec fmt data.json                  # Pretty print
//! jcodec fmt --compact data.json        # Compact print
//! jcodec get .user.name data.json       # Print one value
//! jcodec delete '.items[0]' data.json   # Remove one value
//! cat data.json | jcodec check -        # Validate stdin
//! ```
//!
//! All work happens in `cli/dispatcher.cpp`.

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return jcodec_main(argc, argv);
}
