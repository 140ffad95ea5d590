//! # CLI Utilities Interface
//!
//! | Function          | Description                              |
//! |-------------------|------------------------------------------|
//! | `read_input()`    | Read a file, or stdin for `-`, to string |
//! | `print_usage()`   | Print CLI help text                      |
//! | `print_version()` | Print tool version                       |

#pragma once
#include <string>

namespace jcodec::cli {

// File I/O
std::string read_input(const std::string& path);

// Help text
void print_usage();
void print_version();

} // namespace jcodec::cli
