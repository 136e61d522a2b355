//! # CLI Utilities Interface
//!
//! | Function          | Description                                  |
//! |-------------------|----------------------------------------------|
//! | `read_input()`    | Read a file, or stdin for "" and "-"         |
//! | `json_escape()`   | Escape a string for a JSON string literal    |
//! | `print_usage()`   | Print CLI help text                          |
//! | `print_version()` | Print version                                |

#pragma once
#include "common.hpp"

#include <iosfwd>
#include <string>
#include <string_view>

namespace sigdoc::cli {

/// Why an input could not be read.
struct InputError {
    std::string message;
};

/// A command line that cannot be acted on.
struct UsageError {
    std::string message;
};

// File I/O
Result<std::string, InputError> read_input(const std::string& path, std::istream& in);

// Output helpers
std::string json_escape(std::string_view text);

// Help text
void print_usage(std::ostream& out);
void print_version(std::ostream& out);

} // namespace sigdoc::cli
