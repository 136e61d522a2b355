//! # Params Command
//!
//! Reads a docstring from a file (or stdin) and prints the description of
//! every documented parameter.
//!
//! ## Usage
//!
//! ```bash
//! sigdoc params docstring.txt
//! sigdoc params --style=numpy --format=json < docstring.txt
//! ```
//!
//! ## Options
//!
//! - `--style=<style>`: google, numpy, sphinx, epydoc or auto. Default: auto
//! - `--format=<fmt>`: text (`name: description` lines) or json. Default: text

#ifndef SIGDOC_CLI_CMD_PARAMS_HPP
#define SIGDOC_CLI_CMD_PARAMS_HPP

#include "common.hpp"
#include "docstring/style.hpp"
#include "utils.hpp"

#include <iosfwd>
#include <string>

namespace sigdoc::cli {

/// Output format of the params command.
enum class ParamsFormat {
    Text, ///< One `name: description` line per parameter.
    Json, ///< A single JSON object.
};

/// Options for the params command.
struct ParamsOptions {
    std::string input_file;                                         ///< Empty reads stdin.
    docstring::DocstringStyle style = docstring::DocstringStyle::Auto;
    ParamsFormat format = ParamsFormat::Text;
    bool show_help = false;
};

/// Runs the params command.
///
/// @returns 0 on success, 1 if the input cannot be read.
int run_params(const ParamsOptions& options, std::istream& in, std::ostream& out,
               std::ostream& err);

/// Parses the arguments after `params`, starting at `argv[first]`.
/// Fails on an unknown style or a second input file.
Result<ParamsOptions, UsageError> parse_params_args(int argc, char* argv[], int first);

void print_params_help(std::ostream& out);

} // namespace sigdoc::cli

#endif // SIGDOC_CLI_CMD_PARAMS_HPP
