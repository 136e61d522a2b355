//! # Doc Command
//!
//! Prints the full structured parse of a docstring: summary, description,
//! parameters with their types, return value and exceptions.
//!
//! ## Usage
//!
//! ```bash
//! sigdoc doc [--style=<style>] [file]
//! ```

#ifndef SIGDOC_CLI_CMD_DOC_HPP
#define SIGDOC_CLI_CMD_DOC_HPP

#include "common.hpp"
#include "docstring/model.hpp"
#include "docstring/style.hpp"
#include "utils.hpp"

#include <iosfwd>
#include <string>

namespace sigdoc::cli {

/// Options for the doc command.
struct DocOptions {
    std::string input_file; ///< Empty reads stdin.
    docstring::DocstringStyle style = docstring::DocstringStyle::Auto;
    bool show_help = false;
};

/// Runs the doc command.
///
/// @returns 0 on success, 1 if the input cannot be read or parsed.
int run_doc(const DocOptions& options, std::istream& in, std::ostream& out, std::ostream& err);

/// Parses the arguments after `doc`, starting at `argv[first]`.
Result<DocOptions, UsageError> parse_doc_args(int argc, char* argv[], int first);

/// Writes a parsed docstring in the human-readable layout used by `run_doc`.
void print_parsed_docstring(const docstring::ParsedDocstring& doc, std::ostream& out);

void print_doc_help(std::ostream& out);

} // namespace sigdoc::cli

#endif // SIGDOC_CLI_CMD_DOC_HPP
