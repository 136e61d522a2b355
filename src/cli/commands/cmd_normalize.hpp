//! # Normalize Command
//!
//! Prints the canonical spelling of each annotation given on the command
//! line, one per line. Without arguments, each line of stdin is treated as
//! one annotation.
//!
//! ## Usage
//!
//! ```bash
//! sigdoc normalize "typing.Dict[str, mod.Widget]"    # Dict[str, Widget]
//! sigdoc normalize --color "<class 'int'>"            # <fg=cyan>(int)</>
//! ```

#ifndef SIGDOC_CLI_CMD_NORMALIZE_HPP
#define SIGDOC_CLI_CMD_NORMALIZE_HPP

#include <iosfwd>
#include <string>
#include <vector>

namespace sigdoc::cli {

/// Options for the normalize command.
struct NormalizeOptions {
    std::vector<std::string> expressions; ///< Annotations to normalize; empty reads stdin.
    std::string color;                    ///< Color tag to wrap results in; empty for none.
    bool show_help = false;
};

/// Runs the normalize command. Returns 0.
int run_normalize(const NormalizeOptions& options, std::istream& in, std::ostream& out);

/// Parses the arguments after `normalize`, starting at `argv[first]`.
NormalizeOptions parse_normalize_args(int argc, char* argv[], int first);

void print_normalize_help(std::ostream& out);

} // namespace sigdoc::cli

#endif // SIGDOC_CLI_CMD_NORMALIZE_HPP
