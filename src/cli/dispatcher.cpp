//! # CLI Command Dispatcher
//!
//! ```text
//! sigdoc_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ normalize      → run_normalize()
//!   ├─ params         → run_params()
//!   └─ doc            → run_doc()
//! ```
//!
//! Logging flags (`--log-level=`, `-v`, `-q`, ...) may appear anywhere on
//! the command line and are consumed before dispatch.

#include "commands/cmd_doc.hpp"
#include "commands/cmd_normalize.hpp"
#include "commands/cmd_params.hpp"
#include "common.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>

using namespace sigdoc;
using namespace sigdoc::cli;

namespace {

/// Index of the first argument that is not a logging flag, or argc.
int find_command(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (!sigdoc::log::is_log_option(argv[i])) {
            return i;
        }
    }
    return argc;
}

int usage_error(const UsageError& error, std::string_view command) {
    std::cerr << "error: " << error.message << "\n";
    std::cerr << "Run 'sigdoc " << command << " --help' for usage.\n";
    return 1;
}

} // namespace

/// Main entry point for the sigdoc CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                              |
/// |------|--------------------------------------|
/// | 0    | Success                              |
/// | 1    | Usage error or unreadable input      |
int sigdoc_main(int argc, char* argv[]) {
    sigdoc::log::Logger::init(sigdoc::log::parse_log_options(argc, argv));

    int index = find_command(argc, argv);
    if (index >= argc) {
        print_usage(std::cout);
        return 0;
    }

    std::string command = argv[index];
    int first = index + 1;
    SIGDOC_LOG_DEBUG("cli", "command '" << command << "'");

    if (command == "--help" || command == "-h") {
        print_usage(std::cout);
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version(std::cout);
        return 0;
    }

    if (command == "normalize") {
        auto options = parse_normalize_args(argc, argv, first);
        if (options.show_help) {
            print_normalize_help(std::cout);
            return 0;
        }
        return run_normalize(options, std::cin, std::cout);
    }

    if (command == "params") {
        auto options = parse_params_args(argc, argv, first);
        if (is_err(options)) {
            return usage_error(unwrap_err(options), command);
        }
        if (unwrap(options).show_help) {
            print_params_help(std::cout);
            return 0;
        }
        return run_params(unwrap(options), std::cin, std::cout, std::cerr);
    }

    if (command == "doc") {
        auto options = parse_doc_args(argc, argv, first);
        if (is_err(options)) {
            return usage_error(unwrap_err(options), command);
        }
        if (unwrap(options).show_help) {
            print_doc_help(std::cout);
            return 0;
        }
        return run_doc(unwrap(options), std::cin, std::cout, std::cerr);
    }

    std::cerr << "error: unknown command '" << command << "'\n\n";
    print_usage(std::cerr);
    return 1;
}
