#include "cmd_normalize.hpp"

#include "annotation/normalizer.hpp"
#include "log/log.hpp"

#include <iostream>

namespace sigdoc::cli {

int run_normalize(const NormalizeOptions& options, std::istream& in, std::ostream& out) {
    if (!options.expressions.empty()) {
        for (const auto& expr : options.expressions) {
            out << annotation::normalize(expr, options.color) << "\n";
        }
        return 0;
    }

    std::string line;
    size_t count = 0;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        out << annotation::normalize(line, options.color) << "\n";
        ++count;
    }
    SIGDOC_LOG_INFO("cli", "normalized " << count << " annotations from stdin");
    return 0;
}

NormalizeOptions parse_normalize_args(int argc, char* argv[], int first) {
    NormalizeOptions options;
    bool only_expressions = false;

    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];

        if (only_expressions || arg.empty() || arg[0] != '-') {
            options.expressions.push_back(arg);
        } else if (arg == "--") {
            only_expressions = true;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--color") {
            options.color = std::string(annotation::DEFAULT_COLOR);
        } else if (arg.starts_with("--color=")) {
            options.color = arg.substr(8);
        } else if (log::is_log_option(arg)) {
            continue;
        } else {
            SIGDOC_LOG_WARN("cli", "Unknown option '" << arg << "'");
        }
    }

    return options;
}

void print_normalize_help(std::ostream& out) {
    out << R"(
Usage: sigdoc normalize [options] [annotation...]

Prints the canonical form of each annotation. Reads one annotation per line
from stdin when none are given.

Options:
  --color[=<name>]    Wrap results as <fg=name>(...)</> (default name: cyan)
  --help, -h          Show this help
  --                  Treat the remaining arguments as annotations
)";
}

} // namespace sigdoc::cli
