#include "cmd_params.hpp"

#include "docstring/extractor.hpp"
#include "log/log.hpp"

#include <iostream>

namespace sigdoc::cli {

namespace {

void print_text(const docstring::ParamDescriptions& params, std::ostream& out) {
    for (const auto& [name, description] : params) {
        out << name << ": ";
        // Continuation lines are indented under the name
        for (char c : description) {
            out << c;
            if (c == '\n') {
                out << "    ";
            }
        }
        out << "\n";
    }
}

void print_json(const docstring::ParamDescriptions& params, std::ostream& out) {
    out << "{";
    bool first = true;
    for (const auto& [name, description] : params) {
        out << (first ? "\n" : ",\n");
        out << "  \"" << json_escape(name) << "\": \"" << json_escape(description) << "\"";
        first = false;
    }
    out << (first ? "}\n" : "\n}\n");
}

} // namespace

int run_params(const ParamsOptions& options, std::istream& in, std::ostream& out,
               std::ostream& err) {
    auto input = read_input(options.input_file, in);
    if (is_err(input)) {
        err << "error: " << unwrap_err(input).message << "\n";
        return 1;
    }

    auto params = docstring::extract_params(unwrap(input), options.style);
    SIGDOC_LOG_INFO("cli", "extracted " << params.size() << " parameter descriptions");

    if (options.format == ParamsFormat::Json) {
        print_json(params, out);
    } else {
        print_text(params, out);
    }
    return 0;
}

Result<ParamsOptions, UsageError> parse_params_args(int argc, char* argv[], int first) {
    ParamsOptions options;

    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg.starts_with("--style=")) {
            auto style = docstring::parse_style(arg.substr(8));
            if (!style) {
                return UsageError{"unknown docstring style '" + arg.substr(8) +
                                  "' (expected google, numpy, sphinx, epydoc or auto)"};
            }
            options.style = *style;
        } else if (arg.starts_with("--format=")) {
            std::string format = arg.substr(9);
            if (format == "json") {
                options.format = ParamsFormat::Json;
            } else if (format == "text") {
                options.format = ParamsFormat::Text;
            } else {
                SIGDOC_LOG_WARN("cli", "Unknown format '" << format << "', using text");
                options.format = ParamsFormat::Text;
            }
        } else if (arg == "-" || arg.empty() || arg[0] != '-') {
            if (!options.input_file.empty()) {
                return UsageError{"only one input file may be given"};
            }
            options.input_file = arg;
        } else if (log::is_log_option(arg)) {
            continue;
        } else {
            SIGDOC_LOG_WARN("cli", "Unknown option '" << arg << "'");
        }
    }

    return options;
}

void print_params_help(std::ostream& out) {
    out << R"(
Usage: sigdoc params [options] [file]

Prints the description of each documented parameter of a docstring read from
file, or from stdin when no file (or "-") is given.

Options:
  --style=<style>     google, numpy, sphinx, epydoc, auto (default: auto)
  --format=<fmt>      text or json (default: text)
  --help, -h          Show this help
)";
}

} // namespace sigdoc::cli
