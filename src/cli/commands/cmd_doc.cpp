#include "cmd_doc.hpp"

#include "docstring/doc_parser.hpp"
#include "log/log.hpp"

#include <iostream>

namespace sigdoc::cli {

namespace {

/// Writes `text` with every line after the first indented by `indent`.
void write_indented(std::ostream& out, const std::string& text, std::string_view indent) {
    for (char c : text) {
        out << c;
        if (c == '\n') {
            out << indent;
        }
    }
}

} // namespace

void print_parsed_docstring(const docstring::ParsedDocstring& doc, std::ostream& out) {
    out << "style: " << docstring::style_name(doc.style) << "\n";
    out << "summary: " << doc.summary << "\n";
    if (!doc.description.empty()) {
        out << "description:\n  ";
        write_indented(out, doc.description, "  ");
        out << "\n";
    }

    if (!doc.params.empty()) {
        out << "params:\n";
        for (const auto& param : doc.params) {
            out << "  " << param.name;
            if (!param.type.empty() || param.is_optional) {
                out << " (" << param.type;
                if (param.is_optional) {
                    out << (param.type.empty() ? "optional" : ", optional");
                }
                out << ")";
            }
            out << ": ";
            write_indented(out, param.description, "    ");
            out << "\n";
        }
    }

    if (doc.returns) {
        out << "returns: ";
        if (!doc.returns->type.empty()) {
            out << doc.returns->type << ": ";
        }
        write_indented(out, doc.returns->description, "    ");
        out << "\n";
    }

    if (!doc.raises.empty()) {
        out << "raises:\n";
        for (const auto& raises : doc.raises) {
            out << "  " << raises.type << ": ";
            write_indented(out, raises.description, "    ");
            out << "\n";
        }
    }
}

int run_doc(const DocOptions& options, std::istream& in, std::ostream& out, std::ostream& err) {
    auto input = read_input(options.input_file, in);
    if (is_err(input)) {
        err << "error: " << unwrap_err(input).message << "\n";
        return 1;
    }

    auto parsed = docstring::parse_docstring(unwrap(input), options.style);
    if (is_err(parsed)) {
        const auto& failure = unwrap_err(parsed);
        err << "error: line " << failure.line << ": " << failure.message << "\n";
        return 1;
    }

    SIGDOC_LOG_DEBUG("cli", "parsed docstring as " << docstring::style_name(unwrap(parsed).style));
    print_parsed_docstring(unwrap(parsed), out);
    return 0;
}

Result<DocOptions, UsageError> parse_doc_args(int argc, char* argv[], int first) {
    DocOptions options;

    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg.starts_with("--style=")) {
            auto style = docstring::parse_style(arg.substr(8));
            if (!style) {
                return UsageError{"unknown docstring style '" + arg.substr(8) + "'"};
            }
            options.style = *style;
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

void print_doc_help(std::ostream& out) {
    out << R"(
Usage: sigdoc doc [options] [file]

Prints the structured parse of a docstring read from file, or from stdin
when no file (or "-") is given.

Options:
  --style=<style>     google, numpy, sphinx, epydoc, auto (default: auto)
  --help, -h          Show this help
)";
}

} // namespace sigdoc::cli
