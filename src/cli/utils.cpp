#include "utils.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>

namespace sigdoc::cli {

Result<std::string, InputError> read_input(const std::string& path, std::istream& in) {
    std::stringstream buffer;
    if (path.empty() || path == "-") {
        buffer << in.rdbuf();
        return buffer.str();
    }

    std::ifstream file(path);
    if (!file) {
        return InputError{"cannot open file: " + path};
    }
    buffer << file.rdbuf();
    return buffer.str();
}

std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                out += buf;
            } else {
                out += c;
            }
        }
    }
    return out;
}

void print_usage(std::ostream& out) {
    out << "sigdoc " << VERSION << "\n\n";
    out << "Usage: sigdoc <command> [options] [inputs]\n\n";
    out << "Commands:\n";
    out << "  normalize   Print the canonical form of type annotations\n";
    out << "  params      Extract parameter descriptions from a docstring\n";
    out << "  doc         Print the structured parse of a docstring\n";
    out << "\nOptions:\n";
    out << "  --help, -h          Show this help\n";
    out << "  --version, -V       Show version\n";
    out << "  --log-level=<lvl>   trace, debug, info, warn, error, off\n";
    out << "  --log-filter=<spec> Per-module levels, e.g. docstring=debug,*=warn\n";
    out << "  --log-file=<path>   Also write log records to a file\n";
    out << "  --log-format=<fmt>  text or json\n";
    out << "  -v, -vv, -vvv       Increase log verbosity\n";
    out << "  -q, --quiet         Only log errors\n";
    out << "\nEnvironment:\n";
    out << "  SIGDOC_LOG          Log filter used when no log flag is given\n";
}

void print_version(std::ostream& out) {
    out << "sigdoc " << VERSION << "\n";
}

} // namespace sigdoc::cli
