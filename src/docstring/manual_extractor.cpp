//! # Manual Parameter Extraction Implementation
//!
//! The text is dedented first so that section titles and the capital-letter
//! terminator are matched at column zero regardless of source indentation.
//! Patterns only ever see the head of a single line, at most `HEAD_WINDOW`
//! bytes; descriptions are gathered line by line.

#include "docstring/manual_extractor.hpp"

#include "docstring/text.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace sigdoc::docstring {

namespace {

constexpr size_t HEAD_WINDOW = 256;

using Lines = std::vector<std::string>;
using Entries = std::vector<std::pair<std::string, std::string>>;

/// A recognized item head: the name and the text after its colon.
struct LineHead {
    std::string name;
    std::string rest;
};

auto param_field_pattern() -> const std::regex& {
    static const std::regex pattern(R"(^[ \t]*:param[ \t]+(\w+):)");
    return pattern;
}

auto numpy_item_pattern() -> const std::regex& {
    static const std::regex pattern(R"(^[ \t]*(\w+)[ \t]*:)");
    return pattern;
}

/// Matches `pattern` against the start of `line`.
auto match_head(const std::string& line, const std::regex& pattern) -> std::optional<LineHead> {
    auto window_end = line.begin() + static_cast<std::ptrdiff_t>(std::min(line.size(), HEAD_WINDOW));
    std::smatch match;
    if (!std::regex_search(line.begin(), window_end, match, pattern)) {
        return std::nullopt;
    }
    return LineHead{.name = match[1].str(),
                    .rest = line.substr(static_cast<size_t>(match.length(0)))};
}

auto starts_field(const std::string& line) -> bool {
    auto indent = indent_of(line);
    return indent < line.size() && line[indent] == ':';
}

/// `text` followed by `lines[begin, end)`, newline-joined and trimmed.
auto gather(std::string text, const Lines& lines, size_t begin, size_t end) -> std::string {
    for (size_t i = begin; i < end; ++i) {
        text += '\n';
        text += lines[i];
    }
    return trim(text);
}

/// `:param NAME: DESCRIPTION` fields. A description runs on until a line
/// starting with ':', a blank line, or the end of the text.
auto scan_param_fields(const Lines& lines) -> Entries {
    Entries entries;
    for (size_t i = 0; i < lines.size(); ++i) {
        auto head = match_head(lines[i], param_field_pattern());
        if (!head) {
            continue;
        }
        size_t end = i + 1;
        while (end < lines.size() && !is_blank(lines[end]) && !starts_field(lines[end])) {
            ++end;
        }
        entries.emplace_back(std::move(head->name), gather(std::move(head->rest), lines, i + 1, end));
        i = end - 1;
    }
    return entries;
}

auto is_dash_rule(const std::string& line) -> bool {
    auto body = trim(line);
    return !body.empty() && body.find_first_not_of('-') == std::string::npos;
}

auto is_parameters_title(const std::string& line) -> bool {
    return line.starts_with("Parameters") &&
           line.find_first_not_of(" \t", 10) == std::string::npos;
}

auto starts_capitalized(const std::string& line) -> bool {
    return !line.empty() && line[0] >= 'A' && line[0] <= 'Z';
}

/// `name : type` items of the first `Parameters` section with a dash rule.
/// The body ends before a blank or capitalized line. Each description is the
/// run of lines after its head up to the next head.
auto scan_numpy_section(const Lines& lines) -> Entries {
    Entries entries;

    size_t title = 0;
    while (title + 2 < lines.size() &&
           !(is_parameters_title(lines[title]) && is_dash_rule(lines[title + 1]))) {
        ++title;
    }
    if (title + 2 >= lines.size()) {
        return entries;
    }

    size_t begin = title + 2;
    size_t end = begin + 1;
    while (end < lines.size() && !is_blank(lines[end]) && !starts_capitalized(lines[end])) {
        ++end;
    }

    for (size_t i = begin; i < end; ++i) {
        auto head = match_head(lines[i], numpy_item_pattern());
        if (!head) {
            continue;
        }
        size_t next = i + 1;
        while (next < end && !match_head(lines[next], numpy_item_pattern())) {
            ++next;
        }
        entries.emplace_back(std::move(head->name), gather("", lines, i + 1, next));
        i = next - 1;
    }
    return entries;
}

/// Adds every entry with a description; existing names win.
void fill_missing(const Entries& entries, ParamDescriptions& params, std::string_view pass) {
    for (const auto& [name, description] : entries) {
        if (description.empty()) {
            continue;
        }
        auto [entry, inserted] = params.emplace(name, description);
        if (inserted) {
            SIGDOC_LOG_TRACE("docstring", pass << " pass found '" << entry->first << "'");
        }
    }
}

} // namespace

auto extract_params_manual(std::string_view docstring) -> ParamDescriptions {
    ParamDescriptions params;
    if (docstring.empty()) {
        return params;
    }

    auto lines = clean_docstring(docstring);

    auto fields = scan_param_fields(lines);
    fill_missing(fields, params, "google");
    fill_missing(fields, params, "sphinx");
    fill_missing(scan_numpy_section(lines), params, "numpy");

    return params;
}

} // namespace sigdoc::docstring
