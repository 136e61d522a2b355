//! # Docstring Text Utilities Implementation

#include "docstring/text.hpp"

#include <algorithm>
#include <limits>
#include <optional>

namespace sigdoc::docstring {

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto split_lines(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        auto newline = text.find('\n', start);
        auto end = newline == std::string_view::npos ? text.size() : newline;
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);
        if (newline == std::string_view::npos) {
            break;
        }
        start = newline + 1;
    }
    return lines;
}

auto indent_of(std::string_view line) -> size_t {
    size_t n = 0;
    while (n < line.size() && (line[n] == ' ' || line[n] == '\t')) {
        ++n;
    }
    return n;
}

auto is_blank(std::string_view line) -> bool {
    return line.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

auto clean_docstring(std::string_view text) -> std::vector<std::string> {
    auto lines = split_lines(text);

    size_t common = std::numeric_limits<size_t>::max();
    for (size_t i = 1; i < lines.size(); ++i) {
        if (!is_blank(lines[i])) {
            common = std::min(common, indent_of(lines[i]));
        }
    }

    for (size_t i = 0; i < lines.size(); ++i) {
        auto& line = lines[i];
        if (is_blank(line)) {
            line.clear();
        } else if (i == 0) {
            line.erase(0, indent_of(line));
        } else {
            line.erase(0, common);
        }
        while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) {
            line.pop_back();
        }
    }
    return lines;
}

auto find_top_level_colon(std::string_view text) -> size_t {
    int depth = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if ((c == ')' || c == ']' || c == '}') && depth > 0) {
            --depth;
        } else if (c == ':' && depth == 0) {
            return i;
        }
    }
    return std::string_view::npos;
}

auto strip_optional(std::string& type) -> bool {
    constexpr std::string_view MARKER = "optional";

    auto trimmed = trim(type);
    if (trimmed == MARKER) {
        type.clear();
        return true;
    }

    auto comma = trimmed.rfind(',');
    if (comma != std::string::npos && trim(std::string_view(trimmed).substr(comma + 1)) == MARKER) {
        type = trim(std::string_view(trimmed).substr(0, comma));
        return true;
    }

    type = trimmed;
    return false;
}

auto group_items(const std::vector<std::string>& lines, size_t begin, size_t end)
    -> std::vector<SectionItem> {
    std::vector<SectionItem> items;
    std::optional<size_t> item_indent;

    for (size_t i = begin; i < end && i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (is_blank(line)) {
            continue;
        }
        auto indent = indent_of(line);
        if (!item_indent) {
            item_indent = indent;
        }
        if (indent <= *item_indent || items.empty()) {
            items.push_back(SectionItem{.head = trim(line), .body = {}, .line = i + 1});
        } else {
            items.back().body.push_back(trim(line));
        }
    }
    return items;
}

auto join_description(std::string_view first, const std::vector<std::string>& rest)
    -> std::string {
    std::string text = trim(first);
    for (const auto& line : rest) {
        if (!text.empty()) {
            text += "\n";
        }
        text += line;
    }
    return text;
}

auto split_prose(const std::vector<std::string>& lines) -> Prose {
    Prose prose;

    size_t i = 0;
    while (i < lines.size() && is_blank(lines[i])) {
        ++i;
    }

    // Summary: first paragraph
    for (; i < lines.size() && !is_blank(lines[i]); ++i) {
        if (!prose.summary.empty()) {
            prose.summary += " ";
        }
        prose.summary += trim(lines[i]);
    }

    std::string rest;
    for (; i < lines.size(); ++i) {
        if (!rest.empty() || !is_blank(lines[i])) {
            rest += lines[i];
            rest += "\n";
        }
    }
    prose.description = trim(rest);
    return prose;
}

} // namespace sigdoc::docstring
