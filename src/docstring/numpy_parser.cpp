//! # NumPy-Style Docstrings
//!
//! ```text
//! Summary line.
//!
//! Parameters
//! ----------
//! path : str
//!     File to read.
//! mode : str, optional
//!     Open mode.
//!
//! Returns
//! -------
//! bytes
//!     The file contents.
//! ```
//!
//! A section is a title line underlined with dashes and runs until the next
//! underlined title. Items sit at the section's indentation and their
//! descriptions are indented below them.

#include "docstring/doc_parser.hpp"
#include "docstring/text.hpp"

#include <string_view>
#include <utility>

namespace sigdoc::docstring {

namespace {

enum class NumpySection { Params, Returns, Raises, Other };

auto section_kind(std::string_view title) -> NumpySection {
    if (title == "Parameters" || title == "Other Parameters" || title == "Arguments" ||
        title == "Args" || title == "Params") {
        return NumpySection::Params;
    }
    if (title == "Returns" || title == "Return") {
        return NumpySection::Returns;
    }
    if (title == "Raises") {
        return NumpySection::Raises;
    }
    return NumpySection::Other;
}

auto is_underline(std::string_view line) -> bool {
    auto text = trim(line);
    return !text.empty() && text.find_first_not_of('-') == std::string::npos;
}

/// True if `lines[i]` is a title and `lines[i + 1]` its underline.
auto is_section_start(const std::vector<std::string>& lines, size_t i) -> bool {
    return i + 1 < lines.size() && !is_blank(lines[i]) && !is_underline(lines[i]) &&
           is_underline(lines[i + 1]);
}

/// `name : type` with both parts optional around the colon.
auto split_declaration(const std::string& head) -> std::pair<std::string, std::string> {
    auto colon = find_top_level_colon(head);
    if (colon == std::string::npos) {
        return {head, ""};
    }
    return {trim(std::string_view(head).substr(0, colon)),
            trim(std::string_view(head).substr(colon + 1))};
}

} // namespace

auto parse_numpy(const std::vector<std::string>& lines) -> DocstringResult {
    ParsedDocstring result;
    result.style = DocstringStyle::Numpy;
    std::vector<std::string> prose;

    size_t i = 0;
    while (i < lines.size() && !is_section_start(lines, i)) {
        prose.push_back(lines[i]);
        ++i;
    }

    while (i < lines.size()) {
        auto kind = section_kind(trim(lines[i]));
        size_t begin = i + 2;
        size_t end = begin;
        while (end < lines.size() && !is_section_start(lines, end)) {
            ++end;
        }

        auto items = group_items(lines, begin, end);
        switch (kind) {
        case NumpySection::Params:
            for (const auto& item : items) {
                auto [name, type] = split_declaration(item.head);
                DocstringParam param{.name = std::move(name),
                                     .type = std::move(type),
                                     .description = join_description("", item.body),
                                     .is_optional = false};
                param.is_optional = strip_optional(param.type);
                result.params.push_back(std::move(param));
            }
            break;
        case NumpySection::Returns:
            if (!items.empty()) {
                const auto& item = items.front();
                auto [name, type] = split_declaration(item.head);
                result.returns = DocstringReturns{.type = type.empty() ? name : type,
                                                  .description = join_description("", item.body)};
            }
            break;
        case NumpySection::Raises:
            for (const auto& item : items) {
                result.raises.push_back(DocstringRaises{
                    .type = item.head, .description = join_description("", item.body)});
            }
            break;
        case NumpySection::Other:
            break;
        }
        i = end;
    }

    auto text = split_prose(prose);
    result.summary = std::move(text.summary);
    result.description = std::move(text.description);
    return std::move(result);
}

} // namespace sigdoc::docstring
