//! # Google-Style Docstrings
//!
//! ```text
//! Summary line.
//!
//! Args:
//!     path (str): File to read.
//!     mode (str, optional): Open mode.
//!
//! Returns:
//!     bytes: The file contents.
//!
//! Raises:
//!     IOError: If the file cannot be read.
//! ```
//!
//! A section runs from its title line to the next line at the title's
//! indentation.

#include "docstring/doc_parser.hpp"
#include "docstring/text.hpp"

#include <optional>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace sigdoc::docstring {

namespace {

enum class GoogleSection { Params, Returns, Raises, Other };

auto section_kind(std::string_view title) -> std::optional<GoogleSection> {
    static const std::unordered_map<std::string_view, GoogleSection> SECTIONS = {
        {"Args", GoogleSection::Params},       {"Arguments", GoogleSection::Params},
        {"Parameters", GoogleSection::Params}, {"Params", GoogleSection::Params},
        {"Returns", GoogleSection::Returns},   {"Return", GoogleSection::Returns},
        {"Yields", GoogleSection::Other},      {"Raises", GoogleSection::Raises},
        {"Exceptions", GoogleSection::Raises}, {"Example", GoogleSection::Other},
        {"Examples", GoogleSection::Other},    {"Note", GoogleSection::Other},
        {"Notes", GoogleSection::Other},       {"Attributes", GoogleSection::Other},
    };

    auto it = SECTIONS.find(title);
    if (it == SECTIONS.end()) {
        return std::nullopt;
    }
    return it->second;
}

/// Recognizes a `Title:` line at the top indentation level.
auto section_title(const std::string& line) -> std::optional<GoogleSection> {
    if (line.empty() || indent_of(line) != 0 || line.back() != ':') {
        return std::nullopt;
    }
    return section_kind(std::string_view(line).substr(0, line.size() - 1));
}

/// True if `head` reads as a bare type: no whitespace outside brackets.
auto looks_like_type(std::string_view head) -> bool {
    if (head.empty()) {
        return false;
    }
    int depth = 0;
    for (char c : head) {
        if (c == '[' || c == '(') {
            ++depth;
        } else if ((c == ']' || c == ')') && depth > 0) {
            --depth;
        } else if ((c == ' ' || c == '\t') && depth == 0) {
            return false;
        }
    }
    return true;
}

auto parse_param_item(const SectionItem& item) -> Result<DocstringParam, DocstringError> {
    auto colon = find_top_level_colon(item.head);
    if (colon == std::string::npos) {
        return DocstringError{.message = "expected ':' in parameter entry '" + item.head + "'",
                              .line = item.line};
    }

    auto head = trim(std::string_view(item.head).substr(0, colon));
    DocstringParam param{.name = head,
                         .type = "",
                         .description = join_description(
                             std::string_view(item.head).substr(colon + 1), item.body),
                         .is_optional = false};

    auto open = head.find('(');
    if (open != std::string::npos && head.back() == ')') {
        param.name = trim(std::string_view(head).substr(0, open));
        param.type = head.substr(open + 1, head.size() - open - 2);
        param.is_optional = strip_optional(param.type);
    }

    if (param.name.empty()) {
        return DocstringError{.message = "parameter entry without a name", .line = item.line};
    }
    return std::move(param);
}

auto parse_raises_item(const SectionItem& item) -> Result<DocstringRaises, DocstringError> {
    auto colon = find_top_level_colon(item.head);
    if (colon == std::string::npos) {
        return DocstringError{.message = "expected ':' in exception entry '" + item.head + "'",
                              .line = item.line};
    }
    return DocstringRaises{
        .type = trim(std::string_view(item.head).substr(0, colon)),
        .description =
            join_description(std::string_view(item.head).substr(colon + 1), item.body)};
}

/// `Returns:` holds a single entry; a leading `type:` is optional.
auto parse_returns(const std::vector<SectionItem>& items) -> std::optional<DocstringReturns> {
    if (items.empty()) {
        return std::nullopt;
    }

    // Several items under Returns are one multi-line description.
    std::vector<std::string> rest = items.front().body;
    for (size_t i = 1; i < items.size(); ++i) {
        rest.push_back(items[i].head);
        rest.insert(rest.end(), items[i].body.begin(), items[i].body.end());
    }

    const auto& head = items.front().head;
    auto colon = find_top_level_colon(head);
    if (colon != std::string::npos) {
        auto type = trim(std::string_view(head).substr(0, colon));
        if (looks_like_type(type)) {
            return DocstringReturns{
                .type = type,
                .description = join_description(std::string_view(head).substr(colon + 1), rest)};
        }
    }
    return DocstringReturns{.type = "", .description = join_description(head, rest)};
}

} // namespace

auto parse_google(const std::vector<std::string>& lines) -> DocstringResult {
    ParsedDocstring result;
    result.style = DocstringStyle::Google;
    std::vector<std::string> prose;

    size_t i = 0;
    while (i < lines.size()) {
        auto kind = section_title(lines[i]);
        if (!kind) {
            prose.push_back(lines[i]);
            ++i;
            continue;
        }

        size_t end = i + 1;
        while (end < lines.size() && (lines[end].empty() || indent_of(lines[end]) > 0)) {
            ++end;
        }
        auto items = group_items(lines, i + 1, end);

        switch (*kind) {
        case GoogleSection::Params:
            for (const auto& item : items) {
                auto param = parse_param_item(item);
                if (is_err(param)) {
                    return unwrap_err(param);
                }
                result.params.push_back(std::move(unwrap(param)));
            }
            break;
        case GoogleSection::Raises:
            for (const auto& item : items) {
                auto raises = parse_raises_item(item);
                if (is_err(raises)) {
                    return unwrap_err(raises);
                }
                result.raises.push_back(std::move(unwrap(raises)));
            }
            break;
        case GoogleSection::Returns:
            if (auto returns = parse_returns(items)) {
                result.returns = std::move(returns);
            }
            break;
        case GoogleSection::Other:
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
