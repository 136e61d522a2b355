//! # Structured Docstring Parser Implementation
//!
//! Dispatch and automatic convention selection. The individual conventions
//! live in google_parser.cpp, numpy_parser.cpp and field_parser.cpp.

#include "docstring/doc_parser.hpp"

#include "docstring/text.hpp"
#include "log/log.hpp"

#include <array>
#include <optional>
#include <utility>

namespace sigdoc::docstring {

namespace {

using StyleParser = DocstringResult (*)(const std::vector<std::string>&);

constexpr std::array<std::pair<DocstringStyle, StyleParser>, 4> AUTO_ORDER = {{
    {DocstringStyle::Sphinx, &parse_sphinx},
    {DocstringStyle::Google, &parse_google},
    {DocstringStyle::Numpy, &parse_numpy},
    {DocstringStyle::Epydoc, &parse_epydoc},
}};

auto parse_auto(const std::vector<std::string>& lines) -> DocstringResult {
    std::optional<ParsedDocstring> best;
    std::optional<DocstringError> first_error;

    for (const auto& [style, parser] : AUTO_ORDER) {
        auto result = parser(lines);
        if (is_err(result)) {
            const auto& err = unwrap_err(result);
            SIGDOC_LOG_TRACE("docstring", style_name(style) << " rejected docstring at line "
                                                            << err.line << ": " << err.message);
            if (!first_error) {
                first_error = err;
            }
            continue;
        }

        auto& parsed = unwrap(result);
        SIGDOC_LOG_TRACE("docstring",
                         style_name(style) << " found " << parsed.entry_count() << " entries");
        if (!best || parsed.entry_count() > best->entry_count()) {
            best = std::move(parsed);
        }
    }

    if (best) {
        return std::move(*best);
    }
    return *first_error;
}

} // namespace

auto parse_docstring(std::string_view text, DocstringStyle style) -> DocstringResult {
    auto lines = clean_docstring(text);

    switch (style) {
    case DocstringStyle::Google:
        return parse_google(lines);
    case DocstringStyle::Numpy:
        return parse_numpy(lines);
    case DocstringStyle::Sphinx:
        return parse_sphinx(lines);
    case DocstringStyle::Epydoc:
        return parse_epydoc(lines);
    case DocstringStyle::Auto:
        break;
    }
    return parse_auto(lines);
}

} // namespace sigdoc::docstring
