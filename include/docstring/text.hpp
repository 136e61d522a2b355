//! # Docstring Text Utilities
//!
//! Line handling shared by the docstring parsers. Docstrings arrive with the
//! indentation of the surrounding source, so every parser works on the
//! output of `clean_docstring`, which removes it while keeping one entry
//! per input line (error line numbers stay meaningful).

#ifndef SIGDOC_DOCSTRING_TEXT_HPP
#define SIGDOC_DOCSTRING_TEXT_HPP

#include <string>
#include <string_view>
#include <vector>

namespace sigdoc::docstring {

/// Trims spaces, tabs and line breaks from both ends.
[[nodiscard]] auto trim(std::string_view s) -> std::string;

/// Splits on '\n', dropping a trailing '\r' from each line.
[[nodiscard]] auto split_lines(std::string_view text) -> std::vector<std::string>;

/// Returns the lines of `text` with the common indentation removed.
///
/// The first line has its own leading whitespace stripped and does not take
/// part in computing the common indentation. Blank lines become empty.
[[nodiscard]] auto clean_docstring(std::string_view text) -> std::vector<std::string>;

/// Number of leading spaces and tabs.
[[nodiscard]] auto indent_of(std::string_view line) -> size_t;

/// True if the line holds only whitespace.
[[nodiscard]] auto is_blank(std::string_view line) -> bool;

/// Finds the first ':' that is not inside brackets or parentheses.
[[nodiscard]] auto find_top_level_colon(std::string_view text) -> size_t;

/// Strips a trailing `optional` marker from a type: `int, optional` -> `int`.
/// Returns true if the marker was present.
auto strip_optional(std::string& type) -> bool;

/// One entry of an indented section: a head line and its deeper lines.
struct SectionItem {
    std::string head;                  ///< Trimmed head line.
    std::vector<std::string> body;     ///< Trimmed continuation lines.
    size_t line;                       ///< 1-based line number of the head.
};

/// Groups `lines[begin, end)` into items. A non-blank line indented no deeper
/// than the first non-blank line starts an item; deeper lines continue it.
/// Blank lines are skipped.
[[nodiscard]] auto group_items(const std::vector<std::string>& lines, size_t begin, size_t end)
    -> std::vector<SectionItem>;

/// Joins the first description line of an item with its continuation lines.
[[nodiscard]] auto join_description(std::string_view first, const std::vector<std::string>& rest)
    -> std::string;

/// Free text of a docstring split into its first paragraph and the rest.
struct Prose {
    std::string summary;
    std::string description;
};

/// Builds the summary and description from the prose lines of a docstring.
[[nodiscard]] auto split_prose(const std::vector<std::string>& lines) -> Prose;

} // namespace sigdoc::docstring

#endif // SIGDOC_DOCSTRING_TEXT_HPP
