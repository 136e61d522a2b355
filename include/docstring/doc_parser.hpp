//! # Structured Docstring Parser
//!
//! Parses a docstring written in one of the common conventions into a
//! `ParsedDocstring`.
//!
//! ## Conventions
//!
//! | Style    | Parameters                         | Returns               |
//! |----------|------------------------------------|-----------------------|
//! | Google   | `Args:` then `name (type): desc`   | `Returns:` section    |
//! | NumPy    | `Parameters` / `----------`        | `Returns` / `-------` |
//! | Sphinx   | `:param type name: desc`           | `:returns:` `:rtype:` |
//! | Epydoc   | `@param name: desc`                | `@return:` `@rtype:`  |
//!
//! With `DocstringStyle::Auto` every convention is tried in the order
//! Sphinx, Google, NumPy, Epydoc. The result with the most structured entries
//! wins; on a tie the earlier convention wins. Auto fails only when every
//! convention fails, and then reports the first failure.
//!
//! ## Errors
//!
//! A Google `Args:` or `Raises:` item without a `:` separator, and a Sphinx
//! or Epydoc field without its closing `:`, are errors. NumPy sections are
//! always accepted.

#ifndef SIGDOC_DOCSTRING_DOC_PARSER_HPP
#define SIGDOC_DOCSTRING_DOC_PARSER_HPP

#include "common.hpp"
#include "docstring/model.hpp"
#include "docstring/style.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sigdoc::docstring {

/// Why a docstring could not be parsed in the requested convention.
struct DocstringError {
    std::string message;
    size_t line; ///< 1-based line number in the docstring.
};

using DocstringResult = Result<ParsedDocstring, DocstringError>;

/// Parses `text` in the given convention.
[[nodiscard]] auto parse_docstring(std::string_view text,
                                   DocstringStyle style = DocstringStyle::Auto)
    -> DocstringResult;

// Per-convention parsers. Each takes the output of `clean_docstring`.

[[nodiscard]] auto parse_google(const std::vector<std::string>& lines) -> DocstringResult;
[[nodiscard]] auto parse_numpy(const std::vector<std::string>& lines) -> DocstringResult;
[[nodiscard]] auto parse_sphinx(const std::vector<std::string>& lines) -> DocstringResult;
[[nodiscard]] auto parse_epydoc(const std::vector<std::string>& lines) -> DocstringResult;

} // namespace sigdoc::docstring

#endif // SIGDOC_DOCSTRING_DOC_PARSER_HPP
