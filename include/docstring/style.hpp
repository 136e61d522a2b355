//! # Docstring Style Tags
//!
//! Names the documentation conventions the docstring parser understands.
//! `Auto` does not pick a convention up front; it asks the parser to try all
//! of them and keep the best result.

#ifndef SIGDOC_DOCSTRING_STYLE_HPP
#define SIGDOC_DOCSTRING_STYLE_HPP

#include <optional>
#include <string_view>

namespace sigdoc::docstring {

/// A docstring convention.
enum class DocstringStyle {
    Google, ///< `Args:` / `Returns:` sections with indented items.
    Numpy,  ///< Titles underlined with dashes, `name : type` items.
    Sphinx, ///< reST field lists: `:param name: desc`.
    Epydoc, ///< `@param name: desc` tags.
    Auto,   ///< Try every convention.
};

/// Parses a style name ("google", "numpy", "sphinx", "epydoc", "auto").
/// Matching ignores case. Returns `std::nullopt` for anything else.
[[nodiscard]] auto parse_style(std::string_view name) -> std::optional<DocstringStyle>;

/// Lowercase name of a style, the inverse of `parse_style`.
[[nodiscard]] auto style_name(DocstringStyle style) -> std::string_view;

} // namespace sigdoc::docstring

#endif // SIGDOC_DOCSTRING_STYLE_HPP
