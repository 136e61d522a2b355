//! # Annotation Normalizer
//!
//! Entry point for turning an arbitrary annotation string into its canonical
//! spelling. The string is first parsed and rendered; if the parser rejects
//! it, the pattern cleaner produces a best-effort result instead, and that
//! result is parsed and rendered once more if it has become valid. A whole
//! `<class 'word.word'>` input keeps its dotted cleaner output. The caller
//! always gets a string back.
//!
//! ```cpp
//! normalize("typing.Optional[mod.Widget]");  // "Optional[Widget]"
//! normalize("<class 'int'>");                // "int"
//! normalize("int", "cyan");                  // "<fg=cyan>(int)</>"
//! ```

#ifndef SIGDOC_ANNOTATION_NORMALIZER_HPP
#define SIGDOC_ANNOTATION_NORMALIZER_HPP

#include <string>
#include <string_view>

namespace sigdoc::annotation {

/// Color applied by the CLI when `--color` is given without a value.
constexpr std::string_view DEFAULT_COLOR = "cyan";

/// Canonical spelling of `raw`. Empty input yields an empty string.
[[nodiscard]] auto normalize(std::string_view raw) -> std::string;

/// Like `normalize(raw)`, then wrapped with `format_with_color` when `color`
/// is non-empty.
[[nodiscard]] auto normalize(std::string_view raw, std::string_view color) -> std::string;

/// Wraps `text` in a console color tag: `<fg=COLOR>(TEXT)</>`.
[[nodiscard]] auto format_with_color(std::string_view text, std::string_view color)
    -> std::string;

} // namespace sigdoc::annotation

#endif // SIGDOC_ANNOTATION_NORMALIZER_HPP
