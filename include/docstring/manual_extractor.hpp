//! # Manual Parameter Extraction
//!
//! Regex-based recovery of parameter descriptions, used when the structured
//! parser rejects a docstring. Three passes run over the same text, and a
//! name found by an earlier pass is never overwritten by a later one:
//!
//! 1. Lines starting (after indentation) with `:param NAME:`. The
//!    description is the rest of the line plus following lines, up to a line
//!    whose first non-blank character is `:`, a blank line, or the end of
//!    the text. The first occurrence of a name wins.
//! 2. The same `:param` pattern again, only filling names still missing.
//! 3. A NumPy `Parameters` section (title, dash underline, `name : type`
//!    lines with indented descriptions). The section ends at a blank line,
//!    a line starting with a capital letter, or the end of the text.

#ifndef SIGDOC_DOCSTRING_MANUAL_EXTRACTOR_HPP
#define SIGDOC_DOCSTRING_MANUAL_EXTRACTOR_HPP

#include "docstring/model.hpp"

#include <string_view>

namespace sigdoc::docstring {

/// Extracts parameter descriptions by pattern matching. Never fails; text
/// without recognizable entries yields an empty mapping.
[[nodiscard]] auto extract_params_manual(std::string_view docstring) -> ParamDescriptions;

} // namespace sigdoc::docstring

#endif // SIGDOC_DOCSTRING_MANUAL_EXTRACTOR_HPP
