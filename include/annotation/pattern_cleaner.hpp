//! # Pattern-Based Annotation Cleaning
//!
//! Best-effort cleanup for annotation strings the expression parser rejects,
//! such as runtime reprs (`<class 'int'>`) or truncated text. An ordered list
//! of substitutions is applied to the whole string; each rule sees the
//! output of the previous one. `word` below means `[A-Za-z0-9_]+`.
//!
//! | # | Pattern                          | Replacement |
//! |---|----------------------------------|-------------|
//! | 1 | `typing.`                        | (removed)   |
//! | 2 | `__main__.`                      | (removed)   |
//! | 3 | `builtins.`                      | (removed)   |
//! | 4 | `collections.abc.`               | (removed)   |
//! | 5 | `module.ClassName`               | `ClassName` |
//! | 6 | `<class 'word'>`                 | `word`      |
//! | 7 | `<class 'word.word'>`            | `word.word` |
//!
//! Rule 5 leaves a dotted name alone when it is the entire body of a
//! `<class '...'>` wrapper, so rule 7 unwraps `<class 'pkg.Widget'>` to
//! `pkg.Widget` with its dot intact, while rule 6 fully unwraps one-segment
//! wrappers.

#ifndef SIGDOC_ANNOTATION_PATTERN_CLEANER_HPP
#define SIGDOC_ANNOTATION_PATTERN_CLEANER_HPP

#include <string>
#include <string_view>

namespace sigdoc::annotation {

/// Applies the substitution rules in order. Never fails; returns the input
/// unchanged when no rule matches.
[[nodiscard]] auto clean_pattern(std::string_view annotation) -> std::string;

} // namespace sigdoc::annotation

#endif // SIGDOC_ANNOTATION_PATTERN_CLEANER_HPP
