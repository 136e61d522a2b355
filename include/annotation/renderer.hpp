//! # Canonical Annotation Rendering
//!
//! Serializes an annotation AST back into its minimal, qualifier-free form.
//!
//! ## Rules
//!
//! - `NameRef` renders as the identifier.
//! - `QualifiedRef` keeps only its last segment: `outer.inner.T` -> `T`.
//! - `Subscript` renders as `base[a, b]`, except that a subscript whose base
//!   renders as `Union` is spelled as a flat union: `Union[a, b]` -> `a | b`.
//! - `Literal` renders as its source text.
//! - `UnionOp` renders as `left | right`.
//!
//! A union used as the base of a subscript is parenthesized so that the
//! output parses back to the same tree.

#ifndef SIGDOC_ANNOTATION_RENDERER_HPP
#define SIGDOC_ANNOTATION_RENDERER_HPP

#include "annotation/ast.hpp"

#include <string>
#include <string_view>

namespace sigdoc::annotation {

/// Separator placed between union members.
constexpr std::string_view UNION_SEPARATOR = " | ";

/// Renders `node` in canonical form. Never returns an empty string.
[[nodiscard]] auto render(const Node& node) -> std::string;

/// Returns true if `subscript` is a `Union[...]` application (qualified or
/// not) with at least one argument. A hand-built `Union[]` renders as written.
[[nodiscard]] auto is_union_subscript(const Subscript& subscript) -> bool;

} // namespace sigdoc::annotation

#endif // SIGDOC_ANNOTATION_RENDERER_HPP
