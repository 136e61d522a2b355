//! # Annotation AST
//!
//! The tree produced by the annotation parser. The node set is closed: a
//! `Node` holds exactly one of five kinds, and every consumer matches on all
//! of them with `std::visit`.
//!
//! | Kind           | Example source           | Canonical form     |
//! |----------------|--------------------------|--------------------|
//! | `NameRef`      | `int`                    | `int`              |
//! | `QualifiedRef` | `collections.abc.Vector` | `Vector`           |
//! | `Subscript`    | `Dict[str, int]`         | `Dict[str, int]`   |
//! | `Literal`      | `'r'`, `3`, `None`       | source text        |
//! | `UnionOp`      | `int | None`             | `int | None`       |
//!
//! Nodes are never modified after the parser builds them.

#ifndef SIGDOC_ANNOTATION_AST_HPP
#define SIGDOC_ANNOTATION_AST_HPP

#include "common.hpp"

#include <string>
#include <variant>
#include <vector>

namespace sigdoc::annotation {

struct Node;

/// Owning pointer to an AST node.
using NodePtr = Box<Node>;

/// A bare identifier such as `int` or `MyClass`.
struct NameRef {
    std::string identifier;
};

/// A dotted attribute chain such as `typing.List` (at least two segments).
struct QualifiedRef {
    std::vector<std::string> chain;
};

/// A generic application `base[arg, ...]`. Argument order is preserved.
struct Subscript {
    NodePtr base;
    std::vector<NodePtr> args;
};

/// A constant: number, quoted string, `None`, `True`, `False` or `...`.
/// `text` is the exact source spelling, quotes included.
struct Literal {
    std::string text;
};

/// A binary `left | right` union. Chains nest on the left.
struct UnionOp {
    NodePtr left;
    NodePtr right;
};

/// An annotation expression node.
struct Node {
    std::variant<NameRef, QualifiedRef, Subscript, Literal, UnionOp> kind; ///< The node variant.
    size_t offset = 0; ///< Byte offset of the node's first token.

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Gets this node as kind `T`. Throws `std::bad_variant_access` if wrong kind.
    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

// ============================================================================
// Node Factories
// ============================================================================

[[nodiscard]] auto make_name(std::string identifier, size_t offset = 0) -> NodePtr;
[[nodiscard]] auto make_qualified(std::vector<std::string> chain, size_t offset = 0) -> NodePtr;
[[nodiscard]] auto make_subscript(NodePtr base, std::vector<NodePtr> args) -> NodePtr;
[[nodiscard]] auto make_literal(std::string text, size_t offset = 0) -> NodePtr;
[[nodiscard]] auto make_union(NodePtr left, NodePtr right) -> NodePtr;

/// Returns the depth of the tree rooted at `node` (a leaf has depth 1).
[[nodiscard]] auto depth(const Node& node) -> size_t;

} // namespace sigdoc::annotation

#endif // SIGDOC_ANNOTATION_AST_HPP
