//! # Annotation AST Factories
//!
//! These functions wrap node construction in `Box<Node>`. Composite nodes
//! take their offset from their leftmost child.

#include "annotation/ast.hpp"

#include <algorithm>
#include <type_traits>

namespace sigdoc::annotation {

auto make_name(std::string identifier, size_t offset) -> NodePtr {
    return make_box<Node>(Node{.kind = NameRef{.identifier = std::move(identifier)}, .offset = offset});
}

auto make_qualified(std::vector<std::string> chain, size_t offset) -> NodePtr {
    return make_box<Node>(Node{.kind = QualifiedRef{.chain = std::move(chain)}, .offset = offset});
}

auto make_subscript(NodePtr base, std::vector<NodePtr> args) -> NodePtr {
    size_t offset = base->offset;
    return make_box<Node>(
        Node{.kind = Subscript{.base = std::move(base), .args = std::move(args)}, .offset = offset});
}

auto make_literal(std::string text, size_t offset) -> NodePtr {
    return make_box<Node>(Node{.kind = Literal{.text = std::move(text)}, .offset = offset});
}

auto make_union(NodePtr left, NodePtr right) -> NodePtr {
    size_t offset = left->offset;
    return make_box<Node>(
        Node{.kind = UnionOp{.left = std::move(left), .right = std::move(right)}, .offset = offset});
}

auto depth(const Node& node) -> size_t {
    return std::visit(
        [](const auto& n) -> size_t {
            using T = std::decay_t<decltype(n)>;

            if constexpr (std::is_same_v<T, Subscript>) {
                size_t deepest = depth(*n.base);
                for (const auto& arg : n.args) {
                    deepest = std::max(deepest, depth(*arg));
                }
                return deepest + 1;
            } else if constexpr (std::is_same_v<T, UnionOp>) {
                return std::max(depth(*n.left), depth(*n.right)) + 1;
            } else {
                return 1;
            }
        },
        node.kind);
}

} // namespace sigdoc::annotation
