//! # Canonical Annotation Rendering Implementation

#include "annotation/renderer.hpp"

#include <type_traits>

namespace sigdoc::annotation {

namespace {

/// The final segment of a name or dotted chain, or empty for other kinds.
auto terminal_name(const Node& node) -> std::string_view {
    if (node.is<NameRef>()) {
        return node.as<NameRef>().identifier;
    }
    if (node.is<QualifiedRef>()) {
        const auto& chain = node.as<QualifiedRef>().chain;
        return chain.empty() ? std::string_view{} : std::string_view(chain.back());
    }
    return {};
}

/// True if the canonical spelling of `node` is a top-level `a | b` chain.
auto renders_as_union(const Node& node) -> bool {
    if (node.is<UnionOp>()) {
        return true;
    }
    if (node.is<Subscript>() && is_union_subscript(node.as<Subscript>())) {
        const auto& args = node.as<Subscript>().args;
        return args.size() > 1 || renders_as_union(*args.front());
    }
    return false;
}

template <typename> constexpr bool always_false = false;

} // namespace

auto is_union_subscript(const Subscript& subscript) -> bool {
    return !subscript.args.empty() && terminal_name(*subscript.base) == "Union";
}

auto render(const Node& node) -> std::string {
    return std::visit(
        [](const auto& n) -> std::string {
            using T = std::decay_t<decltype(n)>;

            if constexpr (std::is_same_v<T, NameRef>) {
                return n.identifier;
            } else if constexpr (std::is_same_v<T, QualifiedRef>) {
                return n.chain.back();
            } else if constexpr (std::is_same_v<T, Subscript>) {
                std::string result;
                if (is_union_subscript(n)) {
                    for (size_t i = 0; i < n.args.size(); ++i) {
                        if (i > 0) {
                            result += UNION_SEPARATOR;
                        }
                        result += render(*n.args[i]);
                    }
                    return result;
                }

                if (renders_as_union(*n.base)) {
                    result += "(";
                    result += render(*n.base);
                    result += ")";
                } else {
                    result += render(*n.base);
                }
                result += "[";
                for (size_t i = 0; i < n.args.size(); ++i) {
                    if (i > 0) {
                        result += ", ";
                    }
                    result += render(*n.args[i]);
                }
                result += "]";
                return result;
            } else if constexpr (std::is_same_v<T, Literal>) {
                return n.text;
            } else if constexpr (std::is_same_v<T, UnionOp>) {
                std::string result = render(*n.left);
                result += UNION_SEPARATOR;
                result += render(*n.right);
                return result;
            } else {
                static_assert(always_false<T>, "unhandled annotation node kind");
            }
        },
        node.kind);
}

} // namespace sigdoc::annotation
