//! # Common Definitions
//!
//! Version string, the `Result` type that every fallible sigdoc operation
//! returns, and the `Box` owner used by the annotation tree. sigdoc does not
//! throw across module boundaries: a parser either yields its value or an
//! error struct describing where the input went wrong.

#ifndef SIGDOC_COMMON_HPP
#define SIGDOC_COMMON_HPP

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace sigdoc {

/// Reported by `sigdoc version` and `sigdoc --help`.
constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Result
// ============================================================================

/// Either a value or an error.
///
/// ```cpp
/// auto parsed = annotation::parse_expression("Dict[str, int]");
/// if (is_err(parsed)) {
///     return unwrap_err(parsed).message;
/// }
/// return annotation::render(*unwrap(parsed));
/// ```
///
/// `T` and `E` must be distinct types.
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// The value. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// The error. Throws `std::bad_variant_access` on a value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Ownership
// ============================================================================

/// Sole owner of a heap value; annotation nodes hold their children this way.
template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace sigdoc

#endif // SIGDOC_COMMON_HPP
