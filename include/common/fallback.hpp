//! # Primary/Fallback Combinator
//!
//! Both the annotation normalizer and the docstring extractor follow the
//! same shape: run a structured strategy that may fail with an error value,
//! and recover with a best-effort strategy when it does. `with_fallback`
//! is the single place where that failure is absorbed.
//!
//! ```cpp
//! auto text = with_fallback(
//!     [&] { return try_structured(input); },
//!     [&](const ParseError& err) { return best_effort(input); });
//! ```

#ifndef SIGDOC_COMMON_FALLBACK_HPP
#define SIGDOC_COMMON_FALLBACK_HPP

#include "common.hpp"

#include <type_traits>
#include <utility>

namespace sigdoc {

/// Runs `primary` and returns its success value, or `fallback(error)`.
///
/// `primary` must return a `Result<T, E>`; `fallback` is invoked with the
/// error by const reference and must return something convertible to `T`.
template <typename Primary, typename Fallback>
[[nodiscard]] auto with_fallback(Primary&& primary, Fallback&& fallback) {
    auto result = std::forward<Primary>(primary)();
    using ResultT = std::decay_t<decltype(result)>;
    using T = std::variant_alternative_t<0, ResultT>;
    using E = std::variant_alternative_t<1, ResultT>;

    if (is_ok<T, E>(result)) {
        return T(std::move(unwrap<T, E>(result)));
    }
    return T(std::forward<Fallback>(fallback)(unwrap_err<T, E>(std::as_const(result))));
}

} // namespace sigdoc

#endif // SIGDOC_COMMON_FALLBACK_HPP
