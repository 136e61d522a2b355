//! # Docstring Model
//!
//! Plain data produced by the docstring parsers.

#ifndef SIGDOC_DOCSTRING_MODEL_HPP
#define SIGDOC_DOCSTRING_MODEL_HPP

#include "docstring/style.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sigdoc::docstring {

/// Parameter name to trimmed description.
using ParamDescriptions = std::map<std::string, std::string>;

/// A documented parameter.
struct DocstringParam {
    std::string name;        ///< Parameter name as written (may include `*`).
    std::string type;        ///< Declared type, empty if none.
    std::string description; ///< Description text, continuation lines joined by '\n'.
    bool is_optional;        ///< Marked `optional` in its type.
};

/// The documented return value.
struct DocstringReturns {
    std::string type;
    std::string description;
};

/// A documented exception.
struct DocstringRaises {
    std::string type;
    std::string description;
};

/// Result of parsing a whole docstring.
struct ParsedDocstring {
    std::string summary;                    ///< First paragraph, lines joined by spaces.
    std::string description;                ///< Remaining prose.
    std::vector<DocstringParam> params;     ///< In source order.
    std::optional<DocstringReturns> returns;
    std::vector<DocstringRaises> raises;
    DocstringStyle style = DocstringStyle::Auto; ///< Convention that produced this result.

    /// Number of structured entries (params, returns, raises).
    [[nodiscard]] auto entry_count() const -> size_t {
        return params.size() + (returns ? 1 : 0) + raises.size();
    }
};

} // namespace sigdoc::docstring

#endif // SIGDOC_DOCSTRING_MODEL_HPP
