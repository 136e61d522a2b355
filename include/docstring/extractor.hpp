//! # Parameter Description Extraction
//!
//! Maps each documented parameter of a docstring to its description. The
//! structured parser runs first with the requested style; if it rejects the
//! docstring, the manual extractor recovers what it can.
//!
//! ```cpp
//! auto params = extract_params(":param path: File to read.\n");
//! // params["path"] == "File to read."
//! ```

#ifndef SIGDOC_DOCSTRING_EXTRACTOR_HPP
#define SIGDOC_DOCSTRING_EXTRACTOR_HPP

#include "docstring/model.hpp"
#include "docstring/style.hpp"

#include <string_view>

namespace sigdoc::docstring {

/// Parameter name to trimmed description. Parameters without a description
/// are left out. An empty docstring yields an empty mapping. Never fails.
[[nodiscard]] auto extract_params(std::string_view docstring,
                                  DocstringStyle style = DocstringStyle::Auto)
    -> ParamDescriptions;

} // namespace sigdoc::docstring

#endif // SIGDOC_DOCSTRING_EXTRACTOR_HPP
