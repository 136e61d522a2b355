#include "docstring/extractor.hpp"

#include "common/fallback.hpp"
#include "docstring/doc_parser.hpp"
#include "docstring/manual_extractor.hpp"
#include "docstring/text.hpp"
#include "log/log.hpp"

namespace sigdoc::docstring {

namespace {

auto structured_params(std::string_view docstring, DocstringStyle style)
    -> Result<ParamDescriptions, DocstringError> {
    auto parsed = parse_docstring(docstring, style);
    if (is_err(parsed)) {
        return unwrap_err(parsed);
    }

    ParamDescriptions params;
    for (const auto& param : unwrap(parsed).params) {
        auto description = trim(param.description);
        if (!description.empty()) {
            params[param.name] = std::move(description);
        }
    }
    return std::move(params);
}

} // namespace

auto extract_params(std::string_view docstring, DocstringStyle style) -> ParamDescriptions {
    if (docstring.empty()) {
        return {};
    }

    return with_fallback([&] { return structured_params(docstring, style); },
                         [&](const DocstringError& err) {
                             SIGDOC_LOG_DEBUG("docstring", style_name(style)
                                                               << " parse failed at line "
                                                               << err.line << ": " << err.message
                                                               << "; using manual extraction");
                             return extract_params_manual(docstring);
                         });
}

} // namespace sigdoc::docstring
