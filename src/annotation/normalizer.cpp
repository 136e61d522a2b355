//! # Annotation Normalizer Implementation

#include "annotation/normalizer.hpp"

#include "annotation/parser.hpp"
#include "annotation/pattern_cleaner.hpp"
#include "annotation/renderer.hpp"
#include "common/fallback.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace sigdoc::annotation {

namespace {

auto parse_and_render(std::string_view raw) -> Result<std::string, ParseError> {
    auto parsed = parse_expression(raw);
    if (is_err(parsed)) {
        return unwrap_err(parsed);
    }
    return render(*unwrap(parsed));
}

/// True for a whole-input `<class 'word.word'>` wrapper, whose dotted body
/// is kept as the cleaner produced it.
auto is_dotted_class_repr(std::string_view raw) -> bool {
    constexpr std::string_view open = "<class '";
    constexpr std::string_view close = "'>";
    if (raw.size() <= open.size() + close.size() || !raw.starts_with(open) ||
        !raw.ends_with(close)) {
        return false;
    }
    auto body = raw.substr(open.size(), raw.size() - open.size() - close.size());
    auto is_word = [](std::string_view word) {
        return !word.empty() && std::all_of(word.begin(), word.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
        });
    };
    auto dot = body.find('.');
    return dot != std::string_view::npos && is_word(body.substr(0, dot)) &&
           is_word(body.substr(dot + 1));
}

/// Pattern cleanup, then the structured path again when the cleaned text
/// parses, so a second `normalize` has nothing left to strip.
auto clean_and_reparse(std::string_view raw) -> std::string {
    auto cleaned = clean_pattern(raw);
    if (is_dotted_class_repr(raw)) {
        return cleaned;
    }
    auto reparsed = parse_and_render(cleaned);
    return is_ok(reparsed) ? std::move(unwrap(reparsed)) : cleaned;
}

} // namespace

auto normalize(std::string_view raw) -> std::string {
    if (raw.empty()) {
        return "";
    }

    return with_fallback([&] { return parse_and_render(raw); },
                         [&](const ParseError& err) {
                             SIGDOC_LOG_DEBUG("annotation", "falling back to pattern cleanup for '"
                                                                << raw << "': " << err.message
                                                                << " at offset " << err.offset);
                             return clean_and_reparse(raw);
                         });
}

auto normalize(std::string_view raw, std::string_view color) -> std::string {
    auto text = normalize(raw);
    if (color.empty()) {
        return text;
    }
    return format_with_color(text, color);
}

auto format_with_color(std::string_view text, std::string_view color) -> std::string {
    std::string result;
    result.reserve(text.size() + color.size() + 10);
    result += "<fg=";
    result += color;
    result += ">(";
    result += text;
    result += ")</>";
    return result;
}

} // namespace sigdoc::annotation
