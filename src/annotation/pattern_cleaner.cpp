//! # Pattern-Based Annotation Cleaning Implementation
//!
//! Each rule is a single left-to-right scan over the text, replacing
//! non-overlapping matches the way a global regex replace would. The scans
//! never recurse, so input length is bounded only by memory.

#include "annotation/pattern_cleaner.hpp"

#include <array>
#include <cctype>

namespace sigdoc::annotation {

namespace {

constexpr std::string_view REPR_OPEN = "<class '";
constexpr std::string_view REPR_CLOSE = "'>";

constexpr std::array<std::string_view, 4> REMOVED_PREFIXES = {
    "typing.",
    "__main__.",
    "builtins.",
    "collections.abc.",
};

auto is_word_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto is_word_start(char c) -> bool {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto is_upper(char c) -> bool {
    return c >= 'A' && c <= 'Z';
}

/// End of the run of word characters starting at `pos`.
auto word_end(std::string_view text, size_t pos) -> size_t {
    while (pos < text.size() && is_word_char(text[pos])) {
        ++pos;
    }
    return pos;
}

/// True if [begin, end) of `text` is exactly the body of a `<class '...'>` wrapper.
auto is_repr_body(std::string_view text, size_t begin, size_t end) -> bool {
    return begin >= REPR_OPEN.size() &&
           text.substr(begin - REPR_OPEN.size(), REPR_OPEN.size()) == REPR_OPEN &&
           text.substr(end, REPR_CLOSE.size()) == REPR_CLOSE;
}

// Rules 1-4
auto remove_prefix(std::string_view text, std::string_view prefix) -> std::string {
    std::string result;
    result.reserve(text.size());
    size_t pos = 0;
    while (true) {
        size_t hit = text.find(prefix, pos);
        if (hit == std::string_view::npos) {
            break;
        }
        result.append(text, pos, hit - pos);
        pos = hit + prefix.size();
    }
    result.append(text.substr(pos));
    return result;
}

// Rule 5: `module.ClassName` -> `ClassName`. The module part starts at the
// first letter or underscore of its word, so leading digits stay behind.
auto collapse_module_prefix(std::string_view text) -> std::string {
    std::string result;
    result.reserve(text.size());
    size_t pos = 0;

    while (pos < text.size()) {
        if (!is_word_start(text[pos])) {
            result += text[pos++];
            continue;
        }

        size_t dot = word_end(text, pos);
        bool matched = dot + 1 < text.size() && text[dot] == '.' && is_upper(text[dot + 1]);
        if (!matched) {
            result.append(text, pos, dot - pos);
            pos = dot;
            continue;
        }

        size_t end = word_end(text, dot + 1);
        if (is_repr_body(text, pos, end)) {
            result.append(text, pos, end - pos);
        } else {
            result.append(text, dot + 1, end - dot - 1);
        }
        pos = end;
    }
    return result;
}

// Rules 6 and 7: `<class 'word'>` and `<class 'word.word'>` -> the body.
auto unwrap_repr(std::string_view text, bool dotted) -> std::string {
    std::string result;
    result.reserve(text.size());
    size_t pos = 0;

    while (true) {
        size_t open = text.find(REPR_OPEN, pos);
        if (open == std::string_view::npos) {
            break;
        }

        size_t body = open + REPR_OPEN.size();
        size_t end = word_end(text, body);
        bool matched = end > body;
        if (matched && dotted) {
            matched = end < text.size() && text[end] == '.';
            size_t second = end + 1;
            end = matched ? word_end(text, second) : end;
            matched = matched && end > second;
        }
        matched = matched && text.substr(end, REPR_CLOSE.size()) == REPR_CLOSE;

        if (!matched) {
            result.append(text, pos, open + 1 - pos);
            pos = open + 1;
            continue;
        }
        result.append(text, pos, open - pos);
        result.append(text, body, end - body);
        pos = end + REPR_CLOSE.size();
    }

    result.append(text.substr(pos));
    return result;
}

} // namespace

auto clean_pattern(std::string_view annotation) -> std::string {
    std::string cleaned(annotation);
    for (auto prefix : REMOVED_PREFIXES) {
        cleaned = remove_prefix(cleaned, prefix);
    }
    cleaned = collapse_module_prefix(cleaned);
    cleaned = unwrap_repr(cleaned, false);
    cleaned = unwrap_repr(cleaned, true);
    return cleaned;
}

} // namespace sigdoc::annotation
