#include "docstring/style.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace sigdoc::docstring {

namespace {

constexpr std::array<std::pair<std::string_view, DocstringStyle>, 5> STYLE_NAMES = {{
    {"google", DocstringStyle::Google},
    {"numpy", DocstringStyle::Numpy},
    {"sphinx", DocstringStyle::Sphinx},
    {"epydoc", DocstringStyle::Epydoc},
    {"auto", DocstringStyle::Auto},
}};

auto equals_ignore_case(std::string_view a, std::string_view b) -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

auto parse_style(std::string_view name) -> std::optional<DocstringStyle> {
    for (const auto& [text, style] : STYLE_NAMES) {
        if (equals_ignore_case(name, text)) {
            return style;
        }
    }
    return std::nullopt;
}

auto style_name(DocstringStyle style) -> std::string_view {
    for (const auto& [text, value] : STYLE_NAMES) {
        if (value == style) {
            return text;
        }
    }
    return "auto";
}

} // namespace sigdoc::docstring
