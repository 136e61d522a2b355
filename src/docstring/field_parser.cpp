//! # Field-List Docstrings (Sphinx and Epydoc)
//!
//! Both conventions mark structured entries with a leading tag character
//! and close the tag with a colon:
//!
//! ```text
//! :param str path: File to read.          @param path: File to read.
//! :type mode: str                         @type mode: str
//! :returns: The file contents.            @return: The file contents.
//! :rtype: bytes                           @rtype: bytes
//! :raises IOError: If unreadable.         @raise IOError: If unreadable.
//! ```
//!
//! A field continues over the following non-blank lines that do not start a
//! new field. A blank line ends it.

#include "docstring/doc_parser.hpp"
#include "docstring/text.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <map>
#include <optional>
#include <sstream>
#include <utility>

namespace sigdoc::docstring {

namespace {

struct Field {
    std::vector<std::string> words; ///< Tag words, the first one lowercased.
    std::string body;
    size_t line;
};

/// True if `line` starts a field for the given tag character.
auto starts_field(const std::string& line, char marker) -> bool {
    auto text = trim(line);
    return text.size() > 1 && text[0] == marker &&
           std::isalpha(static_cast<unsigned char>(text[1]));
}

auto split_words(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> words;
    std::istringstream stream{std::string(text)};
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

auto join_words(const std::vector<std::string>& words, size_t from, size_t to) -> std::string {
    std::string text;
    for (size_t i = from; i < to; ++i) {
        if (!text.empty()) {
            text += " ";
        }
        text += words[i];
    }
    return text;
}

auto is_one_of(const std::string& key, std::initializer_list<std::string_view> names) -> bool {
    return std::find(names.begin(), names.end(), key) != names.end();
}

/// Splits the docstring into prose lines and fields.
auto collect_fields(const std::vector<std::string>& lines, char marker,
                    std::vector<std::string>& prose) -> Result<std::vector<Field>, DocstringError> {
    std::vector<Field> fields;
    bool in_field = false;

    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];

        if (starts_field(line, marker)) {
            auto text = trim(line);
            auto close = text.find(':', 1);
            if (close == std::string::npos) {
                return DocstringError{.message = "field '" + text + "' is missing a closing ':'",
                                      .line = i + 1};
            }

            Field field{.words = split_words(std::string_view(text).substr(1, close - 1)),
                        .body = trim(std::string_view(text).substr(close + 1)),
                        .line = i + 1};
            auto& key = field.words.front();
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            fields.push_back(std::move(field));
            in_field = true;
        } else if (is_blank(line)) {
            in_field = false;
            prose.push_back(line);
        } else if (in_field) {
            auto& body = fields.back().body;
            if (!body.empty()) {
                body += "\n";
            }
            body += trim(line);
        } else {
            prose.push_back(line);
        }
    }

    return std::move(fields);
}

auto parse_fields(const std::vector<std::string>& lines, char marker, DocstringStyle style)
    -> DocstringResult {
    ParsedDocstring result;
    result.style = style;
    std::vector<std::string> prose;

    auto collected = collect_fields(lines, marker, prose);
    if (is_err(collected)) {
        return unwrap_err(collected);
    }

    std::map<std::string, std::string> declared_types;
    std::optional<std::string> return_type;

    for (auto& field : unwrap(collected)) {
        const auto& words = field.words;
        const auto& key = words.front();

        if (is_one_of(key, {"param", "parameter", "arg", "argument", "key", "keyword"})) {
            if (words.size() < 2) {
                return DocstringError{.message = "parameter field without a name",
                                      .line = field.line};
            }
            DocstringParam param{.name = words.back(),
                                 .type = join_words(words, 1, words.size() - 1),
                                 .description = std::move(field.body),
                                 .is_optional = false};
            param.is_optional = strip_optional(param.type);
            result.params.push_back(std::move(param));
        } else if (is_one_of(key, {"type"})) {
            if (words.size() >= 2) {
                declared_types[words[1]] = field.body;
            }
        } else if (is_one_of(key, {"returns", "return"})) {
            result.returns = DocstringReturns{.type = "", .description = std::move(field.body)};
        } else if (is_one_of(key, {"rtype"})) {
            return_type = field.body;
        } else if (is_one_of(key, {"raises", "raise", "except", "exception"})) {
            result.raises.push_back(DocstringRaises{.type = join_words(words, 1, words.size()),
                                                    .description = std::move(field.body)});
        }
    }

    for (auto& param : result.params) {
        auto it = declared_types.find(param.name);
        if (param.type.empty() && it != declared_types.end()) {
            param.type = it->second;
            param.is_optional = strip_optional(param.type) || param.is_optional;
        }
    }

    if (return_type) {
        if (!result.returns) {
            result.returns = DocstringReturns{.type = "", .description = ""};
        }
        result.returns->type = *return_type;
    }

    auto text = split_prose(prose);
    result.summary = std::move(text.summary);
    result.description = std::move(text.description);
    return std::move(result);
}

} // namespace

auto parse_sphinx(const std::vector<std::string>& lines) -> DocstringResult {
    return parse_fields(lines, ':', DocstringStyle::Sphinx);
}

auto parse_epydoc(const std::vector<std::string>& lines) -> DocstringResult {
    return parse_fields(lines, '@', DocstringStyle::Epydoc);
}

} // namespace sigdoc::docstring
