//! # Annotation Lexer
//!
//! Converts an annotation string into a token stream for the expression
//! parser.
//!
//! ## Features
//!
//! - **UTF-8 identifiers**: any byte >= 0x80 may appear in an identifier
//! - **Number literals**: decimal, `0x`/`0o`/`0b` prefixes, `_` separators,
//!   fractions and exponents
//! - **String literals**: single or double quoted, backslash escapes
//! - **Singletons**: `None`, `True`, `False` and `...`
//!
//! Whitespace, including newlines, is insignificant. A character outside the
//! expression language yields a `TokenKind::Error` token and lexing stops.
//!
//! ## Example
//!
//! ```cpp
//! Lexer lexer("typing.List[int]");
//! std::vector<Token> tokens = lexer.tokenize();
//! // Identifier Dot Identifier LBracket Identifier RBracket Eof
//! ```

#ifndef SIGDOC_ANNOTATION_LEXER_HPP
#define SIGDOC_ANNOTATION_LEXER_HPP

#include "annotation/token.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sigdoc::annotation {

/// Lexical analyzer for annotation strings.
class Lexer {
public:
    /// Constructs a lexer over `source`, which must outlive the lexer and its tokens.
    explicit Lexer(std::string_view source);

    /// Returns the next token. Returns `Eof` at the end of input.
    [[nodiscard]] auto next_token() -> Token;

    /// Tokenizes the entire input. The last token is `Eof`, or `Error` if an
    /// invalid character was found (nothing after it is lexed).
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

    /// Description of the first lexing error, if any.
    [[nodiscard]] auto error() const -> const std::optional<std::string>& {
        return error_;
    }

private:
    std::string_view source_;
    size_t pos_ = 0;
    size_t token_start_ = 0;
    std::optional<std::string> error_;

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_next() const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;

    [[nodiscard]] auto make_token(TokenKind kind) const -> Token;
    [[nodiscard]] auto make_error_token(const std::string& message) -> Token;

    void skip_whitespace();

    [[nodiscard]] auto lex_identifier() -> Token;
    [[nodiscard]] auto lex_number() -> Token;
    [[nodiscard]] auto lex_string(char quote) -> Token;
    [[nodiscard]] auto lex_punct() -> Token;

    [[nodiscard]] static auto is_identifier_start(char c) -> bool;
    [[nodiscard]] static auto is_identifier_continue(char c) -> bool;
};

} // namespace sigdoc::annotation

#endif // SIGDOC_ANNOTATION_LEXER_HPP
