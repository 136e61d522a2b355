//! # Annotation Token Definitions
//!
//! This module defines the tokens produced by the annotation lexer.
//!
//! Annotation strings are the textual form of a type hint as produced by a
//! runtime or a tool, for example `typing.Optional[builtins.str]` or
//! `dict[str, list[int]] | None`. The token set is deliberately small: only
//! what the four grammar constructs (names, dotted chains, subscripts and
//! `|` unions) and literal constants need. Everything else becomes an
//! `Error` token, which makes the parse fail and the caller fall back.

#ifndef SIGDOC_ANNOTATION_TOKEN_HPP
#define SIGDOC_ANNOTATION_TOKEN_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace sigdoc::annotation {

/// All token kinds of the annotation expression language.
enum class TokenKind : uint8_t {
    Eof, ///< End of input

    // ========================================================================
    // Names and Literals
    // ========================================================================
    Identifier,    ///< `int`, `typing`, `MyClass`, `_T`
    IntLiteral,    ///< `3`, `0x1F`, `1_000`
    FloatLiteral,  ///< `1.5`, `2e10`
    StringLiteral, ///< `'a'`, `"b"` (quotes included in the lexeme)
    NoneLiteral,   ///< `None`
    BoolLiteral,   ///< `True`, `False`
    Ellipsis,      ///< `...`

    // ========================================================================
    // Punctuation
    // ========================================================================
    Dot,      ///< `.`
    Comma,    ///< `,`
    LBracket, ///< `[`
    RBracket, ///< `]`
    LParen,   ///< `(`
    RParen,   ///< `)`
    Pipe,     ///< `|`

    Error, ///< Any character outside the expression language
};

/// A lexical token. The lexeme views the lexed string, which must outlive it.
struct Token {
    TokenKind kind;          ///< Token category.
    std::string_view lexeme; ///< Source text of the token.
    size_t offset;           ///< Byte offset of the first character.

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    /// True for the kinds that become `Literal` nodes.
    [[nodiscard]] auto is_literal() const -> bool {
        return kind == TokenKind::IntLiteral || kind == TokenKind::FloatLiteral ||
               kind == TokenKind::StringLiteral || kind == TokenKind::NoneLiteral ||
               kind == TokenKind::BoolLiteral || kind == TokenKind::Ellipsis;
    }
};

/// Returns a short human-readable name for a token kind (for diagnostics).
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

} // namespace sigdoc::annotation

#endif // SIGDOC_ANNOTATION_TOKEN_HPP
