//! # Annotation Parser
//!
//! Recursive-descent parser for annotation strings.
//!
//! ## Grammar
//!
//! ```text
//! expr    := union EOF
//! union   := postfix ( '|' postfix )*
//! postfix := primary ( '.' IDENT | '[' args ']' )*
//! primary := IDENT | literal | '(' union ')'
//! args    := union ( ',' union )* ','?
//! ```
//!
//! Attribute access is only accepted on names and dotted chains, and literals
//! cannot be subscripted. Anything else (calls, keyword arguments, other
//! operators, tuples, list displays, several expressions) is rejected with a
//! `ParseError`; the parser never produces a partial tree.

#ifndef SIGDOC_ANNOTATION_PARSER_HPP
#define SIGDOC_ANNOTATION_PARSER_HPP

#include "annotation/ast.hpp"
#include "annotation/token.hpp"
#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sigdoc::annotation {

/// Maximum nesting of brackets and parentheses accepted by the parser.
constexpr size_t MAX_NESTING = 256;

/// Maximum number of `|` operators in one annotation. Union chains nest on
/// the left, so this bounds the tree depth together with `MAX_NESTING`.
constexpr size_t MAX_UNION_OPERATORS = 1024;

/// Why an annotation string could not be parsed.
struct ParseError {
    std::string message; ///< Human-readable description.
    size_t offset;       ///< Byte offset in the input where parsing stopped.
};

/// Parser over a token stream produced by `Lexer::tokenize()`.
class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    /// Parses the whole token stream as one expression.
    [[nodiscard]] auto parse() -> Result<NodePtr, ParseError>;

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    size_t nesting_ = 0;
    size_t union_operators_ = 0;

    [[nodiscard]] auto peek() const -> const Token&;
    auto advance() -> const Token&;
    [[nodiscard]] auto check(TokenKind kind) const -> bool;
    auto match(TokenKind kind) -> bool;
    [[nodiscard]] auto error_here(const std::string& message) const -> ParseError;
    [[nodiscard]] auto unexpected(std::string_view context) const -> ParseError;

    auto parse_union() -> Result<NodePtr, ParseError>;
    auto parse_postfix() -> Result<NodePtr, ParseError>;
    auto parse_primary() -> Result<NodePtr, ParseError>;
    auto parse_args() -> Result<std::vector<NodePtr>, ParseError>;
};

/// Lexes and parses `source` as a single annotation expression.
[[nodiscard]] auto parse_expression(std::string_view source) -> Result<NodePtr, ParseError>;

} // namespace sigdoc::annotation

#endif // SIGDOC_ANNOTATION_PARSER_HPP
