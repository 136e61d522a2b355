//! # Annotation Lexer Implementation
//!
//! | Input        | Token kind                          |
//! |--------------|-------------------------------------|
//! | `Dict`, `_T` | `Identifier`                        |
//! | `None`       | `NoneLiteral`                       |
//! | `True`       | `BoolLiteral`                       |
//! | `42`, `0x1F` | `IntLiteral`                        |
//! | `1.5`, `1e3` | `FloatLiteral`                      |
//! | `'a'`, `"b"` | `StringLiteral`                     |
//! | `...`        | `Ellipsis`                          |
//! | `. , [ ] ( ) |` | punctuation                      |

#include "annotation/lexer.hpp"

#include <cctype>
#include <unordered_map>

namespace sigdoc::annotation {

namespace {

// Identifiers that denote constants rather than names
const std::unordered_map<std::string_view, TokenKind> SINGLETONS = {
    {"None", TokenKind::NoneLiteral},
    {"True", TokenKind::BoolLiteral},
    {"False", TokenKind::BoolLiteral},
};

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

auto is_hex_digit(char c) -> bool {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Eof:
        return "end of input";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::IntLiteral:
        return "integer literal";
    case TokenKind::FloatLiteral:
        return "float literal";
    case TokenKind::StringLiteral:
        return "string literal";
    case TokenKind::NoneLiteral:
        return "'None'";
    case TokenKind::BoolLiteral:
        return "boolean literal";
    case TokenKind::Ellipsis:
        return "'...'";
    case TokenKind::Dot:
        return "'.'";
    case TokenKind::Comma:
        return "','";
    case TokenKind::LBracket:
        return "'['";
    case TokenKind::RBracket:
        return "']'";
    case TokenKind::LParen:
        return "'('";
    case TokenKind::RParen:
        return "')'";
    case TokenKind::Pipe:
        return "'|'";
    case TokenKind::Error:
        return "invalid character";
    }
    return "unknown token";
}

Lexer::Lexer(std::string_view source) : source_(source) {}

auto Lexer::peek() const -> char {
    return pos_ < source_.size() ? source_[pos_] : '\0';
}

auto Lexer::peek_next() const -> char {
    return pos_ + 1 < source_.size() ? source_[pos_ + 1] : '\0';
}

auto Lexer::advance() -> char {
    return pos_ < source_.size() ? source_[pos_++] : '\0';
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.size();
}

auto Lexer::make_token(TokenKind kind) const -> Token {
    return Token{
        .kind = kind, .lexeme = source_.substr(token_start_, pos_ - token_start_), .offset = token_start_};
}

auto Lexer::make_error_token(const std::string& message) -> Token {
    if (!error_) {
        error_ = message;
    }
    return make_token(TokenKind::Error);
}

void Lexer::skip_whitespace() {
    while (!is_at_end()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
            advance();
        } else {
            break;
        }
    }
}

auto Lexer::is_identifier_start(char c) -> bool {
    auto u = static_cast<unsigned char>(c);
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || u >= 0x80;
}

auto Lexer::is_identifier_continue(char c) -> bool {
    return is_identifier_start(c) || is_digit(c);
}

auto Lexer::next_token() -> Token {
    skip_whitespace();
    token_start_ = pos_;

    if (is_at_end()) {
        return make_token(TokenKind::Eof);
    }

    char c = peek();
    if (is_identifier_start(c)) {
        return lex_identifier();
    }
    if (is_digit(c) || (c == '.' && is_digit(peek_next()))) {
        return lex_number();
    }
    if (c == '\'' || c == '"') {
        advance();
        return lex_string(c);
    }
    return lex_punct();
}

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;
    while (true) {
        Token token = next_token();
        tokens.push_back(token);
        if (token.is_eof() || token.is(TokenKind::Error)) {
            break;
        }
    }
    return tokens;
}

auto Lexer::lex_identifier() -> Token {
    while (!is_at_end() && is_identifier_continue(peek())) {
        advance();
    }
    auto text = source_.substr(token_start_, pos_ - token_start_);
    if (auto it = SINGLETONS.find(text); it != SINGLETONS.end()) {
        return make_token(it->second);
    }
    return make_token(TokenKind::Identifier);
}

auto Lexer::lex_number() -> Token {
    // Prefixed integers: 0x1F, 0o17, 0b101
    if (peek() == '0' && (peek_next() == 'x' || peek_next() == 'X' || peek_next() == 'o' ||
                          peek_next() == 'O' || peek_next() == 'b' || peek_next() == 'B')) {
        char base = static_cast<char>(std::tolower(static_cast<unsigned char>(peek_next())));
        advance();
        advance();
        size_t digits = 0;
        while (!is_at_end()) {
            char d = peek();
            bool ok = d == '_' || (base == 'x' && is_hex_digit(d)) ||
                      (base == 'o' && d >= '0' && d <= '7') || (base == 'b' && (d == '0' || d == '1'));
            if (!ok) {
                break;
            }
            if (d != '_') {
                ++digits;
            }
            advance();
        }
        if (digits == 0) {
            return make_error_token("missing digits after integer prefix");
        }
        if (!is_at_end() && is_identifier_continue(peek())) {
            return make_error_token("invalid digit in integer literal");
        }
        return make_token(TokenKind::IntLiteral);
    }

    bool is_float = false;
    while (is_digit(peek()) || peek() == '_') {
        advance();
    }
    if (peek() == '.' && is_digit(peek_next())) {
        is_float = true;
        advance();
        while (is_digit(peek()) || peek() == '_') {
            advance();
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        size_t save = pos_;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (is_digit(peek())) {
            is_float = true;
            while (is_digit(peek()) || peek() == '_') {
                advance();
            }
        } else {
            pos_ = save;
        }
    }
    if (!is_at_end() && is_identifier_continue(peek())) {
        return make_error_token("invalid character in number literal");
    }
    return make_token(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral);
}

auto Lexer::lex_string(char quote) -> Token {
    while (!is_at_end()) {
        char c = advance();
        if (c == '\\') {
            if (is_at_end()) {
                break;
            }
            advance();
        } else if (c == quote) {
            return make_token(TokenKind::StringLiteral);
        } else if (c == '\n') {
            return make_error_token("newline in string literal");
        }
    }
    return make_error_token("unterminated string literal");
}

auto Lexer::lex_punct() -> Token {
    char c = advance();
    switch (c) {
    case '.':
        if (peek() == '.' && peek_next() == '.') {
            advance();
            advance();
            return make_token(TokenKind::Ellipsis);
        }
        return make_token(TokenKind::Dot);
    case ',':
        return make_token(TokenKind::Comma);
    case '[':
        return make_token(TokenKind::LBracket);
    case ']':
        return make_token(TokenKind::RBracket);
    case '(':
        return make_token(TokenKind::LParen);
    case ')':
        return make_token(TokenKind::RParen);
    case '|':
        return make_token(TokenKind::Pipe);
    default:
        return make_error_token(std::string("unexpected character '") + c + "'");
    }
}

} // namespace sigdoc::annotation
