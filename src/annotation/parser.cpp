//! # Annotation Parser Implementation
//!
//! `|` is the only binary operator and it is left-associative, so
//! `a | b | c` parses as `(a | b) | c`. Postfix `.name` and `[...]` bind
//! tighter than `|`. Parentheses only group and leave no node behind.

#include "annotation/parser.hpp"

#include "annotation/lexer.hpp"

namespace sigdoc::annotation {

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || !(tokens_.back().is_eof() || tokens_.back().is(TokenKind::Error))) {
        size_t end = tokens_.empty() ? 0 : tokens_.back().offset + tokens_.back().lexeme.size();
        tokens_.push_back(Token{.kind = TokenKind::Eof, .lexeme = {}, .offset = end});
    }
}

auto Parser::peek() const -> const Token& {
    return tokens_[pos_];
}

auto Parser::advance() -> const Token& {
    const Token& token = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) {
        ++pos_;
    }
    return token;
}

auto Parser::check(TokenKind kind) const -> bool {
    return peek().kind == kind;
}

auto Parser::match(TokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto Parser::error_here(const std::string& message) const -> ParseError {
    return ParseError{.message = message, .offset = peek().offset};
}

auto Parser::unexpected(std::string_view context) const -> ParseError {
    const Token& token = peek();
    std::string message = "unexpected ";
    message += token_kind_to_string(token.kind);
    if (!token.lexeme.empty() && !token.is_eof()) {
        message += " '";
        message += token.lexeme;
        message += "'";
    }
    message += " ";
    message += context;
    return error_here(message);
}

auto Parser::parse() -> Result<NodePtr, ParseError> {
    if (check(TokenKind::Eof)) {
        return error_here("empty annotation");
    }

    auto root = parse_union();
    if (is_err(root)) {
        return root;
    }

    if (!check(TokenKind::Eof)) {
        return unexpected("after end of expression");
    }
    return root;
}

auto Parser::parse_union() -> Result<NodePtr, ParseError> {
    if (++nesting_ > MAX_NESTING) {
        return error_here("annotation nested too deeply");
    }

    auto left = parse_postfix();
    if (is_err(left)) {
        return left;
    }

    NodePtr node = std::move(unwrap(left));
    while (check(TokenKind::Pipe)) {
        if (++union_operators_ > MAX_UNION_OPERATORS) {
            return error_here("too many '|' operators in annotation");
        }
        advance();
        auto right = parse_postfix();
        if (is_err(right)) {
            return right;
        }
        node = make_union(std::move(node), std::move(unwrap(right)));
    }

    --nesting_;
    return std::move(node);
}

auto Parser::parse_postfix() -> Result<NodePtr, ParseError> {
    auto primary = parse_primary();
    if (is_err(primary)) {
        return primary;
    }
    NodePtr node = std::move(unwrap(primary));

    while (true) {
        if (check(TokenKind::Dot)) {
            size_t offset = node->offset;
            if (node->is<NameRef>()) {
                advance();
                if (!check(TokenKind::Identifier)) {
                    return unexpected("after '.'");
                }
                std::vector<std::string> chain;
                chain.push_back(node->as<NameRef>().identifier);
                chain.emplace_back(advance().lexeme);
                node = make_qualified(std::move(chain), offset);
            } else if (node->is<QualifiedRef>()) {
                advance();
                if (!check(TokenKind::Identifier)) {
                    return unexpected("after '.'");
                }
                auto chain = node->as<QualifiedRef>().chain;
                chain.emplace_back(advance().lexeme);
                node = make_qualified(std::move(chain), offset);
            } else {
                return error_here("attribute access is only supported on names");
            }
        } else if (check(TokenKind::LBracket)) {
            if (node->is<Literal>()) {
                return error_here("a constant cannot be subscripted");
            }
            advance();
            auto args = parse_args();
            if (is_err(args)) {
                return unwrap_err(args);
            }
            if (!match(TokenKind::RBracket)) {
                return unexpected("in subscript, expected ']'");
            }
            node = make_subscript(std::move(node), std::move(unwrap(args)));
        } else {
            return std::move(node);
        }
    }
}

auto Parser::parse_primary() -> Result<NodePtr, ParseError> {
    const Token& token = peek();

    if (token.is(TokenKind::Identifier)) {
        advance();
        return make_name(std::string(token.lexeme), token.offset);
    }

    if (token.is_literal()) {
        advance();
        return make_literal(std::string(token.lexeme), token.offset);
    }

    if (token.is(TokenKind::LParen)) {
        advance();
        if (check(TokenKind::RParen)) {
            return error_here("empty tuple is not a type expression");
        }
        auto inner = parse_union();
        if (is_err(inner)) {
            return inner;
        }
        if (!match(TokenKind::RParen)) {
            return unexpected("in parenthesized expression, expected ')'");
        }
        return inner;
    }

    return unexpected("at start of expression");
}

auto Parser::parse_args() -> Result<std::vector<NodePtr>, ParseError> {
    std::vector<NodePtr> args;

    if (check(TokenKind::RBracket)) {
        return error_here("subscript needs at least one argument");
    }

    while (true) {
        auto arg = parse_union();
        if (is_err(arg)) {
            return unwrap_err(arg);
        }
        args.push_back(std::move(unwrap(arg)));

        if (!match(TokenKind::Comma)) {
            break;
        }
        // Trailing comma: `Tuple[int,]`
        if (check(TokenKind::RBracket)) {
            break;
        }
    }

    return std::move(args);
}

auto parse_expression(std::string_view source) -> Result<NodePtr, ParseError> {
    Lexer lexer(source);
    auto tokens = lexer.tokenize();
    if (lexer.error()) {
        const Token& bad = tokens.back();
        return ParseError{.message = *lexer.error(), .offset = bad.offset};
    }
    Parser parser(std::move(tokens));
    return parser.parse();
}

} // namespace sigdoc::annotation
