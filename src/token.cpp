#include "token.hpp"

namespace lex {

const char* tokenTypeName(TokenType type) {
    switch (type) {
    case TokenType::End:
        return "END_OF_INPUT";
    case TokenType::Identifier:
        return "IDENTIFIER";
    case TokenType::Number:
        return "NUMBER";
    case TokenType::Plus:
        return "PLUS";
    case TokenType::Minus:
        return "MINUS";
    case TokenType::Star:
        return "STAR";
    case TokenType::Slash:
        return "SLASH";
    case TokenType::LParen:
        return "LPAREN";
    case TokenType::RParen:
        return "RPAREN";
    }
    return "UNKNOWN";
}

bool operator==(const Token& lhs, const Token& rhs) {
    return lhs.type == rhs.type
        && lhs.lexeme == rhs.lexeme
        && lhs.line == rhs.line
        && lhs.literal == rhs.literal;
}

bool operator!=(const Token& lhs, const Token& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const Token& token) {
    os << "Token{" << tokenTypeName(token.type) << ", \"" << token.lexeme << "\", line " << token.line;
    if (token.literal.has_value()) {
        os << ", literal " << token.literal.value();
    }
    return os << "}";
}

} // namespace lex
