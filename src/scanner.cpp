#include "scanner.hpp"

#include <cctype>
#include <utility>

namespace lex {

namespace {

bool isLetter(char ch) {
    return std::isalpha(static_cast<unsigned char>(ch)) != 0;
}

bool isDigit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

} // namespace

Scanner::Scanner(std::string sourceText) : source(std::move(sourceText)) {}

// Один шаг сканирования: пропуск пробелов, затем распознавание токена
Token Scanner::nextToken() {
    if (exhausted) {
        return makeEnd();
    }

    skipWhitespace();
    if (isAtEnd()) {
        return makeEnd();
    }

    start = current;
    char ch = advance();

    if (isLetter(ch)) {
        return makeIdentifier();
    }
    if (isDigit(ch)) {
        return makeNumber();
    }

    switch (ch) {
    // Односимвольные токены
    case '+':
        return makeToken(TokenType::Plus);
    case '-':
        return makeToken(TokenType::Minus);
    case '*':
        return makeToken(TokenType::Star);
    case '/':
        return makeToken(TokenType::Slash);
    case '(':
        return makeToken(TokenType::LParen);
    case ')':
        return makeToken(TokenType::RParen);
    default:
        // Неизвестный символ: сканирование прекращается без сообщения об ошибке.
        // Позиция возвращается на этот символ, чтобы position() указывала на него.
        current = start;
        return makeEnd();
    }
}

std::vector<Token> Scanner::scanAll() {
    std::vector<Token> tokens;
    while (true) {
        Token token = nextToken();
        bool done = token.type == TokenType::End;
        tokens.push_back(std::move(token));
        if (done) {
            break;
        }
    }
    return tokens;
}

bool Scanner::isAtEnd() const {
    return current >= source.size();
}

char Scanner::peek() const {
    if (isAtEnd()) {
        return '\0';
    }
    return source[current];
}

char Scanner::advance() {
    return source[current++];
}

void Scanner::skipWhitespace() {
    while (!isAtEnd()) {
        switch (peek()) {
        case ' ':
        case '\r':
        case '\t':
            advance();
            break;
        case '\n':
            ++currentLine;
            advance();
            break;
        default:
            return;
        }
    }
}

// Жадное чтение: забираем все буквы и цифры после первой буквы
Token Scanner::makeIdentifier() {
    while (isLetter(peek()) || isDigit(peek())) {
        advance();
    }
    return makeToken(TokenType::Identifier);
}

// Только десятичные цифры: без знака, дробной части и экспоненты
Token Scanner::makeNumber() {
    while (isDigit(peek())) {
        advance();
    }
    return makeToken(TokenType::Number);
}

Token Scanner::makeToken(TokenType type) const {
    return {type, source.substr(start, current - start), currentLine, std::nullopt};
}

Token Scanner::makeEnd() {
    exhausted = true;
    return {TokenType::End, "", currentLine, std::nullopt};
}

} // namespace lex
