#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace lex {

// Типы токенов, которые распознает сканер.
// Перечисление закрытое: при добавлении нового типа компилятор
// укажет на все switch, где он не обработан.
enum class TokenType {
    End,        // Конец входных данных (или неизвестный символ)
    Identifier, // Имя: буква, затем буквы или цифры
    Number,     // Целое число из десятичных цифр
    Plus,
    Minus,
    Star,
    Slash,
    LParen,
    RParen
};

// Лексема, полученная за один шаг сканирования
struct Token {
    TokenType type = TokenType::End;
    std::string lexeme;                 // Точный фрагмент исходного текста
    std::size_t line = 0;               // Номер строки (счет с нуля)
    std::optional<long long> literal;   // Зарезервировано под разобранное значение, сканер не заполняет
};

// Имя типа токена в верхнем регистре ("IDENTIFIER", "END_OF_INPUT" и т.д.)
const char* tokenTypeName(TokenType type);

bool operator==(const Token& lhs, const Token& rhs);
bool operator!=(const Token& lhs, const Token& rhs);

// Формат: Token{IDENTIFIER, "var", line 0}
std::ostream& operator<<(std::ostream& os, const Token& token);

} // namespace lex
