#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "token.hpp"

namespace lex {

// Класс лексического сканера.
// Работает над полностью загруженной строкой и по одному запросу
// выдает следующий токен. Пробелы, \r и \t пропускаются, \n увеличивает
// счетчик строк. Неизвестный символ завершает сканирование токеном End,
// после чего сканер остается в исчерпанном состоянии.
class Scanner {
public:
    // Конструктор принимает исходный текст целиком; проверок не выполняется
    explicit Scanner(std::string sourceText);

    // Возвращает следующий токен.
    // После первого End все последующие вызовы тоже возвращают End.
    Token nextToken();

    // Сканирует весь оставшийся текст
    // Возвращает вектор токенов, заканчивающийся токеном End
    std::vector<Token> scanAll();

    // true, если уже был выдан токен End
    bool isExhausted() const { return exhausted; }

    // Текущая позиция чтения (индекс следующего непрочитанного символа).
    // Если сканирование остановил неизвестный символ, указывает на него.
    std::size_t position() const { return current; }

    // Текущее значение счетчика строк
    std::size_t line() const { return currentLine; }

private:
    const std::string source;     // Исходный текст
    std::size_t start = 0;        // Начало текущего токена
    std::size_t current = 0;      // Текущая позиция чтения
    std::size_t currentLine = 0;  // Счетчик строк (первая строка — 0)
    bool exhausted = false;       // Сканирование завершено

    bool isAtEnd() const;

    // Текущий символ без продвижения вперед ('\0' в конце строки)
    char peek() const;

    char advance();

    // Пропускает пробелы, \r, \t и переводы строк
    void skipWhitespace();

    // Считывает остаток идентификатора (буквы и цифры)
    Token makeIdentifier();

    // Считывает остаток числа (только цифры)
    Token makeNumber();

    // Токен из диапазона [start, current)
    Token makeToken(TokenType type) const;

    // Переводит сканер в исчерпанное состояние
    Token makeEnd();
};

} // namespace lex
