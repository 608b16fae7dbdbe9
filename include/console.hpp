#pragma once

#include <cstddef>
#include <iostream>
#include <string>

#include "token.hpp"

// ANSI цветовые коды для форматирования вывода в терминал
namespace Color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
    constexpr const char* GRAY = "\033[90m";
}

// Вывод приветственного заголовка программы
void printHeader();

// Вывод одного токена с порядковым номером
void printToken(std::size_t index, const lex::Token& token);

// Вывод сообщения об ошибке в stderr
void printError(const std::string& message);

// Вывод предупреждения в stdout
void printWarning(const std::string& message);
