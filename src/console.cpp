#include "console.hpp"

#include <iomanip>

void printHeader() {
    std::cout << Color::BOLD << Color::CYAN;
    std::cout << "\n╔═══════════════════════════════════════════════════════════╗\n";
    std::cout << "║    Лексический сканер арифметических выражений v1.0      ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════╝\n";
    std::cout << Color::RESET << "\n";
}

void printToken(std::size_t index, const lex::Token& token) {
    std::cout << "  " << Color::GRAY << std::setw(3) << index << Color::RESET << "  "
        << Color::CYAN << std::left << std::setw(12) << lex::tokenTypeName(token.type) << std::right
        << Color::RESET << " " << Color::YELLOW << '"' << token.lexeme << '"' << Color::RESET
        << Color::GRAY << "  (строка " << token.line << ")" << Color::RESET << "\n";
}

void printError(const std::string& message) {
    std::cerr << Color::RED << Color::BOLD << "✗ Ошибка: "
        << Color::RESET << Color::RED << message << Color::RESET << "\n\n";
}

void printWarning(const std::string& message) {
    std::cout << Color::YELLOW << "Внимание: " << Color::RESET << message << "\n";
}
