#include <cstddef>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "console.hpp"
#include "csv_writer.hpp"
#include "file_utils.hpp"
#include "scanner.hpp"

namespace {

    // Пример по умолчанию, если входной файл не указан
    constexpr const char* SAMPLE_SOURCE = "var x = 42 + 3 * (y - 5)";

    void printUsage(const char* program) {
        std::cout << "Использование: " << program << " [входной_файл] [выходной.csv]\n";
    }

    // Сканирование текста и вывод токенов в консоль
    // Возвращает все токены, включая завершающий End
    std::vector<lex::Token> scanAndPrint(const std::string& source) {
        lex::Scanner scanner(source);
        std::vector<lex::Token> tokens;

        std::cout << Color::BOLD << "Токены:\n" << Color::RESET;
        while (true) {
            lex::Token token = scanner.nextToken();
            if (token.type == lex::TokenType::End) {
                tokens.push_back(std::move(token));
                break;
            }
            printToken(tokens.size() + 1, token);
            tokens.push_back(std::move(token));
        }
        std::cout << "\n";

        // Сканер останавливается на неизвестном символе молча,
        // поэтому сообщаем об этом здесь
        if (scanner.position() < source.size()) {
            printWarning("сканирование остановлено на позиции " + std::to_string(scanner.position())
                + " (символ '" + source[scanner.position()] + "')");
        }

        std::cout << Color::GREEN << "Найдено токенов: " << (tokens.size() - 1) << Color::RESET << "\n\n";
        return tokens;
    }

} // namespace

// Точка входа в программу
int main(int argc, char** argv) {
    if (argc > 3) {
        printUsage(argv[0]);
        return 1;
    }

    printHeader();

    try {
        std::string source = SAMPLE_SOURCE;
        if (argc >= 2) {
            std::filesystem::path inputPath = argv[1];
            source = lex::readSourceFile(inputPath);
            std::cout << "  Входной файл:  " << Color::YELLOW << inputPath << Color::RESET << "\n\n";
        } else {
            std::cout << "  Выражение:     " << Color::YELLOW << source << Color::RESET << "\n\n";
        }

        std::vector<lex::Token> tokens = scanAndPrint(source);

        if (argc == 3) {
            lex::CsvWriter writer(argv[2]);
            writer.write(tokens);
            std::cout << Color::GREEN << "Результаты сохранены в: " << writer.target() << Color::RESET << "\n\n";
        }
    }
    catch (const std::exception& ex) {
        printError(ex.what());
        return 1;
    }

    return 0;
}
