#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "token.hpp"

namespace lex {

// Класс для записи таблицы токенов в формате CSV
// Формат: index,type,lexeme,line
class CsvWriter {
public:
    // Конструктор открывает файл для записи (перезаписывая его) и пишет заголовок
    explicit CsvWriter(std::filesystem::path targetPath);

    // Записывает один токен с порядковым номером index
    void writeToken(std::size_t index, const Token& token);

    // Записывает все токены, нумеруя их с единицы
    void write(const std::vector<Token>& tokens);

    const std::filesystem::path& target() const { return path; }

private:
    std::filesystem::path path; // Путь к выходному файлу
    std::ofstream stream;
};

} // namespace lex
