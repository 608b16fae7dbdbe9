#include "csv_writer.hpp"

#include <stdexcept>
#include <utility>

namespace lex {

namespace {

// Замена двойных кавычек на одинарные и оборачивание в кавычки
std::string quote(std::string text) {
    for (char& ch : text) {
        if (ch == '"') {
            ch = '\'';
        }
    }
    return '"' + text + '"';
}

} // namespace

CsvWriter::CsvWriter(std::filesystem::path targetPath)
    : path(std::move(targetPath)), stream(path, std::ios::trunc) {
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    stream << "index,type,lexeme,line\n";
}

void CsvWriter::writeToken(std::size_t index, const Token& token) {
    stream << index << ','
        << tokenTypeName(token.type) << ','
        << quote(token.lexeme) << ','
        << token.line << '\n';
    if (!stream) {
        throw std::runtime_error("Ошибка записи CSV: " + path.string());
    }
}

void CsvWriter::write(const std::vector<Token>& tokens) {
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        writeToken(i + 1, tokens[i]);
    }
    stream.flush();
}

} // namespace lex
