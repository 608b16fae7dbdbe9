#include "file_utils.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace lex {

std::string readSourceFile(const std::filesystem::path& path) {
    std::error_code error;
    if (!std::filesystem::is_regular_file(path, error)) {
        throw std::runtime_error("Файл не найден: " + path.string());
    }

    // Бинарный режим, чтобы \r\n дошли до сканера без изменений
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть входной файл: " + path.string());
    }

    std::ostringstream contents;
    contents << input.rdbuf();
    if (input.bad()) {
        throw std::runtime_error("Ошибка чтения файла: " + path.string());
    }
    return contents.str();
}

} // namespace lex
