#pragma once

#include <filesystem>
#include <string>

namespace lex {

// Чтение файла целиком в строку (сканер работает только с полным буфером)
// Выбрасывает std::runtime_error, если файл не найден или не открывается
std::string readSourceFile(const std::filesystem::path& path);

} // namespace lex
