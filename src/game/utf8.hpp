#ifndef UTF8_HPP
#define UTF8_HPP

#include <string>
#include <cstddef>
#include <cstdint>

namespace GameLogic {

// Утилиты для UTF-8 строк: ввод и словари хранятся в байтах,
// а длины слов и удаление символа считаются по кодовым точкам
namespace Utf8 {
    std::size_t length(const std::string& text);
    void pop_back(std::string& text);
    std::string sanitize(const std::string& bytes);

    // Первая кодовая точка строки; 0 для пустой или битой строки
    std::uint32_t first_code_point(const std::string& text);
}

} // namespace GameLogic

#endif
