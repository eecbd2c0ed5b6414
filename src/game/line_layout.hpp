#ifndef LINE_LAYOUT_HPP
#define LINE_LAYOUT_HPP

#include <string>
#include <vector>
#include <utility>
#include <cstddef>

namespace GameLogic {

// Полуинтервал [low, high) индексов слов одной строки экрана
using LineRange = std::pair<std::size_t, std::size_t>;

// Разбивает слова на строки шириной меньше max_columns.
// Слово длиннее строки всё равно занимает строку целиком.
std::vector<LineRange> divide_lines(const std::vector<std::string>& words, int max_columns);

} // namespace GameLogic

#endif
