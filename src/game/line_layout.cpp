#include "line_layout.hpp"
#include "utf8.hpp"

namespace GameLogic {

std::vector<LineRange> divide_lines(const std::vector<std::string>& words, int max_columns) {
    std::vector<LineRange> lines;
    std::size_t next = 0;

    while (next < words.size()) {
        std::size_t low = next;
        std::size_t line_length = 0;

        while (next < words.size()) {
            std::size_t word_length = Utf8::length(words[next]);
            std::size_t new_length = (next == low) ? word_length : line_length + 1 + word_length;

            // Первое слово строки принимаем всегда, иначе длинное слово зациклит разбиение
            if (next != low && new_length >= static_cast<std::size_t>(max_columns)) {
                break;
            }

            line_length = new_length;
            next++;
        }

        lines.emplace_back(low, next);
    }

    return lines;
}

} // namespace GameLogic
