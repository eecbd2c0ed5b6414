#ifndef DISPLAY_HPP
#define DISPLAY_HPP

#include <string>

namespace Terminal {

enum class TextColor {
    DEFAULT,
    RED,
    GREEN,
    YELLOW
};

// Куда рисуется игра. Игровой код не знает про escape-последовательности.
class Display {
public:
    virtual ~Display() = default;

    virtual void move_cursor_up(int lines) = 0;
    virtual void erase_line() = 0;
    virtual void set_color(TextColor color) = 0;
    virtual void reset_color() = 0;

    virtual void write(const std::string& text) = 0;
    virtual void new_line() = 0;
    virtual void flush() = 0;
};

} // namespace Terminal

#endif
