#ifndef ANSI_DISPLAY_HPP
#define ANSI_DISPLAY_HPP

#include <ostream>
#include <string>
#include "display.hpp"

namespace Terminal {

class AnsiDisplay : public Display {
private:
    std::ostream& out_;

public:
    explicit AnsiDisplay(std::ostream& out) : out_(out) {}

    void move_cursor_up(int lines) override;
    void erase_line() override;
    void set_color(TextColor color) override;
    void reset_color() override;

    void write(const std::string& text) override;
    void new_line() override;
    void flush() override;
};

} // namespace Terminal

#endif
