#include "ansi_display.hpp"

namespace Terminal {

void AnsiDisplay::move_cursor_up(int lines) {
    out_ << "\x1B[" << lines << "F";
}

void AnsiDisplay::erase_line() {
    out_ << "\x1B[999D\x1B[K";
}

void AnsiDisplay::set_color(TextColor color) {
    switch (color) {
        case TextColor::RED: out_ << "\x1B[31;1m"; break;
        case TextColor::GREEN: out_ << "\x1B[32;1m"; break;
        case TextColor::YELLOW: out_ << "\x1B[33;1m"; break;
        case TextColor::DEFAULT: reset_color(); break;
    }
}

void AnsiDisplay::reset_color() {
    out_ << "\x1B[0m";
}

void AnsiDisplay::write(const std::string& text) {
    out_ << text;
}

void AnsiDisplay::new_line() {
    // В raw-режиме терминал не переводит \n в \r\n сам
    out_ << "\r\n";
}

void AnsiDisplay::flush() {
    out_.flush();
}

} // namespace Terminal
