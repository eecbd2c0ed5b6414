#ifndef RAW_TERMINAL_HPP
#define RAW_TERMINAL_HPP

#include <termios.h>

namespace Terminal {

// Переводит терминал в raw-режим без эха, восстанавливает в деструкторе
class RawTerminal {
private:
    int fd_;
    struct termios old_settings_;

public:
    explicit RawTerminal(int fd);
    ~RawTerminal();

    RawTerminal(const RawTerminal&) = delete;
    RawTerminal& operator=(const RawTerminal&) = delete;
};

// Ширина терминала или fallback, если stdout не терминал
int terminal_columns(int fallback);

} // namespace Terminal

#endif
