#include "raw_terminal.hpp"
#include <sys/ioctl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace Terminal {

RawTerminal::RawTerminal(int fd) : fd_(fd) {
    if (tcgetattr(fd_, &old_settings_) != 0) {
        throw std::runtime_error(std::string("cannot read terminal settings: ") + std::strerror(errno));
    }

    struct termios raw = old_settings_;
    cfmakeraw(&raw);
    raw.c_lflag &= ~(ECHO | ICANON);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;

    if (tcsetattr(fd_, TCSADRAIN, &raw) != 0) {
        throw std::runtime_error(std::string("cannot enable raw terminal: ") + std::strerror(errno));
    }
}

RawTerminal::~RawTerminal() {
    tcsetattr(fd_, TCSADRAIN, &old_settings_);
}

int terminal_columns(int fallback) {
    struct winsize size;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) == 0 && size.ws_col > 0) {
        return size.ws_col;
    }
    return fallback;
}

} // namespace Terminal
