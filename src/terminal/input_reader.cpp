#include "input_reader.hpp"
#include "../game/game_config.hpp"
#include "../game/utf8.hpp"
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstddef>
#include <utility>

namespace Terminal {

InputReader::InputReader(int fd, GameLogic::EventQueue& queue)
    : fd_(fd), queue_(queue), running_(false) {
}

InputReader::~InputReader() {
    stop();
}

void InputReader::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread(&InputReader::read_loop, this);
}

void InputReader::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void InputReader::read_loop() {
    while (running_) {
        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, Config::INPUT_POLL_TIMEOUT_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        std::string bytes;
        if (!read_available(bytes)) {
            // Конец ввода: игровой цикл завершит игру сам
            break;
        }

        std::string event = GameLogic::Utf8::sanitize(bytes);
        if (!event.empty()) {
            queue_.push(std::move(event));
        }
    }

    queue_.close();
}

bool InputReader::read_available(std::string& bytes) {
    char buffer[256];

    while (true) {
        ssize_t n = read(fd_, buffer, sizeof(buffer));
        if (n > 0) {
            bytes.append(buffer, static_cast<std::size_t>(n));
            // Есть ли еще данные, не блокируясь
            struct pollfd pfd;
            pfd.fd = fd_;
            pfd.events = POLLIN;
            pfd.revents = 0;
            if (poll(&pfd, 1, 0) <= 0 || !(pfd.revents & POLLIN)) {
                return true;
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;

        // fd готов, но прочитать нечего: EOF или ошибка
        return !bytes.empty();
    }
}

} // namespace Terminal
