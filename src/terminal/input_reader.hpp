#ifndef INPUT_READER_HPP
#define INPUT_READER_HPP

#include <atomic>
#include <string>
#include <thread>
#include "../game/event_queue.hpp"

namespace Terminal {

// Поток чтения клавиатуры: всё, что накопилось в fd к моменту
// готовности, становится одним событием в очереди
class InputReader {
private:
    int fd_;
    GameLogic::EventQueue& queue_;
    std::atomic<bool> running_;
    std::thread thread_;

    void read_loop();
    bool read_available(std::string& bytes);

public:
    InputReader(int fd, GameLogic::EventQueue& queue);
    ~InputReader();

    void start();
    void stop();

    InputReader(const InputReader&) = delete;
    InputReader& operator=(const InputReader&) = delete;
};

} // namespace Terminal

#endif
