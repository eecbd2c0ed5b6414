#ifndef GAME_RUNNER_HPP
#define GAME_RUNNER_HPP

#include <string>
#include <vector>
#include <mutex>
#include <thread>
#include <chrono>
#include <condition_variable>
#include "../game/game_config.hpp"
#include "../game/game_controller.hpp"
#include "../game/game_stats.hpp"
#include "../game/event_queue.hpp"
#include "../terminal/display.hpp"

struct GameSettings {
    std::vector<std::string> words;
    int max_time = Config::DEFAULT_TIME_SECONDS;
    int max_columns = Config::DEFAULT_WIDTH;
    bool rigorous_spaces = false;
    std::chrono::milliseconds tick_interval{Config::TICK_INTERVAL_MS};
};

// Игровой цикл: события из очереди и тики таймера применяются к игре
// строго по одному под общим мьютексом
class GameRunner {
private:
    GameLogic::GameController controller_;
    GameLogic::EventQueue& input_queue_;
    Terminal::Display& display_;
    const std::chrono::milliseconds tick_interval_;

    std::mutex mutex_;
    std::condition_variable finished_cv_;
    std::thread timer_thread_;
    bool first_render_;

    void timer_loop();
    void render();      // вызывать под mutex_
    void join_timer();

public:
    GameRunner(GameSettings settings, GameLogic::EventQueue& input_queue, Terminal::Display& display);
    ~GameRunner();

    GameRunner(const GameRunner&) = delete;
    GameRunner& operator=(const GameRunner&) = delete;

    // Играет до конца и выводит статистику; возвращает ее же
    GameLogic::GameStats run();

    // Снимок состояния для чтения после окончания игры
    const GameLogic::GameState& state() const { return controller_.state(); }
};

#endif
