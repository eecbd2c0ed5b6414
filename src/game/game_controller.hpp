#ifndef GAME_CONTROLLER_HPP
#define GAME_CONTROLLER_HPP

#include <string>
#include <vector>
#include <functional>
#include <utility>
#include "game_state.hpp"

namespace GameLogic {

// Что делать с очередным событием ввода
enum class KeyAction {
    IGNORED,
    ABORT,
    BACKSPACE,
    WORD_BACKSPACE,
    WHITESPACE,
    TEXT
};

KeyAction classify_key(const std::string& key);

class GameController {
private:
    GameState state_;
    bool rigorous_spaces_;
    std::function<void()> on_finish_;

    void update_typing_status();

public:
    GameController(std::vector<std::string> words, int max_time, int max_columns,
                   bool rigorous_spaces = false);

    const GameState& state() const { return state_; }

    // Вызывается один раз при первом завершении игры (например, чтобы разбудить таймер)
    void set_on_finish(std::function<void()> callback) { on_finish_ = std::move(callback); }

    // Разбор одного события ввода; первое не игнорируемое событие запускает игру
    KeyAction handle_key(const std::string& key);

    void start();
    void key_pressed(const std::string& text);
    void backspace_pressed();
    void word_backspace_pressed();
    void word_finished();
    void finish();
    void tick();
};

} // namespace GameLogic

#endif
