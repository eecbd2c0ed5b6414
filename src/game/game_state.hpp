#ifndef GAME_STATE_HPP
#define GAME_STATE_HPP

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstddef>
#include "line_layout.hpp"

namespace GameLogic {

using Clock = std::chrono::steady_clock;

enum class WordStatus {
    UNTYPED,
    TYPING_CORRECT,
    TYPING_WRONG,
    TYPED_CORRECT,
    TYPED_WRONG
};

class GameController;

// Состояние одной игры. Изменяется только через GameController,
// снаружи доступно лишь для чтения.
class GameState {
private:
    std::vector<std::string> words_;
    // Хранит только итог слова (UNTYPED или TYPED_*); статус TYPING_*
    // вычисляется для текущего слова, поэтому он всегда ровно один
    std::vector<WordStatus> committed_;
    std::size_t current_word_;
    std::string word_input_;
    bool typing_wrong_;
    std::vector<LineRange> line_boundaries_;
    int time_left_;
    std::optional<Clock::time_point> start_time_;
    std::optional<Clock::time_point> end_time_;
    int keys_pressed_;
    int current_word_keys_pressed_;

    friend class GameController;

public:
    GameState(std::vector<std::string> words, int max_time, int max_columns);

    // Геттеры
    const std::vector<std::string>& get_words() const { return words_; }
    std::size_t get_current_word() const { return current_word_; }
    const std::string& get_word_input() const { return word_input_; }
    const std::vector<LineRange>& get_line_boundaries() const { return line_boundaries_; }
    int get_time_left() const { return time_left_; }
    int get_keys_pressed() const { return keys_pressed_; }
    int get_current_word_keys_pressed() const { return current_word_keys_pressed_; }
    const std::optional<Clock::time_point>& get_start_time() const { return start_time_; }
    const std::optional<Clock::time_point>& get_end_time() const { return end_time_; }

    bool is_started() const { return start_time_.has_value(); }
    bool is_finished() const { return end_time_.has_value(); }

    WordStatus get_word_status(std::size_t index) const;
    std::size_t current_line() const;
    std::vector<LineRange> visible_lines() const;
};

} // namespace GameLogic

#endif
