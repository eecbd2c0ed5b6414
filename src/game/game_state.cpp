#include "game_state.hpp"
#include "game_config.hpp"
#include <stdexcept>
#include <utility>

namespace GameLogic {

GameState::GameState(std::vector<std::string> words, int max_time, int max_columns)
    : words_(std::move(words)), current_word_(0), typing_wrong_(false),
      time_left_(max_time), keys_pressed_(0), current_word_keys_pressed_(0) {
    if (words_.empty()) {
        throw std::invalid_argument("game needs at least one word");
    }
    if (max_time <= 0) {
        throw std::invalid_argument("game time must be positive");
    }

    committed_.assign(words_.size(), WordStatus::UNTYPED);
    line_boundaries_ = divide_lines(words_, max_columns);
}

WordStatus GameState::get_word_status(std::size_t index) const {
    if (index == current_word_ && !is_finished()) {
        return typing_wrong_ ? WordStatus::TYPING_WRONG : WordStatus::TYPING_CORRECT;
    }
    return committed_.at(index);
}

std::size_t GameState::current_line() const {
    for (std::size_t i = 0; i < line_boundaries_.size(); ++i) {
        if (current_word_ >= line_boundaries_[i].first && current_word_ < line_boundaries_[i].second) {
            return i;
        }
    }
    return line_boundaries_.size() - 1;
}

std::vector<LineRange> GameState::visible_lines() const {
    std::vector<LineRange> visible;
    std::size_t current = current_line();

    for (int i = 0; i < Config::MAX_DISPLAY_LINES; ++i) {
        std::size_t line = current + i;
        if (line < line_boundaries_.size()) {
            visible.push_back(line_boundaries_[line]);
        }
    }

    return visible;
}

} // namespace GameLogic
