#ifndef GAME_STATS_HPP
#define GAME_STATS_HPP

#include <cstddef>
#include "game_state.hpp"

namespace GameLogic {

struct GameStats {
    std::size_t correct_words = 0;
    std::size_t wrong_words = 0;
    std::size_t correct_chars = 0;
    std::size_t wrong_chars = 0;
    std::size_t total_chars = 0;
    int keys_pressed = 0;
    double elapsed_seconds = 0.0;
    double chars_per_second = 0.0;
    double words_per_minute = 0.0;
    double accuracy = 1.0;
};

// Итоговая статистика по завершенной игре
GameStats compute_stats(const GameState& state);

} // namespace GameLogic

#endif
