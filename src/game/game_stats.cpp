#include "game_stats.hpp"
#include "game_config.hpp"
#include "utf8.hpp"

namespace GameLogic {

GameStats compute_stats(const GameState& state) {
    GameStats stats;
    const auto& words = state.get_words();

    for (std::size_t i = 0; i < words.size(); ++i) {
        // Каждое слово считается вместе с пробелом после него
        std::size_t chars = Utf8::length(words[i]) + 1;

        switch (state.get_word_status(i)) {
            case WordStatus::TYPED_CORRECT:
                stats.correct_words++;
                stats.correct_chars += chars;
                break;
            case WordStatus::TYPED_WRONG:
                stats.wrong_words++;
                stats.wrong_chars += chars;
                break;
            default:
                break;
        }
    }

    stats.total_chars = stats.correct_chars + stats.wrong_chars;
    stats.keys_pressed = state.get_keys_pressed();

    if (state.get_start_time() && state.get_end_time()) {
        std::chrono::duration<double> elapsed = *state.get_end_time() - *state.get_start_time();
        stats.elapsed_seconds = elapsed.count();
    }

    if (stats.elapsed_seconds > 0.0) {
        stats.chars_per_second = static_cast<double>(stats.correct_chars) / stats.elapsed_seconds;
    }
    stats.words_per_minute = stats.chars_per_second * 60.0 / Config::AVG_WORD_LENGTH;

    if (stats.keys_pressed > 0) {
        stats.accuracy = static_cast<double>(stats.correct_chars) / stats.keys_pressed;
    }

    return stats;
}

} // namespace GameLogic
