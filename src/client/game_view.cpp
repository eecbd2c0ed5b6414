#include "game_view.hpp"
#include "../game/game_config.hpp"
#include <cstdio>

namespace GameView {

namespace {

std::string format_number(const char* format, double value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), format, value);
    return buffer;
}

const char* CPS_LABEL      = "CPS (chars per second): ";
const char* WPM_LABEL      = "WPM (words per minute): ";
const char* CHARS_LABEL    = "Characters typed:       ";
const char* KEYS_LABEL     = "Keys pressed:           ";
const char* ACCURACY_LABEL = "Accuracy:               ";
const char* CORRECT_LABEL  = "Correct words:          ";
const char* WRONG_LABEL    = "Wrong words:            ";

} // namespace

Terminal::TextColor status_color(GameLogic::WordStatus status) {
    switch (status) {
        case GameLogic::WordStatus::TYPING_CORRECT: return Terminal::TextColor::YELLOW;
        case GameLogic::WordStatus::TYPING_WRONG: return Terminal::TextColor::RED;
        case GameLogic::WordStatus::TYPED_CORRECT: return Terminal::TextColor::GREEN;
        case GameLogic::WordStatus::TYPED_WRONG: return Terminal::TextColor::RED;
        default: return Terminal::TextColor::DEFAULT;
    }
}

std::string format_timer(int time_left) {
    return "--- (" + std::to_string(time_left) + " s left) ---";
}

void render_game(const GameLogic::GameState& state, Terminal::Display& display, bool first_render) {
    auto visible = state.visible_lines();
    const auto& words = state.get_words();

    if (!first_render) {
        display.move_cursor_up(Config::MAX_DISPLAY_LINES + 1);
    }

    for (int i = 0; i < Config::MAX_DISPLAY_LINES; ++i) {
        display.erase_line();
        if (static_cast<std::size_t>(i) < visible.size()) {
            for (std::size_t idx = visible[i].first; idx < visible[i].second; ++idx) {
                display.set_color(status_color(state.get_word_status(idx)));
                display.write(words[idx]);
                display.write(" ");
            }
            display.reset_color();
        }
        display.new_line();
    }

    display.erase_line();
    display.write(format_timer(state.get_time_left()));
    display.new_line();

    display.erase_line();
    display.write(state.get_word_input());
    display.flush();
}

std::vector<std::string> format_stats(const GameLogic::GameStats& stats) {
    std::vector<std::string> lines;
    lines.push_back(CPS_LABEL + format_number("%.1f", stats.chars_per_second));
    lines.push_back(WPM_LABEL + format_number("%.1f", stats.words_per_minute));
    lines.push_back(CHARS_LABEL + std::to_string(stats.total_chars) + " (" +
                    std::to_string(stats.correct_chars) + "|" + std::to_string(stats.wrong_chars) + ")");
    lines.push_back(KEYS_LABEL + std::to_string(stats.keys_pressed));
    lines.push_back(ACCURACY_LABEL + format_number("%.1f", stats.accuracy * 100.0) + "%");
    lines.push_back(CORRECT_LABEL + std::to_string(stats.correct_words));
    lines.push_back(WRONG_LABEL + std::to_string(stats.wrong_words));
    return lines;
}

void render_stats(const GameLogic::GameStats& stats, Terminal::Display& display) {
    auto plain = format_stats(stats);

    // Первые строки без цвета выводим как есть
    display.erase_line();
    display.write(plain[0]);
    display.new_line();
    display.erase_line();
    display.write(plain[1]);
    display.new_line();

    display.erase_line();
    display.write(CHARS_LABEL + std::to_string(stats.total_chars) + " (");
    display.set_color(Terminal::TextColor::GREEN);
    display.write(std::to_string(stats.correct_chars));
    display.reset_color();
    display.write("|");
    display.set_color(Terminal::TextColor::RED);
    display.write(std::to_string(stats.wrong_chars));
    display.reset_color();
    display.write(")");
    display.new_line();

    display.erase_line();
    display.write(plain[3]);
    display.new_line();
    display.erase_line();
    display.write(plain[4]);
    display.new_line();

    display.erase_line();
    display.write(CORRECT_LABEL);
    display.set_color(Terminal::TextColor::GREEN);
    display.write(std::to_string(stats.correct_words));
    display.reset_color();
    display.new_line();

    display.erase_line();
    display.write(WRONG_LABEL);
    display.set_color(Terminal::TextColor::RED);
    display.write(std::to_string(stats.wrong_words));
    display.reset_color();
    display.new_line();

    display.flush();
}

} // namespace GameView
