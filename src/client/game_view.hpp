#ifndef GAME_VIEW_HPP
#define GAME_VIEW_HPP

#include <string>
#include <vector>
#include "../game/game_state.hpp"
#include "../game/game_stats.hpp"
#include "../terminal/display.hpp"

namespace GameView {

Terminal::TextColor status_color(GameLogic::WordStatus status);

// Видимые строки слов, таймер и текущий ввод. Каждый следующий вызов
// перерисовывает экран поверх предыдущего.
void render_game(const GameLogic::GameState& state, Terminal::Display& display, bool first_render);

void render_stats(const GameLogic::GameStats& stats, Terminal::Display& display);

// Те же строки статистики без цветов
std::vector<std::string> format_stats(const GameLogic::GameStats& stats);

std::string format_timer(int time_left);

} // namespace GameView

#endif
