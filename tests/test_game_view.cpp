// tests/test_game_view.cpp
#include <doctest/doctest.h>

#include "client/game_view.hpp"
#include "game/game_controller.hpp"
#include "test_support/recording_display.hpp"

#include <string>
#include <vector>

using GameLogic::GameController;
using GameLogic::WordStatus;
using Terminal::TextColor;

TEST_CASE("status colors")
{
    CHECK(GameView::status_color(WordStatus::UNTYPED) == TextColor::DEFAULT);
    CHECK(GameView::status_color(WordStatus::TYPING_CORRECT) == TextColor::YELLOW);
    CHECK(GameView::status_color(WordStatus::TYPING_WRONG) == TextColor::RED);
    CHECK(GameView::status_color(WordStatus::TYPED_CORRECT) == TextColor::GREEN);
    CHECK(GameView::status_color(WordStatus::TYPED_WRONG) == TextColor::RED);
}

TEST_CASE("first render draws lines, timer and input without moving up")
{
    GameController game({"cat", "dog"}, 45, 80);
    game.handle_key("c");

    RecordingDisplay display;
    GameView::render_game(game.state(), display, true);

    CHECK_FALSE(display.contains("up:3"));
    CHECK(display.text() == "cat dog \n\n--- (45 s left) ---\nc");
    CHECK(display.ops.back() == "flush");
    CHECK(display.count("erase") == 4);
}

TEST_CASE("next renders move back over the previous frame")
{
    GameController game({"cat", "dog"}, 60, 80);

    RecordingDisplay display;
    GameView::render_game(game.state(), display, false);

    REQUIRE_FALSE(display.ops.empty());
    CHECK(display.ops.front() == "up:3");
}

TEST_CASE("words are colored by their status")
{
    GameController game({"cat", "dog", "cow"}, 60, 80);
    for (char c : std::string("cat dx")) {
        game.handle_key(std::string(1, c));
    }

    RecordingDisplay display;
    GameView::render_game(game.state(), display, true);

    std::vector<std::string> expected = {
        "erase",
        "color:green", "text:cat", "text: ",
        "color:red", "text:dog", "text: ",
        "color:default", "text:cow", "text: ",
        "reset", "nl",
    };
    REQUIRE(display.ops.size() > expected.size());
    CHECK(std::vector<std::string>(display.ops.begin(), display.ops.begin() + expected.size()) == expected);
}

TEST_CASE("format_stats produces labeled lines in fixed order")
{
    GameLogic::GameStats stats;
    stats.chars_per_second = 2.5;
    stats.words_per_minute = 30.0;
    stats.total_chars = 12;
    stats.correct_chars = 8;
    stats.wrong_chars = 4;
    stats.keys_pressed = 14;
    stats.accuracy = 8.0 / 14.0;
    stats.correct_words = 2;
    stats.wrong_words = 1;

    std::vector<std::string> expected = {
        "CPS (chars per second): 2.5",
        "WPM (words per minute): 30.0",
        "Characters typed:       12 (8|4)",
        "Keys pressed:           14",
        "Accuracy:               57.1%",
        "Correct words:          2",
        "Wrong words:            1",
    };
    CHECK(GameView::format_stats(stats) == expected);
}

TEST_CASE("default stats report full accuracy")
{
    GameLogic::GameStats stats;
    auto lines = GameView::format_stats(stats);

    REQUIRE(lines.size() == 7);
    CHECK(lines[0] == "CPS (chars per second): 0.0");
    CHECK(lines[4] == "Accuracy:               100.0%");
}

TEST_CASE("render_stats prints the same text with colored counters")
{
    GameLogic::GameStats stats;
    stats.total_chars = 12;
    stats.correct_chars = 8;
    stats.wrong_chars = 4;
    stats.correct_words = 2;
    stats.wrong_words = 1;

    RecordingDisplay display;
    GameView::render_stats(stats, display);

    std::string expected;
    for (const auto& line : GameView::format_stats(stats)) {
        expected += line + "\n";
    }
    CHECK(display.text() == expected);
    CHECK(display.count("color:green") == 2);
    CHECK(display.count("color:red") == 2);
}
