// tests/test_game_runner.cpp
//
// Игровой цикл целиком: очередь событий, таймер и итоговая статистика.
#include <doctest/doctest.h>

#include "client/game_runner.hpp"
#include "test_support/recording_display.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using GameLogic::WordStatus;

namespace {

GameSettings make_settings(std::vector<std::string> words, int max_time,
                           std::chrono::milliseconds tick = 1000ms) {
    GameSettings settings;
    settings.words = std::move(words);
    settings.max_time = max_time;
    settings.max_columns = 80;
    settings.tick_interval = tick;
    return settings;
}

void push_keys(GameLogic::EventQueue& queue, const std::string& keys) {
    for (char c : keys) {
        queue.push(std::string(1, c));
    }
}

} // namespace

TEST_CASE("runner plays a game to the last word")
{
    GameLogic::EventQueue queue;
    RecordingDisplay display;
    push_keys(queue, "cat dog ");

    GameRunner runner(make_settings({"cat", "dog"}, 60), queue, display);
    auto stats = runner.run();

    CHECK(runner.state().is_finished());
    CHECK(runner.state().get_current_word() == 2);
    CHECK(stats.correct_words == 2);
    CHECK(stats.correct_chars == 8);
    CHECK(stats.keys_pressed == 8);
    CHECK(stats.accuracy == doctest::Approx(1.0));
    CHECK(display.text().find("Correct words:          2\n") != std::string::npos);
}

TEST_CASE("runner stops on the interrupt key without waiting for a tick")
{
    GameLogic::EventQueue queue;
    RecordingDisplay display;
    push_keys(queue, "ca\x03");

    GameRunner runner(make_settings({"cat", "dog"}, 60, 10000ms), queue, display);
    auto started = std::chrono::steady_clock::now();
    auto stats = runner.run();

    CHECK(std::chrono::steady_clock::now() - started < 5000ms);
    CHECK(runner.state().is_finished());
    CHECK(runner.state().get_time_left() == 60);
    CHECK(stats.correct_words == 0);
    CHECK(stats.keys_pressed == 0);
    CHECK(stats.accuracy == 1.0);
}

TEST_CASE("runner ends the game when time runs out")
{
    GameLogic::EventQueue queue;
    RecordingDisplay display;
    queue.push("c");

    GameRunner runner(make_settings({"cat", "dog"}, 2, 20ms), queue, display);
    auto stats = runner.run();

    CHECK(runner.state().is_finished());
    CHECK(runner.state().get_time_left() == 0);
    CHECK(runner.state().get_word_input() == "c");
    CHECK(runner.state().get_word_status(0) == WordStatus::UNTYPED);
    CHECK(stats.correct_words == 0);
    CHECK(display.text().find("--- (0 s left) ---") != std::string::npos);
}

TEST_CASE("timer does not run before the first key")
{
    GameLogic::EventQueue queue;
    RecordingDisplay display;

    GameRunner runner(make_settings({"cat"}, 1, 10ms), queue, display);
    std::thread closer([&queue] {
        std::this_thread::sleep_for(100ms);
        queue.close();
    });
    auto stats = runner.run();
    closer.join();

    CHECK(runner.state().get_time_left() == 1);
    CHECK_FALSE(runner.state().is_started());
    CHECK(runner.state().is_finished());
    CHECK(stats.chars_per_second == 0.0);
}

TEST_CASE("runner finishes when input ends")
{
    GameLogic::EventQueue queue;
    RecordingDisplay display;
    push_keys(queue, "\x01" "cat ");
    queue.close();

    GameRunner runner(make_settings({"cat", "dog", "cow"}, 60), queue, display);
    auto stats = runner.run();

    CHECK(runner.state().is_finished());
    CHECK(stats.correct_words == 1);
    CHECK(stats.keys_pressed == 4);
}

TEST_CASE("every applied event is rendered")
{
    GameLogic::EventQueue queue;
    RecordingDisplay display;
    push_keys(queue, "x\x03");

    GameRunner runner(make_settings({"cat"}, 60), queue, display);
    runner.run();

    // Начальный кадр и по кадру на каждое событие
    CHECK(display.count("text:--- (60 s left) ---") == 3);
    CHECK(display.count("up:3") == 2);
    CHECK(display.contains("text:Wrong words:            "));
}
