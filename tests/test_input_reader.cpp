// tests/test_input_reader.cpp
//
// Поток чтения проверяется на pipe вместо терминала.
#include <doctest/doctest.h>

#include "terminal/input_reader.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

bool wait_closed(const GameLogic::EventQueue& queue) {
    auto deadline = std::chrono::steady_clock::now() + 5000ms;
    while (std::chrono::steady_clock::now() < deadline) {
        if (queue.is_closed()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

} // namespace

TEST_CASE("InputReader turns available bytes into one event")
{
    int fds[2];
    REQUIRE(pipe(fds) == 0);

    GameLogic::EventQueue queue;
    Terminal::InputReader reader(fds[0], queue);

    REQUIRE(write(fds[1], "abc", 3) == 3);
    reader.start();

    auto event = queue.try_pop_for(5000ms);
    REQUIRE(event.has_value());
    CHECK(*event == "abc");

    reader.stop();
    close(fds[0]);
    close(fds[1]);
}

TEST_CASE("InputReader drops invalid bytes")
{
    int fds[2];
    REQUIRE(pipe(fds) == 0);

    GameLogic::EventQueue queue;
    Terminal::InputReader reader(fds[0], queue);

    REQUIRE(write(fds[1], "\xff", 1) == 1);
    reader.start();
    std::this_thread::sleep_for(50ms);
    REQUIRE(write(fds[1], "\xc3\xa9", 2) == 2);

    auto event = queue.try_pop_for(5000ms);
    REQUIRE(event.has_value());
    CHECK(*event == "\xc3\xa9");

    reader.stop();
    close(fds[0]);
    close(fds[1]);
}

TEST_CASE("InputReader closes the queue at end of input")
{
    int fds[2];
    REQUIRE(pipe(fds) == 0);

    GameLogic::EventQueue queue;
    Terminal::InputReader reader(fds[0], queue);
    reader.start();

    close(fds[1]);
    CHECK(wait_closed(queue));

    reader.stop();
    close(fds[0]);
}
