#include "game_runner.hpp"
#include "game_view.hpp"
#include <algorithm>
#include <utility>

GameRunner::GameRunner(GameSettings settings, GameLogic::EventQueue& input_queue, Terminal::Display& display)
    : controller_(std::move(settings.words), settings.max_time, settings.max_columns, settings.rigorous_spaces),
      input_queue_(input_queue), display_(display), tick_interval_(settings.tick_interval),
      first_render_(true) {
    // finish() всегда вызывается под mutex_, поэтому будить таймер можно сразу
    controller_.set_on_finish([this] { finished_cv_.notify_all(); });
}

GameRunner::~GameRunner() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        controller_.finish();
    }
    join_timer();
}

void GameRunner::render() {
    GameView::render_game(controller_.state(), display_, first_render_);
    first_render_ = false;
}

void GameRunner::join_timer() {
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
}

void GameRunner::timer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!controller_.state().is_finished()) {
        // Ждем секунду или пока игру не закончат досрочно
        bool finished = finished_cv_.wait_for(lock, tick_interval_, [this] {
            return controller_.state().is_finished();
        });
        if (finished) break;

        controller_.tick();
        render();
    }
}

GameLogic::GameStats GameRunner::run() {
    const std::chrono::milliseconds poll_interval(Config::INPUT_POLL_TIMEOUT_MS);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        render();
    }

    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (controller_.state().is_finished()) break;
        }

        // Ожидание ограничено, чтобы заметить окончание времени без нажатий
        auto key = input_queue_.try_pop_for(std::min(tick_interval_, poll_interval));

        std::lock_guard<std::mutex> lock(mutex_);
        if (controller_.state().is_finished()) break;

        if (!key) {
            if (input_queue_.is_closed() && input_queue_.size() == 0) {
                // Ввод закончился - дальше играть нечем
                controller_.finish();
                break;
            }
            continue;
        }

        bool was_started = controller_.state().is_started();
        controller_.handle_key(*key);

        if (!was_started && controller_.state().is_started() && !timer_thread_.joinable()) {
            timer_thread_ = std::thread(&GameRunner::timer_loop, this);
        }

        render();
    }

    join_timer();

    GameLogic::GameStats stats = GameLogic::compute_stats(controller_.state());
    GameView::render_stats(stats, display_);
    return stats;
}
