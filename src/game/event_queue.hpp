#ifndef EVENT_QUEUE_HPP
#define EVENT_QUEUE_HPP

#include <string>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <optional>
#include <utility>
#include <cstddef>

namespace GameLogic {

// Неограниченная очередь событий ввода: пишет поток чтения терминала,
// читает игровой цикл
class EventQueue {
private:
    std::deque<std::string> events_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    bool closed_;

public:
    EventQueue() : closed_(false) {}

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    void push(std::string event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            events_.push_back(std::move(event));
        }
        ready_.notify_one();
    }

    // Ждет событие не дольше timeout; пусто, если событий нет или очередь закрыта
    std::optional<std::string> try_pop_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });

        if (events_.empty()) {
            return std::nullopt;
        }

        std::string event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    // Больше событий не будет (например, конец stdin)
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }
};

} // namespace GameLogic

#endif
