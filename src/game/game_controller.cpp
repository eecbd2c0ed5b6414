#include "game_controller.hpp"
#include "game_config.hpp"
#include "utf8.hpp"
#include <cstdint>
#include <utility>

namespace GameLogic {

namespace {

// Пробельные символы Unicode, включая разделители \x1c-\x1f
bool is_whitespace(std::uint32_t c) {
    return (c >= 0x09 && c <= 0x0D) || (c >= 0x1C && c <= 0x20) ||
           c == 0x85 || c == 0xA0 || c == 0x1680 ||
           (c >= 0x2000 && c <= 0x200A) ||
           c == 0x2028 || c == 0x2029 || c == 0x202F || c == 0x205F || c == 0x3000;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

KeyAction classify_key(const std::string& key) {
    if (key.empty()) return KeyAction::IGNORED;

    if (key.size() == 1) {
        if (key[0] == Config::KEY_INTERRUPT) return KeyAction::ABORT;
        if (key[0] == Config::KEY_BACKSPACE) return KeyAction::BACKSPACE;
        if (key[0] == Config::KEY_WORD_ERASE) return KeyAction::WORD_BACKSPACE;
    }

    // Пробельный символ в начале события завершает слово
    if (is_whitespace(Utf8::first_code_point(key))) return KeyAction::WHITESPACE;

    if (key.size() > 1 || static_cast<unsigned char>(key[0]) >= 32) {
        return KeyAction::TEXT;
    }

    return KeyAction::IGNORED;
}

GameController::GameController(std::vector<std::string> words, int max_time, int max_columns,
                               bool rigorous_spaces)
    : state_(std::move(words), max_time, max_columns), rigorous_spaces_(rigorous_spaces) {
}

KeyAction GameController::handle_key(const std::string& key) {
    KeyAction action = classify_key(key);
    if (action == KeyAction::IGNORED || state_.is_finished()) {
        return action;
    }

    if (!state_.is_started()) {
        start();
    }

    switch (action) {
        case KeyAction::ABORT:
            finish();
            break;
        case KeyAction::BACKSPACE:
            backspace_pressed();
            break;
        case KeyAction::WORD_BACKSPACE:
            word_backspace_pressed();
            break;
        case KeyAction::WHITESPACE:
            // Без строгого режима двойной пробел ничего не делает
            if (!state_.word_input_.empty() || rigorous_spaces_) {
                word_finished();
            }
            break;
        case KeyAction::TEXT:
            key_pressed(key);
            break;
        default:
            break;
    }

    return action;
}

void GameController::start() {
    if (state_.start_time_) return;
    state_.start_time_ = Clock::now();
}

void GameController::key_pressed(const std::string& text) {
    if (state_.is_finished()) return;

    state_.word_input_ += text;
    state_.current_word_keys_pressed_++;
    update_typing_status();
}

void GameController::backspace_pressed() {
    if (state_.is_finished()) return;

    Utf8::pop_back(state_.word_input_);
    state_.current_word_keys_pressed_++;
    update_typing_status();
}

void GameController::word_backspace_pressed() {
    if (state_.is_finished()) return;

    state_.word_input_.clear();
    state_.current_word_keys_pressed_++;
    update_typing_status();
}

void GameController::word_finished() {
    if (state_.is_finished()) return;

    std::size_t index = state_.current_word_;

    // +1 за пробел, которым слово завершено
    state_.keys_pressed_ += state_.current_word_keys_pressed_ + 1;
    state_.current_word_keys_pressed_ = 0;
    state_.committed_[index] = (state_.words_[index] == state_.word_input_)
        ? WordStatus::TYPED_CORRECT
        : WordStatus::TYPED_WRONG;
    state_.word_input_.clear();
    state_.typing_wrong_ = false;

    state_.current_word_++;
    if (state_.current_word_ == state_.words_.size()) {
        finish();
    }
}

void GameController::finish() {
    if (state_.end_time_) return;

    state_.end_time_ = Clock::now();
    if (on_finish_) {
        on_finish_();
    }
}

void GameController::tick() {
    if (state_.is_finished() || state_.time_left_ <= 0) return;

    state_.time_left_--;
    if (state_.time_left_ == 0) {
        finish();
    }
}

void GameController::update_typing_status() {
    const std::string& target = state_.words_[state_.current_word_];
    state_.typing_wrong_ = !starts_with(target, state_.word_input_);
}

} // namespace GameLogic
