#ifndef GAME_CONFIG_HPP
#define GAME_CONFIG_HPP

#include <string>
#include <cstddef>

#ifndef TENFF_CORPORA_DIR
#define TENFF_CORPORA_DIR "data"
#endif

namespace Config {
    // Параметры игры
    const std::size_t SAMPLE_SIZE = 1000;
    const int MAX_DISPLAY_LINES = 2;
    const int AVG_WORD_LENGTH = 5;

    // Значения по умолчанию для командной строки
    const int DEFAULT_TIME_SECONDS = 60;
    const int DEFAULT_WIDTH = 80;
    const std::string DEFAULT_CORPUS = "english";

    // Таймеры
    const int TICK_INTERVAL_MS = 1000;       // один тик в секунду
    const int INPUT_POLL_TIMEOUT_MS = 100;

    // Управляющие символы
    const char KEY_INTERRUPT = '\x03';       // Ctrl-C
    const char KEY_WORD_ERASE = '\x17';      // Ctrl-W
    const char KEY_BACKSPACE = '\x7F';

    // Встроенные словари
    const std::string CORPORA_DIR = TENFF_CORPORA_DIR;
    const std::string CORPORA_DIR_ENV = "TENFF_CORPORA_DIR";
    const std::string CORPUS_EXTENSION = ".txt";
}

#endif // GAME_CONFIG_HPP
