#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <string>
#include <vector>
#include "../game/game_config.hpp"

struct Options {
    int time = Config::DEFAULT_TIME_SECONDS;
    std::string corpus = Config::DEFAULT_CORPUS;
    int width = Config::DEFAULT_WIDTH;
    bool list = false;
    bool rigorous_spaces = false;
    bool help = false;
};

struct ParsedOptions {
    Options options;
    std::string error;      // пусто, если разбор прошел успешно
};

// args[0] - имя программы
ParsedOptions parse_options(const std::vector<std::string>& args);
std::string usage_text(const std::string& program);

#endif
