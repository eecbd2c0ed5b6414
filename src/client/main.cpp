#include "game_runner.hpp"
#include "options.hpp"
#include "../corpus/corpus.hpp"
#include "../terminal/ansi_display.hpp"
#include "../terminal/input_reader.hpp"
#include "../terminal/raw_terminal.hpp"
#include <algorithm>
#include <iostream>
#include <random>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv, argv + argc);
    std::string program = args.empty() ? "tenff" : args[0];

    ParsedOptions parsed = parse_options(args);
    if (!parsed.error.empty()) {
        std::cerr << usage_text(program);
        std::cerr << program << ": error: " << parsed.error << std::endl;
        return 2;
    }

    const Options& options = parsed.options;
    if (options.help) {
        std::cout << usage_text(program);
        return 0;
    }

    std::string corpora_dir = Corpus::default_corpora_dir();
    if (options.list) {
        for (const auto& name : Corpus::list_corpora(corpora_dir)) {
            std::cout << name << std::endl;
        }
        return 0;
    }

    try {
        std::string corpus_path = Corpus::resolve_corpus_path(options.corpus, corpora_dir);
        auto corpus = Corpus::load_words(corpus_path);
        if (corpus.empty()) {
            std::cerr << "Error: No words loaded from " << corpus_path << std::endl;
            return 1;
        }

        std::random_device rd;
        std::mt19937 gen(rd());

        GameSettings settings;
        settings.words = Corpus::sample_words(corpus, Config::SAMPLE_SIZE, gen);
        settings.max_time = options.time;
        settings.max_columns = std::min(options.width, Terminal::terminal_columns(options.width));
        settings.rigorous_spaces = options.rigorous_spaces;

        Terminal::AnsiDisplay display(std::cout);
        GameLogic::EventQueue input_queue;

        // Порядок важен: терминал восстанавливается после остановки чтения
        Terminal::RawTerminal raw_terminal(STDIN_FILENO);
        Terminal::InputReader input_reader(STDIN_FILENO, input_queue);
        GameRunner runner(std::move(settings), input_queue, display);

        input_reader.start();
        runner.run();
    } catch (const std::exception& e) {
        std::cerr << "Game error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
