#include "corpus.hpp"
#include "../game/game_config.hpp"
#include <fstream>
#include <filesystem>
#include <algorithm>
#include <cstdlib>

namespace fs = std::filesystem;

namespace Corpus {

std::string default_corpora_dir() {
    const char* env_dir = std::getenv(Config::CORPORA_DIR_ENV.c_str());
    if (env_dir != nullptr && env_dir[0] != '\0') {
        return env_dir;
    }
    return Config::CORPORA_DIR;
}

std::string resolve_corpus_path(const std::string& name, const std::string& corpora_dir) {
    fs::path builtin = fs::path(corpora_dir) / (name + Config::CORPUS_EXTENSION);

    std::error_code ec;
    if (fs::is_regular_file(builtin, ec)) {
        return builtin.string();
    }
    return name;
}

std::vector<std::string> load_words(const std::string& path) {
    std::vector<std::string> words;
    std::ifstream file(path);
    std::string word;

    // operator>> сам пропускает любые пробельные символы
    while (file >> word) {
        words.push_back(word);
    }

    return words;
}

std::vector<std::string> list_corpora(const std::string& corpora_dir) {
    std::vector<std::string> names;

    std::error_code ec;
    fs::directory_iterator it(corpora_dir, ec);
    if (ec) {
        return names;
    }

    for (const auto& entry : it) {
        if (entry.path().extension() == Config::CORPUS_EXTENSION) {
            names.push_back(entry.path().stem().string());
        }
    }

    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> sample_words(const std::vector<std::string>& corpus, std::size_t count,
                                      std::mt19937& gen) {
    std::vector<std::string> sample;
    if (corpus.empty()) {
        return sample;
    }

    std::uniform_int_distribution<std::size_t> dist(0, corpus.size() - 1);
    sample.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        sample.push_back(corpus[dist(gen)]);
    }

    return sample;
}

} // namespace Corpus
