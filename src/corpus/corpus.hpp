#ifndef CORPUS_HPP
#define CORPUS_HPP

#include <string>
#include <vector>
#include <random>
#include <cstddef>

namespace Corpus {

// Каталог встроенных словарей: переменная окружения или путь из сборки
std::string default_corpora_dir();

// Имя встроенного словаря -> путь к файлу; иначе имя считается путем
std::string resolve_corpus_path(const std::string& name, const std::string& corpora_dir);

// Все слова файла, разделенные пробельными символами. Пусто, если файл не прочитан.
std::vector<std::string> load_words(const std::string& path);

// Отсортированные имена встроенных словарей
std::vector<std::string> list_corpora(const std::string& corpora_dir);

// count случайных слов с повторениями
std::vector<std::string> sample_words(const std::vector<std::string>& corpus, std::size_t count,
                                      std::mt19937& gen);

} // namespace Corpus

#endif
