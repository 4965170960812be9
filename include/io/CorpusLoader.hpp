#ifndef CORPUS_LOADER_HPP
#define CORPUS_LOADER_HPP

#include <string>
#include <vector>

struct RawDocument
{
    std::string filename;
    std::string text;
};

// Читает корпус из каталога: .txt как есть, .html/.htm через HtmlParser.
// Остальные файлы пропускаются. Результат упорядочен по имени файла.
class CorpusLoader
{
public:
    // Бросает NotFoundError, если каталога нет
    static std::vector<RawDocument> load(const std::string &directory);

    static bool isTextFile(const std::string &filename);
    static bool isHtmlFile(const std::string &filename);
};

#endif
