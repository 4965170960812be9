#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <cstddef>
#include <string>

const size_t FILE_MATCHES = 1;
const size_t SENTENCE_MATCHES = 1;

struct Options
{
    std::string corpusDir;
    size_t fileMatches = FILE_MATCHES;
    size_t sentenceMatches = SENTENCE_MATCHES;
    bool stem = false;
    bool verbose = false;
};

// Разбор argv. Ровно один позиционный аргумент (каталог корпуса), флаги
// в любом месте. При ошибке бросает UsageError.
Options parseOptions(int argc, const char *const argv[]);

std::string usage(const std::string &program);

#endif
