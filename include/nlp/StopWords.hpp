#ifndef STOP_WORDS_HPP
#define STOP_WORDS_HPP

#include <string>
#include <unordered_set>

// Английские стоп-слова. Набор строится один раз при первом обращении
// и дальше только читается.
class StopWords
{
public:
    static const std::unordered_set<std::string> &english();

    static bool isStopWord(const std::string &word)
    {
        return english().count(word) != 0;
    }
};

#endif
