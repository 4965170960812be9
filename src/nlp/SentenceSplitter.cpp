#include "nlp/SentenceSplitter.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace
{
    bool isTerminator(char c)
    {
        return c == '.' || c == '!' || c == '?';
    }

    bool isSpace(char c)
    {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    // Длина закрывающей кавычки/скобки в позиции pos (0, если её нет).
    // Учитываются ASCII и типографские ’ ” (UTF-8).
    size_t closerLength(const std::string &s, size_t pos)
    {
        char c = s[pos];
        if (c == '"' || c == '\'' || c == ')' || c == ']')
            return 1;
        if (pos + 2 < s.size() && (unsigned char)c == 0xE2 && (unsigned char)s[pos + 1] == 0x80 &&
            ((unsigned char)s[pos + 2] == 0x99 || (unsigned char)s[pos + 2] == 0x9D))
            return 3;
        return 0;
    }

    std::string trim(const std::string &s)
    {
        size_t first = 0;
        while (first < s.size() && isSpace(s[first]))
            first++;
        size_t last = s.size();
        while (last > first && isSpace(s[last - 1]))
            last--;
        return s.substr(first, last - first);
    }

    const std::unordered_set<std::string> &abbreviations()
    {
        static const std::unordered_set<std::string> words = {
            "mr", "mrs", "ms", "dr", "prof", "sr", "jr", "st", "vs", "e.g",
            "i.e", "inc", "ltd", "co", "corp", "fig", "al", "approx", "dept",
            "est", "gen", "gov", "lt", "col", "sgt", "rev", "mt", "ave",
            "jan", "feb", "mar", "apr", "jun", "jul", "aug", "sep", "sept",
            "oct", "nov", "dec", "u.s", "u.k", "a.m", "p.m"};
        return words;
    }
}

std::vector<std::string> SentenceSplitter::passages(const std::string &text)
{
    std::vector<std::string> result;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
    {
        result.push_back(line);
    }
    return result;
}

bool SentenceSplitter::isAbbreviation(const std::string &passage, size_t dotPos)
{
    size_t start = dotPos;
    while (start > 0)
    {
        char c = passage[start - 1];
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '.')
            start--;
        else
            break;
    }

    std::string word;
    for (size_t i = start; i < dotPos; ++i)
    {
        word += (char)std::tolower(static_cast<unsigned char>(passage[i]));
    }

    if (word.empty())
        return false;

    // Инициалы: "J. R. R. Tolkien"
    if (word.size() == 1)
        return std::isupper(static_cast<unsigned char>(passage[start])) != 0;

    return abbreviations().count(word) != 0;
}

std::vector<std::string> SentenceSplitter::sentences(const std::string &passage)
{
    std::vector<std::string> result;
    size_t sentenceStart = 0;
    size_t i = 0;

    while (i < passage.size())
    {
        if (!isTerminator(passage[i]))
        {
            i++;
            continue;
        }

        size_t firstTerminator = i;
        while (i < passage.size() && isTerminator(passage[i]))
            i++;
        bool singleDot = (i - firstTerminator == 1) && passage[firstTerminator] == '.';

        size_t len = 0;
        while (i < passage.size() && (len = closerLength(passage, i)) > 0)
            i += len;

        if (i < passage.size() && !isSpace(passage[i]))
            continue;

        if (singleDot && isAbbreviation(passage, firstTerminator))
            continue;

        // Строчная буква после одиночной точки - продолжение того же предложения
        size_t next = i;
        while (next < passage.size() && isSpace(passage[next]))
            next++;
        if (singleDot && next < passage.size() && std::islower(static_cast<unsigned char>(passage[next])))
            continue;

        std::string sentence = trim(passage.substr(sentenceStart, i - sentenceStart));
        if (!sentence.empty())
            result.push_back(sentence);
        sentenceStart = i;
    }

    std::string tail = trim(passage.substr(std::min(sentenceStart, passage.size())));
    if (!tail.empty())
        result.push_back(tail);

    return result;
}

std::vector<std::string> SentenceSplitter::split(const std::string &text)
{
    std::vector<std::string> result;
    for (const auto &passage : passages(text))
    {
        for (auto &sentence : sentences(passage))
        {
            result.push_back(std::move(sentence));
        }
    }
    return result;
}
