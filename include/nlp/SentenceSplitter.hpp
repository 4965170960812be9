#ifndef SENTENCE_SPLITTER_HPP
#define SENTENCE_SPLITTER_HPP

#include <string>
#include <vector>

// Разбиение текста на предложения для английского языка.
// Текст сначала режется на фрагменты по переводам строк, затем каждый
// фрагмент - по концевым знакам (. ! ?), за которыми идёт пробел или конец.
class SentenceSplitter
{
public:
    static std::vector<std::string> passages(const std::string &text);
    static std::vector<std::string> sentences(const std::string &passage);

    // passages() + sentences() для каждого фрагмента
    static std::vector<std::string> split(const std::string &text);

private:
    static bool isAbbreviation(const std::string &passage, size_t dotPos);
};

#endif
