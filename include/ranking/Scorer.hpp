#ifndef SCORER_HPP
#define SCORER_HPP

#include "../core/DocumentSet.hpp"
#include "IdfCalculator.hpp"
#include <string>
#include <vector>

struct FileScore
{
    std::string id;
    double score;
};

struct SentenceScore
{
    std::string id;
    double matchingWordMeasure;
    double queryTermDensity;
};

// Ничьи разрешаются порядком обхода DocumentSet (stable_sort):
// для файлов это порядок загрузки корпуса, для предложений - порядок извлечения.
class Scorer
{
public:
    // Сумма TF * IDF по терминам запроса, по убыванию
    static std::vector<FileScore> scoreFiles(
        const Query &query,
        const DocumentSet &files,
        const IdfTable &idfs);

    // Ключ: (сумма IDF различных терминов запроса, плотность терминов запроса), по убыванию.
    // Пустое предложение - DomainError.
    static std::vector<SentenceScore> scoreSentences(
        const Query &query,
        const DocumentSet &sentences,
        const IdfTable &idfs);

    static std::vector<std::string> topFiles(
        const Query &query,
        const DocumentSet &files,
        const IdfTable &idfs,
        size_t n);

    static std::vector<std::string> topSentences(
        const Query &query,
        const DocumentSet &sentences,
        const IdfTable &idfs,
        size_t n);
};

#endif
