#include "ranking/Scorer.hpp"
#include "core/Errors.hpp"

#include <algorithm>

std::vector<FileScore> Scorer::scoreFiles(
    const Query &query,
    const DocumentSet &files,
    const IdfTable &idfs)
{
    std::vector<FileScore> results;
    results.reserve(files.size());

    for (const auto &file : files)
    {
        // Сырые TF только для терминов запроса
        HashMap<Term, uint32_t> termFrequencies(query.size() * 2 + 1);
        for (const auto &token : file.tokens)
        {
            if (query.count(token) == 0)
                continue;

            uint32_t *tf = termFrequencies.get(token);
            if (tf)
                ++*tf;
            else
                termFrequencies.insert(token, 1);
        }

        double score = 0.0;
        for (const auto &term : query)
        {
            double tf = (double)termFrequencies.getOr(term, 0);
            if (tf > 0)
                score += tf * idfs.get(term);
        }

        results.push_back({file.id, score});
    }

    std::stable_sort(results.begin(), results.end(), [](const FileScore &a, const FileScore &b)
                     { return a.score > b.score; });

    return results;
}

std::vector<SentenceScore> Scorer::scoreSentences(
    const Query &query,
    const DocumentSet &sentences,
    const IdfTable &idfs)
{
    std::vector<SentenceScore> results;
    results.reserve(sentences.size());

    for (const auto &sentence : sentences)
    {
        if (sentence.tokens.empty())
            throw DomainError("sentence '" + sentence.id + "' has no tokens");

        std::set<Term> present;
        size_t queryTokens = 0;
        for (const auto &token : sentence.tokens)
        {
            if (query.count(token) == 0)
                continue;

            present.insert(token);
            queryTokens++;
        }

        // Каждый термин запроса учитывается один раз, сколько бы раз он ни встретился
        double measure = 0.0;
        for (const auto &term : present)
        {
            measure += idfs.get(term);
        }

        double density = (double)queryTokens / (double)sentence.tokens.size();
        results.push_back({sentence.id, measure, density});
    }

    std::stable_sort(results.begin(), results.end(), [](const SentenceScore &a, const SentenceScore &b)
                     {
        if (a.matchingWordMeasure != b.matchingWordMeasure)
            return a.matchingWordMeasure > b.matchingWordMeasure;
        return a.queryTermDensity > b.queryTermDensity; });

    return results;
}

std::vector<std::string> Scorer::topFiles(
    const Query &query,
    const DocumentSet &files,
    const IdfTable &idfs,
    size_t n)
{
    std::vector<FileScore> scores = scoreFiles(query, files, idfs);

    std::vector<std::string> top;
    for (size_t i = 0; i < std::min(scores.size(), n); ++i)
    {
        top.push_back(scores[i].id);
    }
    return top;
}

std::vector<std::string> Scorer::topSentences(
    const Query &query,
    const DocumentSet &sentences,
    const IdfTable &idfs,
    size_t n)
{
    std::vector<SentenceScore> scores = scoreSentences(query, sentences, idfs);

    std::vector<std::string> top;
    for (size_t i = 0; i < std::min(scores.size(), n); ++i)
    {
        top.push_back(scores[i].id);
    }
    return top;
}
