#include "ranking/IdfCalculator.hpp"
#include "core/Errors.hpp"

#include <cmath>
#include <unordered_set>

void DocumentFrequencyCounter::addDocument(const std::vector<Term> &tokens)
{
    // Повторы внутри одного документа учитываются один раз
    std::unordered_set<Term> unique(tokens.begin(), tokens.end());
    for (const auto &term : unique)
    {
        uint32_t *count = frequencies.get(term);
        if (count)
            ++*count;
        else
            frequencies.insert(term, 1);
    }
    totalDocs++;
}

void DocumentFrequencyCounter::merge(const DocumentFrequencyCounter &other)
{
    other.frequencies.traverse([&](const Term &term, const uint32_t &df)
                               {
        uint32_t *count = frequencies.get(term);
        if (count)
            *count += df;
        else
            frequencies.insert(term, df); });
    totalDocs += other.totalDocs;
}

IdfTable DocumentFrequencyCounter::finalize() const
{
    if (totalDocs == 0)
        throw DomainError("cannot compute IDF over an empty document set");

    IdfTable idfs;
    double N = (double)totalDocs;
    frequencies.traverse([&](const Term &term, const uint32_t &df)
                         { idfs.set(term, std::log(N / (double)df)); });
    return idfs;
}

IdfTable IdfCalculator::computeIdfs(const DocumentSet &documents)
{
    DocumentFrequencyCounter counter;
    for (const auto &doc : documents)
    {
        counter.addDocument(doc.tokens);
    }
    return counter.finalize();
}
