#ifndef TEXT_NORMALIZER_HPP
#define TEXT_NORMALIZER_HPP

#include "../core/DocumentSet.hpp"
#include "Lemmatizer.hpp"
#include "StopWords.hpp"
#include "Tokenizer.hpp"
#include <string>
#include <vector>

// Токенизация -> удаление стоп-слов -> (опционально) стемминг.
// Без лемматизатора термины остаются словами в нижнем регистре.
class TextNormalizer
{
private:
    Lemmatizer *lemmatizer;

public:
    explicit TextNormalizer(Lemmatizer *lemm = nullptr) : lemmatizer(lemm) {}

    std::vector<Term> terms(const std::string &text) const
    {
        std::vector<Term> cleanTerms;
        for (const auto &token : Tokenizer::tokenize(text))
        {
            if (StopWords::isStopWord(token))
                continue;

            std::string term = lemmatizer ? lemmatizer->lemmatize(token) : token;
            if (!term.empty())
                cleanTerms.push_back(term);
        }
        return cleanTerms;
    }

    Query query(const std::string &text) const
    {
        std::vector<Term> words = terms(text);
        return Query(words.begin(), words.end());
    }
};

#endif
