#include "app/QuestionAnswerer.hpp"
#include "nlp/SentenceSplitter.hpp"
#include "ranking/Scorer.hpp"

#include <iostream>
#include <utility>

QuestionAnswerer::QuestionAnswerer(const Options &opts)
    : options(opts),
      lemmatizer(opts.stem ? std::make_unique<Lemmatizer>("english") : std::unique_ptr<Lemmatizer>()),
      normalizer(lemmatizer.get())
{
}

void QuestionAnswerer::prepare(const std::vector<RawDocument> &corpus)
{
    texts.clear();
    fileWords = DocumentSet();
    fileIdfs = IdfTable();

    for (const auto &doc : corpus)
    {
        texts.insert(doc.filename, doc.text);
        fileWords.add(doc.filename, normalizer.terms(doc.text));
    }

    if (fileWords.empty())
    {
        if (options.verbose)
            std::clog << "[INDEX] Corpus is empty, nothing to index." << std::endl;
        return;
    }

    fileIdfs = IdfCalculator::computeIdfs(fileWords);

    if (options.verbose)
        std::clog << "[INDEX] " << fileWords.size() << " files, " << fileIdfs.size() << " distinct terms." << std::endl;
}

DocumentSet QuestionAnswerer::extractSentences(const std::vector<std::string> &filenames) const
{
    DocumentSet sentences;
    for (const auto &filename : filenames)
    {
        const std::string *text = texts.get(filename);
        if (!text)
            continue;

        for (const auto &sentence : SentenceSplitter::split(*text))
        {
            std::vector<Term> tokens = normalizer.terms(sentence);
            if (!tokens.empty())
                sentences.add(sentence, std::move(tokens));
        }
    }
    return sentences;
}

std::vector<std::string> QuestionAnswerer::answer(const std::string &queryText) const
{
    Query query = normalizer.query(queryText);

    if (fileWords.empty() || query.empty())
    {
        if (options.verbose)
            std::clog << "[QUERY] Empty corpus or query, no results." << std::endl;
        return {};
    }

    std::vector<std::string> filenames = Scorer::topFiles(query, fileWords, fileIdfs, options.fileMatches);
    if (options.verbose)
    {
        for (const auto &filename : filenames)
            std::clog << "[QUERY] Top file: " << filename << std::endl;
    }

    DocumentSet sentences = extractSentences(filenames);
    if (sentences.empty())
    {
        if (options.verbose)
            std::clog << "[QUERY] Top files contain no sentences." << std::endl;
        return {};
    }

    // IDF только по предложениям-кандидатам, не по всему корпусу
    IdfTable sentenceIdfs = IdfCalculator::computeIdfs(sentences);

    if (options.verbose)
        std::clog << "[QUERY] Ranking " << sentences.size() << " candidate sentences." << std::endl;

    return Scorer::topSentences(query, sentences, sentenceIdfs, options.sentenceMatches);
}
