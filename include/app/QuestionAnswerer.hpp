#ifndef QUESTION_ANSWERER_HPP
#define QUESTION_ANSWERER_HPP

#include "Options.hpp"
#include "../core/DocumentSet.hpp"
#include "../core/HashMap.hpp"
#include "../io/CorpusLoader.hpp"
#include "../nlp/Lemmatizer.hpp"
#include "../nlp/TextNormalizer.hpp"
#include "../ranking/IdfCalculator.hpp"
#include <memory>
#include <string>
#include <vector>

// Конвейер: файлы -> IDF по файлам -> лучшие файлы -> предложения
// -> отдельный IDF по предложениям-кандидатам -> лучшие предложения.
class QuestionAnswerer
{
private:
    Options options;
    std::unique_ptr<Lemmatizer> lemmatizer;
    TextNormalizer normalizer;

    HashMap<std::string, std::string> texts;
    DocumentSet fileWords;
    IdfTable fileIdfs;

    // Предложения лучших файлов с непустыми токенами, в порядке извлечения
    DocumentSet extractSentences(const std::vector<std::string> &filenames) const;

public:
    explicit QuestionAnswerer(const Options &opts);

    // Токенизирует корпус и строит IDF по файлам. Пустой корпус допустим.
    void prepare(const std::vector<RawDocument> &corpus);

    std::vector<std::string> answer(const std::string &queryText) const;

    const DocumentSet &files() const { return fileWords; }
    const IdfTable &idfs() const { return fileIdfs; }
};

#endif
