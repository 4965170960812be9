#ifndef DOCUMENT_SET_HPP
#define DOCUMENT_SET_HPP

#include "HashMap.hpp"
#include <set>
#include <string>
#include <vector>

using Term = std::string;
using Query = std::set<Term>;

struct Document
{
    std::string id;
    std::vector<Term> tokens;
};

// Отображение "идентификатор -> токены" с сохранением порядка вставки.
// Порядок обхода используется как порядок разрешения ничьих при ранжировании.
class DocumentSet
{
private:
    std::vector<Document> documents;
    HashMap<std::string, size_t> positions;

public:
    // Повторный id заменяет токены, но документ остаётся на прежнем месте
    void add(const std::string &id, std::vector<Term> tokens);

    const std::vector<Term> *find(const std::string &id) const;

    size_t size() const { return documents.size(); }
    bool empty() const { return documents.empty(); }

    std::vector<Document>::const_iterator begin() const { return documents.begin(); }
    std::vector<Document>::const_iterator end() const { return documents.end(); }
};

#endif
