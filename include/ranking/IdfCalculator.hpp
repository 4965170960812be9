#ifndef IDF_CALCULATOR_HPP
#define IDF_CALCULATOR_HPP

#include "../core/DocumentSet.hpp"
#include "../core/HashMap.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// Таблица IDF: термин -> ln(N / df). Отсутствующий термин весит 0.
class IdfTable
{
private:
    HashMap<Term, double> values;

public:
    void set(const Term &term, double idf) { values.insert(term, idf); }

    double get(const Term &term) const { return values.getOr(term, 0.0); }
    bool contains(const Term &term) const { return values.contains(term); }
    size_t size() const { return values.size(); }

    void traverse(std::function<void(const Term &, const double &)> callback) const
    {
        values.traverse(callback);
    }
};

// Счётчик документной частоты. Части корпуса можно считать независимо
// и потом слить через merge(): сложение счётчиков ассоциативно.
class DocumentFrequencyCounter
{
private:
    HashMap<Term, uint32_t> frequencies;
    size_t totalDocs = 0;

public:
    void addDocument(const std::vector<Term> &tokens);
    void merge(const DocumentFrequencyCounter &other);

    uint32_t documentFrequency(const Term &term) const { return frequencies.getOr(term, 0); }
    size_t getTotalDocs() const { return totalDocs; }

    // Бросает DomainError, если не было ни одного документа
    IdfTable finalize() const;
};

class IdfCalculator
{
public:
    static IdfTable computeIdfs(const DocumentSet &documents);
};

#endif
