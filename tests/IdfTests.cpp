#include <gtest/gtest.h>
#include "ranking/IdfCalculator.hpp"
#include "core/Errors.hpp"

#include <cmath>

// 1. Базовая формула: idf = ln(N / df)
TEST(IdfTest, ComputesNaturalLogRatio)
{
    DocumentSet docs;
    docs.add("1", {"cat", "dog"});
    docs.add("2", {"cat"});
    docs.add("3", {"bird"});
    docs.add("4", {"cat", "bird"});

    IdfTable idfs = IdfCalculator::computeIdfs(docs);

    EXPECT_EQ(idfs.size(), 3u);
    EXPECT_DOUBLE_EQ(idfs.get("cat"), std::log(4.0 / 3.0));
    EXPECT_DOUBLE_EQ(idfs.get("dog"), std::log(4.0));
    EXPECT_DOUBLE_EQ(idfs.get("bird"), std::log(2.0));
}

// 2. Повторы внутри документа учитываются один раз
TEST(IdfTest, RepeatsWithinDocumentCountOnce)
{
    DocumentSet docs;
    docs.add("1", {"apple", "apple", "apple"});
    docs.add("2", {"pear"});

    IdfTable idfs = IdfCalculator::computeIdfs(docs);

    EXPECT_DOUBLE_EQ(idfs.get("apple"), std::log(2.0));
}

// 3. Термин во всех документах весит ровно 0, и только он
TEST(IdfTest, TermInEveryDocumentIsZero)
{
    DocumentSet docs;
    docs.add("1", {"common", "rare"});
    docs.add("2", {"common"});
    docs.add("3", {"common", "other"});

    IdfTable idfs = IdfCalculator::computeIdfs(docs);

    EXPECT_EQ(idfs.get("common"), 0.0);
    EXPECT_GT(idfs.get("rare"), 0.0);
    EXPECT_GT(idfs.get("other"), 0.0);
}

// 4. Все значения в диапазоне [0, ln N]
TEST(IdfTest, ValuesWithinRange)
{
    DocumentSet docs;
    docs.add("a", {"x", "y"});
    docs.add("b", {"y", "z"});
    docs.add("c", {"z", "w", "x"});
    docs.add("d", {"q"});
    docs.add("e", {"x", "y", "z"});

    IdfTable idfs = IdfCalculator::computeIdfs(docs);
    double maxIdf = std::log(5.0);

    idfs.traverse([&](const Term &term, const double &idf)
                  {
        EXPECT_GE(idf, 0.0) << term;
        EXPECT_LE(idf, maxIdf) << term; });
}

// 5. Незнакомый термин отсутствует в таблице и весит 0
TEST(IdfTest, UnseenTermIsAbsent)
{
    DocumentSet docs;
    docs.add("1", {"seen"});

    IdfTable idfs = IdfCalculator::computeIdfs(docs);

    EXPECT_FALSE(idfs.contains("unseen"));
    EXPECT_EQ(idfs.get("unseen"), 0.0);
}

// 6. Пустой корпус - DomainError
TEST(IdfTest, EmptyCorpusThrows)
{
    DocumentSet docs;
    EXPECT_THROW(IdfCalculator::computeIdfs(docs), DomainError);
}

// 7. Копия документа под новым id: df растёт на 1, idf не растёт
TEST(IdfTest, DuplicatingDocumentNeverRaisesIdf)
{
    DocumentSet docs;
    docs.add("1", {"cat", "sat"});
    docs.add("2", {"dog", "ran"});
    docs.add("3", {"cat", "ran"});

    DocumentFrequencyCounter before;
    for (const auto &doc : docs)
        before.addDocument(doc.tokens);
    IdfTable idfsBefore = before.finalize();

    DocumentSet withCopy = docs;
    withCopy.add("1-copy", {"cat", "sat"});

    DocumentFrequencyCounter after;
    for (const auto &doc : withCopy)
        after.addDocument(doc.tokens);
    IdfTable idfsAfter = after.finalize();

    for (const Term term : {"cat", "sat"})
    {
        EXPECT_EQ(after.documentFrequency(term), before.documentFrequency(term) + 1) << term;
        EXPECT_LE(idfsAfter.get(term), idfsBefore.get(term)) << term;
    }
}

// 8. Подсчёт по частям и слияние дают тот же результат
TEST(IdfTest, MergedPartitionsMatchSinglePass)
{
    DocumentSet docs;
    docs.add("1", {"a", "b"});
    docs.add("2", {"b", "c"});
    docs.add("3", {"c", "d", "a"});
    docs.add("4", {"e"});

    IdfTable whole = IdfCalculator::computeIdfs(docs);

    DocumentFrequencyCounter left;
    left.addDocument({"a", "b"});
    left.addDocument({"b", "c"});

    DocumentFrequencyCounter right;
    right.addDocument({"c", "d", "a"});
    right.addDocument({"e"});

    left.merge(right);
    IdfTable merged = left.finalize();

    EXPECT_EQ(left.getTotalDocs(), 4u);
    EXPECT_EQ(merged.size(), whole.size());
    whole.traverse([&](const Term &term, const double &idf)
                   { EXPECT_DOUBLE_EQ(merged.get(term), idf) << term; });
}
