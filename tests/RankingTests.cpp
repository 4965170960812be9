#include <gtest/gtest.h>
#include "ranking/Scorer.hpp"
#include "core/Errors.hpp"

#include <cmath>

// Хелпер: корпус, IDF по нему строится в каждом тесте
class RankingTest : public ::testing::Test
{
protected:
    DocumentSet files;

    IdfTable idfs() const
    {
        return IdfCalculator::computeIdfs(files);
    }
};

// ==========================================
// Ранжирование файлов (TF-IDF)
// ==========================================

// 1. Чем выше TF, тем выше скор
TEST_F(RankingTest, HighTFScoredHigher)
{
    files.add("one.txt", {"apple", "tree"});
    files.add("three.txt", {"apple", "apple", "apple"});
    files.add("none.txt", {"pear"});

    auto results = Scorer::scoreFiles({"apple"}, files, idfs());

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].id, "three.txt");
    EXPECT_EQ(results[1].id, "one.txt");
    EXPECT_EQ(results[2].id, "none.txt");

    double idf = std::log(3.0 / 2.0);
    EXPECT_DOUBLE_EQ(results[0].score, 3 * idf);
    EXPECT_DOUBLE_EQ(results[1].score, idf);
    EXPECT_EQ(results[2].score, 0.0);
}

// 2. Редкое слово весит больше частого
TEST_F(RankingTest, RareTermBoostsScore)
{
    for (int i = 1; i <= 9; ++i)
        files.add("doc" + std::to_string(i), {"common"});
    files.add("doc10", {"other"});
    files.add("doc1", {"common", "rare"});

    auto top = Scorer::topFiles({"common", "rare"}, files, idfs(), 2);

    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0], "doc1");
}

// 3. Термины запроса вне IDF-таблицы дают 0, а не ошибку
TEST_F(RankingTest, UnknownQueryTermContributesZero)
{
    files.add("a.txt", {"alpha", "beta"});
    files.add("b.txt", {"gamma"});

    IdfTable empty;
    auto results = Scorer::scoreFiles({"alpha", "gamma"}, files, empty);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].score, 0.0);
    EXPECT_EQ(results[1].score, 0.0);
}

// 4. Масштабирование TF в k раз масштабирует скор в k раз
TEST_F(RankingTest, ScoreScalesWithTermCounts)
{
    files.add("base.txt", {"x", "y", "y", "z"});
    files.add("other.txt", {"w"});
    files.add("third.txt", {"x", "w"});
    IdfTable table = idfs();

    DocumentSet scaled;
    std::vector<Term> tripled;
    for (int k = 0; k < 3; ++k)
        tripled.insert(tripled.end(), {"x", "y", "y", "z"});
    scaled.add("base.txt", tripled);

    Query query = {"x", "y", "z"};
    double baseScore = Scorer::scoreFiles(query, files, table)[0].score;
    double scaledScore = Scorer::scoreFiles(query, scaled, table)[0].score;

    EXPECT_GT(baseScore, 0.0);
    EXPECT_NEAR(scaledScore, 3 * baseScore, 1e-12);
}

// 5. Пустой запрос: все скоры 0, порядок - порядок корпуса
TEST_F(RankingTest, EmptyQueryKeepsCorpusOrder)
{
    files.add("c.txt", {"cat"});
    files.add("a.txt", {"dog"});
    files.add("b.txt", {"bird"});

    auto results = Scorer::scoreFiles({}, files, idfs());

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].id, "c.txt");
    EXPECT_EQ(results[1].id, "a.txt");
    EXPECT_EQ(results[2].id, "b.txt");
    for (const auto &r : results)
        EXPECT_EQ(r.score, 0.0);
}

// 6. n ограничивает выдачу, n = 0 - пустая выдача
TEST_F(RankingTest, TopFilesRespectsLimit)
{
    files.add("a.txt", {"word"});
    files.add("b.txt", {"word", "word"});
    files.add("c.txt", {"other"});

    EXPECT_EQ(Scorer::topFiles({"word"}, files, idfs(), 1), (std::vector<std::string>{"b.txt"}));
    EXPECT_EQ(Scorer::topFiles({"word"}, files, idfs(), 10).size(), 3u);
    EXPECT_TRUE(Scorer::topFiles({"word"}, files, idfs(), 0).empty());
}

// 7. Повторные вызовы дают одинаковый результат
TEST_F(RankingTest, RankingIsDeterministic)
{
    files.add("a.txt", {"x", "y"});
    files.add("b.txt", {"y", "x"});
    files.add("c.txt", {"z"});
    files.add("d.txt", {"x", "z"});
    IdfTable table = idfs();

    auto first = Scorer::topFiles({"x", "y"}, files, table, 4);
    for (int i = 0; i < 5; ++i)
        EXPECT_EQ(Scorer::topFiles({"x", "y"}, files, table, 4), first);
}

// ==========================================
// Ранжирование предложений
// ==========================================

// 8. Основной ключ: сумма IDF различных терминов, повторы не считаются
TEST(SentenceRankingTest, MeasureCountsDistinctTermsOnce)
{
    DocumentSet sentences;
    sentences.add("Cats cats cats.", {"cats", "cats", "cats"});
    sentences.add("Cats and dogs.", {"cats", "dogs"});
    sentences.add("Birds fly.", {"birds", "fly"});

    IdfTable idfs = IdfCalculator::computeIdfs(sentences);
    auto results = Scorer::scoreSentences({"cats", "dogs"}, sentences, idfs);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].id, "Cats and dogs.");
    EXPECT_DOUBLE_EQ(results[0].matchingWordMeasure, idfs.get("cats") + idfs.get("dogs"));
    EXPECT_EQ(results[1].id, "Cats cats cats.");
    EXPECT_DOUBLE_EQ(results[1].matchingWordMeasure, idfs.get("cats"));
    EXPECT_DOUBLE_EQ(results[1].queryTermDensity, 1.0);
}

// 9. При равной мере выигрывает большая плотность терминов запроса
TEST(SentenceRankingTest, DensityBreaksTies)
{
    DocumentSet sentences;
    sentences.add("sparse", {"cat", "on", "long", "mat"});
    sentences.add("dense", {"cat", "mat"});
    sentences.add("filler", {"nothing"});

    IdfTable idfs = IdfCalculator::computeIdfs(sentences);
    auto results = Scorer::scoreSentences({"cat"}, sentences, idfs);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_DOUBLE_EQ(results[0].matchingWordMeasure, results[1].matchingWordMeasure);
    EXPECT_EQ(results[0].id, "dense");
    EXPECT_DOUBLE_EQ(results[0].queryTermDensity, 0.5);
    EXPECT_EQ(results[1].id, "sparse");
    EXPECT_DOUBLE_EQ(results[1].queryTermDensity, 0.25);
}

// 10. Полная ничья: порядок извлечения
TEST(SentenceRankingTest, FullTieKeepsExtractionOrder)
{
    DocumentSet sentences;
    sentences.add("second by text", {"cat", "dog"});
    sentences.add("first by text", {"cat", "bird"});

    IdfTable idfs = IdfCalculator::computeIdfs(sentences);
    auto top = Scorer::topSentences({"cat"}, sentences, idfs, 2);

    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0], "second by text");
    EXPECT_EQ(top[1], "first by text");
}

// 11. Пустое предложение - нарушение контракта
TEST(SentenceRankingTest, EmptySentenceThrows)
{
    DocumentSet sentences;
    sentences.add("ok", {"cat"});
    sentences.add("...", {});

    IdfTable idfs;
    EXPECT_THROW(Scorer::scoreSentences({"cat"}, sentences, idfs), DomainError);
}

// 12. Граничный сценарий: одно предложение "The cat sat."
TEST(SentenceRankingTest, SingleSentenceBoundaryScenario)
{
    DocumentSet files;
    files.add("a.txt", {"cat", "sat"});
    IdfTable fileIdfs = IdfCalculator::computeIdfs(files);

    EXPECT_EQ(Scorer::topFiles({"cat"}, files, fileIdfs, 1), (std::vector<std::string>{"a.txt"}));

    DocumentSet sentences;
    sentences.add("The cat sat.", {"cat", "sat"});
    IdfTable idfs = IdfCalculator::computeIdfs(sentences);

    auto results = Scorer::scoreSentences({"cat"}, sentences, idfs);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].id, "The cat sat.");
    EXPECT_DOUBLE_EQ(results[0].matchingWordMeasure, idfs.get("cat"));
    EXPECT_DOUBLE_EQ(results[0].queryTermDensity, 0.5);
}

// 13. Пустой запрос: (0, 0) для каждого предложения
TEST(SentenceRankingTest, EmptyQueryScoresZero)
{
    DocumentSet sentences;
    sentences.add("one", {"a", "b"});
    sentences.add("two", {"c"});

    IdfTable idfs = IdfCalculator::computeIdfs(sentences);
    auto results = Scorer::scoreSentences({}, sentences, idfs);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].id, "one");
    for (const auto &r : results)
    {
        EXPECT_EQ(r.matchingWordMeasure, 0.0);
        EXPECT_EQ(r.queryTermDensity, 0.0);
    }
}
