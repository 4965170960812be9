#include "app/Cli.hpp"
#include "app/Options.hpp"
#include "app/QuestionAnswerer.hpp"
#include "core/Errors.hpp"
#include "io/CorpusLoader.hpp"

#include <iostream>
#include <string>
#include <vector>

int runQuestions(int argc, const char *const argv[],
                 std::istream &in, std::ostream &out, std::ostream &err,
                 bool prompt)
{
    Options options;
    try
    {
        options = parseOptions(argc, argv);
    }
    catch (const UsageError &e)
    {
        err << "Error: " << e.what() << "\n"
            << usage(argc > 0 ? argv[0] : "questions") << std::endl;
        return 2;
    }

    try
    {
        if (options.verbose)
            std::clog << "[LOAD] Reading corpus from " << options.corpusDir << "..." << std::endl;

        std::vector<RawDocument> corpus = CorpusLoader::load(options.corpusDir);

        if (options.verbose)
            std::clog << "[LOAD] " << corpus.size() << " files loaded." << std::endl;

        QuestionAnswerer answerer(options);
        answerer.prepare(corpus);

        if (prompt)
            out << "Query: " << std::flush;

        std::string query;
        if (!std::getline(in, query))
            query.clear();

        for (const auto &sentence : answerer.answer(query))
        {
            out << sentence << std::endl;
        }
    }
    catch (const NotFoundError &e)
    {
        err << "Error: " << e.what() << std::endl;
        return 1;
    }
    catch (const DomainError &e)
    {
        err << "Internal error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception &e)
    {
        err << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
