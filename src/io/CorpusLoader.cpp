#include "io/CorpusLoader.hpp"
#include "core/Errors.hpp"
#include "nlp/HtmlParser.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace
{
    std::string lowerExtension(const std::string &filename)
    {
        std::string ext = fs::path(filename).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                       { return (char)std::tolower(c); });
        return ext;
    }

    std::string readFile(const fs::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
            throw NotFoundError("cannot open '" + path.string() + "'");

        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }
}

bool CorpusLoader::isTextFile(const std::string &filename)
{
    return lowerExtension(filename) == ".txt";
}

bool CorpusLoader::isHtmlFile(const std::string &filename)
{
    std::string ext = lowerExtension(filename);
    return ext == ".html" || ext == ".htm";
}

std::vector<RawDocument> CorpusLoader::load(const std::string &directory)
{
    std::error_code ec;
    if (!fs::is_directory(directory, ec))
        throw NotFoundError("the directory '" + directory + "' does not exist");

    std::vector<RawDocument> documents;
    for (const auto &entry : fs::directory_iterator(directory))
    {
        if (!entry.is_regular_file())
            continue;

        std::string filename = entry.path().filename().string();
        if (isTextFile(filename))
        {
            documents.push_back({filename, readFile(entry.path())});
        }
        else if (isHtmlFile(filename))
        {
            documents.push_back({filename, HtmlParser::getCleanText(readFile(entry.path()))});
        }
    }

    // Порядок directory_iterator не определён
    std::sort(documents.begin(), documents.end(), [](const RawDocument &a, const RawDocument &b)
              { return a.filename < b.filename; });

    return documents;
}
