#include "app/Options.hpp"
#include "core/Errors.hpp"

#include <cctype>
#include <vector>

namespace
{
    size_t parseCount(const std::string &flag, const std::string &value)
    {
        bool digitsOnly = !value.empty();
        for (char c : value)
        {
            if (!std::isdigit(static_cast<unsigned char>(c)))
                digitsOnly = false;
        }

        if (!digitsOnly || value.size() > 9 || std::stoul(value) == 0)
            throw UsageError(flag + " expects a positive integer, got '" + value + "'");

        return std::stoul(value);
    }
}

std::string usage(const std::string &program)
{
    return "Usage: " + program + " [--files N] [--sentences N] [--stem] [--verbose] corpus";
}

Options parseOptions(int argc, const char *const argv[])
{
    Options options;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--stem")
        {
            options.stem = true;
        }
        else if (arg == "--verbose")
        {
            options.verbose = true;
        }
        else if (arg == "--files" || arg == "--sentences")
        {
            if (i + 1 >= argc)
                throw UsageError(arg + " requires a value");

            size_t count = parseCount(arg, argv[++i]);
            if (arg == "--files")
                options.fileMatches = count;
            else
                options.sentenceMatches = count;
        }
        else if (arg.size() > 1 && arg[0] == '-')
        {
            throw UsageError("unknown option '" + arg + "'");
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 1)
        throw UsageError("expected exactly one corpus directory");

    options.corpusDir = positional.front();
    return options;
}
