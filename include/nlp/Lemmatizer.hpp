#ifndef LEMMATIZER_HPP
#define LEMMATIZER_HPP

#include <string>
#include <new>
#include <stdexcept>
#include "libstemmer.h"

// Обёртка над Snowball-стеммером (libstemmer). Владеет sb_stemmer.
class Lemmatizer
{
private:
    struct sb_stemmer *stemmer;

public:
    explicit Lemmatizer(const std::string &language = "english")
    {
        stemmer = sb_stemmer_new(language.c_str(), "UTF_8");
        if (!stemmer)
            throw std::invalid_argument("no Snowball stemmer for language '" + language + "'");
    }

    ~Lemmatizer()
    {
        if (stemmer)
            sb_stemmer_delete(stemmer);
    }

    Lemmatizer(const Lemmatizer &) = delete;
    Lemmatizer &operator=(const Lemmatizer &) = delete;

    std::string lemmatize(const std::string &word)
    {
        const sb_symbol *stemmed = sb_stemmer_stem(stemmer,
                                                   reinterpret_cast<const sb_symbol *>(word.c_str()),
                                                   static_cast<int>(word.length()));
        if (!stemmed)
            throw std::bad_alloc();

        return std::string(reinterpret_cast<const char *>(stemmed), sb_stemmer_length(stemmer));
    }
};

#endif
