#ifndef TOKENIZER_HPP
#define TOKENIZER_HPP

#include <string>
#include <vector>
#include <locale>
#include <codecvt>

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

// Разбивает UTF-8 текст на слова в нижнем регистре.
// Всё, что не буква и не цифра, считается разделителем, поэтому знаки
// препинания никогда не попадают в токены.
class Tokenizer
{
public:
    static std::vector<std::string> tokenize(const std::string &text)
    {
        std::wstring_convert<std::codecvt_utf8<wchar_t>> converter;
        std::wstring wtext = decodeUtf8(text);

        std::vector<std::string> tokens;
        std::wstring current;

        for (wchar_t wc : wtext)
        {
            wc = foldCase(wc);

            if (isWordChar(wc))
            {
                current += wc;
            }
            else if (!current.empty())
            {
                tokens.push_back(converter.to_bytes(current));
                current.clear();
            }
        }

        if (!current.empty())
        {
            tokens.push_back(converter.to_bytes(current));
        }

        return tokens;
    }

private:
    // Битые последовательности заменяются на U+FFFD (разделитель),
    // остальной текст декодируется как обычно.
    static std::wstring decodeUtf8(const std::string &text)
    {
        std::wstring result;
        result.reserve(text.size());

        size_t i = 0;
        while (i < text.size())
        {
            unsigned char lead = static_cast<unsigned char>(text[i]);
            size_t length = 0;
            wchar_t wc = 0;

            if (lead < 0x80)
            {
                length = 1;
                wc = lead;
            }
            else if (lead >= 0xC2 && lead <= 0xDF)
            {
                length = 2;
                wc = lead & 0x1F;
            }
            else if (lead >= 0xE0 && lead <= 0xEF)
            {
                length = 3;
                wc = lead & 0x0F;
            }
            else if (lead >= 0xF0 && lead <= 0xF4)
            {
                length = 4;
                wc = lead & 0x07;
            }

            if (length == 0 || !validSequence(text, i, length))
            {
                result += static_cast<wchar_t>(0xFFFD);
                i++;
                continue;
            }

            for (size_t k = 1; k < length; ++k)
            {
                wc = (wc << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
            }
            result += wc;
            i += length;
        }

        return result;
    }

    static bool validSequence(const std::string &text, size_t pos, size_t length)
    {
        if (pos + length > text.size())
            return false;

        for (size_t k = 1; k < length; ++k)
        {
            unsigned char c = static_cast<unsigned char>(text[pos + k]);
            if (c < 0x80 || c > 0xBF)
                return false;
        }

        // Overlong-формы, суррогаты и значения выше U+10FFFF
        unsigned char lead = static_cast<unsigned char>(text[pos]);
        unsigned char second = length > 1 ? static_cast<unsigned char>(text[pos + 1]) : 0;
        if (lead == 0xE0 && second < 0xA0)
            return false;
        if (lead == 0xED && second > 0x9F)
            return false;
        if (lead == 0xF0 && second < 0x90)
            return false;
        if (lead == 0xF4 && second > 0x8F)
            return false;
        return true;
    }

    static wchar_t foldCase(wchar_t wc)
    {
        if (wc >= L'A' && wc <= L'Z')
            return wc + 32;
        if (wc >= 0x00C0 && wc <= 0x00DE && wc != 0x00D7) // Latin-1: À..Þ без ×
            return wc + 0x20;
        if (wc >= 0x0410 && wc <= 0x042F) // А..Я
            return wc + 0x20;
        if (wc == 0x0401) // Ё
            return 0x0451;
        return wc;
    }

    static bool isWordChar(wchar_t wc)
    {
        return (wc >= L'a' && wc <= L'z') ||
               (wc >= L'0' && wc <= L'9') ||
               (wc >= 0x00DF && wc <= 0x00FF && wc != 0x00F7) || // Latin-1 строчные, без ÷
               (wc >= 0x0430 && wc <= 0x044F) ||
               (wc == 0x0451);
    }
};

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif
