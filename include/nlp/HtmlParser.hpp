#ifndef HTML_PARSER_HPP
#define HTML_PARSER_HPP

#include <string>
#include <gumbo.h>

// Извлекает видимый текст из HTML. Блочные элементы завершаются переводом
// строки, чтобы абзацы оставались отдельными фрагментами для SentenceSplitter.
class HtmlParser
{
public:
    static std::string getCleanText(const std::string &html)
    {
        GumboOutput *output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());

        std::string result;
        extractText(output->root, result);

        gumbo_destroy_output(&kGumboDefaultOptions, output);

        return result;
    }

private:
    static bool isBlock(GumboTag tag)
    {
        switch (tag)
        {
        case GUMBO_TAG_P:
        case GUMBO_TAG_DIV:
        case GUMBO_TAG_BR:
        case GUMBO_TAG_LI:
        case GUMBO_TAG_TR:
        case GUMBO_TAG_H1:
        case GUMBO_TAG_H2:
        case GUMBO_TAG_H3:
        case GUMBO_TAG_H4:
        case GUMBO_TAG_H5:
        case GUMBO_TAG_H6:
        case GUMBO_TAG_TITLE:
        case GUMBO_TAG_BLOCKQUOTE:
        case GUMBO_TAG_PRE:
            return true;
        default:
            return false;
        }
    }

    static void extractText(const GumboNode *node, std::string &text)
    {
        if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_WHITESPACE)
        {
            text.append(node->v.text.text);
            return;
        }

        if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_DOCUMENT)
            return;

        if (node->type == GUMBO_NODE_ELEMENT)
        {
            GumboTag tag = node->v.element.tag;
            if (tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE || tag == GUMBO_TAG_NOSCRIPT)
                return;
        }

        const GumboVector *children = node->type == GUMBO_NODE_DOCUMENT
                                          ? &node->v.document.children
                                          : &node->v.element.children;
        for (unsigned int i = 0; i < children->length; ++i)
        {
            extractText(static_cast<const GumboNode *>(children->data[i]), text);
        }

        if (node->type == GUMBO_NODE_ELEMENT && isBlock(node->v.element.tag))
            text.append("\n");
    }
};

#endif
