#include "core/DocumentSet.hpp"

#include <utility>

void DocumentSet::add(const std::string &id, std::vector<Term> tokens)
{
    const size_t *position = positions.get(id);
    if (position)
    {
        documents[*position].tokens = std::move(tokens);
        return;
    }

    positions.insert(id, documents.size());
    documents.push_back({id, std::move(tokens)});
}

const std::vector<Term> *DocumentSet::find(const std::string &id) const
{
    const size_t *position = positions.get(id);
    return position ? &documents[*position].tokens : nullptr;
}
