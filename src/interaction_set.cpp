#include "interaction_set.hpp"

InteractionSet::InteractionSet(const std::vector<ProteinPair>& canonical_edges)
{
    edges.reserve(canonical_edges.size());
    for (const auto& edge : canonical_edges)
    {
        insert(edge);
    }
}

void InteractionSet::insert(const ProteinPair& canonical_edge)
{
    edges.insert(canonical_edge);
}

bool InteractionSet::contains(const std::string& a, const std::string& b) const
{
    if (edges.count(ProteinPair(a, b)) != 0)
    {
        return true;
    }
    return edges.count(ProteinPair(b, a)) != 0;
}

std::size_t InteractionSet::size() const
{
    return edges.size();
}
