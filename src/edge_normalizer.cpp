#include "edge_normalizer.hpp"
#include <cctype>
#include <stdexcept>

std::string extractNumericToken(const std::string& protein_id)
{
    std::string digits;
    digits.reserve(protein_id.size());
    for (char c : protein_id)
    {
        if (std::isdigit(static_cast<unsigned char>(c)))
        {
            digits.push_back(c);
        }
    }

    if (digits.empty())
    {
        throw std::invalid_argument("Malformed protein identifier (no digits): '" + protein_id + "'");
    }

    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos)
    {
        return "0";
    }
    return digits.substr(first);
}

int compareNumericTokens(const std::string& lhs, const std::string& rhs)
{
    // Tokens carry no leading zeros, so the longer one is the larger number.
    if (lhs.size() != rhs.size())
    {
        return lhs.size() < rhs.size() ? -1 : 1;
    }
    int cmp = lhs.compare(rhs);
    return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

ProteinPair canonicalizeEdge(const ProteinPair& edge)
{
    int cmp = compareNumericTokens(extractNumericToken(edge.first), extractNumericToken(edge.second));

    if (cmp > 0 || (cmp == 0 && edge.second < edge.first))
    {
        return ProteinPair(edge.second, edge.first);
    }
    return edge;
}

std::vector<ProteinPair> canonicalizeEdges(const std::vector<ProteinPair>& edges)
{
    std::vector<ProteinPair> sorted;
    sorted.reserve(edges.size());
    for (const auto& edge : edges)
    {
        sorted.push_back(canonicalizeEdge(edge));
    }
    return sorted;
}
