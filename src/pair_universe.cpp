#include "pair_universe.hpp"
#include <stdexcept>

std::uint64_t pairUniverseSize(std::size_t n_proteins)
{
    std::uint64_t n = n_proteins;
    if (n < 2)
    {
        return 0;
    }
    return n * (n - 1) / 2;
}

std::vector<ProteinPair> generateAllPairs(const std::vector<std::string>& proteins, std::uint64_t max_pairs)
{
    std::uint64_t n_pairs = pairUniverseSize(proteins.size());
    if (n_pairs > max_pairs)
    {
        throw std::length_error("Pair universe of " + std::to_string(proteins.size()) + " proteins has " +
                                std::to_string(n_pairs) + " pairs, above the limit of " +
                                std::to_string(max_pairs) + ".");
    }

    std::vector<ProteinPair> pairs;
    pairs.reserve(static_cast<size_t>(n_pairs));
    for (size_t i = 0; i < proteins.size(); i++)
    {
        for (size_t j = i + 1; j < proteins.size(); j++)
        {
            pairs.emplace_back(proteins[i], proteins[j]);
        }
    }
    return pairs;
}
