#ifndef INTERACTION_SET_HPP
#define INTERACTION_SET_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

#include "protein_types.hpp"

// Hash for (protein_A, protein_B) keys.
struct ProteinPairHash {
    std::size_t operator()(const ProteinPair& p) const {
        std::size_t h1 = std::hash<std::string>()(p.first);
        std::size_t h2 = std::hash<std::string>()(p.second);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

// Set of known direct interactions, built from already canonicalized edges.
// Duplicates collapse. Membership is tested in either orientation so a
// universe pair matches an edge regardless of which side sorts first.
class InteractionSet {
public:
    InteractionSet() = default;
    explicit InteractionSet(const std::vector<ProteinPair>& canonical_edges);

    void insert(const ProteinPair& canonical_edge);

    // True if (a, b) or (b, a) is a known interaction.
    bool contains(const std::string& a, const std::string& b) const;

    // Number of distinct stored edges.
    std::size_t size() const;

private:
    std::unordered_set<ProteinPair, ProteinPairHash> edges;
};

#endif // INTERACTION_SET_HPP
