#ifndef PROTEIN_UNION_FIND_HPP
#define PROTEIN_UNION_FIND_HPP

#include <string>
#include <vector>
#include <unordered_map>

#include "protein_types.hpp"

// Union-Find (Disjoint Set Union) over protein identifiers with path compression.
// The element universe is every protein that appears in at least one interaction
// edge; proteins are interned to dense indices in order of first appearance.
// Union attaches the root of the second argument under the root of the first
// (no rank heuristic), so the partition is independent of edge order while the
// chosen root of each group is not.
class ProteinUnionFind {
public:
    // Initializes every protein referenced by `canonical_edges` as its own root,
    // then unions the endpoints of every edge in input order.
    // Self-edges and duplicate edges are accepted and leave the partition unchanged.
    explicit ProteinUnionFind(const std::vector<ProteinPair>& canonical_edges);

    // Finds the root protein of the group containing `protein`, compressing
    // the visited path onto that root.
    // Throws std::out_of_range if `protein` never appeared in an edge.
    std::string find(const std::string& protein);

    // Merges the groups containing 'a' and 'b'.
    // Returns true if a merge occurred; false if they were already in the same group.
    // Throws std::out_of_range if either protein never appeared in an edge.
    bool unionSets(const std::string& a, const std::string& b);

    // Checks if 'a' and 'b' are in the same group.
    // Throws std::out_of_range if either protein never appeared in an edge.
    bool sameSet(const std::string& a, const std::string& b);

    // True if `protein` was initialized (appeared in at least one edge).
    bool contains(const std::string& protein) const;

    // Groups proteins by root. Groups are enumerated in order of the first
    // member (by first appearance in the edge list); members keep that order too.
    std::vector<std::vector<std::string>> connectedGroups();

    // Maps each initialized protein to the index of its group in connectedGroups().
    GroupIdMap groupIdMap();

    // Returns the number of initialized proteins.
    int size() const;

    // Proteins in first-appearance order.
    const std::vector<std::string>& proteins() const;

    ~ProteinUnionFind() = default;

    ProteinUnionFind(const ProteinUnionFind&) = delete;
    ProteinUnionFind& operator=(const ProteinUnionFind&) = delete;
    ProteinUnionFind(ProteinUnionFind&&) = delete;
    ProteinUnionFind& operator=(ProteinUnionFind&&) = delete;

private:
    // Iterative root lookup; rewrites every node on the path to point at the root.
    // Precondition: 0 <= a < size()
    int findIndex(int a);

    // Precondition: 0 <= a < size(), 0 <= b < size()
    bool unionIndices(int a, int b);

    // Throws std::out_of_range for proteins outside the edge universe.
    int indexOf(const std::string& protein) const;

    int intern(const std::string& protein);

    std::vector<int> parent;
    std::vector<std::string> protein_ids;
    std::unordered_map<std::string, int> index_of;
    int num_elements;
};

#endif // PROTEIN_UNION_FIND_HPP
