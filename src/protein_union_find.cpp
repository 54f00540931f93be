#include "protein_union_find.hpp"
#include <cassert>
#include <stdexcept>

// Constructor
ProteinUnionFind::ProteinUnionFind(const std::vector<ProteinPair>& canonical_edges)
    : num_elements(0)
{
    // Every protein touched by an edge starts as its own root.
    for (const auto& edge : canonical_edges)
    {
        intern(edge.first);
        intern(edge.second);
    }

    for (const auto& edge : canonical_edges)
    {
        unionIndices(index_of.at(edge.first), index_of.at(edge.second));
    }
}

int ProteinUnionFind::intern(const std::string& protein)
{
    auto it = index_of.find(protein);
    if (it != index_of.end())
    {
        return it->second;
    }

    int idx = num_elements++;
    index_of.emplace(protein, idx);
    protein_ids.push_back(protein);
    parent.push_back(idx);
    return idx;
}

int ProteinUnionFind::indexOf(const std::string& protein) const
{
    auto it = index_of.find(protein);
    if (it == index_of.end())
    {
        throw std::out_of_range("Protein '" + protein + "' does not appear in any interaction edge.");
    }
    return it->second;
}

int ProteinUnionFind::findIndex(int a)
{
    assert(a >= 0 && a < num_elements && "Element index out of bounds in findIndex().");

    int root = a;
    while (parent[root] != root)
    {
        root = parent[root];
    }

    // Path compression
    while (parent[a] != root)
    {
        int next = parent[a];
        parent[a] = root;
        a = next;
    }
    return root;
}

bool ProteinUnionFind::unionIndices(int a, int b)
{
    assert(a >= 0 && a < num_elements && "Element index 'a' out of bounds in unionIndices().");
    assert(b >= 0 && b < num_elements && "Element index 'b' out of bounds in unionIndices().");

    int rootA = findIndex(a);
    int rootB = findIndex(b);

    if (rootA == rootB)
    {
        return false;
    }

    parent[rootB] = rootA;
    return true;
}

std::string ProteinUnionFind::find(const std::string& protein)
{
    return protein_ids[findIndex(indexOf(protein))];
}

bool ProteinUnionFind::unionSets(const std::string& a, const std::string& b)
{
    int idxA = indexOf(a);
    int idxB = indexOf(b);
    return unionIndices(idxA, idxB);
}

bool ProteinUnionFind::sameSet(const std::string& a, const std::string& b)
{
    int idxA = indexOf(a);
    int idxB = indexOf(b);
    return findIndex(idxA) == findIndex(idxB);
}

bool ProteinUnionFind::contains(const std::string& protein) const
{
    return index_of.count(protein) != 0;
}

std::vector<std::vector<std::string>> ProteinUnionFind::connectedGroups()
{
    std::vector<std::vector<std::string>> groups;
    std::vector<int> group_of_root(num_elements, -1);

    for (int i = 0; i < num_elements; i++)
    {
        int root = findIndex(i);
        if (group_of_root[root] < 0)
        {
            group_of_root[root] = static_cast<int>(groups.size());
            groups.emplace_back();
        }
        groups[group_of_root[root]].push_back(protein_ids[i]);
    }
    return groups;
}

GroupIdMap ProteinUnionFind::groupIdMap()
{
    GroupIdMap group_ids;
    group_ids.reserve(num_elements);

    std::vector<std::vector<std::string>> groups = connectedGroups();
    for (size_t group_id = 0; group_id < groups.size(); group_id++)
    {
        for (const auto& protein : groups[group_id])
        {
            group_ids[protein] = static_cast<int>(group_id);
        }
    }
    return group_ids;
}

int ProteinUnionFind::size() const
{
    return num_elements;
}

const std::vector<std::string>& ProteinUnionFind::proteins() const
{
    return protein_ids;
}
