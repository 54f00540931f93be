#include "attribute_joiner.hpp"

std::optional<std::string> lookupCompartment(const CompartmentMap& compartments, const std::string& protein)
{
    auto it = compartments.find(protein);
    if (it == compartments.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<int> lookupGroup(const GroupIdMap& group_ids, const std::string& protein)
{
    auto it = group_ids.find(protein);
    if (it == group_ids.end())
    {
        return std::nullopt;
    }
    return it->second;
}

JoinedPair joinPair(const ProteinPair& pair, const CompartmentMap& compartments, const GroupIdMap& group_ids)
{
    JoinedPair row;
    row.protein_A = pair.first;
    row.protein_B = pair.second;
    row.compartment_A = lookupCompartment(compartments, pair.first);
    row.compartment_B = lookupCompartment(compartments, pair.second);
    row.group_A = lookupGroup(group_ids, pair.first);
    row.group_B = lookupGroup(group_ids, pair.second);
    return row;
}

std::vector<JoinedPair> joinAttributes(const std::vector<ProteinPair>& pairs,
                                       const CompartmentMap& compartments,
                                       const GroupIdMap& group_ids)
{
    std::vector<JoinedPair> table;
    table.reserve(pairs.size());
    for (const auto& pair : pairs)
    {
        table.push_back(joinPair(pair, compartments, group_ids));
    }
    return table;
}
