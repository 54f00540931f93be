#include "pair_classifier.hpp"
#include "attribute_joiner.hpp"
#include <stdexcept>

const char* categoryName(PairCategory category)
{
    switch (category)
    {
        case PairCategory::UNOBSERVED:
            return "unobserved_pairs";
        case PairCategory::UNOBSERVED_CROSS_COMPARTMENT:
            return "unobserved_cross_compartment_pairs";
        case PairCategory::CROSS_GROUP_CROSS_COMPARTMENT:
            return "cross_group_cross_compartment_pairs";
    }
    throw std::invalid_argument("Unknown pair category.");
}

bool matchesCategory(const JoinedPair& row, PairCategory category, const InteractionSet& known_interactions)
{
    switch (category)
    {
        case PairCategory::UNOBSERVED:
            return !known_interactions.contains(row.protein_A, row.protein_B);
        case PairCategory::UNOBSERVED_CROSS_COMPARTMENT:
            return attributesDiffer(row.compartment_A, row.compartment_B) &&
                   !known_interactions.contains(row.protein_A, row.protein_B);
        case PairCategory::CROSS_GROUP_CROSS_COMPARTMENT:
            return attributesDiffer(row.compartment_A, row.compartment_B) &&
                   attributesDiffer(row.group_A, row.group_B);
    }
    throw std::invalid_argument("Unknown pair category.");
}

// Constructor
PairClassifier::PairClassifier(const InteractionSet& known_interactions)
    : known(known_interactions)
{
}

std::vector<JoinedPair> PairClassifier::join(const std::vector<ProteinPair>& pairs,
                                             const CompartmentMap& compartments,
                                             const GroupIdMap& group_ids) const
{
    return joinAttributes(pairs, compartments, group_ids);
}

std::vector<JoinedPair> PairClassifier::classify(const std::vector<JoinedPair>& table, PairCategory category) const
{
    std::vector<JoinedPair> selected;
    for (const auto& row : table)
    {
        if (matches(row, category))
        {
            selected.push_back(row);
        }
    }
    return selected;
}

bool PairClassifier::matches(const JoinedPair& row, PairCategory category) const
{
    return matchesCategory(row, category, known);
}
