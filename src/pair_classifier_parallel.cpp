#include "pair_classifier_parallel.hpp"
#include "attribute_joiner.hpp"
#include <omp.h>
#include <vector>

// Constructor
PairClassifierParallel::PairClassifierParallel(const InteractionSet& known_interactions)
    : known(known_interactions)
{
}

std::vector<JoinedPair> PairClassifierParallel::join(const std::vector<ProteinPair>& pairs,
                                                     const CompartmentMap& compartments,
                                                     const GroupIdMap& group_ids) const
{
    long long nPairs = static_cast<long long>(pairs.size());
    std::vector<JoinedPair> table(pairs.size());

    // Each iteration writes only its own slot.
    #pragma omp parallel for schedule(static)
    for (long long i = 0; i < nPairs; i++)
    {
        table[i] = joinPair(pairs[i], compartments, group_ids);
    }
    return table;
}

std::vector<JoinedPair> PairClassifierParallel::classify(const std::vector<JoinedPair>& table, PairCategory category) const
{
    long long nRows = static_cast<long long>(table.size());
    std::vector<char> keep(table.size(), 0);

    #pragma omp parallel for schedule(static)
    for (long long i = 0; i < nRows; i++)
    {
        keep[i] = matches(table[i], category) ? 1 : 0;
    }

    std::vector<JoinedPair> selected;
    for (long long i = 0; i < nRows; i++)
    {
        if (keep[i])
        {
            selected.push_back(table[i]);
        }
    }
    return selected;
}

bool PairClassifierParallel::matches(const JoinedPair& row, PairCategory category) const
{
    return matchesCategory(row, category, known);
}
