#include "protein_network_analyzer.hpp"
#include "edge_normalizer.hpp"
#include "pair_universe.hpp"
#include "pair_classifier_parallel.hpp"
#include "protein_union_find.hpp"

bool parseExecutionMode(const std::string& text, ExecutionMode& mode)
{
    if (text == "serial")
    {
        mode = ExecutionMode::SERIAL;
        return true;
    }
    if (text == "parallel")
    {
        mode = ExecutionMode::PARALLEL;
        return true;
    }
    return false;
}

const char* executionModeName(ExecutionMode mode)
{
    return mode == ExecutionMode::PARALLEL ? "parallel" : "serial";
}

// Constructor
ProteinNetworkAnalyzer::ProteinNetworkAnalyzer(const NetworkInput& input, ExecutionMode mode)
    : execution_mode(mode),
      protein_list(input.proteins),
      compartment_map(input.compartments),
      interactions_sorted(canonicalizeEdges(input.interactions)),
      known(interactions_sorted),
      all_pairs(generateAllPairs(input.proteins))
{
    ProteinUnionFind union_find(interactions_sorted);
    groups = union_find.connectedGroups();
    group_ids = union_find.groupIdMap();

    if (execution_mode == ExecutionMode::PARALLEL)
    {
        joined = PairClassifierParallel(known).join(all_pairs, compartment_map, group_ids);
    }
    else
    {
        joined = PairClassifier(known).join(all_pairs, compartment_map, group_ids);
    }
}

const std::vector<std::string>& ProteinNetworkAnalyzer::proteins() const
{
    return protein_list;
}

const std::vector<ProteinPair>& ProteinNetworkAnalyzer::canonicalInteractions() const
{
    return interactions_sorted;
}

const InteractionSet& ProteinNetworkAnalyzer::knownInteractions() const
{
    return known;
}

const std::vector<ProteinPair>& ProteinNetworkAnalyzer::allPairs() const
{
    return all_pairs;
}

const std::vector<std::vector<std::string>>& ProteinNetworkAnalyzer::connectedGroups() const
{
    return groups;
}

const GroupIdMap& ProteinNetworkAnalyzer::groupIdMap() const
{
    return group_ids;
}

const std::vector<JoinedPair>& ProteinNetworkAnalyzer::joinedPairs() const
{
    return joined;
}

std::vector<JoinedPair> ProteinNetworkAnalyzer::select(PairCategory category) const
{
    if (execution_mode == ExecutionMode::PARALLEL)
    {
        return PairClassifierParallel(known).classify(joined, category);
    }
    return PairClassifier(known).classify(joined, category);
}

std::vector<JoinedPair> ProteinNetworkAnalyzer::selectUnobservedInteractions() const
{
    return select(PairCategory::UNOBSERVED);
}

std::vector<JoinedPair> ProteinNetworkAnalyzer::selectCrossCompartmentUnobservedInteractions() const
{
    return select(PairCategory::UNOBSERVED_CROSS_COMPARTMENT);
}

std::vector<JoinedPair> ProteinNetworkAnalyzer::selectCrossGroupCrossCompartmentInteractions() const
{
    return select(PairCategory::CROSS_GROUP_CROSS_COMPARTMENT);
}

ExecutionMode ProteinNetworkAnalyzer::mode() const
{
    return execution_mode;
}
