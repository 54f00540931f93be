#ifndef PROTEIN_NETWORK_ANALYZER_HPP
#define PROTEIN_NETWORK_ANALYZER_HPP

#include <string>
#include <vector>

#include "protein_types.hpp"
#include "interaction_set.hpp"
#include "pair_classifier.hpp"

// Already-parsed inputs of one run.
struct NetworkInput {
    std::vector<std::string> proteins;      // ordered protein list
    CompartmentMap compartments;            // protein_id -> compartment_id
    std::vector<ProteinPair> interactions;  // raw edges, any orientation, duplicates allowed
};

// Which classifier runs the join and the filters.
enum class ExecutionMode { SERIAL, PARALLEL };

// Parses "serial" / "parallel". Returns false for anything else.
bool parseExecutionMode(const std::string& text, ExecutionMode& mode);

const char* executionModeName(ExecutionMode mode);

// Runs the whole pipeline once for a fixed input:
// raw edges -> canonical edges -> connectivity groups -> group id map
// -> pair universe -> joined pair table.
// Everything is computed in the constructor; the selections only filter the
// joined table and never modify it.
// Throws std::invalid_argument for a malformed edge identifier and
// std::length_error if the pair universe is too large.
class ProteinNetworkAnalyzer {
public:
    explicit ProteinNetworkAnalyzer(const NetworkInput& input, ExecutionMode mode = ExecutionMode::SERIAL);

    const std::vector<std::string>& proteins() const;
    const std::vector<ProteinPair>& canonicalInteractions() const;
    const InteractionSet& knownInteractions() const;
    const std::vector<ProteinPair>& allPairs() const;

    // Connectivity groups; index in this vector is the group id.
    const std::vector<std::vector<std::string>>& connectedGroups() const;
    const GroupIdMap& groupIdMap() const;

    const std::vector<JoinedPair>& joinedPairs() const;

    std::vector<JoinedPair> select(PairCategory category) const;

    // Pairs that are not known interactions.
    std::vector<JoinedPair> selectUnobservedInteractions() const;

    // Cross-compartment pairs that are not known interactions.
    std::vector<JoinedPair> selectCrossCompartmentUnobservedInteractions() const;

    // Cross-compartment pairs in different connectivity groups.
    std::vector<JoinedPair> selectCrossGroupCrossCompartmentInteractions() const;

    ExecutionMode mode() const;

private:
    ExecutionMode execution_mode;
    std::vector<std::string> protein_list;
    CompartmentMap compartment_map;
    std::vector<ProteinPair> interactions_sorted;
    InteractionSet known;
    std::vector<ProteinPair> all_pairs;
    std::vector<std::vector<std::string>> groups;
    GroupIdMap group_ids;
    std::vector<JoinedPair> joined;
};

#endif // PROTEIN_NETWORK_ANALYZER_HPP
