#ifndef ATTRIBUTE_JOINER_HPP
#define ATTRIBUTE_JOINER_HPP

#include <string>
#include <vector>
#include <optional>

#include "protein_types.hpp"

// Compartment of `protein`, or an empty optional when it has no assignment.
std::optional<std::string> lookupCompartment(const CompartmentMap& compartments, const std::string& protein);

// Group id of `protein`, or an empty optional when it has no interaction edge.
std::optional<int> lookupGroup(const GroupIdMap& group_ids, const std::string& protein);

// Attaches compartment and group id to both sides of one pair. Never throws
// on a missing key.
JoinedPair joinPair(const ProteinPair& pair, const CompartmentMap& compartments, const GroupIdMap& group_ids);

// Joins every pair, preserving pair-universe order.
std::vector<JoinedPair> joinAttributes(const std::vector<ProteinPair>& pairs,
                                       const CompartmentMap& compartments,
                                       const GroupIdMap& group_ids);

#endif // ATTRIBUTE_JOINER_HPP
