#ifndef PROTEIN_TYPES_HPP
#define PROTEIN_TYPES_HPP

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <unordered_map>

// Shared record shapes for the protein interaction pipeline.

// An interaction edge or a pair from the pair universe: (protein_A, protein_B).
using ProteinPair = std::pair<std::string, std::string>;

// protein_id -> compartment_id
using CompartmentMap = std::unordered_map<std::string, std::string>;

// protein_id -> dense connectivity group id. Only proteins that appear in at
// least one interaction edge are present.
using GroupIdMap = std::unordered_map<std::string, int>;

// One row of the joined pair table. An empty optional is the "missing"
// sentinel for that attribute.
struct JoinedPair {
    std::string protein_A;
    std::string protein_B;
    std::optional<std::string> compartment_A;
    std::optional<std::string> compartment_B;
    std::optional<int> group_A;
    std::optional<int> group_B;
};

// Two attribute values differ unless both are present and equal.
// A missing value never equals anything, including another missing value.
template <typename T>
bool attributesDiffer(const std::optional<T>& a, const std::optional<T>& b) {
    if (!a || !b) {
        return true;
    }
    return *a != *b;
}

inline bool operator==(const JoinedPair& lhs, const JoinedPair& rhs) {
    return lhs.protein_A == rhs.protein_A && lhs.protein_B == rhs.protein_B &&
           lhs.compartment_A == rhs.compartment_A && lhs.compartment_B == rhs.compartment_B &&
           lhs.group_A == rhs.group_A && lhs.group_B == rhs.group_B;
}

inline bool operator!=(const JoinedPair& lhs, const JoinedPair& rhs) {
    return !(lhs == rhs);
}

#endif // PROTEIN_TYPES_HPP
