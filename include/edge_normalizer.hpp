#ifndef EDGE_NORMALIZER_HPP
#define EDGE_NORMALIZER_HPP

#include <string>
#include <vector>

#include "protein_types.hpp"

// Extracts the numeric token of a protein identifier by dropping every
// non-digit character and then any leading zeros ("P23" -> "23",
// "Q0a7" -> "7", "P000" -> "0"). The token is kept as a digit string, so
// identifiers of any length are accepted.
// Throws std::invalid_argument if the identifier holds no digits.
std::string extractNumericToken(const std::string& protein_id);

// Compares two tokens from extractNumericToken by numeric value.
// Returns -1, 0 or 1.
int compareNumericTokens(const std::string& lhs, const std::string& rhs);

// Returns the edge ordered so the protein with the smaller numeric token comes
// first. Equal tokens fall back to lexicographic order so the result is a total
// function of the two identifiers. Applying it twice is a no-op.
ProteinPair canonicalizeEdge(const ProteinPair& edge);

// Canonicalizes every edge, preserving input order and duplicates.
std::vector<ProteinPair> canonicalizeEdges(const std::vector<ProteinPair>& edges);

#endif // EDGE_NORMALIZER_HPP
