#ifndef PAIR_UNIVERSE_HPP
#define PAIR_UNIVERSE_HPP

#include <string>
#include <vector>
#include <cstdint>

#include "protein_types.hpp"

// Upper bound on the number of materialized pairs. Every pair holds two
// identifier strings, so the default keeps the universe within a few GB.
#ifndef PROTNET_MAX_PAIRS
#define PROTNET_MAX_PAIRS 50000000ULL
#endif

// Number of unordered pairs n*(n-1)/2 for n proteins.
std::uint64_t pairUniverseSize(std::size_t n_proteins);

// Generates every two-element combination of `proteins` in input order:
// (p0,p1), (p0,p2), ..., (p1,p2), ... Each pair keeps list order within it.
// Throws std::length_error if the universe would exceed `max_pairs`.
std::vector<ProteinPair> generateAllPairs(const std::vector<std::string>& proteins,
                                          std::uint64_t max_pairs = PROTNET_MAX_PAIRS);

#endif // PAIR_UNIVERSE_HPP
