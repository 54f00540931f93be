#ifndef NETWORK_IO_HPP
#define NETWORK_IO_HPP

#include <string>
#include <vector>

#include "protein_types.hpp"

// Loaders and writers for the on-disk protein network files.
// All functions report problems on std::cerr and return false instead of throwing.

// Reads one protein identifier per line. Blank lines are skipped and
// surrounding whitespace is trimmed. Order is preserved.
bool load_proteins(const std::string& filename, std::vector<std::string>& proteins);

// Reads a CSV with a header containing "protein_id" and "compartment_id"
// columns (any position). Double-quoted fields may contain commas.
// A protein listed twice keeps its last row. An empty compartment_id leaves
// the protein without a compartment.
bool load_compartments(const std::string& filename, CompartmentMap& compartments);

// Reads whitespace-separated "protein_A protein_B" lines. Edges are returned
// as listed, not canonicalized.
bool load_interactions(const std::string& filename, std::vector<ProteinPair>& interactions);

// Writes rows as CSV with header
// protein_A,protein_B,compartment_A,compartment_B,group_A,group_B.
// Missing attributes are written as empty fields.
bool write_pair_table(const std::string& filename, const std::vector<JoinedPair>& rows);

#endif // NETWORK_IO_HPP
