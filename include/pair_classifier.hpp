#ifndef PAIR_CLASSIFIER_HPP
#define PAIR_CLASSIFIER_HPP

#include <string>
#include <vector>

#include "protein_types.hpp"
#include "interaction_set.hpp"

// Named subsets of the joined pair table.
enum class PairCategory {
    UNOBSERVED,                     // not a known interaction edge
    UNOBSERVED_CROSS_COMPARTMENT,   // compartments differ and not a known edge
    CROSS_GROUP_CROSS_COMPARTMENT   // compartments differ and connectivity groups differ
};

// Short name of a category, used for logging and output file names.
const char* categoryName(PairCategory category);

// Evaluates one category predicate on one joined row. Missing compartments or
// groups count as different from everything.
bool matchesCategory(const JoinedPair& row, PairCategory category, const InteractionSet& known_interactions);

// Serial pair classifier. Joins the pair universe against the attribute maps
// and filters the joined table into the named subsets, in pair-universe order.
// Holds a reference to `known_interactions`; it must outlive the classifier.
class PairClassifier {
public:
    explicit PairClassifier(const InteractionSet& known_interactions);

    // Attaches compartment and group attributes to every pair.
    std::vector<JoinedPair> join(const std::vector<ProteinPair>& pairs,
                                 const CompartmentMap& compartments,
                                 const GroupIdMap& group_ids) const;

    // Returns the rows of `table` matching `category`, in table order.
    // Does not modify `table`; repeated calls return the same rows.
    std::vector<JoinedPair> classify(const std::vector<JoinedPair>& table, PairCategory category) const;

    bool matches(const JoinedPair& row, PairCategory category) const;

private:
    const InteractionSet& known;
};

#endif // PAIR_CLASSIFIER_HPP
