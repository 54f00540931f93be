#ifndef PAIR_CLASSIFIER_PARALLEL_HPP
#define PAIR_CLASSIFIER_PARALLEL_HPP

#include <vector>

#include "protein_types.hpp"
#include "interaction_set.hpp"
#include "pair_classifier.hpp"

// Parallel pair classifier using OpenMP.
// The interface is consistent with the serial PairClassifier class.
// Joining and predicate evaluation are split across threads along the pair
// axis (rows are independent); selected rows are gathered on one thread so the
// output is in pair-universe order and identical to the serial result.
// Holds a reference to `known_interactions`; it must outlive the classifier.
class PairClassifierParallel {
public:
    explicit PairClassifierParallel(const InteractionSet& known_interactions);

    // Attaches compartment and group attributes to every pair in parallel.
    // The attribute maps are only read.
    std::vector<JoinedPair> join(const std::vector<ProteinPair>& pairs,
                                 const CompartmentMap& compartments,
                                 const GroupIdMap& group_ids) const;

    // Evaluates `category` on every row in parallel, then gathers matches in table order.
    std::vector<JoinedPair> classify(const std::vector<JoinedPair>& table, PairCategory category) const;

    bool matches(const JoinedPair& row, PairCategory category) const;

private:
    const InteractionSet& known;
};

#endif // PAIR_CLASSIFIER_PARALLEL_HPP
