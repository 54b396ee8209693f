/**
 * Ensemble refinement by pairwise RMSD bounds.
 *
 * Greedy graph pruning: conformations closer than `lower` or farther than
 * `upper` from another surviving conformation are removed, except protected
 * ones. The reference conformation is always protected.
 */

#pragma once

#include "ensemble.h"

#include "confens/common/observer.h"

#include <optional>
#include <string>
#include <vector>

namespace confens {
namespace ensemble {

/**
 * Conformation selector: an index or a label.
 */
struct ConformationRef {
    enum class Type { Index, Label };

    Type type = Type::Index;
    int index = 0;
    std::string label;

    static ConformationRef at(int index);
    static ConformationRef by_label(const std::string& label);

    /**
     * Parse a selector: an all-digit string is an index, anything else a label.
     */
    static ConformationRef parse(const std::string& spec);

    /**
     * Resolve to a conformation index.
     *
     * @throws LookupError if the label is not in the ensemble
     * @throws ValidationError if the index is out of range
     */
    int resolve(const Ensemble& ensemble) const;
};

/**
 * Configuration for refine_ensemble.
 */
struct RefineConfig {
    std::optional<float> lower = 0.5f;   // Minimum allowed pairwise RMSD (absent = no bound)
    std::optional<float> upper = 10.0f;  // Maximum allowed pairwise RMSD (absent = no bound)
    ConformationRef reference;           // Always kept; scanned first
    std::vector<ConformationRef> protected_confs;

    RefineConfig() = default;
};

/**
 * Remove conformations violating the pairwise RMSD bounds.
 *
 * For each bound, conformations are ordered by ascending number of
 * violations (ties by index) with the reference moved to the front, and pairs
 * are scanned in that order. A pair is skipped if either side is already
 * removed. On a violation the later side is removed unless protected, then the
 * earlier side unless protected. When both are protected the side that is
 * not the reference is removed, or the one with the larger index if neither
 * is the reference. Survivors of both passes are returned in ascending order.
 *
 * @return Index subset of the input ensemble
 * @throws PreconditionError if the ensemble has no conformations
 * @throws LookupError for an unknown reference or protected label
 */
Ensemble refine_ensemble(const Ensemble& ensemble, const RefineConfig& config = RefineConfig(),
                         common::Observer& observer = common::null_observer());

/**
 * Survivor indices of one greedy pruning pass over a violation relation.
 *
 * @param violates Symmetric relation [M * M]
 * @param M Number of conformations
 * @param reference Reference index (scanned first)
 * @param protected_set Protected indices (including the reference)
 */
std::vector<int> prune_by_relation(const std::vector<bool>& violates, int M, int reference,
                                   const std::vector<int>& protected_set);

}  // namespace ensemble
}  // namespace confens
