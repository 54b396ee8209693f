/**
 * Per-atom occupancy statistics and occupancy-based trimming.
 */

#pragma once

#include "ensemble.h"

#include <optional>
#include <vector>

namespace confens {
namespace ensemble {

/**
 * Configuration for trim_pdb_ensemble.
 */
struct TrimConfig {
    // Keep atoms whose normalized occupancy is >= this value, in (0, 1].
    // Absent keeps every active atom.
    std::optional<float> occupancy;

    // Physically discard trimmed atoms. Forced when occupancy is absent or no
    // atom structure is attached.
    bool hard = false;

    TrimConfig() = default;
};

/**
 * Occupancy of each active atom: the number of conformations in which the
 * atom has a nonzero presence weight, divided by the number of conformations
 * when normed.
 *
 * @return Occupancies [num_atoms(selected=true)]
 * @throws PreconditionError for ensembles without presence weights or conformations
 */
std::vector<float> calc_occupancies(const Ensemble& ensemble, bool normed = false);

/**
 * Trim an ensemble by occupancy.
 *
 * Hard trimming builds a new reference frame from the kept atoms. Soft
 * trimming copies the storage and narrows the selection view, composing with
 * any existing selection. The input is left unmodified; auxiliary data is
 * shared with the result.
 *
 * @throws ValidationError if occupancy is outside (0, 1]
 * @throws PreconditionError for ensembles without presence weights,
 *         conformations or atoms
 */
Ensemble trim_pdb_ensemble(const Ensemble& ensemble, const TrimConfig& config = TrimConfig());

}  // namespace ensemble
}  // namespace confens
