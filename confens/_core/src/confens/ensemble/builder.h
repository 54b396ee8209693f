/**
 * Ensemble builder: maps heterogeneous structures onto a common reference
 * frame, collects their coordinates with presence weights, optionally trims
 * by occupancy, and superposes the result.
 */

#pragma once

#include "ensemble.h"

#include "confens/common/observer.h"
#include "confens/mapping/atom_mapper.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace confens {
namespace ensemble {

/**
 * Which reference frame the builder maps inputs onto.
 */
struct ReferenceSpec {
    enum class Type { First, Index, Structure, Extend };

    Type type = Type::First;
    int index = 0;
    std::shared_ptr<const io::Structure> structure;
    const Ensemble* ensemble = nullptr;

    /// First input structure (default).
    static ReferenceSpec first();

    /// Input structure at the given position.
    static ReferenceSpec at(int index);

    /// Explicit structure, not necessarily one of the inputs.
    static ReferenceSpec from_structure(std::shared_ptr<const io::Structure> structure);

    /// Append to an existing ensemble, reusing its atoms as the reference.
    static ReferenceSpec extend(const Ensemble& ensemble);
};

enum class SuperposeMode {
    Iterative,  // Superpose onto the evolving mean until it converges
    Once        // Superpose onto the reference coordinates once
};

/**
 * Configuration for build_pdb_ensemble.
 */
struct BuildConfig {
    std::string title = "Unknown";

    // One label per input; empty means each structure's own title.
    std::vector<std::string> labels;

    // Atom selection applied to the reference and to every input.
    std::string subset = "calpha";

    // true: only the active coordinate set of each structure is added.
    // false: every coordinate set; labels get an _m<model> suffix when a
    // structure has more than one.
    bool degeneracy = true;

    // Hard-trim columns whose occupancy is below this value, in (0, 1].
    std::optional<float> occupancy;

    SuperposeMode superpose = SuperposeMode::Iterative;
    float tolerance = 1e-4f;
    int max_iterations = 100;

    BuildConfig() = default;
};

/**
 * Build a PDB ensemble.
 *
 * Null entries in structures are unavailable inputs: they, and inputs the
 * mapper cannot match, are recorded in unmapped (when given) and skipped.
 *
 * @param structures Input structures (at least two; entries may be null)
 * @param reference Reference frame selection
 * @param config Build options
 * @param mapper Atom mapping service
 * @param observer Progress and log side channel
 * @param unmapped Optional output: labels of inputs that were not added
 *
 * @throws PreconditionError for fewer than two inputs, an unavailable
 *         reference, an input without chain/residue information, or an
 *         ensemble to extend without atoms
 * @throws DimensionError if the label count does not match the input count
 */
Ensemble build_pdb_ensemble(const std::vector<std::shared_ptr<const io::Structure>>& structures,
                            const ReferenceSpec& reference, const BuildConfig& config,
                            mapping::AtomMapper& mapper,
                            common::Observer& observer = common::null_observer(),
                            std::vector<std::string>* unmapped = nullptr);

}  // namespace ensemble
}  // namespace confens
