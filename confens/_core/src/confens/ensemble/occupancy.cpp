#include "occupancy.h"

#include "confens/errors/confens_error.h"
#include "confens/errors/validators.h"

#include <sstream>

namespace confens {
namespace ensemble {

namespace {

void require_presence_ensemble(const Ensemble& ensemble, const std::string& operation) {
    if (!ensemble.has_presence_weights()) {
        throw errors::PreconditionError(operation, "an ensemble with presence weights",
                                        "Build a PDB ensemble with build_pdb_ensemble");
    }
    if (ensemble.num_conformations() == 0) {
        throw errors::PreconditionError(operation, "an ensemble with at least one conformation");
    }
}

}  // namespace

std::vector<float> calc_occupancies(const Ensemble& ensemble, bool normed) {
    require_presence_ensemble(ensemble, "calc_occupancies");

    const int n = ensemble.num_atoms(true);
    const int M = ensemble.num_conformations();
    const std::vector<float> weights = ensemble.weights(true);

    std::vector<float> occupancies(n, 0.0f);
    for (int i = 0; i < M; i++) {
        const float* w = weights.data() + static_cast<size_t>(i) * n;
        for (int k = 0; k < n; k++) {
            if (w[k] != 0.0f) {
                occupancies[k] += 1.0f;
            }
        }
    }

    if (normed) {
        for (float& value : occupancies) {
            value /= static_cast<float>(M);
        }
    }
    return occupancies;
}

Ensemble trim_pdb_ensemble(const Ensemble& ensemble, const TrimConfig& config) {
    require_presence_ensemble(ensemble, "trim_pdb_ensemble");
    if (ensemble.num_atoms(true) == 0) {
        throw errors::PreconditionError("trim_pdb_ensemble", "an ensemble with at least one atom");
    }

    const std::vector<int> active = ensemble.indices();
    std::vector<int> keep_positions;  // relative to the active view

    if (config.occupancy) {
        validation::validate_open_closed_range(*config.occupancy, 0.0f, 1.0f, "occupancy");
        const std::vector<float> occupancies = calc_occupancies(ensemble, true);
        for (size_t k = 0; k < occupancies.size(); k++) {
            if (occupancies[k] >= *config.occupancy) {
                keep_positions.push_back(static_cast<int>(k));
            }
        }
        if (keep_positions.empty()) {
            std::ostringstream threshold;
            threshold << *config.occupancy;
            throw errors::PreconditionError(
                "trim_pdb_ensemble", "at least one atom with occupancy >= " + threshold.str(),
                "Lower the occupancy threshold");
        }
    } else {
        keep_positions.resize(active.size());
        for (size_t k = 0; k < active.size(); k++) {
            keep_positions[k] = static_cast<int>(k);
        }
    }

    const bool hard = config.hard || !config.occupancy || !ensemble.has_atoms();

    if (hard) {
        std::vector<int> full_frame;
        full_frame.reserve(keep_positions.size());
        for (int p : keep_positions) {
            full_frame.push_back(active[p]);
        }
        return ensemble.slice_atoms(full_frame);
    }

    Ensemble trimmed = ensemble;
    trimmed.select(keep_positions);
    return trimmed;
}

}  // namespace ensemble
}  // namespace confens
