#include "builder.h"

#include "occupancy.h"

#include "confens/common/perf_timer.h"
#include "confens/errors/confens_error.h"
#include "confens/errors/validators.h"

#include <sstream>

namespace confens {
namespace ensemble {

ReferenceSpec ReferenceSpec::first() {
    return ReferenceSpec();
}

ReferenceSpec ReferenceSpec::at(int index) {
    ReferenceSpec spec;
    spec.type = Type::Index;
    spec.index = index;
    return spec;
}

ReferenceSpec ReferenceSpec::from_structure(std::shared_ptr<const io::Structure> structure) {
    ReferenceSpec spec;
    spec.type = Type::Structure;
    spec.structure = std::move(structure);
    return spec;
}

ReferenceSpec ReferenceSpec::extend(const Ensemble& ensemble) {
    ReferenceSpec spec;
    spec.type = Type::Extend;
    spec.ensemble = &ensemble;
    return spec;
}

namespace {

constexpr const char* kProgressKey = "build_pdb_ensemble";

std::shared_ptr<const io::Structure> resolve_reference_structure(
    const std::vector<std::shared_ptr<const io::Structure>>& structures,
    const ReferenceSpec& reference) {
    switch (reference.type) {
        case ReferenceSpec::Type::First:
            return structures.front();
        case ReferenceSpec::Type::Index:
            if (reference.index < 0 || reference.index >= static_cast<int>(structures.size())) {
                throw errors::ValidationError(
                    "reference index", std::to_string(reference.index),
                    "index in [0, " + std::to_string(structures.size()) + ")");
            }
            return structures[reference.index];
        case ReferenceSpec::Type::Structure:
            return reference.structure;
        case ReferenceSpec::Type::Extend:
            break;
    }
    return nullptr;
}

}  // namespace

Ensemble build_pdb_ensemble(const std::vector<std::shared_ptr<const io::Structure>>& structures,
                            const ReferenceSpec& reference, const BuildConfig& config,
                            mapping::AtomMapper& mapper, common::Observer& observer,
                            std::vector<std::string>* unmapped) {
    perf::ScopedTimer timer("build_pdb_ensemble");

    if (structures.size() < 2) {
        throw errors::PreconditionError("build_pdb_ensemble", "at least two input structures");
    }
    validation::validate_choice(config.subset, io::Structure::selection_keywords(), "subset");

    std::vector<std::string> labels = config.labels;
    if (!labels.empty()) {
        validation::validate_dimensions_match(labels.size(), structures.size(), "labels",
                                              "structures");
    } else {
        labels.reserve(structures.size());
        for (const auto& structure : structures) {
            labels.push_back(structure ? structure->title() : "");
        }
    }

    // Step 1: reference frame
    Ensemble result(config.title, EnsembleKind::PDB);
    io::Structure target;

    if (reference.type == ReferenceSpec::Type::Extend) {
        if (reference.ensemble == nullptr || !reference.ensemble->has_atoms()) {
            throw errors::PreconditionError("build_pdb_ensemble",
                                            "an ensemble to extend with attached atoms");
        }
        if (!reference.ensemble->has_presence_weights()) {
            throw errors::PreconditionError("build_pdb_ensemble",
                                            "an ensemble to extend with presence weights");
        }
        result = *reference.ensemble;
        target = result.atoms(false);
    } else {
        std::shared_ptr<const io::Structure> ref = resolve_reference_structure(structures, reference);
        if (!ref) {
            throw errors::PreconditionError("build_pdb_ensemble", "an available reference structure",
                                            "The reference input is null");
        }
        target = config.subset == "all" ? *ref : ref->select(config.subset);
        if (target.num_atoms() == 0 || target.num_coordsets() == 0) {
            throw errors::PreconditionError(
                "build_pdb_ensemble",
                "a reference with atoms matching subset '" + config.subset + "'");
        }
        result.set_atoms(target);
        result.set_coords(target.coords());
    }

    // Step 2: map every input onto the reference
    std::vector<std::string> skipped;
    const int total = static_cast<int>(structures.size());

    for (int i = 0; i < total; i++) {
        const auto& structure = structures[i];
        observer.progress(i, total, "Mapping " + labels[i] + " to the reference...",
                          kProgressKey);
        if (!structure) {
            skipped.push_back(labels[i]);
            continue;
        }

        if (!structure->has_hierarchy()) {
            throw errors::PreconditionError(
                "build_pdb_ensemble", "input structures with chain and residue information",
                "Input '" + labels[i] + "' has no residue hierarchy");
        }

        std::shared_ptr<const io::Structure> atoms =
            config.subset == "all" ? structure
                                   : std::make_shared<const io::Structure>(
                                         structure->select(config.subset));

        std::vector<mapping::AtomMap> maps = mapper.map(atoms, target);
        if (maps.empty()) {
            skipped.push_back(labels[i]);
            continue;
        }

        for (const auto& map : maps) {
            std::string label = labels[i];
            if (maps.size() > 1) {
                label += "_" + map.chain_ids();
            }

            std::vector<int> states;
            if (config.degeneracy) {
                states.push_back(map.active_state());
            } else {
                for (int s = 0; s < map.num_states(); s++) states.push_back(s);
            }

            const std::vector<float> weights = map.matched_flags();
            const std::string sequence = map.sequence();
            for (int state : states) {
                std::string state_label =
                    states.size() > 1 ? label + "_m" + std::to_string(state + 1) : label;
                result.add_conformation(map.coords(state), weights, state_label, sequence);
            }
        }
    }
    observer.progress(total, total, "Mapped " + std::to_string(total) + " structures",
                      kProgressKey);
    observer.progress_done(kProgressKey);

    // Step 3: occupancy trim
    if (config.occupancy) {
        if (result.num_conformations() == 0) {
            validation::validate_open_closed_range(*config.occupancy, 0.0f, 1.0f, "occupancy");
        } else {
            TrimConfig trim;
            trim.occupancy = config.occupancy;
            trim.hard = true;
            result = trim_pdb_ensemble(result, trim);
        }
    }

    // Step 4: superposition
    if (result.num_conformations() > 0) {
        if (config.superpose == SuperposeMode::Once) {
            result.superpose();
        } else {
            result.iterpose(config.tolerance, config.max_iterations, observer);
        }
    }

    std::ostringstream oss;
    oss << "Ensemble (" << result.num_conformations() << " conformations) were built in "
        << timer.elapsed_text() << ".";
    observer.info(oss.str());

    if (!skipped.empty()) {
        observer.warning(std::to_string(skipped.size()) + " structures cannot be mapped.");
    }
    if (unmapped != nullptr) {
        unmapped->insert(unmapped->end(), skipped.begin(), skipped.end());
    }
    return result;
}

}  // namespace ensemble
}  // namespace confens
