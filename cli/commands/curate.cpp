#include "commands.h"

#include <iostream>

#include "confens/common/observer.h"
#include "confens/ensemble/occupancy.h"
#include "confens/ensemble/refine.h"
#include "confens/errors/confens_error.h"
#include "confens/io/ensemble_archive.h"

namespace confens {
namespace commands {

int trim(const std::string& ensemble_path, const std::string& output_path,
         std::optional<float> occupancy, bool hard, const GlobalFlags& flags) {
    try {
        ensemble::Ensemble ens = io::load_ensemble(ensemble_path);

        ensemble::TrimConfig config;
        config.occupancy = occupancy;
        config.hard = hard;
        ensemble::Ensemble trimmed = ensemble::trim_pdb_ensemble(ens, config);

        std::string written = io::save_ensemble(trimmed, output_path);
        print_success("Trimmed ensemble written to " + written, flags.quiet);
        print_field("Atoms", std::to_string(ens.num_atoms()) + " -> " +
                                 std::to_string(trimmed.num_atoms()),
                    flags.quiet);
        return 0;

    } catch (const errors::ConfensError& e) {
        std::cerr << e.formatted() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int refine(const std::string& ensemble_path, const std::string& output_path,
           std::optional<float> lower, std::optional<float> upper, const std::string& reference,
           const std::vector<std::string>& protect, const GlobalFlags& flags) {
    try {
        common::ConsoleObserver observer(flags.quiet);
        ensemble::Ensemble ens = io::load_ensemble(ensemble_path);

        ensemble::RefineConfig config;
        config.lower = lower;
        config.upper = upper;
        if (!reference.empty()) {
            config.reference = ensemble::ConformationRef::parse(reference);
        }
        for (const auto& spec : protect) {
            config.protected_confs.push_back(ensemble::ConformationRef::parse(spec));
        }

        ensemble::Ensemble refined = ensemble::refine_ensemble(ens, config, observer);

        std::string written = io::save_ensemble(refined, output_path);
        print_success("Refined ensemble written to " + written, flags.quiet);
        print_field("Conformations", std::to_string(ens.num_conformations()) + " -> " +
                                         std::to_string(refined.num_conformations()),
                    flags.quiet);
        return 0;

    } catch (const errors::ConfensError& e) {
        std::cerr << e.formatted() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace commands
}  // namespace confens
