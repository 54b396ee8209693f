#include "commands.h"
#include "input_utils.h"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "confens/ensemble/occupancy.h"
#include "confens/errors/confens_error.h"
#include "confens/io/ensemble_archive.h"

namespace confens {
namespace commands {

namespace {

std::string format_float(float value, int precision) {
    if (std::isnan(value)) {
        return "nan";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

}  // namespace

int info(const std::string& ensemble_path, const GlobalFlags& flags) {
    try {
        ensemble::Ensemble ens = io::load_ensemble(ensemble_path);

        std::cout << "Ensemble: " << ens.title() << "\n";
        std::cout << "  Kind: " << ensemble::kind_to_string(ens.kind()) << "\n";
        std::cout << "  Atoms: " << ens.num_atoms(false);
        if (ens.has_selection()) {
            std::cout << " (" << ens.num_atoms(true) << " selected)";
        }
        std::cout << "\n";
        std::cout << "  Conformations: " << ens.num_conformations() << "\n";
        std::cout << "  Atom structure: " << (ens.has_atoms() ? "yes" : "no") << "\n";
        std::cout << "  MSA: " << (ens.has_msa() ? "yes" : "no") << "\n";
        std::cout << "  Superposed: " << (ens.all_transformed() ? "yes" : "no") << "\n";

        if (!ens.data()->empty()) {
            std::cout << "  Data:";
            for (const auto& entry : *ens.data()) {
                std::cout << " " << entry.first << "[" << entry.second.size() << "]";
            }
            std::cout << "\n";
        }

        if (!flags.quiet && ens.has_presence_weights()) {
            std::vector<float> rmsds;
            if (ens.has_coords()) {
                rmsds = ens.rmsds();
            }
            std::cout << "\n  " << std::left << std::setw(6) << "#" << std::setw(24) << "Label"
                      << std::setw(10) << "Present" << "RMSD\n";
            for (int i = 0; i < ens.num_conformations(); i++) {
                std::vector<float> w = ens.conformation_weights(i);
                int present = 0;
                for (float v : w) {
                    if (v != 0.0f) present++;
                }
                std::cout << "  " << std::left << std::setw(6) << i << std::setw(24)
                          << ens.label(i) << std::setw(10) << present
                          << (rmsds.empty() ? "-" : format_float(rmsds[i], 3)) << "\n";
            }
        }
        return 0;

    } catch (const errors::ConfensError& e) {
        std::cerr << e.formatted() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int occupancy(const std::string& ensemble_path, const std::string& output_path, bool normed,
              const GlobalFlags& flags) {
    try {
        ensemble::Ensemble ens = io::load_ensemble(ensemble_path);
        std::vector<float> occ = ensemble::calc_occupancies(ens, normed);

        std::vector<std::string> lines;
        lines.push_back("index\tchain\tresname\tresnum\tatom\toccupancy");

        std::vector<int> positions = ens.indices();
        const io::Structure* atoms = ens.has_atoms() ? ens.atoms_ptr().get() : nullptr;
        for (size_t k = 0; k < occ.size(); k++) {
            std::ostringstream row;
            row << positions[k] << "\t";
            if (atoms != nullptr) {
                const io::AtomRecord& atom = atoms->atom(positions[k]);
                row << atom.chain_id << "\t" << atom.resname << "\t" << atom.resnum << "\t"
                    << atom.name;
            } else {
                row << "-\t-\t-\t-";
            }
            row << "\t" << (normed ? format_float(occ[k], 4) : format_float(occ[k], 0));
            lines.push_back(row.str());
        }

        WriteLines(output_path, lines);
        if (!output_path.empty()) {
            print_success("Occupancies written to " + output_path, flags.quiet);
        }
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
