#include "commands.h"
#include "input_utils.h"

#include <iostream>
#include <memory>

#include "confens/common/observer.h"
#include "confens/ensemble/builder.h"
#include "confens/errors/confens_error.h"
#include "confens/io/ensemble_archive.h"
#include "confens/io/pdb_parser.h"
#include "confens/mapping/chain_mapper.h"

namespace confens {
namespace commands {

int build(const BuildArgs& args, const GlobalFlags& flags) {
    try {
        common::ConsoleObserver observer(flags.quiet);

        std::vector<std::string> paths = ResolveInputs(args.inputs, args.input_list,
                                                       args.input_dir);

        std::vector<std::shared_ptr<const io::Structure>> structures;
        structures.reserve(paths.size());
        for (const auto& path : paths) {
            structures.push_back(LoadStructureOrNull(path, observer));
        }

        ensemble::BuildConfig config;
        config.title = args.title;
        config.subset = args.subset;
        config.occupancy = args.occupancy;
        config.degeneracy = !args.all_models;
        config.superpose = args.superpose == "once" ? ensemble::SuperposeMode::Once
                                                    : ensemble::SuperposeMode::Iterative;
        if (!args.labels.empty()) {
            config.labels = args.labels;
        } else {
            for (const auto& path : paths) {
                config.labels.push_back(io::PDBParser::title_from_path(path));
            }
        }

        ensemble::ReferenceSpec reference = ensemble::ReferenceSpec::first();
        if (!args.reference.empty()) {
            io::PDBParser parser;
            reference = ensemble::ReferenceSpec::from_structure(
                std::make_shared<const io::Structure>(parser.parse_file(args.reference)));
        } else if (args.reference_index >= 0) {
            reference = ensemble::ReferenceSpec::at(args.reference_index);
        }

        mapping::ChainMapperConfig mapper_config;
        mapper_config.seqid = args.seqid;
        mapper_config.overlap = args.overlap;
        mapping::ChainMapper mapper(mapper_config);

        std::vector<std::string> unmapped;
        ensemble::Ensemble ens =
            ensemble::build_pdb_ensemble(structures, reference, config, mapper, observer, &unmapped);

        std::string written = io::save_ensemble(ens, args.output);
        if (!args.unmapped_path.empty()) {
            WriteLines(args.unmapped_path, unmapped);
        }

        print_success("Ensemble written to " + written, flags.quiet);
        print_field("Conformations", ens.num_conformations(), flags.quiet);
        print_field("Atoms", ens.num_atoms(false), flags.quiet);
        print_field("Unmapped", unmapped.size(), flags.quiet);
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
