#include "commands.h"

#include <iostream>

#include "confens/common/observer.h"
#include "confens/ensemble/align_export.h"
#include "confens/errors/confens_error.h"
#include "confens/io/ensemble_archive.h"
#include "confens/io/structure_source.h"

namespace confens {
namespace commands {

int align(const std::string& ensemble_path, const std::vector<std::string>& pdb_dirs,
          const std::string& outdir, const std::string& suffix, bool gzip,
          const GlobalFlags& flags) {
    try {
        common::ConsoleObserver observer(flags.quiet);
        ensemble::Ensemble ens = io::load_ensemble(ensemble_path);

        io::DirectorySource source(pdb_dirs.empty() ? std::vector<std::string>{"."} : pdb_dirs);

        ensemble::AlignExportConfig config;
        config.outdir = outdir;
        config.suffix = suffix;
        config.gzip = gzip;

        auto written = ensemble::align_pdb_ensemble(ens, source, config, observer);

        int failed = 0;
        for (size_t i = 0; i < written.size(); i++) {
            if (written[i]) {
                print_field(ens.label(static_cast<int>(i)), *written[i], flags.quiet);
            } else {
                failed++;
            }
        }
        if (failed > 0) {
            print_info(std::to_string(failed) + " conformations could not be exported",
                       flags.quiet);
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
