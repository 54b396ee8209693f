#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace confens {
namespace commands {

// Global flags shared across all commands
struct GlobalFlags {
    bool quiet = false;  // Suppress informational output and progress bars
};

inline void print_info(const std::string& message, bool quiet) {
    if (!quiet) {
        std::cout << message << std::endl;
    }
}

inline void print_success(const std::string& message, bool quiet) {
    if (!quiet) {
        std::cout << "[OK] " << message << std::endl;
    }
}

template<typename T>
inline void print_field(const std::string& name, const T& value, bool quiet) {
    if (!quiet) {
        std::cout << "  " << name << ": " << value << std::endl;
    }
}

// Arguments of the build command
struct BuildArgs {
    std::vector<std::string> inputs;
    std::string input_list;
    std::string input_dir;
    std::string output;
    std::string reference;         // Reference structure file (optional)
    int reference_index = -1;      // Position in the inputs; -1 = first
    std::string title = "Unknown";
    std::vector<std::string> labels;
    std::string subset = "calpha";
    std::optional<float> occupancy;
    std::string superpose = "iter";
    bool all_models = false;
    float seqid = 90.0f;
    float overlap = 70.0f;
    std::string unmapped_path;
};

// Build an ensemble from structure files
// Usage: confens build <structures...> --output ens.ens [options]
int build(const BuildArgs& args, const GlobalFlags& flags);

// Summarize an ensemble archive
// Usage: confens info <ens>
int info(const std::string& ensemble_path, const GlobalFlags& flags);

// Per-atom occupancy table
// Usage: confens occupancy <ens> [--normed] [--output file.tsv]
int occupancy(const std::string& ensemble_path, const std::string& output_path, bool normed,
              const GlobalFlags& flags);

// Trim atoms by occupancy
// Usage: confens trim <ens> --output out.ens [--occupancy X] [--hard]
int trim(const std::string& ensemble_path, const std::string& output_path,
         std::optional<float> occupancy, bool hard, const GlobalFlags& flags);

// Remove conformations violating pairwise RMSD bounds
// Usage: confens refine <ens> --output out.ens [--lower X] [--upper X] [--ref R] [--protect a,b]
int refine(const std::string& ensemble_path, const std::string& output_path,
           std::optional<float> lower, std::optional<float> upper, const std::string& reference,
           const std::vector<std::string>& protect, const GlobalFlags& flags);

// Write source structures superposed with the stored transformations
// Usage: confens align <ens> --pdb-dir D [--outdir O] [--suffix S] [--gzip]
int align(const std::string& ensemble_path, const std::vector<std::string>& pdb_dirs,
          const std::string& outdir, const std::string& suffix, bool gzip,
          const GlobalFlags& flags);

}  // namespace commands
}  // namespace confens
