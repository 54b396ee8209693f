#include "confens/cli/cli.h"
#include "confens/io/structure.h"
#include "commands/commands.h"
#include <iostream>

using namespace confens::cli;

int main(int argc, char** argv) {
    App app("confens", "Structural ensemble assembly and curation");

    // ========== Global Flags ==========
    confens::commands::GlobalFlags flags;
    app.add_flag("--quiet", flags.quiet, "Suppress informational output (only show errors)");

    // ========== Build Subcommand ==========
    App* build_cmd = app.add_subcommand("build", "Build an ensemble from structure files");

    confens::commands::BuildArgs build_args;
    float build_occupancy = 1.0f;
    auto* build_positional =
        build_cmd->add_positional("structures", build_args.inputs, "Input PDB files (optional)");
    build_positional->required(false)->consume_remaining();
    build_cmd->add_option("--input-list", build_args.input_list, "File containing list of inputs")
        ->check(ExistingFile());
    build_cmd->add_option("--input-dir", build_args.input_dir, "Directory containing inputs")
        ->check(ExistingDirectory());
    build_cmd->add_option("-o,--output", build_args.output, "Output ensemble (.ens)")
        ->required(true);
    build_cmd->add_option("--reference", build_args.reference,
                          "Reference structure file (default: first input)")
        ->check(ExistingFile());
    build_cmd->add_option("--reference-index", build_args.reference_index,
                          "Position of the reference among the inputs (default: 0)")
        ->check(Range(0, 1e6));
    build_cmd->add_option("--title", build_args.title, "Ensemble title (default: Unknown)");
    build_cmd->add_option("--labels", build_args.labels,
                          "Comma-separated labels, one per input (default: file names)");
    build_cmd->add_option("--subset", build_args.subset, "Atom subset (default: calpha)")
        ->check(Choice(confens::io::Structure::selection_keywords()));
    auto* build_occupancy_opt =
        build_cmd->add_option("--occupancy", build_occupancy,
                              "Hard-trim atoms present in fewer than this fraction of "
                              "conformations")
            ->check(OpenClosedRange(0.0, 1.0));
    build_cmd->add_option("--superpose", build_args.superpose,
                          "Superposition: iter (onto the evolving mean) or once (default: iter)")
        ->check(Choice({"iter", "once"}));
    build_cmd->add_flag("--all-models", build_args.all_models,
                        "Add every model of multi-model structures");
    build_cmd->add_option("--seqid", build_args.seqid,
                          "Minimum percent sequence identity for chain matching (default: 90)")
        ->check(Range(0, 100));
    build_cmd->add_option("--overlap", build_args.overlap,
                          "Minimum percent overlap for chain matching (default: 70)")
        ->check(Range(0, 100));
    build_cmd->add_option("--unmapped", build_args.unmapped_path,
                          "Write labels of structures that could not be mapped to this file");

    // ========== Info Subcommand ==========
    App* info_cmd = app.add_subcommand("info", "Summarize an ensemble");
    std::string info_path;
    info_cmd->add_positional("ensemble", info_path, "Ensemble file (.ens)")->check(ExistingFile());

    // ========== Occupancy Subcommand ==========
    App* occ_cmd = app.add_subcommand("occupancy", "Per-atom occupancy table");
    std::string occ_path, occ_output;
    bool occ_normed = false;
    occ_cmd->add_positional("ensemble", occ_path, "Ensemble file (.ens)")->check(ExistingFile());
    occ_cmd->add_option("-o,--output", occ_output, "Output TSV (default: stdout)");
    occ_cmd->add_flag("--normed", occ_normed, "Report fractions instead of counts");

    // ========== Trim Subcommand ==========
    App* trim_cmd = app.add_subcommand("trim", "Trim atoms by occupancy");
    std::string trim_path, trim_output;
    float trim_occupancy = 1.0f;
    bool trim_hard = false;
    trim_cmd->add_positional("ensemble", trim_path, "Ensemble file (.ens)")->check(ExistingFile());
    trim_cmd->add_option("-o,--output", trim_output, "Output ensemble (.ens)")->required(true);
    auto* trim_occupancy_opt =
        trim_cmd->add_option("--occupancy", trim_occupancy,
                             "Keep atoms present in at least this fraction of conformations")
            ->check(OpenClosedRange(0.0, 1.0));
    trim_cmd->add_flag("--hard", trim_hard, "Discard trimmed atoms instead of deselecting them");

    // ========== Refine Subcommand ==========
    App* refine_cmd = app.add_subcommand("refine", "Remove conformations violating RMSD bounds");
    std::string refine_path, refine_output, refine_ref;
    float refine_lower = 0.5f;
    float refine_upper = 10.0f;
    bool refine_no_lower = false;
    bool refine_no_upper = false;
    std::vector<std::string> refine_protect;
    refine_cmd->add_positional("ensemble", refine_path, "Ensemble file (.ens)")
        ->check(ExistingFile());
    refine_cmd->add_option("-o,--output", refine_output, "Output ensemble (.ens)")->required(true);
    refine_cmd->add_option("--lower", refine_lower, "Minimum pairwise RMSD (default: 0.5)")
        ->check(Range(0, 1e6));
    refine_cmd->add_option("--upper", refine_upper, "Maximum pairwise RMSD (default: 10.0)")
        ->check(Range(0, 1e6));
    refine_cmd->add_flag("--no-lower", refine_no_lower, "Do not enforce a minimum RMSD");
    refine_cmd->add_flag("--no-upper", refine_no_upper, "Do not enforce a maximum RMSD");
    refine_cmd->add_option("--ref", refine_ref,
                           "Reference conformation, index or label (default: 0)");
    refine_cmd->add_option("--protect", refine_protect,
                           "Comma-separated conformations (indices or labels) never removed");

    // ========== Align Subcommand ==========
    App* align_cmd =
        app.add_subcommand("align", "Write source structures superposed as in the ensemble");
    std::string align_path, align_outdir = ".", align_suffix = "_aligned";
    std::vector<std::string> align_dirs;
    bool align_gzip = false;
    align_cmd->add_positional("ensemble", align_path, "Ensemble file (.ens)")
        ->check(ExistingFile());
    align_cmd->add_option("--pdb-dir", align_dirs,
                          "Folders searched for source structures (default: .)");
    align_cmd->add_option("--outdir", align_outdir, "Output folder (default: .)")
        ->check(ExistingDirectory());
    align_cmd->add_option("--suffix", align_suffix, "File name suffix (default: _aligned)");
    align_cmd->add_flag("--gzip", align_gzip, "Compress output files");

    app.require_subcommand(true);

    // ========== Parse Arguments ==========
    CONFENS_PARSE(app, argc, argv);

    // ========== Dispatch to Subcommand ==========
    if (app.get_active_subcommand() == build_cmd) {
        if (build_occupancy_opt->count() > 0) {
            build_args.occupancy = build_occupancy;
        }
        return confens::commands::build(build_args, flags);
    } else if (app.get_active_subcommand() == info_cmd) {
        return confens::commands::info(info_path, flags);
    } else if (app.get_active_subcommand() == occ_cmd) {
        return confens::commands::occupancy(occ_path, occ_output, occ_normed, flags);
    } else if (app.get_active_subcommand() == trim_cmd) {
        std::optional<float> occupancy;
        if (trim_occupancy_opt->count() > 0) {
            occupancy = trim_occupancy;
        }
        return confens::commands::trim(trim_path, trim_output, occupancy, trim_hard, flags);
    } else if (app.get_active_subcommand() == refine_cmd) {
        std::optional<float> lower;
        std::optional<float> upper;
        if (!refine_no_lower) lower = refine_lower;
        if (!refine_no_upper) upper = refine_upper;
        return confens::commands::refine(refine_path, refine_output, lower, upper, refine_ref,
                                         refine_protect, flags);
    } else if (app.get_active_subcommand() == align_cmd) {
        return confens::commands::align(align_path, align_dirs, align_outdir, align_suffix,
                                        align_gzip, flags);
    }

    std::cerr << "Error: No subcommand selected" << std::endl;
    return 1;
}
