/**
 * Unit tests for build_pdb_ensemble.
 *
 * Inputs are synthetic backbone peptides; the default chain mapper matches
 * them to the reference by sequence.
 */

#include "confens/ensemble/builder.h"
#include "confens/ensemble/occupancy.h"
#include "confens/errors/confens_error.h"
#include "confens/mapping/chain_mapper.h"

#include "test_utils.h"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace confens;
using namespace confens::ensemble;

using StructurePtr = std::shared_ptr<const io::Structure>;

#define TEST_START(name) std::cout << "Test: " << name << "..." << std::flush
#define TEST_PASS() std::cout << " ✓ PASS" << std::endl
#define TEST_FAIL(msg) do { std::cout << " ✗ FAIL: " << msg << std::endl; return false; } while(0)

namespace {

const std::string kSequence = "MKVLAGSDEF";

struct Inputs {
    std::vector<StructurePtr> structures;
    std::vector<std::string> labels;
};

// reference, rigidly moved copy, copy missing the last two residues,
// unrelated peptide, unavailable input
Inputs mixed_inputs() {
    auto ref = test::make_peptide("1ref", kSequence);
    auto moved = test::moved_copy(*ref, "2mov", 0.8f, 5.0f, -2.0f, 1.0f);
    auto truncated_base = test::make_peptide("3trn", kSequence.substr(0, 8));
    auto truncated = test::moved_copy(*truncated_base, "3trn", -0.4f, 0.0f, 3.0f, 0.0f);
    auto unrelated = test::make_peptide("4unr", "WWWWWWWWWW");

    Inputs inputs;
    inputs.structures = {ref, moved, truncated, unrelated, nullptr};
    inputs.labels = {"1ref", "2mov", "3trn", "4unr", "5nul"};
    return inputs;
}

// Keeps progress messages for inspection.
class RecordingObserver : public common::Observer {
public:
    void progress(int, int, const std::string& message, const std::string&) override {
        messages.push_back(message);
    }
    void progress_done(const std::string&) override {}
    void info(const std::string&) override {}
    void warning(const std::string&) override {}
    void error(const std::string&) override {}

    std::vector<std::string> messages;
};

}  // namespace

// ============================================================================
// Test Category 1: Mapping and assembly
// ============================================================================

bool test_build_mixed_inputs() {
    TEST_START("Mapped inputs become conformations, others are reported");

    Inputs inputs = mixed_inputs();
    BuildConfig config;
    config.title = "mixed";
    config.labels = inputs.labels;

    mapping::ChainMapper mapper;
    std::vector<std::string> unmapped;
    Ensemble ens = build_pdb_ensemble(inputs.structures, ReferenceSpec::first(), config, mapper,
                                      common::null_observer(), &unmapped);

    if (ens.num_conformations() != 3) {
        TEST_FAIL("Expected 3 conformations, got " + std::to_string(ens.num_conformations()));
    }
    if (ens.labels() != std::vector<std::string>{"1ref", "2mov", "3trn"}) TEST_FAIL("Labels");
    if (unmapped != std::vector<std::string>{"4unr", "5nul"}) TEST_FAIL("Unmapped labels");
    if (ens.num_atoms(false) != 10 || ens.title() != "mixed") TEST_FAIL("Reference frame");

    std::vector<float> w = ens.conformation_weights(2);
    if (w[7] != 1.0f || w[8] != 0.0f || w[9] != 0.0f) TEST_FAIL("Presence weights");
    if (ens.msa_row(2) != "MKVLAGSD--" || ens.msa_row(0) != kSequence) TEST_FAIL("MSA rows");

    TEST_PASS();
    return true;
}

bool test_build_superposes() {
    TEST_START("Built ensemble is superposed with transformations recorded");

    Inputs inputs = mixed_inputs();
    BuildConfig config;
    config.labels = inputs.labels;

    mapping::ChainMapper mapper;
    Ensemble ens = build_pdb_ensemble(inputs.structures, ReferenceSpec::first(), config, mapper);

    if (!ens.all_transformed()) TEST_FAIL("Missing transformations");
    for (float r : ens.rmsds()) {
        if (r > 1e-3f) TEST_FAIL("Conformation not superposed: " + std::to_string(r));
    }

    TEST_PASS();
    return true;
}

bool test_default_labels_are_titles() {
    TEST_START("Labels default to structure titles");

    auto ref = test::make_peptide("alpha", kSequence);
    auto other = test::moved_copy(*ref, "beta", 0.2f, 1.0f, 1.0f, 1.0f);

    BuildConfig config;
    config.superpose = SuperposeMode::Once;
    mapping::ChainMapper mapper;
    Ensemble ens = build_pdb_ensemble({ref, other}, ReferenceSpec::first(), config, mapper);

    if (ens.labels() != std::vector<std::string>{"alpha", "beta"}) TEST_FAIL("Labels");

    TEST_PASS();
    return true;
}

bool test_occupancy_hard_trim() {
    TEST_START("Occupancy threshold removes poorly resolved atoms");

    Inputs inputs = mixed_inputs();
    BuildConfig config;
    config.labels = inputs.labels;
    config.occupancy = 1.0f;

    mapping::ChainMapper mapper;
    Ensemble ens = build_pdb_ensemble(inputs.structures, ReferenceSpec::first(), config, mapper);

    if (ens.num_atoms(false) != 8 || ens.has_selection()) TEST_FAIL("Frame not trimmed");
    for (float occ : calc_occupancies(ens, true)) {
        if (occ < 1.0f) TEST_FAIL("Remaining atom below threshold");
    }

    TEST_PASS();
    return true;
}

bool test_progress_names_labels() {
    TEST_START("Progress reports every input by its label");

    Inputs inputs = mixed_inputs();
    BuildConfig config;
    config.labels = {"L0", "L1", "L2", "L3", "L4"};
    config.superpose = SuperposeMode::Once;

    mapping::ChainMapper mapper;
    RecordingObserver observer;
    build_pdb_ensemble(inputs.structures, ReferenceSpec::first(), config, mapper, observer);

    for (const std::string& label : config.labels) {
        bool seen = false;
        for (const auto& message : observer.messages) {
            if (message.find(label) != std::string::npos) seen = true;
        }
        if (!seen) TEST_FAIL("No progress message for " + label);
    }

    TEST_PASS();
    return true;
}

// ============================================================================
// Test Category 2: Multiple chains, models and references
// ============================================================================

bool test_multiple_chain_groups() {
    TEST_START("Homodimer source maps twice onto a monomer reference");

    auto ref = test::make_peptide("mono", kSequence);
    auto dimer = test::make_complex("dim", {{'A', kSequence}, {'B', kSequence}});

    BuildConfig config;
    mapping::ChainMapper mapper;
    Ensemble ens = build_pdb_ensemble({ref, dimer}, ReferenceSpec::first(), config, mapper);

    if (ens.labels() != std::vector<std::string>{"mono", "dim_A", "dim_B"}) {
        std::string got;
        for (const auto& l : ens.labels()) got += l + " ";
        TEST_FAIL("Labels: " + got);
    }

    TEST_PASS();
    return true;
}

bool test_all_models() {
    TEST_START("All models become conformations with model suffixes");

    auto ref = test::make_peptide("ref", kSequence);
    auto nmr = std::make_shared<io::Structure>(*ref);
    nmr->set_title("nmr");
    std::vector<float> second = nmr->coords();
    test::rotate_z_translate(second, 1.0f, 2.0f, 2.0f, 2.0f);
    nmr->add_coordset(second);

    BuildConfig config;
    config.degeneracy = false;
    mapping::ChainMapper mapper;
    Ensemble ens = build_pdb_ensemble({ref, nmr}, ReferenceSpec::first(), config, mapper);

    if (ens.labels() != std::vector<std::string>{"ref", "nmr_m1", "nmr_m2"}) TEST_FAIL("Labels");

    config.degeneracy = true;
    Ensemble single = build_pdb_ensemble({ref, nmr}, ReferenceSpec::first(), config, mapper);
    if (single.num_conformations() != 2) TEST_FAIL("Degenerate build should add one model");

    TEST_PASS();
    return true;
}

bool test_reference_by_index_and_structure() {
    TEST_START("Reference chosen by index or given explicitly");

    Inputs inputs = mixed_inputs();
    BuildConfig config;
    config.labels = inputs.labels;
    mapping::ChainMapper mapper;

    // Truncated structure as reference: the frame has 8 atoms
    Ensemble by_index = build_pdb_ensemble(inputs.structures, ReferenceSpec::at(2), config, mapper);
    if (by_index.num_atoms(false) != 8) TEST_FAIL("Index reference frame");

    auto external = test::make_peptide("ext", kSequence.substr(2, 6));
    Ensemble explicit_ref = build_pdb_ensemble(
        inputs.structures, ReferenceSpec::from_structure(external), config, mapper);
    if (explicit_ref.num_atoms(false) != 6 || explicit_ref.num_conformations() != 3) {
        TEST_FAIL("Explicit reference frame");
    }

    TEST_PASS();
    return true;
}

bool test_extend_existing() {
    TEST_START("Extending an ensemble appends conformations");

    auto ref = test::make_peptide("ref", kSequence);
    auto a = test::moved_copy(*ref, "a", 0.3f, 0.0f, 0.0f, 0.0f);
    auto b = test::moved_copy(*ref, "b", 0.6f, 1.0f, 0.0f, 0.0f);
    auto c = test::moved_copy(*ref, "c", 0.9f, 0.0f, 1.0f, 0.0f);

    BuildConfig config;
    mapping::ChainMapper mapper;
    Ensemble base = build_pdb_ensemble({ref, a}, ReferenceSpec::first(), config, mapper);
    Ensemble extended = build_pdb_ensemble({b, c}, ReferenceSpec::extend(base), config, mapper);

    if (extended.labels() != std::vector<std::string>{"ref", "a", "b", "c"}) TEST_FAIL("Labels");
    if (base.num_conformations() != 2) TEST_FAIL("Base ensemble modified");

    TEST_PASS();
    return true;
}

// ============================================================================
// Test Category 3: Errors
// ============================================================================

bool test_build_errors() {
    TEST_START("Invalid builds are rejected");

    auto ref = test::make_peptide("ref", kSequence);
    BuildConfig config;
    mapping::ChainMapper mapper;
    int rejected = 0;

    try {
        build_pdb_ensemble({ref}, ReferenceSpec::first(), config, mapper);
    } catch (const errors::PreconditionError&) {
        rejected++;
    }

    try {
        build_pdb_ensemble({nullptr, ref}, ReferenceSpec::first(), config, mapper);
    } catch (const errors::PreconditionError&) {
        rejected++;
    }

    BuildConfig bad_labels;
    bad_labels.labels = {"only_one"};
    try {
        build_pdb_ensemble({ref, ref}, ReferenceSpec::first(), bad_labels, mapper);
    } catch (const errors::DimensionError&) {
        rejected++;
    }

    // Atoms without residue information
    auto bare = std::make_shared<io::Structure>("bare");
    io::AtomRecord atom;
    atom.name = "CA";
    bare->add_atom(atom);
    bare->add_coordset({0, 0, 0});
    BuildConfig all_atoms;
    all_atoms.subset = "all";
    try {
        build_pdb_ensemble({ref, bare}, ReferenceSpec::first(), all_atoms, mapper);
    } catch (const errors::PreconditionError&) {
        rejected++;
    }

    if (rejected != 4) TEST_FAIL("Only " + std::to_string(rejected) + " of 4 rejected");

    TEST_PASS();
    return true;
}

int main() {
    std::cout << "\n";
    std::cout << "=========================================\n";
    std::cout << "  Ensemble Builder Unit Tests\n";
    std::cout << "=========================================\n\n";

    bool all_passed = true;

    std::cout << "Category 1: Mapping and assembly\n";
    std::cout << "-------------------------------------\n";
    all_passed &= test_build_mixed_inputs();
    all_passed &= test_build_superposes();
    all_passed &= test_default_labels_are_titles();
    all_passed &= test_occupancy_hard_trim();
    all_passed &= test_progress_names_labels();
    std::cout << "\n";

    std::cout << "Category 2: Multiple chains, models and references\n";
    std::cout << "-------------------------------------\n";
    all_passed &= test_multiple_chain_groups();
    all_passed &= test_all_models();
    all_passed &= test_reference_by_index_and_structure();
    all_passed &= test_extend_existing();
    std::cout << "\n";

    std::cout << "Category 3: Errors\n";
    std::cout << "-------------------------------------\n";
    all_passed &= test_build_errors();
    std::cout << "\n";

    std::cout << "=========================================\n";
    if (all_passed) {
        std::cout << "  ✓ All tests PASSED\n";
    } else {
        std::cout << "  ✗ Some tests FAILED\n";
    }
    std::cout << "=========================================\n\n";

    return all_passed ? 0 : 1;
}
