/**
 * Unit tests for RMSD-bound ensemble refinement.
 *
 * Conformations are single atoms on the x axis, so pairwise RMSDs are the
 * distances between their x coordinates.
 */

#include "confens/ensemble/refine.h"
#include "confens/errors/confens_error.h"

#include <iostream>
#include <string>
#include <vector>

using namespace confens;
using namespace confens::ensemble;

#define TEST_START(name) std::cout << "Test: " << name << "..." << std::flush
#define TEST_PASS() std::cout << " ✓ PASS" << std::endl
#define TEST_FAIL(msg) do { std::cout << " ✗ FAIL: " << msg << std::endl; return false; } while(0)

namespace {

Ensemble on_axis(const std::vector<float>& xs) {
    Ensemble ens("axis", EnsembleKind::PDB);
    for (size_t i = 0; i < xs.size(); i++) {
        ens.add_conformation({xs[i], 0.0f, 0.0f}, {}, std::string(1, static_cast<char>('a' + i)));
    }
    return ens;
}

std::string joined(const std::vector<std::string>& labels) {
    std::string out;
    for (const auto& l : labels) out += l;
    return out;
}

}  // namespace

// ============================================================================
// Test Category 1: Bounds
// ============================================================================

bool test_default_bounds() {
    TEST_START("Default bounds remove near-duplicates and outliers");

    Ensemble ens = on_axis({0.0f, 0.1f, 0.2f, 3.0f, 20.0f});
    Ensemble refined = refine_ensemble(ens);

    if (joined(refined.labels()) != "ad") TEST_FAIL("Kept " + joined(refined.labels()));
    if (ens.num_conformations() != 5) TEST_FAIL("Input modified");

    TEST_PASS();
    return true;
}

bool test_identical_conformations() {
    TEST_START("Identical conformations collapse to the reference");

    Ensemble ens = on_axis({1.0f, 1.0f, 1.0f, 1.0f});
    RefineConfig config;
    config.lower = 0.5f;
    config.upper = std::nullopt;
    Ensemble refined = refine_ensemble(ens, config);

    if (joined(refined.labels()) != "a") TEST_FAIL("Kept " + joined(refined.labels()));

    config.reference = ConformationRef::at(2);
    refined = refine_ensemble(ens, config);
    if (joined(refined.labels()) != "c") TEST_FAIL("Kept " + joined(refined.labels()));

    TEST_PASS();
    return true;
}

bool test_absent_bounds_keep_everything() {
    TEST_START("No bounds keeps every conformation");

    Ensemble ens = on_axis({0.0f, 0.0f, 50.0f});
    RefineConfig config;
    config.lower = std::nullopt;
    config.upper = std::nullopt;
    if (refine_ensemble(ens, config).num_conformations() != 3) TEST_FAIL("Conformations removed");

    TEST_PASS();
    return true;
}

bool test_nan_never_violates() {
    TEST_START("Pairs without shared atoms never violate");

    Ensemble ens("nan", EnsembleKind::PDB);
    ens.add_conformation({0, 0, 0}, {1.0f}, "a");
    ens.add_conformation({0, 0, 0}, {0.0f}, "b");
    if (refine_ensemble(ens).num_conformations() != 2) TEST_FAIL("Conformation removed");

    TEST_PASS();
    return true;
}

// ============================================================================
// Test Category 2: Reference and protection
// ============================================================================

bool test_protected_survives() {
    TEST_START("Protected conformation wins over an unprotected one");

    Ensemble ens = on_axis({0.0f, 3.0f, 3.1f});
    RefineConfig config;
    config.upper = std::nullopt;

    if (joined(refine_ensemble(ens, config).labels()) != "ab") TEST_FAIL("Unprotected run");

    config.protected_confs = {ConformationRef::by_label("c")};
    std::string kept = joined(refine_ensemble(ens, config).labels());
    if (kept != "ac") TEST_FAIL("Kept " + kept);

    TEST_PASS();
    return true;
}

bool test_reference_by_label() {
    TEST_START("Reference selected by label is always kept");

    Ensemble ens = on_axis({0.0f, 0.1f, 5.0f});
    RefineConfig config;
    config.reference = ConformationRef::parse("b");
    std::string kept = joined(refine_ensemble(ens, config).labels());
    if (kept != "bc") TEST_FAIL("Kept " + kept);

    TEST_PASS();
    return true;
}

bool test_selector_parsing() {
    TEST_START("Numeric selectors are indices, others are labels");

    ConformationRef idx = ConformationRef::parse("12");
    ConformationRef lbl = ConformationRef::parse("1abc_A");
    if (idx.type != ConformationRef::Type::Index || idx.index != 12) TEST_FAIL("Index");
    if (lbl.type != ConformationRef::Type::Label || lbl.label != "1abc_A") TEST_FAIL("Label");

    TEST_PASS();
    return true;
}

bool test_lookup_failures() {
    TEST_START("Unknown labels and bad indices fail fast");

    Ensemble ens = on_axis({0.0f, 1.0f});
    int rejected = 0;

    RefineConfig unknown_label;
    unknown_label.protected_confs = {ConformationRef::by_label("zzz")};
    try {
        refine_ensemble(ens, unknown_label);
    } catch (const errors::LookupError&) {
        rejected++;
    }

    RefineConfig bad_index;
    bad_index.reference = ConformationRef::at(7);
    try {
        refine_ensemble(ens, bad_index);
    } catch (const errors::ValidationError&) {
        rejected++;
    }

    try {
        refine_ensemble(Ensemble("empty"));
    } catch (const errors::PreconditionError&) {
        rejected++;
    }

    if (rejected != 3) TEST_FAIL("Only " + std::to_string(rejected) + " of 3 rejected");

    TEST_PASS();
    return true;
}

// ============================================================================
// Test Category 3: Pruning pass
// ============================================================================

bool test_prune_both_protected() {
    TEST_START("Both sides protected: the non-reference side is removed");

    // 0-1 and 1-2 violate; 0 is the reference, 1 and 2 protected
    const int M = 3;
    std::vector<bool> rel(M * M, false);
    rel[0 * M + 1] = rel[1 * M + 0] = true;
    rel[1 * M + 2] = rel[2 * M + 1] = true;

    std::vector<int> survivors = prune_by_relation(rel, M, 0, {0, 1, 2});
    if (survivors != std::vector<int>{0, 2}) TEST_FAIL("Unexpected survivors");

    // Only 1-2 violates and neither side is the reference: the larger index goes
    std::vector<bool> pair_only(M * M, false);
    pair_only[1 * M + 2] = pair_only[2 * M + 1] = true;
    std::vector<int> without_ref = prune_by_relation(pair_only, M, 0, {0, 1, 2});
    if (without_ref != std::vector<int>{0, 1}) TEST_FAIL("Unexpected survivors");

    TEST_PASS();
    return true;
}

int main() {
    std::cout << "\n";
    std::cout << "=========================================\n";
    std::cout << "  Ensemble Refinement Unit Tests\n";
    std::cout << "=========================================\n\n";

    bool all_passed = true;

    std::cout << "Category 1: Bounds\n";
    std::cout << "-------------------------------------\n";
    all_passed &= test_default_bounds();
    all_passed &= test_identical_conformations();
    all_passed &= test_absent_bounds_keep_everything();
    all_passed &= test_nan_never_violates();
    std::cout << "\n";

    std::cout << "Category 2: Reference and protection\n";
    std::cout << "-------------------------------------\n";
    all_passed &= test_protected_survives();
    all_passed &= test_reference_by_label();
    all_passed &= test_selector_parsing();
    all_passed &= test_lookup_failures();
    std::cout << "\n";

    std::cout << "Category 3: Pruning pass\n";
    std::cout << "-------------------------------------\n";
    all_passed &= test_prune_both_protected();
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
