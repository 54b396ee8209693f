/**
 * Unit tests for global sequence alignment and the chain mapper.
 */

#include "confens/errors/confens_error.h"
#include "confens/mapping/chain_mapper.h"
#include "confens/mapping/sequence_align.h"

#include "test_utils.h"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace confens;
using namespace confens::mapping;

#define TEST_START(name) std::cout << "Test: " << name << "..." << std::flush
#define TEST_PASS() std::cout << " ✓ PASS" << std::endl
#define TEST_FAIL(msg) do { std::cout << " ✗ FAIL: " << msg << std::endl; return false; } while(0)

namespace {

const std::string kSequence = "MKVLAGSDEF";

}  // namespace

// ============================================================================
// Test Category 1: Global alignment
// ============================================================================

bool test_align_identical() {
    TEST_START("Identical sequences align end to end");

    SequenceAlignment aln = align_global("ACDEF", "ACDEF");
    if (aln.pairs.size() != 5 || aln.matches != 5) TEST_FAIL("Pairs");
    if (std::abs(aln.identity() - 100.0f) > 1e-4f) TEST_FAIL("Identity");
    if (std::abs(aln.overlap(5, 5) - 100.0f) > 1e-4f) TEST_FAIL("Overlap");

    TEST_PASS();
    return true;
}

bool test_align_with_gap() {
    TEST_START("Deletion opens a single gap");

    SequenceAlignment aln = align_global("ACDEF", "ACEF");
    std::vector<std::pair<int, int>> expected = {{0, 0}, {1, 1}, {3, 2}, {4, 3}};
    if (aln.pairs != expected) TEST_FAIL("Pairs");
    if (aln.matches != 4) TEST_FAIL("Matches");
    if (std::abs(aln.overlap(5, 4) - 100.0f) > 1e-4f) TEST_FAIL("Overlap over shorter sequence");

    TEST_PASS();
    return true;
}

bool test_align_unrelated() {
    TEST_START("Unrelated sequences align with zero identity");

    SequenceAlignment aln = align_global("AAAA", "CCCC");
    if (aln.pairs.size() != 4 || aln.matches != 0) TEST_FAIL("Pairs");
    if (aln.identity() != 0.0f) TEST_FAIL("Identity");

    SequenceAlignment empty = align_global("", "ACD");
    if (!empty.pairs.empty() || empty.identity() != 0.0f) TEST_FAIL("Empty sequence");

    TEST_PASS();
    return true;
}

// ============================================================================
// Test Category 2: Chain mapping
// ============================================================================

bool test_map_identical() {
    TEST_START("Identical structure maps every atom");

    auto ref = test::make_peptide("ref", kSequence);
    auto copy = test::moved_copy(*ref, "copy", 0.5f, 1.0f, 2.0f, 3.0f);

    ChainMapper mapper;
    std::vector<AtomMap> maps = mapper.map(copy, *ref);
    if (maps.size() != 1) TEST_FAIL("Expected one map");

    const AtomMap& m = maps[0];
    if (m.num_atoms() != ref->num_atoms() || m.num_mapped() != ref->num_atoms()) {
        TEST_FAIL("Mapped atoms");
    }
    for (int k = 0; k < m.num_atoms(); k++) {
        if (m.mapping()[k] != k) TEST_FAIL("Mapping order");
    }
    if (m.chain_ids() != "A") TEST_FAIL("Chain ids");
    if (test::max_abs_diff(m.coords(), copy->coords()) > 1e-6f) TEST_FAIL("Coordinates");
    if (m.num_states() != 1 || m.active_state() != 0) TEST_FAIL("States");

    TEST_PASS();
    return true;
}

bool test_map_truncated() {
    TEST_START("Truncated structure maps partially");

    io::Structure ref = test::make_peptide("ref", kSequence)->select("calpha");
    auto truncated = test::make_peptide("trn", kSequence.substr(0, 8));

    ChainMapper mapper;
    std::vector<AtomMap> maps = mapper.map(truncated, ref);
    if (maps.size() != 1) TEST_FAIL("Expected one map");

    const AtomMap& m = maps[0];
    if (m.num_atoms() != 10 || m.num_mapped() != 8) TEST_FAIL("Mapped atoms");
    if (m.sequence() != "MKVLAGSD--") TEST_FAIL("Sequence " + m.sequence());
    if (m.covered_indices() != std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7}) TEST_FAIL("Covered");

    std::vector<float> flags = m.matched_flags();
    if (flags[7] != 1.0f || flags[8] != 0.0f || flags[9] != 0.0f) TEST_FAIL("Flags");

    std::vector<float> coords = m.coords();
    for (int c = 24; c < 30; c++) {
        if (coords[c] != 0.0f) TEST_FAIL("Unmapped coordinates should be zero");
    }

    TEST_PASS();
    return true;
}

bool test_identity_threshold() {
    TEST_START("Sequence identity threshold gates candidates");

    io::Structure ref = test::make_peptide("ref", kSequence)->select("calpha");
    auto mutant = test::make_peptide("mut", "MKVAAGSDKF");  // 80% identical
    auto unrelated = test::make_peptide("unr", "WWWWWWWWWW");

    ChainMapper strict;
    if (!strict.map(mutant, ref).empty()) TEST_FAIL("Mutant accepted at 90%");
    if (!strict.map(unrelated, ref).empty()) TEST_FAIL("Unrelated chain accepted");
    if (!strict.map(nullptr, ref).empty()) TEST_FAIL("Null source mapped");

    ChainMapperConfig config;
    config.seqid = 75.0f;
    ChainMapper lenient(config);
    std::vector<AtomMap> maps = lenient.map(mutant, ref);
    if (maps.size() != 1 || maps[0].num_mapped() != 10) TEST_FAIL("Mutant rejected at 75%");
    if (maps[0].sequence() != "MKVAAGSDKF") TEST_FAIL("Sequence " + maps[0].sequence());

    TEST_PASS();
    return true;
}

bool test_chain_groups() {
    TEST_START("Homodimer yields one map per chain group");

    auto mono = test::make_peptide("mono", kSequence);
    auto dimer = test::make_complex("dim", {{'A', kSequence}, {'B', kSequence}});

    ChainMapper mapper;
    std::vector<AtomMap> onto_mono = mapper.map(dimer, *mono);
    if (onto_mono.size() != 2) TEST_FAIL("Expected two maps onto the monomer");
    if (onto_mono[0].chain_ids() != "A" || onto_mono[1].chain_ids() != "B") TEST_FAIL("Chain ids");

    std::vector<AtomMap> onto_dimer = mapper.map(dimer, *dimer);
    if (onto_dimer.size() != 1) TEST_FAIL("Expected one map onto the dimer");
    if (onto_dimer[0].chain_ids() != "AB") TEST_FAIL("Dimer chain ids");
    if (onto_dimer[0].num_mapped() != dimer->num_atoms()) TEST_FAIL("Dimer atoms");

    TEST_PASS();
    return true;
}

bool test_invalid_config() {
    TEST_START("Out-of-range thresholds are rejected");

    int rejected = 0;
    ChainMapperConfig bad_seqid;
    bad_seqid.seqid = 120.0f;
    try {
        ChainMapper mapper(bad_seqid);
    } catch (const errors::ValidationError&) {
        rejected++;
    }

    ChainMapperConfig bad_overlap;
    bad_overlap.overlap = -1.0f;
    try {
        ChainMapper mapper(bad_overlap);
    } catch (const errors::ValidationError&) {
        rejected++;
    }

    if (rejected != 2) TEST_FAIL("Only " + std::to_string(rejected) + " of 2 rejected");

    TEST_PASS();
    return true;
}

int main() {
    std::cout << "\n";
    std::cout << "=========================================\n";
    std::cout << "  Chain Mapper Unit Tests\n";
    std::cout << "=========================================\n\n";

    bool all_passed = true;

    std::cout << "Category 1: Global alignment\n";
    std::cout << "-------------------------------------\n";
    all_passed &= test_align_identical();
    all_passed &= test_align_with_gap();
    all_passed &= test_align_unrelated();
    std::cout << "\n";

    std::cout << "Category 2: Chain mapping\n";
    std::cout << "-------------------------------------\n";
    all_passed &= test_map_identical();
    all_passed &= test_map_truncated();
    all_passed &= test_identity_threshold();
    all_passed &= test_chain_groups();
    all_passed &= test_invalid_config();
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
