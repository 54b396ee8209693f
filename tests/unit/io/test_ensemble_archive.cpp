/**
 * Unit tests for the ensemble archive (.ens).
 */

#include "confens/ensemble/ensemble.h"
#include "confens/errors/confens_error.h"
#include "confens/io/ensemble_archive.h"

#include "test_utils.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace confens;
using ensemble::Ensemble;
using ensemble::EnsembleKind;

#define TEST_START(name) std::cout << "Test: " << name << "..." << std::flush
#define TEST_PASS() std::cout << " ✓ PASS" << std::endl
#define TEST_FAIL(msg) do { std::cout << " ✗ FAIL: " << msg << std::endl; return false; } while(0)

namespace {

// Three conformations of a 5-residue CA trace; the last misses residue 4.
Ensemble make_pdb_ensemble() {
    auto ref = test::make_peptide("ref", "ACDEF")->select("calpha");
    Ensemble ens("Test ensemble", EnsembleKind::PDB);
    ens.set_atoms(ref);

    const std::vector<float>& base = ref.coords();
    for (int i = 0; i < 3; i++) {
        std::vector<float> coords = base;
        test::rotate_z_translate(coords, 0.3f * static_cast<float>(i), 1.0f * i, 0.0f, -0.5f * i);
        std::vector<float> weights(5, 1.0f);
        std::string msa = "ACDEF";
        if (i == 2) {
            weights[3] = 0.0f;
            msa[3] = '-';
        }
        ens.add_conformation(coords, weights, "conf" + std::to_string(i), msa);
    }
    return ens;
}

}  // namespace

bool test_pdb_round_trip() {
    TEST_START("PDB ensemble round trip");

    auto dir = test::make_temp_dir("archive");
    Ensemble ens = make_pdb_ensemble();
    ens.superpose();
    ens.set_indices({0, 1, 2, 4});
    ens.set_data("scores", {0.5f, 1.5f, 2.5f});

    std::string path = io::save_ensemble(ens, (dir / "test").string());
    if (path != (dir / "test.ens").string()) {
        std::filesystem::remove_all(dir);
        TEST_FAIL("Extension not appended: " + path);
    }
    Ensemble back = io::load_ensemble(path);
    std::filesystem::remove_all(dir);

    if (back.title() != ens.title() || back.kind() != EnsembleKind::PDB) {
        TEST_FAIL("Title or kind changed");
    }
    if (back.num_conformations() != 3 || back.num_atoms(false) != 5) {
        TEST_FAIL("Shape changed");
    }
    if (back.labels() != ens.labels()) TEST_FAIL("Labels changed");
    if (back.msa_rows() != ens.msa_rows()) TEST_FAIL("MSA changed");
    if (back.indices() != ens.indices()) TEST_FAIL("Selection changed");
    if (test::max_abs_diff(back.confs(false), ens.confs(false)) > 0.0f) TEST_FAIL("Conformations");
    if (test::max_abs_diff(back.weights(false), ens.weights(false)) > 0.0f) TEST_FAIL("Weights");
    if (test::max_abs_diff(back.coords(false), ens.coords(false)) > 0.0f) TEST_FAIL("Coords");
    if (!back.has_atoms() || back.atoms(false).num_atoms() != 5) TEST_FAIL("Atoms");
    if (back.atoms(false).atom(2).resname != "ASP") TEST_FAIL("Atom identity");
    if (!back.all_transformed()) TEST_FAIL("Transformations lost");

    auto m0 = ens.transformation(1)->matrix();
    auto m1 = back.transformation(1)->matrix();
    for (int k = 0; k < 16; k++) {
        if (m0[k] != m1[k]) TEST_FAIL("Transformation differs at " + std::to_string(k));
    }

    auto it = back.data()->find("scores");
    if (it == back.data()->end() || it->second != std::vector<float>{0.5f, 1.5f, 2.5f}) {
        TEST_FAIL("Auxiliary data lost");
    }

    TEST_PASS();
    return true;
}

bool test_untransformed_conformations() {
    TEST_START("Missing transformations stay missing");

    auto dir = test::make_temp_dir("archive_untransformed");
    Ensemble ens = make_pdb_ensemble();
    std::string path = io::save_ensemble(ens, (dir / "plain.ens").string());
    Ensemble back = io::load_ensemble(path);
    std::filesystem::remove_all(dir);

    for (int i = 0; i < back.num_conformations(); i++) {
        if (back.transformation(i)) TEST_FAIL("Unexpected transformation");
    }
    if (back.has_selection()) TEST_FAIL("Unexpected selection");

    TEST_PASS();
    return true;
}

bool test_plain_round_trip() {
    TEST_START("Plain ensemble keeps its shared weights");

    auto dir = test::make_temp_dir("archive_plain");
    Ensemble ens("plain", EnsembleKind::Plain);
    ens.add_conformation({0, 0, 0, 1, 0, 0});
    ens.add_conformation({0, 1, 0, 1, 1, 0});
    ens.set_coords({0, 0, 0, 1, 0, 0});
    ens.set_weights({1.0f, 0.5f});

    std::string path = io::save_ensemble(ens, (dir / "plain.ens").string());
    Ensemble back = io::load_ensemble(path);
    std::filesystem::remove_all(dir);

    if (back.kind() != EnsembleKind::Plain) TEST_FAIL("Kind changed");
    if (back.weights() != std::vector<float>{1.0f, 0.5f}) TEST_FAIL("Weights changed");
    if (back.num_conformations() != 2) TEST_FAIL("Conformation count");

    TEST_PASS();
    return true;
}

bool test_default_filename() {
    TEST_START("Default file name comes from the title");

    auto dir = test::make_temp_dir("archive_default");
    auto cwd = std::filesystem::current_path();
    std::filesystem::current_path(dir);

    Ensemble ens = make_pdb_ensemble();
    std::string path = io::save_ensemble(ens);
    bool exists = std::filesystem::exists(dir / "Test_ensemble.ens");

    std::filesystem::current_path(cwd);
    std::filesystem::remove_all(dir);

    if (path != "Test_ensemble.ens" || !exists) TEST_FAIL("Got " + path);

    TEST_PASS();
    return true;
}

bool test_legacy_keys() {
    TEST_START("Legacy title/label keys and byte-array strings");

    auto dir = test::make_temp_dir("archive_legacy");
    std::string path = (dir / "legacy.ens").string();

    io::ArchiveWriter writer;
    io::JsonValue name = io::JsonValue::array();
    for (char c : std::string("old")) name.push_back(io::JsonValue(static_cast<int>(c)));
    io::JsonValue ids = io::JsonValue::array();
    ids.push_back(io::JsonValue("a"));
    ids.push_back(io::JsonValue("b"));
    writer.set_metadata("_name", name);
    writer.set_metadata("_identifiers", ids);
    writer.add_f32("_confs", {2, 1, 3}, {0, 0, 0, 1, 1, 1});
    writer.add_f32("_weights", {2, 1, 1}, {1, 1});
    writer.write(path);

    Ensemble back = io::load_ensemble(path);
    std::filesystem::remove_all(dir);

    if (back.title() != "old") TEST_FAIL("Title " + back.title());
    if (back.kind() != EnsembleKind::PDB) TEST_FAIL("Kind");
    if (back.labels() != std::vector<std::string>{"a", "b"}) TEST_FAIL("Labels");

    TEST_PASS();
    return true;
}

bool test_error_cases() {
    TEST_START("Empty ensembles and corrupt files are rejected");

    auto dir = test::make_temp_dir("archive_errors");

    bool empty_rejected = false;
    try {
        io::save_ensemble(Ensemble("empty"), (dir / "empty.ens").string());
    } catch (const errors::PreconditionError&) {
        empty_rejected = true;
    }

    std::string corrupt = (dir / "corrupt.ens").string();
    {
        std::ofstream out(corrupt, std::ios::binary);
        out << "not an archive";
    }
    bool corrupt_rejected = false;
    try {
        io::load_ensemble(corrupt);
    } catch (const errors::FormatError&) {
        corrupt_rejected = true;
    }

    bool missing_rejected = false;
    try {
        io::load_ensemble((dir / "missing.ens").string());
    } catch (const errors::FileNotFoundError&) {
        missing_rejected = true;
    }
    bool unwritable_rejected = false;
    Ensemble one("one", EnsembleKind::PDB);
    one.add_conformation({0, 0, 0}, {}, "a");
    try {
        io::save_ensemble(one, (dir / "no_such_dir" / "one.ens").string());
    } catch (const errors::FileWriteError&) {
        unwritable_rejected = true;
    }
    std::filesystem::remove_all(dir);

    if (!empty_rejected) TEST_FAIL("Empty ensemble saved");
    if (!corrupt_rejected) TEST_FAIL("Corrupt file loaded");
    if (!missing_rejected) TEST_FAIL("Missing file loaded");
    if (!unwritable_rejected) TEST_FAIL("Saved into a missing directory");

    TEST_PASS();
    return true;
}

int main() {
    std::cout << "\n";
    std::cout << "=========================================\n";
    std::cout << "  Ensemble Archive Unit Tests\n";
    std::cout << "=========================================\n\n";

    bool all_passed = true;

    all_passed &= test_pdb_round_trip();
    all_passed &= test_untransformed_conformations();
    all_passed &= test_plain_round_trip();
    all_passed &= test_default_filename();
    all_passed &= test_legacy_keys();
    all_passed &= test_error_cases();

    std::cout << "\n=========================================\n";
    if (all_passed) {
        std::cout << "  ✓ All tests PASSED\n";
    } else {
        std::cout << "  ✗ Some tests FAILED\n";
    }
    std::cout << "=========================================\n\n";

    return all_passed ? 0 : 1;
}
