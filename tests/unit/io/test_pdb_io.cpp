/**
 * Unit tests for the PDB reader/writer, structure selections and the
 * directory-backed structure source.
 */

#include "confens/errors/confens_error.h"
#include "confens/io/pdb_parser.h"
#include "confens/io/pdb_writer.h"
#include "confens/io/structure.h"
#include "confens/io/structure_source.h"

#include "test_utils.h"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>

using namespace confens;
using namespace confens::io;

#define TEST_START(name) std::cout << "Test: " << name << "..." << std::flush
#define TEST_PASS() std::cout << " ✓ PASS" << std::endl
#define TEST_FAIL(msg) do { std::cout << " ✗ FAIL: " << msg << std::endl; return false; } while(0)

namespace {

std::string atom_line(const char* record, int serial, const char* name, char altloc,
                      const char* resname, char chain, int resnum, float x, float y, float z,
                      const char* element) {
    char buffer[96];
    std::snprintf(buffer, sizeof(buffer),
                  "%-6s%5d %-4s%c%-3s %c%4d    %8.3f%8.3f%8.3f%6.2f%6.2f          %2s\n", record,
                  serial, name, altloc, resname, chain, resnum, x, y, z, 1.0, 10.0, element);
    return buffer;
}

std::string small_pdb() {
    std::string text = "HEADER    TEST\n";
    text += atom_line("ATOM", 1, " N", ' ', "ALA", 'A', 1, 0.0f, 0.0f, 0.0f, "N");
    text += atom_line("ATOM", 2, " CA", ' ', "ALA", 'A', 1, 1.5f, 0.0f, 0.0f, "C");
    text += atom_line("ATOM", 3, " CA", 'A', "GLY", 'A', 2, 3.0f, 1.0f, 0.0f, "C");
    text += atom_line("ATOM", 4, " CA", 'B', "GLY", 'A', 2, 9.0f, 9.0f, 9.0f, "C");
    text += atom_line("ATOM", 5, " H", ' ', "GLY", 'A', 2, 3.5f, 1.5f, 0.0f, "H");
    text += atom_line("HETATM", 6, " O", ' ', "HOH", 'B', 100, 7.0f, 7.0f, 7.0f, "O");
    text += "END\n";
    return text;
}

}  // namespace

// ============================================================================
// Test Category 1: Parsing
// ============================================================================

bool test_parse_records() {
    TEST_START("ATOM/HETATM records with first alternate location");

    PDBParser parser;
    Structure s = parser.parse_string(small_pdb(), "small");

    if (s.num_atoms() != 5) {
        TEST_FAIL("Expected 5 atoms (altloc B skipped), got " + std::to_string(s.num_atoms()));
    }
    if (s.num_coordsets() != 1) {
        TEST_FAIL("Expected 1 coordinate set");
    }
    const AtomRecord& ca2 = s.atom(2);
    if (ca2.name != "CA" || ca2.resname != "GLY" || ca2.resnum != 2 || ca2.altloc != 'A') {
        TEST_FAIL("Unexpected third atom");
    }
    if (std::abs(s.coords()[2 * 3 + 0] - 3.0f) > 1e-4f) {
        TEST_FAIL("Third atom should carry the altloc A coordinates");
    }
    if (!s.atom(4).hetero || s.atom(4).chain_id != 'B') {
        TEST_FAIL("HETATM record not flagged");
    }
    if (s.chain_ids() != "AB") {
        TEST_FAIL("Expected chains AB, got " + s.chain_ids());
    }

    TEST_PASS();
    return true;
}

bool test_multi_model() {
    TEST_START("Multi-model file gives one coordinate set per model");

    std::string text;
    for (int model = 1; model <= 3; model++) {
        text += "MODEL     " + std::to_string(model) + "\n";
        text += atom_line("ATOM", 1, " CA", ' ', "ALA", 'A', 1, static_cast<float>(model), 0, 0, "C");
        text += atom_line("ATOM", 2, " CA", ' ', "GLY", 'A', 2, 0, static_cast<float>(model), 0, "C");
        text += "ENDMDL\n";
    }

    PDBParser parser;
    Structure s = parser.parse_string(text, "nmr");
    if (s.num_atoms() != 2 || s.num_coordsets() != 3) {
        TEST_FAIL("Expected 2 atoms x 3 models");
    }
    if (s.coords(2)[0] != 3.0f || s.coords(1)[4] != 2.0f) {
        TEST_FAIL("Model coordinates out of order");
    }
    if (s.active_coordset() != 0) {
        TEST_FAIL("First model should be active");
    }

    TEST_PASS();
    return true;
}

bool test_inconsistent_models_rejected() {
    TEST_START("Models with different atom counts are rejected");

    std::string text = "MODEL        1\n";
    text += atom_line("ATOM", 1, " CA", ' ', "ALA", 'A', 1, 0, 0, 0, "C");
    text += atom_line("ATOM", 2, " CA", ' ', "GLY", 'A', 2, 1, 0, 0, "C");
    text += "ENDMDL\nMODEL        2\n";
    text += atom_line("ATOM", 1, " CA", ' ', "ALA", 'A', 1, 0, 0, 0, "C");
    text += "ENDMDL\n";

    PDBParser parser;
    try {
        parser.parse_string(text, "bad");
    } catch (const errors::FormatError&) {
        TEST_PASS();
        return true;
    }
    TEST_FAIL("No FormatError");
}

bool test_title_from_path() {
    TEST_START("Titles derived from file names");

    if (PDBParser::title_from_path("/data/pdb/1abc.pdb") != "1abc") TEST_FAIL("plain");
    if (PDBParser::title_from_path("2xyz.pdb.gz") != "2xyz") TEST_FAIL("gz");
    if (PDBParser::title_from_path("dir/pdb3def.ent.gz") != "3def") TEST_FAIL("ent");
    if (PDBParser::title_from_path("model_a.pdb") != "model_a") TEST_FAIL("long name");

    TEST_PASS();
    return true;
}

// ============================================================================
// Test Category 2: Selections and hierarchy
// ============================================================================

bool test_selections() {
    TEST_START("Selection keywords");

    PDBParser parser;
    Structure s = parser.parse_string(small_pdb(), "small");

    if (s.select_indices("calpha") != std::vector<int>{1, 2}) TEST_FAIL("calpha");
    if (s.select_indices("backbone") != std::vector<int>{0, 1, 2}) TEST_FAIL("backbone");
    if (s.select_indices("heavy") != std::vector<int>{0, 1, 2, 4}) TEST_FAIL("heavy");
    if (s.select_indices("protein") != std::vector<int>{0, 1, 2, 3}) TEST_FAIL("protein");
    if (s.select("all").num_atoms() != 5) TEST_FAIL("all");

    bool threw = false;
    try {
        s.select_indices("sidechain");
    } catch (const errors::ValidationError&) {
        threw = true;
    }
    if (!threw) TEST_FAIL("Unknown keyword accepted");

    TEST_PASS();
    return true;
}

bool test_hierarchy() {
    TEST_START("Chain and residue hierarchy");

    auto s = test::make_complex("cx", {{'A', "MKV"}, {'B', "GS"}});
    auto chains = s->hierarchy();

    if (chains.size() != 2) TEST_FAIL("Expected 2 chains");
    if (chains[0].sequence() != "MKV" || chains[1].sequence() != "GS") {
        TEST_FAIL("Sequences " + chains[0].sequence() + "/" + chains[1].sequence());
    }
    const ResidueView& res = chains[0].residues[1];
    if (res.atoms.size() != 4 || res.find_atom("CA", s->atoms()) != 5) {
        TEST_FAIL("Residue atoms not grouped");
    }
    if (!s->has_hierarchy()) TEST_FAIL("has_hierarchy");

    TEST_PASS();
    return true;
}

// ============================================================================
// Test Category 3: Writing and sources
// ============================================================================

bool test_write_and_read_back() {
    TEST_START("Written file reads back with the same atoms and coordinates");

    auto dir = test::make_temp_dir("pdb_io");
    auto s = test::make_peptide("pep", "ACDEFG");
    std::string path = (dir / "pep.pdb.gz").string();
    write_pdb_file(path, *s);

    PDBParser parser;
    Structure back = parser.parse_file(path);
    std::filesystem::remove_all(dir);

    if (back.title() != "pep") TEST_FAIL("Title " + back.title());
    if (back.num_atoms() != s->num_atoms()) TEST_FAIL("Atom count");
    if (test::max_abs_diff(back.coords(), s->coords()) > 1e-3f) TEST_FAIL("Coordinates");
    for (int i = 0; i < s->num_atoms(); i++) {
        if (back.atom(i).name != s->atom(i).name || back.atom(i).resname != s->atom(i).resname) {
            TEST_FAIL("Atom identity differs at " + std::to_string(i));
        }
    }

    TEST_PASS();
    return true;
}

bool test_write_models() {
    TEST_START("Multiple coordinate sets are written as models");

    auto s = test::make_peptide("pep", "AG");
    std::vector<float> second = s->coords();
    test::rotate_z_translate(second, 0.5f, 1.0f, 2.0f, 3.0f);
    s->add_coordset(second);

    std::string all = to_pdb_string(*s);
    std::string one = to_pdb_string(*s, 1);
    if (all.find("MODEL") == std::string::npos || all.find("ENDMDL") == std::string::npos) {
        TEST_FAIL("No MODEL records");
    }
    if (one.find("MODEL") != std::string::npos) {
        TEST_FAIL("Single coordinate set written as models");
    }

    PDBParser parser;
    Structure back = parser.parse_string(all, "pep");
    if (back.num_coordsets() != 2 || test::max_abs_diff(back.coords(1), second) > 1e-3f) {
        TEST_FAIL("Models do not read back");
    }

    TEST_PASS();
    return true;
}

bool test_directory_source() {
    TEST_START("Directory source finds files by identifier");

    auto dir = test::make_temp_dir("source");
    auto s = test::make_peptide("1abc", "ACD");
    write_pdb_file((dir / "pdb1abc.ent.gz").string(), *s);

    DirectorySource source({dir.string()});
    std::string found = source.find_file("1ABC");
    auto fetched = source.fetch("1abc");
    auto missing = source.fetch("9zzz");
    std::filesystem::remove_all(dir);

    if (found.empty()) TEST_FAIL("Upper-case identifier not resolved");
    if (!fetched || fetched->num_atoms() != s->num_atoms()) TEST_FAIL("Fetch failed");
    if (fetched->title() != "1abc") TEST_FAIL("Title " + fetched->title());
    if (missing) TEST_FAIL("Missing identifier returned a structure");

    TEST_PASS();
    return true;
}

bool test_missing_file() {
    TEST_START("Missing file raises FileNotFoundError");

    PDBParser parser;
    try {
        parser.parse_file("/nonexistent/path/none.pdb");
    } catch (const errors::FileNotFoundError&) {
        TEST_PASS();
        return true;
    }
    TEST_FAIL("No FileNotFoundError");
}

int main() {
    std::cout << "\n";
    std::cout << "=========================================\n";
    std::cout << "  PDB I/O Unit Tests\n";
    std::cout << "=========================================\n\n";

    bool all_passed = true;

    std::cout << "Category 1: Parsing\n";
    std::cout << "-------------------------------------\n";
    all_passed &= test_parse_records();
    all_passed &= test_multi_model();
    all_passed &= test_inconsistent_models_rejected();
    all_passed &= test_title_from_path();
    std::cout << "\n";

    std::cout << "Category 2: Selections and hierarchy\n";
    std::cout << "-------------------------------------\n";
    all_passed &= test_selections();
    all_passed &= test_hierarchy();
    std::cout << "\n";

    std::cout << "Category 3: Writing and sources\n";
    std::cout << "-------------------------------------\n";
    all_passed &= test_write_and_read_back();
    all_passed &= test_write_models();
    all_passed &= test_directory_source();
    all_passed &= test_missing_file();
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
