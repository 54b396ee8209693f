#pragma once

#include "confens/io/structure.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

/**
 * Test utilities: synthetic structures and scratch directories.
 *
 * Unit tests build small peptides in memory instead of reading fixture
 * files, so every test is self-contained.
 */

namespace confens::test {

/**
 * Three-letter code for a one-letter residue code (GLY for unknown letters).
 */
inline std::string three_letter(char one) {
    switch (one) {
        case 'A': return "ALA";
        case 'C': return "CYS";
        case 'D': return "ASP";
        case 'E': return "GLU";
        case 'F': return "PHE";
        case 'G': return "GLY";
        case 'H': return "HIS";
        case 'I': return "ILE";
        case 'K': return "LYS";
        case 'L': return "LEU";
        case 'M': return "MET";
        case 'N': return "ASN";
        case 'P': return "PRO";
        case 'Q': return "GLN";
        case 'R': return "ARG";
        case 'S': return "SER";
        case 'T': return "THR";
        case 'V': return "VAL";
        case 'W': return "TRP";
        case 'Y': return "TYR";
        default: return "GLY";
    }
}

/**
 * Backbone position of atom `a` (0=N, 1=CA, 2=C, 3=O) of residue k on a
 * helix-like curve. Distinct residues never coincide and the points are not
 * coplanar, so superposition problems are well conditioned.
 */
inline void backbone_position(int k, int a, float* xyz) {
    const float phase = 1.7f * static_cast<float>(k) + 0.4f * static_cast<float>(a);
    xyz[0] = 2.3f * std::cos(phase) + 0.1f * static_cast<float>(a);
    xyz[1] = 2.3f * std::sin(phase);
    xyz[2] = 1.5f * static_cast<float>(k) + 0.35f * static_cast<float>(a);
}

/**
 * Append one chain of backbone atoms (N, CA, C, O per residue).
 *
 * @param records Receives atom records
 * @param coords Receives coordinates [4 * len * 3]
 * @param sequence One-letter residue codes
 * @param chain Chain identifier
 * @param first_resnum Residue number of the first residue
 * @param offset Added to every coordinate (separates chains in space)
 */
inline void append_chain(std::vector<io::AtomRecord>& records, std::vector<float>& coords,
                         const std::string& sequence, char chain, int first_resnum = 1,
                         float offset = 0.0f) {
    static const char* kNames[4] = {"N", "CA", "C", "O"};
    static const char* kElements[4] = {"N", "C", "C", "O"};

    for (int k = 0; k < static_cast<int>(sequence.size()); k++) {
        for (int a = 0; a < 4; a++) {
            io::AtomRecord atom;
            atom.serial = static_cast<int>(records.size()) + 1;
            atom.name = kNames[a];
            atom.resname = three_letter(sequence[k]);
            atom.chain_id = chain;
            atom.resnum = first_resnum + k;
            atom.element = kElements[a];
            records.push_back(atom);

            float xyz[3];
            backbone_position(k, a, xyz);
            coords.push_back(xyz[0] + offset);
            coords.push_back(xyz[1] + offset * 0.5f);
            coords.push_back(xyz[2]);
        }
    }
}

/**
 * Single-chain backbone peptide with one coordinate set.
 */
inline std::shared_ptr<io::Structure> make_peptide(const std::string& title,
                                                   const std::string& sequence, char chain = 'A',
                                                   int first_resnum = 1) {
    std::vector<io::AtomRecord> records;
    std::vector<float> coords;
    append_chain(records, coords, sequence, chain, first_resnum);

    auto structure = std::make_shared<io::Structure>(title);
    for (auto& record : records) {
        structure->add_atom(record);
    }
    structure->add_coordset(std::move(coords));
    return structure;
}

/**
 * Multi-chain peptide: one chain per (chain id, sequence) pair, each shifted
 * in space so chains do not overlap.
 */
inline std::shared_ptr<io::Structure> make_complex(
    const std::string& title, const std::vector<std::pair<char, std::string>>& chains) {
    std::vector<io::AtomRecord> records;
    std::vector<float> coords;
    float offset = 0.0f;
    for (const auto& chain : chains) {
        append_chain(records, coords, chain.second, chain.first, 1, offset);
        offset += 20.0f;
    }

    auto structure = std::make_shared<io::Structure>(title);
    for (auto& record : records) {
        structure->add_atom(record);
    }
    structure->add_coordset(std::move(coords));
    return structure;
}

/**
 * Rotation about the z axis followed by a translation, applied in place.
 */
inline void rotate_z_translate(std::vector<float>& coords, float angle, float tx, float ty,
                               float tz) {
    const float c = std::cos(angle);
    const float s = std::sin(angle);
    for (size_t i = 0; i + 2 < coords.size(); i += 3) {
        float x = coords[i];
        float y = coords[i + 1];
        coords[i] = c * x - s * y + tx;
        coords[i + 1] = s * x + c * y + ty;
        coords[i + 2] = coords[i + 2] + tz;
    }
}

/**
 * Rotation about the x axis, applied in place.
 */
inline void rotate_x(std::vector<float>& coords, float angle) {
    const float c = std::cos(angle);
    const float s = std::sin(angle);
    for (size_t i = 0; i + 2 < coords.size(); i += 3) {
        float y = coords[i + 1];
        float z = coords[i + 2];
        coords[i + 1] = c * y - s * z;
        coords[i + 2] = s * y + c * z;
    }
}

/**
 * Copy of a structure whose active coordinates are rigidly moved.
 */
inline std::shared_ptr<io::Structure> moved_copy(const io::Structure& structure,
                                                 const std::string& title, float angle,
                                                 float tx, float ty, float tz) {
    auto copy = std::make_shared<io::Structure>(structure);
    copy->set_title(title);
    std::vector<float> coords = copy->coords();
    rotate_z_translate(coords, angle, tx, ty, tz);
    copy->set_coords(std::move(coords));
    return copy;
}

inline float max_abs_diff(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        return INFINITY;
    }
    float diff = 0.0f;
    for (size_t i = 0; i < a.size(); i++) {
        diff = std::max(diff, std::abs(a[i] - b[i]));
    }
    return diff;
}

/**
 * Fresh, empty scratch directory under the system temp directory.
 */
inline std::filesystem::path make_temp_dir(const std::string& name) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = std::filesystem::temp_directory_path() /
               ("confens_" + name + "_" + std::to_string(stamp));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

}  // namespace confens::test
