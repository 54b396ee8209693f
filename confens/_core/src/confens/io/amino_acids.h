#pragma once

#include <cctype>
#include <string>
#include <string_view>
#include <unordered_map>

namespace confens {
namespace io {

inline const std::unordered_map<std::string, char>& amino_map() {
    static const std::unordered_map<std::string, char> kMap = {
        {"ALA", 'A'}, {"ARG", 'R'}, {"ASN", 'N'}, {"ASP", 'D'}, {"CYS", 'C'}, {"GLN", 'Q'},
        {"GLU", 'E'}, {"GLY", 'G'}, {"HIS", 'H'}, {"ILE", 'I'}, {"LEU", 'L'}, {"LYS", 'K'},
        {"MET", 'M'}, {"PHE", 'F'}, {"PRO", 'P'}, {"SER", 'S'}, {"THR", 'T'}, {"TRP", 'W'},
        {"TYR", 'Y'}, {"VAL", 'V'}, {"ASX", 'B'}, {"GLX", 'Z'}, {"XAA", 'X'}, {"PYL", 'O'},
        {"SEC", 'U'}, {"XLE", 'J'},
        // Common modified and protonation-state variants
        {"MSE", 'M'}, {"HSD", 'H'}, {"HSE", 'H'}, {"HSP", 'H'}, {"HID", 'H'}, {"HIE", 'H'},
        {"HIP", 'H'}, {"CYX", 'C'}, {"CYM", 'C'}, {"ASH", 'D'}, {"GLH", 'E'}, {"LYN", 'K'},
        {"SEP", 'S'}, {"TPO", 'T'}, {"PTR", 'Y'}, {"CSO", 'C'}, {"MLY", 'K'}};
    return kMap;
}

/**
 * One-letter code for a residue name; 'X' when unknown.
 */
inline char three_to_one(std::string_view three_letter) {
    std::string key;
    key.reserve(three_letter.size());
    for (char c : three_letter) {
        key.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    const auto& map = amino_map();
    auto it = map.find(key);
    if (it != map.end()) {
        return it->second;
    }
    return 'X';
}

/**
 * True for residue names that count as protein in atom selections.
 */
inline bool is_amino_acid(std::string_view resname) {
    std::string key;
    key.reserve(resname.size());
    for (char c : resname) {
        key.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return amino_map().count(key) > 0 && key != "XAA";
}

}  // namespace io
}  // namespace confens
