#include "structure.h"

#include "amino_acids.h"
#include "confens/errors/confens_error.h"
#include "confens/errors/validators.h"

#include <algorithm>
#include <map>
#include <utility>

namespace confens {
namespace io {

namespace {

bool is_hydrogen(const AtomRecord& atom) {
    if (!atom.element.empty()) {
        return atom.element == "H" || atom.element == "D";
    }
    // No element column: fall back to the first letter of the name, skipping
    // a leading digit (e.g. "1HB").
    for (char c : atom.name) {
        if (c >= '0' && c <= '9') continue;
        return c == 'H' || c == 'D';
    }
    return false;
}

bool is_protein(const AtomRecord& atom) {
    return is_amino_acid(atom.resname);
}

bool is_backbone_name(const std::string& name) {
    return name == "N" || name == "CA" || name == "C" || name == "O";
}

}  // namespace

int ResidueView::find_atom(const std::string& atom_name,
                           const std::vector<AtomRecord>& records) const {
    for (int idx : atoms) {
        if (records[idx].name == atom_name) {
            return idx;
        }
    }
    return -1;
}

std::string ChainView::sequence() const {
    std::string seq;
    seq.reserve(residues.size());
    for (const auto& residue : residues) {
        seq.push_back(three_to_one(residue.resname));
    }
    return seq;
}

Structure::Structure(std::string title) : title_(std::move(title)) {
}

void Structure::set_active_coordset(int index) {
    if (index < 0 || index >= num_coordsets()) {
        throw errors::ValidationError("coordset", std::to_string(index),
                                      "index in [0, " + std::to_string(num_coordsets()) + ")");
    }
    active_ = index;
}

void Structure::add_atom(AtomRecord record) {
    if (!coordsets_.empty()) {
        throw errors::PreconditionError("Structure::add_atom",
                                        "no coordinate sets to have been added yet");
    }
    atoms_.push_back(std::move(record));
}

void Structure::add_coordset(std::vector<float> coords) {
    validation::validate_dimensions_match(coords.size(), atoms_.size() * 3, "coords",
                                          "num_atoms * 3");
    coordsets_.push_back(std::move(coords));
}

int Structure::resolve_coordset(int coordset) const {
    int index = coordset < 0 ? active_ : coordset;
    if (index < 0 || index >= num_coordsets()) {
        throw errors::ValidationError("coordset", std::to_string(coordset),
                                      "index in [0, " + std::to_string(num_coordsets()) + ")");
    }
    return index;
}

const std::vector<float>& Structure::coords(int coordset) const {
    return coordsets_[resolve_coordset(coordset)];
}

void Structure::set_coords(std::vector<float> coords, int coordset) {
    int index = resolve_coordset(coordset);
    validation::validate_dimensions_match(coords.size(), atoms_.size() * 3, "coords",
                                          "num_atoms * 3");
    coordsets_[index] = std::move(coords);
}

const std::vector<std::string>& Structure::selection_keywords() {
    static const std::vector<std::string> kKeywords = {"all", "calpha", "ca", "backbone", "bb",
                                                       "heavy", "noh", "protein"};
    return kKeywords;
}

std::vector<int> Structure::select_indices(const std::string& subset) const {
    validation::validate_choice(subset, selection_keywords(), "subset");

    std::vector<int> indices;
    indices.reserve(atoms_.size());

    for (int i = 0; i < num_atoms(); i++) {
        const AtomRecord& atom = atoms_[i];
        bool keep = false;

        if (subset == "all") {
            keep = true;
        } else if (subset == "calpha" || subset == "ca") {
            keep = atom.name == "CA" && is_protein(atom);
        } else if (subset == "backbone" || subset == "bb") {
            keep = is_backbone_name(atom.name) && is_protein(atom);
        } else if (subset == "heavy" || subset == "noh") {
            keep = !is_hydrogen(atom);
        } else if (subset == "protein") {
            keep = is_protein(atom);
        }

        if (keep) {
            indices.push_back(i);
        }
    }

    return indices;
}

Structure Structure::select(const std::string& subset) const {
    return slice(select_indices(subset));
}

Structure Structure::slice(const std::vector<int>& indices) const {
    Structure result(title_);
    result.atoms_.reserve(indices.size());
    for (int idx : indices) {
        result.atoms_.push_back(atoms_.at(idx));
    }

    result.coordsets_.reserve(coordsets_.size());
    for (const auto& source : coordsets_) {
        std::vector<float> sliced(indices.size() * 3);
        for (size_t k = 0; k < indices.size(); k++) {
            size_t src = static_cast<size_t>(indices[k]) * 3;
            sliced[k * 3 + 0] = source[src + 0];
            sliced[k * 3 + 1] = source[src + 1];
            sliced[k * 3 + 2] = source[src + 2];
        }
        result.coordsets_.push_back(std::move(sliced));
    }
    result.active_ = active_;
    return result;
}

bool Structure::has_hierarchy() const {
    if (atoms_.empty()) {
        return false;
    }
    return std::all_of(atoms_.begin(), atoms_.end(),
                       [](const AtomRecord& atom) { return !atom.resname.empty(); });
}

std::vector<ChainView> Structure::hierarchy() const {
    std::vector<ChainView> chains;
    std::map<char, size_t> chain_lookup;
    std::vector<std::map<std::pair<int, char>, size_t>> residue_lookup;

    for (int i = 0; i < num_atoms(); i++) {
        const AtomRecord& atom = atoms_[i];

        auto cit = chain_lookup.find(atom.chain_id);
        if (cit == chain_lookup.end()) {
            cit = chain_lookup.emplace(atom.chain_id, chains.size()).first;
            chains.push_back(ChainView{atom.chain_id, {}});
            residue_lookup.emplace_back();
        }
        ChainView& chain = chains[cit->second];
        auto& residues = residue_lookup[cit->second];

        auto key = std::make_pair(atom.resnum, atom.icode);
        auto rit = residues.find(key);
        if (rit == residues.end()) {
            rit = residues.emplace(key, chain.residues.size()).first;
            chain.residues.push_back(
                ResidueView{atom.chain_id, atom.resnum, atom.icode, atom.resname, {}});
        }
        chain.residues[rit->second].atoms.push_back(i);
    }

    return chains;
}

std::string Structure::chain_ids() const {
    std::string ids;
    for (const auto& atom : atoms_) {
        if (ids.find(atom.chain_id) == std::string::npos) {
            ids.push_back(atom.chain_id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace io
}  // namespace confens
