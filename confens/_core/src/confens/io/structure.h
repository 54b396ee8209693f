/**
 * Atomic structure model shared by the PDB reader/writer, the atom mapper and
 * the ensemble.
 *
 * A Structure is a flat list of atom records plus one or more coordinate sets
 * (models). One coordinate set is active; accessors default to it. The
 * chain/residue hierarchy is derived on demand from the atom records.
 */

#pragma once

#include <string>
#include <vector>

namespace confens {
namespace io {

/**
 * Per-atom identity (everything in an ATOM/HETATM record except coordinates).
 */
struct AtomRecord {
    int serial = 0;
    std::string name;     // Atom name (e.g. "CA")
    char altloc = ' ';    // Alternate location indicator
    std::string resname;  // Residue name (3-letter code)
    char chain_id = ' ';
    int resnum = 0;
    char icode = ' ';     // Insertion code
    std::string element;
    bool hetero = false;  // HETATM record
    float occupancy = 1.0f;
    float bfactor = 0.0f;
};

/**
 * Residue in the hierarchy view; atoms are indices into Structure::atoms().
 */
struct ResidueView {
    char chain_id;
    int resnum;
    char icode;
    std::string resname;
    std::vector<int> atoms;

    /// Index of the atom with the given name, or -1.
    int find_atom(const std::string& atom_name, const std::vector<AtomRecord>& records) const;
};

/**
 * Chain in the hierarchy view.
 */
struct ChainView {
    char chain_id;
    std::vector<ResidueView> residues;

    /// One-letter sequence of the chain's residues ('X' for unknown names).
    std::string sequence() const;
};

class Structure {
public:
    Structure() = default;
    explicit Structure(std::string title);

    const std::string& title() const { return title_; }
    void set_title(const std::string& title) { title_ = title; }

    int num_atoms() const { return static_cast<int>(atoms_.size()); }
    int num_coordsets() const { return static_cast<int>(coordsets_.size()); }

    /// Index of the active coordinate set.
    int active_coordset() const { return active_; }

    /**
     * @throws ValidationError if index is out of range
     */
    void set_active_coordset(int index);

    const std::vector<AtomRecord>& atoms() const { return atoms_; }
    const AtomRecord& atom(int index) const { return atoms_.at(index); }

    /**
     * Append an atom. Only allowed before the first coordinate set is added.
     *
     * @throws PreconditionError if coordinate sets already exist
     */
    void add_atom(AtomRecord record);

    /**
     * Append a coordinate set [num_atoms * 3].
     *
     * @throws DimensionError on size mismatch
     */
    void add_coordset(std::vector<float> coords);

    /**
     * Coordinates of a coordinate set [num_atoms * 3]; -1 selects the active one.
     *
     * @throws ValidationError if index is out of range
     */
    const std::vector<float>& coords(int coordset = -1) const;

    /**
     * Replace a coordinate set; -1 selects the active one.
     *
     * @throws DimensionError on size mismatch
     * @throws ValidationError if index is out of range
     */
    void set_coords(std::vector<float> coords, int coordset = -1);

    /**
     * Atom indices matching a selection keyword.
     *
     * Keywords: "all", "calpha"/"ca", "backbone"/"bb", "heavy"/"noh", "protein".
     *
     * @throws ValidationError for an unknown keyword
     */
    std::vector<int> select_indices(const std::string& subset) const;

    /// New structure holding the atoms matching a selection keyword.
    Structure select(const std::string& subset) const;

    /**
     * New structure holding the given atoms (in the given order), with every
     * coordinate set sliced and the same active index.
     */
    Structure slice(const std::vector<int>& indices) const;

    /**
     * True when every atom carries residue information, i.e. the chain and
     * residue hierarchy can be built.
     */
    bool has_hierarchy() const;

    /**
     * Chains in order of first appearance; residues grouped by
     * (resnum, icode) within each chain, also in order of first appearance.
     */
    std::vector<ChainView> hierarchy() const;

    /// Sorted distinct chain identifiers.
    std::string chain_ids() const;

    static const std::vector<std::string>& selection_keywords();

private:
    int resolve_coordset(int coordset) const;

    std::string title_;
    std::vector<AtomRecord> atoms_;
    std::vector<std::vector<float>> coordsets_;
    int active_ = 0;
};

}  // namespace io
}  // namespace confens
