/**
 * Structural ensemble: a reference frame plus conformations aligned to it.
 *
 * Storage is always the full reference frame (N atoms). An optional selection
 * of reference positions designates the active atoms; every accessor takes a
 * `selected` flag (default true) choosing the active view or the full frame.
 *
 * Two kinds exist:
 * - Plain: coordinates only, with an optional per-atom weight vector shared
 *   by all conformations.
 * - PDB: per-conformation presence weights (nonzero = atom resolved/mapped),
 *   labels, rigid-body transformations and an optional MSA.
 *
 * Behavior that depends on the kind is keyed on has_presence_weights().
 *
 * Layouts (row-major, flat std::vector<float>):
 *   reference coords  [N * 3]
 *   conformations     [M * N * 3]
 *   presence weights  [M * N]    (PDB)  |  [N] (Plain, optional)
 */

#pragma once

#include "confens/common/observer.h"
#include "confens/io/structure.h"
#include "confens/types/transformation.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace confens {
namespace ensemble {

enum class EnsembleKind {
    Plain,
    PDB
};

const char* kind_to_string(EnsembleKind kind);

/// Named auxiliary float arrays, shared between an ensemble and those derived from it.
using AuxData = std::map<std::string, std::vector<float>>;

class Ensemble;

/**
 * Read-only view of one conformation of an ensemble.
 *
 * Valid as long as the ensemble it refers to is alive and not modified.
 */
class Conformation {
public:
    Conformation(const Ensemble& ensemble, int index);

    const Ensemble& ensemble() const { return *ensemble_; }
    int index() const { return index_; }

    const std::string& label() const;
    std::vector<float> coords(bool selected = true) const;
    std::vector<float> weights(bool selected = true) const;
    const std::optional<types::Transformation>& transformation() const;

private:
    const Ensemble* ensemble_;
    int index_;
};

class Ensemble {
public:
    explicit Ensemble(std::string title = "Unknown", EnsembleKind kind = EnsembleKind::PDB);

    // ------------------------------------------------------------------
    // Identity
    // ------------------------------------------------------------------

    const std::string& title() const { return title_; }
    void set_title(const std::string& title) { title_ = title; }

    EnsembleKind kind() const { return kind_; }

    /// True for PDB ensembles (per-conformation presence weights and labels).
    bool has_presence_weights() const { return kind_ == EnsembleKind::PDB; }

    // ------------------------------------------------------------------
    // Reference frame
    // ------------------------------------------------------------------

    /**
     * Number of atoms in the active view (selected) or in the full frame.
     * Zero before the reference frame is set.
     */
    int num_atoms(bool selected = true) const;

    int num_conformations() const { return num_confs_; }

    /**
     * Set the reference atom structure.
     *
     * Sets the atom count when not yet known. When no reference coordinates
     * are set, the structure's active coordinate set becomes the reference
     * coordinates. Once conformations exist, the atom count cannot change.
     *
     * @throws PreconditionError if conformations exist and the count differs
     */
    void set_atoms(const io::Structure& atoms);

    /// Reference atom structure (full frame) or nullptr.
    std::shared_ptr<const io::Structure> atoms_ptr() const { return atoms_; }

    /**
     * Reference atoms, sliced to the active view when selected.
     *
     * @throws PreconditionError if no atoms are attached
     */
    io::Structure atoms(bool selected = true) const;

    bool has_atoms() const { return atoms_ != nullptr; }

    /**
     * Set reference coordinates for the full frame [N * 3].
     *
     * @throws DimensionError if the size does not match the frame
     */
    void set_coords(std::vector<float> coords);

    bool has_coords() const { return !coords_.empty(); }

    /// Reference coordinates [n * 3]; empty when not set.
    std::vector<float> coords(bool selected = true) const;

    // ------------------------------------------------------------------
    // Conformations
    // ------------------------------------------------------------------

    /**
     * Append a conformation in full-frame layout.
     *
     * @param coords Coordinates [N * 3]
     * @param weights Presence weights [N]; empty means all ones. Must be empty
     *                for Plain ensembles.
     * @param label Conformation label (PDB ensembles)
     * @param msa_row Aligned one-letter sequence, one character per atom, or empty
     *
     * @throws DimensionError on size mismatch
     * @throws PreconditionError if weights are given for a Plain ensemble
     */
    void add_conformation(std::vector<float> coords, std::vector<float> weights = {},
                          const std::string& label = "", const std::string& msa_row = "");

    /// Coordinates of one conformation [n * 3].
    std::vector<float> conformation_coords(int index, bool selected = true) const;

    /// All conformation coordinates [M * n * 3].
    std::vector<float> confs(bool selected = true) const;

    /**
     * Presence weights of one conformation [n]. For Plain ensembles returns
     * the shared weight vector (all ones when unset).
     */
    std::vector<float> conformation_weights(int index, bool selected = true) const;

    /**
     * All weights: [M * n] for PDB ensembles, [n] for Plain ones (empty when unset).
     */
    std::vector<float> weights(bool selected = true) const;

    /// True when a weight array is available (always for PDB ensembles).
    bool has_weights() const;

    /**
     * Shared per-atom weight vector of a Plain ensemble [N].
     *
     * @throws PreconditionError for PDB ensembles
     */
    void set_weights(std::vector<float> weights);

    Conformation conformation(int index) const;

    const std::vector<std::string>& labels() const { return labels_; }
    const std::string& label(int index) const;
    void set_label(int index, const std::string& label);

    /**
     * Index of the first conformation with the given label.
     *
     * @throws LookupError if no conformation carries the label
     */
    int find_label(const std::string& label) const;

    const std::optional<types::Transformation>& transformation(int index) const;
    void set_transformation(int index, const types::Transformation& transformation);

    /// True when every conformation carries a transformation.
    bool all_transformed() const;

    // ------------------------------------------------------------------
    // MSA
    // ------------------------------------------------------------------

    /// True when every conformation has an aligned sequence row.
    bool has_msa() const;

    /// Aligned sequence of one conformation (columns of the active view).
    std::string msa_row(int index, bool selected = true) const;

    const std::vector<std::string>& msa_rows() const { return msa_; }

    // ------------------------------------------------------------------
    // Selection view
    // ------------------------------------------------------------------

    bool has_selection() const { return indices_.has_value(); }

    /// Active full-frame positions (0..N-1 when no selection is set).
    std::vector<int> indices() const;

    /**
     * Narrow the active view. Positions are relative to the current view, so
     * successive calls intersect.
     *
     * @throws ValidationError for a position outside the current view
     */
    void select(const std::vector<int>& positions);

    /**
     * Set the active view from full-frame positions (replaces any selection).
     *
     * @throws ValidationError for a position outside the frame
     */
    void set_indices(const std::vector<int>& full_frame_positions);

    void clear_selection() { indices_.reset(); }

    // ------------------------------------------------------------------
    // Derived ensembles
    // ------------------------------------------------------------------

    /**
     * New ensemble holding the given conformations (in that order), with
     * labels, weights, transformations and MSA rows carried over. Reference
     * frame, selection and auxiliary data are shared/copied unchanged.
     *
     * @throws ValidationError for an index out of range
     */
    Ensemble subset(const std::vector<int>& conformation_indices) const;

    /**
     * New ensemble whose reference frame holds only the given full-frame
     * positions. Atoms, reference coordinates, conformations, weights and MSA
     * columns are physically sliced; the selection is cleared.
     */
    Ensemble slice_atoms(const std::vector<int>& full_frame_positions) const;

    // ------------------------------------------------------------------
    // Auxiliary data
    // ------------------------------------------------------------------

    const std::shared_ptr<AuxData>& data() const { return data_; }
    void share_data(std::shared_ptr<AuxData> data) { data_ = std::move(data); }
    void set_data(const std::string& key, std::vector<float> values);

    // ------------------------------------------------------------------
    // Geometry
    // ------------------------------------------------------------------

    /**
     * Weighted RMSD of each conformation to the reference coordinates, without
     * refitting [M]. NaN for a conformation that shares no atoms.
     *
     * @throws PreconditionError if reference coordinates are not set
     */
    std::vector<float> rmsds(bool selected = true) const;

    /**
     * Symmetric pairwise RMSD matrix [M * M] (presence-weighted, no refitting).
     */
    std::vector<float> pairwise_rmsds(bool selected = true) const;

    /**
     * Presence-weighted mean of the conformations [n * 3]. Positions no
     * conformation resolves keep the reference coordinates.
     */
    std::vector<float> mean_coords(bool selected = true) const;

    /**
     * Superpose every conformation onto the reference coordinates once.
     *
     * The fit uses the active atoms and presence weights; the rotation and
     * translation are applied to all atoms, and composed onto any stored
     * transformation.
     *
     * @throws PreconditionError if there are no conformations or no reference coordinates
     */
    void superpose();

    /**
     * Iterative superposition onto the evolving weighted mean.
     *
     * Repeats: superpose onto the current mean, recompute the mean, until the
     * RMSD between successive means is below tol or max_iterations is reached.
     * The final mean becomes the reference coordinates.
     *
     * @return Number of iterations performed
     */
    int iterpose(float tol = 1e-4f, int max_iterations = 100,
                 common::Observer& observer = common::null_observer());

private:
    void check_index(int index) const;
    void check_frame_set(const std::string& operation) const;
    std::vector<float> gather_rows(const float* base, int width) const;

    std::string title_;
    EnsembleKind kind_;
    int n_atoms_ = 0;
    int num_confs_ = 0;

    std::shared_ptr<const io::Structure> atoms_;
    std::vector<float> coords_;
    std::vector<float> confs_;
    std::vector<float> weights_;
    std::vector<std::string> labels_;
    std::vector<std::optional<types::Transformation>> transformations_;
    std::vector<std::string> msa_;
    std::optional<std::vector<int>> indices_;
    std::shared_ptr<AuxData> data_;
};

}  // namespace ensemble
}  // namespace confens
