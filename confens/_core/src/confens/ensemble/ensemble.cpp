#include "ensemble.h"

#include "confens/errors/confens_error.h"
#include "confens/errors/validators.h"
#include "confens/primitives/rmsd/rmsd_impl.h"

#include <algorithm>
#include <numeric>
#include <utility>

namespace confens {
namespace ensemble {

const char* kind_to_string(EnsembleKind kind) {
    switch (kind) {
        case EnsembleKind::Plain:
            return "Plain";
        case EnsembleKind::PDB:
            return "PDB";
    }
    return "Unknown";
}

// ============================================================================
// Conformation
// ============================================================================

Conformation::Conformation(const Ensemble& ensemble, int index)
    : ensemble_(&ensemble), index_(index) {
}

const std::string& Conformation::label() const {
    return ensemble_->label(index_);
}

std::vector<float> Conformation::coords(bool selected) const {
    return ensemble_->conformation_coords(index_, selected);
}

std::vector<float> Conformation::weights(bool selected) const {
    return ensemble_->conformation_weights(index_, selected);
}

const std::optional<types::Transformation>& Conformation::transformation() const {
    return ensemble_->transformation(index_);
}

// ============================================================================
// Ensemble
// ============================================================================

Ensemble::Ensemble(std::string title, EnsembleKind kind)
    : title_(std::move(title)), kind_(kind), data_(std::make_shared<AuxData>()) {
}

int Ensemble::num_atoms(bool selected) const {
    if (selected && indices_) {
        return static_cast<int>(indices_->size());
    }
    return n_atoms_;
}

void Ensemble::set_atoms(const io::Structure& atoms) {
    if (num_confs_ > 0 && atoms.num_atoms() != n_atoms_) {
        throw errors::PreconditionError(
            "Ensemble::set_atoms",
            "an atom structure with " + std::to_string(n_atoms_) + " atoms (got " +
                std::to_string(atoms.num_atoms()) + ")",
            "The reference frame cannot change once conformations are added");
    }

    if (atoms.num_atoms() != n_atoms_) {
        n_atoms_ = atoms.num_atoms();
        indices_.reset();
        if (coords_.size() != static_cast<size_t>(n_atoms_) * 3) {
            coords_.clear();
        }
    }

    if (coords_.empty() && atoms.num_coordsets() > 0) {
        coords_ = atoms.coords();
    }
    atoms_ = std::make_shared<const io::Structure>(atoms);
}

io::Structure Ensemble::atoms(bool selected) const {
    if (!atoms_) {
        throw errors::PreconditionError("Ensemble::atoms", "an attached atom structure");
    }
    if (selected && indices_) {
        return atoms_->slice(*indices_);
    }
    return *atoms_;
}

void Ensemble::set_coords(std::vector<float> coords) {
    if (n_atoms_ == 0 && num_confs_ == 0) {
        if (coords.empty() || coords.size() % 3 != 0) {
            throw errors::DimensionError("coords", std::to_string(coords.size()),
                                         "non-empty multiple of 3");
        }
        n_atoms_ = static_cast<int>(coords.size() / 3);
    }
    validation::validate_dimensions_match(coords.size(), static_cast<size_t>(n_atoms_) * 3,
                                          "coords", "num_atoms * 3");
    coords_ = std::move(coords);
}

std::vector<float> Ensemble::gather_rows(const float* base, int width) const {
    if (!indices_) {
        return std::vector<float>(base, base + static_cast<size_t>(n_atoms_) * width);
    }
    std::vector<float> out;
    out.reserve(indices_->size() * width);
    for (int idx : *indices_) {
        const float* row = base + static_cast<size_t>(idx) * width;
        out.insert(out.end(), row, row + width);
    }
    return out;
}

std::vector<float> Ensemble::coords(bool selected) const {
    if (coords_.empty()) {
        return {};
    }
    if (!selected) {
        return coords_;
    }
    return gather_rows(coords_.data(), 3);
}

void Ensemble::add_conformation(std::vector<float> coords, std::vector<float> weights,
                                const std::string& label, const std::string& msa_row) {
    if (!has_presence_weights() && !weights.empty()) {
        throw errors::PreconditionError("add_conformation with per-conformation weights",
                                        "an ensemble with presence weights",
                                        "Use EnsembleKind::PDB or Ensemble::set_weights");
    }
    if (n_atoms_ == 0) {
        if (coords.empty() || coords.size() % 3 != 0) {
            throw errors::DimensionError("coords", std::to_string(coords.size()),
                                         "non-empty multiple of 3");
        }
        n_atoms_ = static_cast<int>(coords.size() / 3);
    }
    validation::validate_dimensions_match(coords.size(), static_cast<size_t>(n_atoms_) * 3,
                                          "coords", "num_atoms * 3");

    if (has_presence_weights() && weights.empty()) {
        weights.assign(n_atoms_, 1.0f);
    } else if (has_presence_weights()) {
        validation::validate_dimensions_match(weights.size(), static_cast<size_t>(n_atoms_),
                                              "weights", "num_atoms");
    }

    if (!msa_row.empty()) {
        validation::validate_dimensions_match(msa_row.size(), static_cast<size_t>(n_atoms_),
                                              "msa_row", "num_atoms");
    }

    confs_.insert(confs_.end(), coords.begin(), coords.end());
    if (has_presence_weights()) {
        weights_.insert(weights_.end(), weights.begin(), weights.end());
    }
    labels_.push_back(label);
    transformations_.emplace_back();
    msa_.push_back(msa_row);
    num_confs_++;
}

void Ensemble::check_index(int index) const {
    if (index < 0 || index >= num_confs_) {
        throw errors::ValidationError("conformation index", std::to_string(index),
                                      "index in [0, " + std::to_string(num_confs_) + ")");
    }
}

void Ensemble::check_frame_set(const std::string& operation) const {
    if (num_confs_ == 0) {
        throw errors::PreconditionError(operation, "an ensemble with at least one conformation");
    }
    if (coords_.empty()) {
        throw errors::PreconditionError(operation, "reference coordinates to be set");
    }
}

std::vector<float> Ensemble::conformation_coords(int index, bool selected) const {
    check_index(index);
    const float* base = confs_.data() + static_cast<size_t>(index) * n_atoms_ * 3;
    if (!selected) {
        return std::vector<float>(base, base + static_cast<size_t>(n_atoms_) * 3);
    }
    return gather_rows(base, 3);
}

std::vector<float> Ensemble::confs(bool selected) const {
    if (!selected || !indices_) {
        return confs_;
    }
    std::vector<float> out;
    out.reserve(static_cast<size_t>(num_confs_) * indices_->size() * 3);
    for (int i = 0; i < num_confs_; i++) {
        auto rows = gather_rows(confs_.data() + static_cast<size_t>(i) * n_atoms_ * 3, 3);
        out.insert(out.end(), rows.begin(), rows.end());
    }
    return out;
}

std::vector<float> Ensemble::conformation_weights(int index, bool selected) const {
    check_index(index);
    if (!has_presence_weights()) {
        if (weights_.empty()) {
            return std::vector<float>(num_atoms(selected), 1.0f);
        }
        return selected ? gather_rows(weights_.data(), 1) : weights_;
    }
    const float* base = weights_.data() + static_cast<size_t>(index) * n_atoms_;
    if (!selected) {
        return std::vector<float>(base, base + n_atoms_);
    }
    return gather_rows(base, 1);
}

std::vector<float> Ensemble::weights(bool selected) const {
    if (weights_.empty()) {
        return {};
    }
    if (!has_presence_weights()) {
        return selected ? gather_rows(weights_.data(), 1) : weights_;
    }
    if (!selected || !indices_) {
        return weights_;
    }
    std::vector<float> out;
    out.reserve(static_cast<size_t>(num_confs_) * indices_->size());
    for (int i = 0; i < num_confs_; i++) {
        auto rows = gather_rows(weights_.data() + static_cast<size_t>(i) * n_atoms_, 1);
        out.insert(out.end(), rows.begin(), rows.end());
    }
    return out;
}

bool Ensemble::has_weights() const {
    return has_presence_weights() || !weights_.empty();
}

void Ensemble::set_weights(std::vector<float> weights) {
    if (has_presence_weights()) {
        throw errors::PreconditionError("Ensemble::set_weights", "a Plain ensemble",
                                        "Presence weights are given per conformation");
    }
    if (n_atoms_ == 0) {
        n_atoms_ = static_cast<int>(weights.size());
    }
    validation::validate_dimensions_match(weights.size(), static_cast<size_t>(n_atoms_),
                                          "weights", "num_atoms");
    weights_ = std::move(weights);
}

Conformation Ensemble::conformation(int index) const {
    check_index(index);
    return Conformation(*this, index);
}

const std::string& Ensemble::label(int index) const {
    check_index(index);
    return labels_[index];
}

void Ensemble::set_label(int index, const std::string& label) {
    check_index(index);
    labels_[index] = label;
}

int Ensemble::find_label(const std::string& label) const {
    auto it = std::find(labels_.begin(), labels_.end(), label);
    if (it == labels_.end()) {
        throw errors::LookupError("conformation label", label, "ensemble '" + title_ + "'");
    }
    return static_cast<int>(it - labels_.begin());
}

const std::optional<types::Transformation>& Ensemble::transformation(int index) const {
    check_index(index);
    return transformations_[index];
}

void Ensemble::set_transformation(int index, const types::Transformation& transformation) {
    check_index(index);
    transformations_[index] = transformation;
}

bool Ensemble::all_transformed() const {
    return std::all_of(transformations_.begin(), transformations_.end(),
                       [](const auto& t) { return t.has_value(); });
}

bool Ensemble::has_msa() const {
    return num_confs_ > 0 &&
           std::all_of(msa_.begin(), msa_.end(), [](const std::string& row) { return !row.empty(); });
}

std::string Ensemble::msa_row(int index, bool selected) const {
    check_index(index);
    const std::string& row = msa_[index];
    if (row.empty() || !selected || !indices_) {
        return row;
    }
    std::string out;
    out.reserve(indices_->size());
    for (int idx : *indices_) {
        out.push_back(row[idx]);
    }
    return out;
}

std::vector<int> Ensemble::indices() const {
    if (indices_) {
        return *indices_;
    }
    std::vector<int> all(n_atoms_);
    std::iota(all.begin(), all.end(), 0);
    return all;
}

void Ensemble::select(const std::vector<int>& positions) {
    std::vector<int> current = indices();
    std::vector<int> narrowed;
    narrowed.reserve(positions.size());
    for (int p : positions) {
        if (p < 0 || p >= static_cast<int>(current.size())) {
            throw errors::ValidationError("selection position", std::to_string(p),
                                          "position in [0, " + std::to_string(current.size()) +
                                              ")");
        }
        narrowed.push_back(current[p]);
    }
    indices_ = std::move(narrowed);
}

void Ensemble::set_indices(const std::vector<int>& full_frame_positions) {
    for (int p : full_frame_positions) {
        if (p < 0 || p >= n_atoms_) {
            throw errors::ValidationError("atom index", std::to_string(p),
                                          "index in [0, " + std::to_string(n_atoms_) + ")");
        }
    }
    indices_ = full_frame_positions;
}

Ensemble Ensemble::subset(const std::vector<int>& conformation_indices) const {
    for (int index : conformation_indices) {
        check_index(index);
    }

    Ensemble result(title_, kind_);
    result.n_atoms_ = n_atoms_;
    result.atoms_ = atoms_;
    result.coords_ = coords_;
    result.indices_ = indices_;
    result.data_ = data_;
    if (!has_presence_weights()) {
        result.weights_ = weights_;
    }

    const size_t stride = static_cast<size_t>(n_atoms_);
    for (int index : conformation_indices) {
        const float* conf = confs_.data() + index * stride * 3;
        result.confs_.insert(result.confs_.end(), conf, conf + stride * 3);
        if (has_presence_weights()) {
            const float* w = weights_.data() + index * stride;
            result.weights_.insert(result.weights_.end(), w, w + stride);
        }
        result.labels_.push_back(labels_[index]);
        result.transformations_.push_back(transformations_[index]);
        result.msa_.push_back(msa_[index]);
        result.num_confs_++;
    }
    return result;
}

Ensemble Ensemble::slice_atoms(const std::vector<int>& full_frame_positions) const {
    for (int p : full_frame_positions) {
        if (p < 0 || p >= n_atoms_) {
            throw errors::ValidationError("atom index", std::to_string(p),
                                          "index in [0, " + std::to_string(n_atoms_) + ")");
        }
    }

    Ensemble result(title_, kind_);
    result.n_atoms_ = static_cast<int>(full_frame_positions.size());
    result.num_confs_ = num_confs_;
    result.data_ = data_;
    result.labels_ = labels_;
    result.transformations_ = transformations_;

    if (atoms_) {
        result.atoms_ = std::make_shared<const io::Structure>(atoms_->slice(full_frame_positions));
    }

    auto slice_rows = [&](const float* base, int width, std::vector<float>& out) {
        for (int p : full_frame_positions) {
            const float* row = base + static_cast<size_t>(p) * width;
            out.insert(out.end(), row, row + width);
        }
    };

    if (!coords_.empty()) {
        slice_rows(coords_.data(), 3, result.coords_);
    }
    for (int i = 0; i < num_confs_; i++) {
        slice_rows(confs_.data() + static_cast<size_t>(i) * n_atoms_ * 3, 3, result.confs_);
        if (has_presence_weights()) {
            slice_rows(weights_.data() + static_cast<size_t>(i) * n_atoms_, 1, result.weights_);
        }
    }
    if (!has_presence_weights() && !weights_.empty()) {
        slice_rows(weights_.data(), 1, result.weights_);
    }

    for (const auto& row : msa_) {
        if (row.empty()) {
            result.msa_.push_back(row);
            continue;
        }
        std::string sliced;
        sliced.reserve(full_frame_positions.size());
        for (int p : full_frame_positions) {
            sliced.push_back(row[p]);
        }
        result.msa_.push_back(std::move(sliced));
    }
    return result;
}

void Ensemble::set_data(const std::string& key, std::vector<float> values) {
    (*data_)[key] = std::move(values);
}

std::vector<float> Ensemble::rmsds(bool selected) const {
    if (coords_.empty()) {
        throw errors::PreconditionError("Ensemble::rmsds", "reference coordinates to be set");
    }

    std::vector<float> ref = coords(selected);
    int n = num_atoms(selected);
    std::vector<float> out(num_confs_);
    for (int i = 0; i < num_confs_; i++) {
        std::vector<float> conf = conformation_coords(i, selected);
        std::vector<float> w = conformation_weights(i, selected);
        out[i] = rmsd::weighted_rmsd<ScalarBackend>(conf.data(), ref.data(), w.data(), nullptr, n);
    }
    return out;
}

std::vector<float> Ensemble::pairwise_rmsds(bool selected) const {
    int n = num_atoms(selected);
    std::vector<float> all_confs = confs(selected);
    std::vector<float> all_weights;
    for (int i = 0; i < num_confs_; i++) {
        std::vector<float> w = conformation_weights(i, selected);
        all_weights.insert(all_weights.end(), w.begin(), w.end());
    }

    std::vector<float> out(static_cast<size_t>(num_confs_) * num_confs_, 0.0f);
    rmsd::pairwise_rmsd<ScalarBackend>(all_confs.data(), all_weights.data(), num_confs_, n,
                                       out.data());
    return out;
}

std::vector<float> Ensemble::mean_coords(bool selected) const {
    const size_t N = static_cast<size_t>(n_atoms_);
    std::vector<double> sum(N * 3, 0.0);
    std::vector<double> total(N, 0.0);

    for (int i = 0; i < num_confs_; i++) {
        std::vector<float> w = conformation_weights(i, false);
        const float* conf = confs_.data() + static_cast<size_t>(i) * N * 3;
        for (size_t k = 0; k < N; k++) {
            if (w[k] == 0.0f) continue;
            sum[k * 3 + 0] += static_cast<double>(w[k]) * conf[k * 3 + 0];
            sum[k * 3 + 1] += static_cast<double>(w[k]) * conf[k * 3 + 1];
            sum[k * 3 + 2] += static_cast<double>(w[k]) * conf[k * 3 + 2];
            total[k] += w[k];
        }
    }

    std::vector<float> mean(N * 3, 0.0f);
    for (size_t k = 0; k < N; k++) {
        for (int d = 0; d < 3; d++) {
            if (total[k] > 0.0) {
                mean[k * 3 + d] = static_cast<float>(sum[k * 3 + d] / total[k]);
            } else if (!coords_.empty()) {
                mean[k * 3 + d] = coords_[k * 3 + d];
            }
        }
    }

    if (!selected) {
        return mean;
    }
    return gather_rows(mean.data(), 3);
}

}  // namespace ensemble
}  // namespace confens
