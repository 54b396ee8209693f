#include "ensemble_archive.h"

#include "pdb_parser.h"
#include "pdb_writer.h"

#include "confens/errors/confens_error.h"
#include "confens/errors/validators.h"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>

namespace confens {
namespace io {

namespace {

constexpr const char* kDataPrefix = "_data.";

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

JsonValue shape_json(const std::vector<size_t>& shape) {
    JsonValue arr = JsonValue::array();
    for (size_t dim : shape) arr.push_back(JsonValue(dim));
    return arr;
}

size_t element_count(const std::vector<size_t>& shape) {
    size_t total = 1;
    for (size_t dim : shape) total *= dim;
    return total;
}

// Strings may be stored as text or as a list of byte values.
std::string json_text(const JsonValue& value, const std::string& path, const std::string& field) {
    if (value.is_string()) {
        return value.as_string();
    }
    if (value.is_array()) {
        std::string text;
        for (const auto& byte : value.as_array()) {
            if (!byte.is_number()) {
                throw errors::FormatError(path, "field " + field + " is not text");
            }
            text.push_back(static_cast<char>(static_cast<int>(byte.as_number())));
        }
        return text;
    }
    throw errors::FormatError(path, "field " + field + " is not text");
}

std::vector<std::string> json_text_list(const JsonValue& value, const std::string& path,
                                        const std::string& field) {
    if (!value.is_array()) {
        throw errors::FormatError(path, "field " + field + " is not a list");
    }
    std::vector<std::string> out;
    for (const auto& item : value.as_array()) {
        out.push_back(json_text(item, path, field));
    }
    return out;
}

}  // namespace

// ============================================================================
// ArchiveWriter
// ============================================================================

void ArchiveWriter::add_raw(const std::string& name, const std::string& dtype,
                            const std::vector<size_t>& shape, const void* data, size_t bytes) {
    size_t begin = data_.size();
    const uint8_t* src = static_cast<const uint8_t*>(data);
    data_.insert(data_.end(), src, src + bytes);

    JsonValue info = JsonValue::object();
    info.set("dtype", JsonValue(dtype));
    info.set("shape", shape_json(shape));
    JsonValue offsets = JsonValue::array();
    offsets.push_back(JsonValue(begin));
    offsets.push_back(JsonValue(data_.size()));
    info.set("data_offsets", offsets);
    header_.set(name, info);
}

void ArchiveWriter::add_f32(const std::string& name, const std::vector<size_t>& shape,
                            const std::vector<float>& values) {
    if (values.size() != element_count(shape)) {
        throw errors::DimensionError(name, std::to_string(values.size()),
                                     std::to_string(element_count(shape)));
    }
    add_raw(name, "F32", shape, values.data(), values.size() * sizeof(float));
}

void ArchiveWriter::add_i32(const std::string& name, const std::vector<size_t>& shape,
                            const std::vector<int32_t>& values) {
    if (values.size() != element_count(shape)) {
        throw errors::DimensionError(name, std::to_string(values.size()),
                                     std::to_string(element_count(shape)));
    }
    add_raw(name, "I32", shape, values.data(), values.size() * sizeof(int32_t));
}

void ArchiveWriter::add_u8(const std::string& name, const std::vector<size_t>& shape,
                           const std::vector<uint8_t>& values) {
    if (values.size() != element_count(shape)) {
        throw errors::DimensionError(name, std::to_string(values.size()),
                                     std::to_string(element_count(shape)));
    }
    add_raw(name, "U8", shape, values.data(), values.size());
}

void ArchiveWriter::set_metadata(const std::string& key, JsonValue value) {
    metadata_.set(key, std::move(value));
}

void ArchiveWriter::write(const std::string& path) const {
    JsonValue header = header_;
    header.set("__metadata__", metadata_);
    std::string json = header.dump();
    while (json.size() % 8 != 0) json.push_back(' ');

    validation::validate_output_path(path);
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw errors::FileWriteError(path);
    }

    uint64_t n = json.size();
    uint8_t length[8];
    for (int k = 0; k < 8; k++) length[k] = static_cast<uint8_t>((n >> (8 * k)) & 0xFF);

    file.write(reinterpret_cast<const char*>(length), 8);
    file.write(json.data(), static_cast<std::streamsize>(json.size()));
    file.write(reinterpret_cast<const char*>(data_.data()),
               static_cast<std::streamsize>(data_.size()));
    if (!file) {
        throw errors::FileWriteError(path, "write failed");
    }
}

// ============================================================================
// ArchiveReader
// ============================================================================

ArchiveReader::ArchiveReader(const std::string& path) : path_(path) {
    validation::validate_file_exists(path, "Ensemble archive");
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw errors::FileNotFoundError(path, "Ensemble archive");
    }
    bytes_.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());

    if (bytes_.size() < 8) {
        throw errors::FormatError(path, "file too short for an ensemble archive", {".ens"});
    }
    uint64_t n = 0;
    for (int k = 0; k < 8; k++) n |= static_cast<uint64_t>(bytes_[k]) << (8 * k);
    if (n > bytes_.size() - 8) {
        throw errors::FormatError(path, "header length exceeds file size", {".ens"});
    }
    data_offset_ = 8 + static_cast<size_t>(n);

    std::string json(reinterpret_cast<const char*>(bytes_.data()) + 8, static_cast<size_t>(n));
    JsonValue header = JsonValue::parse(json);
    if (!header.is_object()) {
        throw errors::FormatError(path, "header is not a JSON object", {".ens"});
    }

    const size_t data_size = bytes_.size() - data_offset_;
    for (const auto& entry : header.as_object()) {
        if (entry.first == "__metadata__") {
            if (entry.second.is_object()) metadata_ = entry.second;
            continue;
        }

        TensorInfo info;
        info.dtype = entry.second.at("dtype").as_string();
        for (const auto& dim : entry.second.at("shape").as_array()) {
            info.shape.push_back(static_cast<size_t>(dim.as_number()));
        }
        const auto& offsets = entry.second.at("data_offsets").as_array();
        if (offsets.size() != 2) {
            throw errors::FormatError(path, "data_offsets of " + entry.first +
                                                " must have 2 elements");
        }
        info.data_begin = static_cast<size_t>(offsets[0].as_number());
        info.data_end = static_cast<size_t>(offsets[1].as_number());
        if (info.data_begin > info.data_end || info.data_end > data_size) {
            throw errors::FormatError(path, "tensor " + entry.first + " is out of bounds");
        }
        tensors_[entry.first] = info;
    }
}

std::vector<std::string> ArchiveReader::keys() const {
    std::vector<std::string> names;
    for (const auto& entry : tensors_) names.push_back(entry.first);
    return names;
}

const TensorInfo& ArchiveReader::info(const std::string& name) const {
    auto it = tensors_.find(name);
    if (it == tensors_.end()) {
        throw errors::FormatError(path_, "missing tensor " + name);
    }
    return it->second;
}

const uint8_t* ArchiveReader::tensor_data(const std::string& name, const std::string& dtype,
                                          size_t element_size) const {
    const TensorInfo& t = info(name);
    if (t.dtype != dtype) {
        throw errors::FormatError(path_, "tensor " + name + " has dtype " + t.dtype +
                                             ", expected " + dtype);
    }
    if (t.num_bytes() != t.num_elements() * element_size) {
        throw errors::FormatError(path_, "tensor " + name + " size does not match its shape");
    }
    return bytes_.data() + data_offset_ + t.data_begin;
}

std::vector<float> ArchiveReader::read_f32(const std::string& name) const {
    const uint8_t* src = tensor_data(name, "F32", sizeof(float));
    std::vector<float> out(info(name).num_elements());
    std::memcpy(out.data(), src, out.size() * sizeof(float));
    return out;
}

std::vector<int32_t> ArchiveReader::read_i32(const std::string& name) const {
    const uint8_t* src = tensor_data(name, "I32", sizeof(int32_t));
    std::vector<int32_t> out(info(name).num_elements());
    std::memcpy(out.data(), src, out.size() * sizeof(int32_t));
    return out;
}

std::vector<uint8_t> ArchiveReader::read_u8(const std::string& name) const {
    const uint8_t* src = tensor_data(name, "U8", 1);
    return std::vector<uint8_t>(src, src + info(name).num_elements());
}

// ============================================================================
// Ensemble persistence
// ============================================================================

std::string save_ensemble(const ensemble::Ensemble& ens, const std::string& filename) {
    if (ens.num_conformations() == 0) {
        throw errors::PreconditionError("save_ensemble",
                                        "an ensemble with at least one conformation",
                                        "The ensemble instance does not contain data");
    }

    std::string path = filename;
    if (path.empty()) {
        path = ens.title();
        std::replace(path.begin(), path.end(), ' ', '_');
    }
    if (!ends_with(path, ".ens")) {
        path += ".ens";
    }

    const size_t N = static_cast<size_t>(ens.num_atoms(false));
    const size_t M = static_cast<size_t>(ens.num_conformations());

    ArchiveWriter writer;
    writer.set_metadata("_title", JsonValue(ens.title()));
    writer.set_metadata("_kind", JsonValue(ensemble::kind_to_string(ens.kind())));

    if (ens.has_coords()) {
        writer.add_f32("_coords", {N, 3}, ens.coords(false));
    }
    writer.add_f32("_confs", {M, N, 3}, ens.confs(false));

    if (ens.has_presence_weights()) {
        writer.add_f32("_weights", {M, N, 1}, ens.weights(false));

        JsonValue labels = JsonValue::array();
        for (const auto& label : ens.labels()) labels.push_back(JsonValue(label));
        writer.set_metadata("_labels", labels);

        if (ens.has_msa()) {
            JsonValue msa = JsonValue::array();
            for (const auto& row : ens.msa_rows()) msa.push_back(JsonValue(row));
            writer.set_metadata("_msa", msa);
        }
    } else if (ens.has_weights()) {
        writer.add_f32("_weights", {N, 1}, ens.weights(false));
    }

    bool any_transformed = false;
    std::vector<float> trans;
    std::vector<uint8_t> trans_set;
    trans.reserve(M * 16);
    for (size_t i = 0; i < M; i++) {
        const auto& t = ens.transformation(static_cast<int>(i));
        auto matrix = t ? t->matrix() : types::Transformation::identity().matrix();
        trans.insert(trans.end(), matrix.begin(), matrix.end());
        trans_set.push_back(t ? 1 : 0);
        any_transformed = any_transformed || t.has_value();
    }
    if (any_transformed) {
        writer.add_f32("_trans", {M, 4, 4}, trans);
        writer.add_u8("_trans_set", {M}, trans_set);
    }

    if (ens.has_selection()) {
        std::vector<int> indices = ens.indices();
        writer.add_i32("_indices", {indices.size()},
                       std::vector<int32_t>(indices.begin(), indices.end()));
    }

    if (ens.has_atoms()) {
        const auto& atoms = *ens.atoms_ptr();
        int coordset = atoms.num_coordsets() > 0 ? atoms.active_coordset() : -1;
        writer.set_metadata("_atoms", JsonValue(to_pdb_string(atoms, coordset)));
    }

    for (const auto& entry : *ens.data()) {
        writer.add_f32(kDataPrefix + entry.first, {entry.second.size()}, entry.second);
    }

    writer.write(path);
    return path;
}

ensemble::Ensemble load_ensemble(const std::string& filename) {
    ArchiveReader reader(filename);
    const JsonValue& meta = reader.metadata();

    std::string title = "Unknown";
    if (meta.contains("_title")) {
        title = json_text(meta.at("_title"), filename, "_title");
    } else if (meta.contains("_name")) {
        title = json_text(meta.at("_name"), filename, "_name");
    }

    const bool has_weights = reader.has("_weights");
    const bool is_pdb = has_weights && reader.info("_weights").shape.size() == 3;
    ensemble::Ensemble ens(title, is_pdb ? ensemble::EnsembleKind::PDB
                                         : ensemble::EnsembleKind::Plain);

    const TensorInfo& confs_info = reader.info("_confs");
    if (confs_info.shape.size() != 3 || confs_info.shape[2] != 3) {
        throw errors::FormatError(filename, "_confs must have shape [M, N, 3]");
    }
    const size_t M = confs_info.shape[0];
    const size_t N = confs_info.shape[1];

    if (reader.has("_coords")) {
        ens.set_coords(reader.read_f32("_coords"));
    }

    if (meta.contains("_atoms")) {
        PDBParser parser;
        Structure atoms = parser.parse_string(json_text(meta.at("_atoms"), filename, "_atoms"), title);
        if (static_cast<size_t>(atoms.num_atoms()) != N) {
            throw errors::FormatError(filename, "_atoms has " + std::to_string(atoms.num_atoms()) +
                                                    " atoms, expected " + std::to_string(N));
        }
        ens.set_atoms(atoms);
    }

    const std::vector<float> confs = reader.read_f32("_confs");
    std::vector<float> weights;
    if (has_weights) {
        weights = reader.read_f32("_weights");
        size_t expected = is_pdb ? M * N : N;
        if (weights.size() != expected) {
            throw errors::FormatError(filename, "_weights does not match the conformations");
        }
    }

    std::vector<std::string> labels;
    std::vector<std::string> msa;
    if (is_pdb) {
        if (meta.contains("_labels")) {
            labels = json_text_list(meta.at("_labels"), filename, "_labels");
        } else if (meta.contains("_identifiers")) {
            labels = json_text_list(meta.at("_identifiers"), filename, "_identifiers");
        }
        if (!labels.empty() && labels.size() != M) {
            throw errors::FormatError(filename, "label count does not match the conformations");
        }
        if (meta.contains("_msa")) {
            msa = json_text_list(meta.at("_msa"), filename, "_msa");
            if (msa.size() != M) {
                throw errors::FormatError(filename, "MSA row count does not match the conformations");
            }
        }
    }

    for (size_t i = 0; i < M; i++) {
        std::vector<float> coords(confs.begin() + i * N * 3, confs.begin() + (i + 1) * N * 3);
        if (is_pdb) {
            std::vector<float> w(weights.begin() + i * N, weights.begin() + (i + 1) * N);
            ens.add_conformation(std::move(coords), std::move(w), labels.empty() ? "" : labels[i],
                                 msa.empty() ? "" : msa[i]);
        } else {
            ens.add_conformation(std::move(coords));
        }
    }
    if (!is_pdb && has_weights) {
        ens.set_weights(weights);
    }

    if (reader.has("_trans")) {
        const std::vector<float> trans = reader.read_f32("_trans");
        if (trans.size() != M * 16) {
            throw errors::FormatError(filename, "_trans must have shape [M, 4, 4]");
        }
        std::vector<uint8_t> set_flags(M, 1);
        if (reader.has("_trans_set")) {
            set_flags = reader.read_u8("_trans_set");
            if (set_flags.size() != M) {
                throw errors::FormatError(filename, "_trans_set must have shape [M]");
            }
        }
        for (size_t i = 0; i < M; i++) {
            if (set_flags[i]) {
                ens.set_transformation(static_cast<int>(i),
                                       types::Transformation::from_matrix(trans.data() + i * 16));
            }
        }
    }

    if (reader.has("_indices")) {
        std::vector<int32_t> indices = reader.read_i32("_indices");
        ens.set_indices(std::vector<int>(indices.begin(), indices.end()));
    }

    const std::string prefix = kDataPrefix;
    for (const auto& key : reader.keys()) {
        if (key.compare(0, prefix.size(), prefix) == 0) {
            ens.set_data(key.substr(prefix.size()), reader.read_f32(key));
        }
    }

    return ens;
}

}  // namespace io
}  // namespace confens
