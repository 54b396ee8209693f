/**
 * Ensemble archive (.ens)
 *
 * Safetensors-style container:
 *   - 8 bytes: N (uint64_t little-endian) - header size
 *   - N bytes: JSON header (space-padded to a multiple of 8)
 *   - Rest: raw little-endian tensor data
 *
 * Header JSON:
 * {
 *   "__metadata__": {"_title": ..., "_kind": ..., "_labels": [...], "_atoms": ..., "_msa": [...]},
 *   "<tensor>": {"dtype": "F32" | "I32" | "U8", "shape": [...], "data_offsets": [begin, end]},
 *   ...
 * }
 *
 * Tensors written for an ensemble:
 *   _coords     F32 [N, 3]      reference coordinates
 *   _confs      F32 [M, N, 3]   conformations
 *   _weights    F32 [M, N, 1]   presence weights (PDB) or [N, 1] (Plain)
 *   _indices    I32 [K]         selection view
 *   _trans      F32 [M, 4, 4]   transformations, with _trans_set U8 [M]
 *   _data.<key> F32 [L]         auxiliary arrays
 *
 * The ensemble kind is recovered from the rank of _weights (3 = PDB).
 */

#pragma once

#include "json.h"

#include "confens/ensemble/ensemble.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace confens {
namespace io {

/**
 * Tensor metadata from the archive header.
 */
struct TensorInfo {
    std::string dtype;          // "F32", "I32", "U8"
    std::vector<size_t> shape;  // Tensor dimensions
    size_t data_begin = 0;      // Offset relative to the data section
    size_t data_end = 0;

    size_t num_elements() const {
        size_t total = 1;
        for (size_t dim : shape) total *= dim;
        return total;
    }

    size_t num_bytes() const { return data_end - data_begin; }
};

/**
 * Accumulates tensors and metadata, then writes one archive file.
 */
class ArchiveWriter {
public:
    void add_f32(const std::string& name, const std::vector<size_t>& shape,
                 const std::vector<float>& values);
    void add_i32(const std::string& name, const std::vector<size_t>& shape,
                 const std::vector<int32_t>& values);
    void add_u8(const std::string& name, const std::vector<size_t>& shape,
                const std::vector<uint8_t>& values);

    void set_metadata(const std::string& key, JsonValue value);

    /**
     * @throws FileWriteError if the file cannot be written
     */
    void write(const std::string& path) const;

private:
    void add_raw(const std::string& name, const std::string& dtype,
                 const std::vector<size_t>& shape, const void* data, size_t bytes);

    JsonValue header_ = JsonValue::object();
    JsonValue metadata_ = JsonValue::object();
    std::vector<uint8_t> data_;
};

/**
 * Reads an archive file fully into memory.
 */
class ArchiveReader {
public:
    /**
     * @throws FileNotFoundError if the file cannot be opened
     * @throws FormatError if the header is malformed or offsets are out of bounds
     */
    explicit ArchiveReader(const std::string& path);

    const std::string& path() const { return path_; }

    bool has(const std::string& name) const { return tensors_.count(name) > 0; }
    std::vector<std::string> keys() const;

    /// @throws FormatError if missing
    const TensorInfo& info(const std::string& name) const;

    /// @throws FormatError if missing or of another dtype
    std::vector<float> read_f32(const std::string& name) const;
    std::vector<int32_t> read_i32(const std::string& name) const;
    std::vector<uint8_t> read_u8(const std::string& name) const;

    /// Header metadata object (empty object when absent).
    const JsonValue& metadata() const { return metadata_; }

private:
    const uint8_t* tensor_data(const std::string& name, const std::string& dtype,
                               size_t element_size) const;

    std::string path_;
    std::vector<uint8_t> bytes_;
    size_t data_offset_ = 0;
    std::map<std::string, TensorInfo> tensors_;
    JsonValue metadata_ = JsonValue::object();
};

/**
 * Save an ensemble.
 *
 * @param filename Output path; ".ens" is appended when missing. Empty uses
 *                 the title with spaces replaced by underscores.
 * @return Path written
 * @throws PreconditionError if the ensemble has no conformations
 * @throws FileWriteError if the file cannot be written
 */
std::string save_ensemble(const ensemble::Ensemble& ensemble, const std::string& filename = "");

/**
 * Load an ensemble saved by save_ensemble.
 *
 * Accepts legacy header keys (_name for the title, _identifiers for labels)
 * and string fields stored as byte arrays.
 *
 * @throws FileNotFoundError, FormatError
 */
ensemble::Ensemble load_ensemble(const std::string& filename);

}  // namespace io
}  // namespace confens
