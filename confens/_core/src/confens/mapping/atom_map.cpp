#include "atom_map.h"

#include "confens/errors/confens_error.h"
#include "confens/io/amino_acids.h"

#include <algorithm>

namespace confens {
namespace mapping {

AtomMap::AtomMap(std::shared_ptr<const io::Structure> source, std::vector<int> mapping,
                 std::string chain_ids)
    : source_(std::move(source)), mapping_(std::move(mapping)), chain_ids_(std::move(chain_ids)) {
    if (!source_) {
        throw errors::ValidationError("AtomMap requires a source structure");
    }
    for (int idx : mapping_) {
        if (idx >= source_->num_atoms()) {
            throw errors::ValidationError("source atom index", std::to_string(idx),
                                          "index in [0, " +
                                              std::to_string(source_->num_atoms()) + ")");
        }
    }
    std::sort(chain_ids_.begin(), chain_ids_.end());
    chain_ids_.erase(std::unique(chain_ids_.begin(), chain_ids_.end()), chain_ids_.end());
}

int AtomMap::num_mapped() const {
    return static_cast<int>(std::count_if(mapping_.begin(), mapping_.end(),
                                          [](int idx) { return idx >= 0; }));
}

std::vector<int> AtomMap::covered_indices() const {
    std::vector<int> covered;
    for (int k = 0; k < num_atoms(); k++) {
        if (mapping_[k] >= 0) covered.push_back(k);
    }
    return covered;
}

std::vector<float> AtomMap::matched_flags() const {
    std::vector<float> flags(mapping_.size(), 0.0f);
    for (size_t k = 0; k < mapping_.size(); k++) {
        if (mapping_[k] >= 0) flags[k] = 1.0f;
    }
    return flags;
}

std::vector<float> AtomMap::coords(int state) const {
    const std::vector<float>& source = source_->coords(state);
    std::vector<float> out(mapping_.size() * 3, 0.0f);
    for (size_t k = 0; k < mapping_.size(); k++) {
        int idx = mapping_[k];
        if (idx < 0) continue;
        out[k * 3 + 0] = source[static_cast<size_t>(idx) * 3 + 0];
        out[k * 3 + 1] = source[static_cast<size_t>(idx) * 3 + 1];
        out[k * 3 + 2] = source[static_cast<size_t>(idx) * 3 + 2];
    }
    return out;
}

std::string AtomMap::sequence() const {
    std::string seq(mapping_.size(), '-');
    for (size_t k = 0; k < mapping_.size(); k++) {
        int idx = mapping_[k];
        if (idx < 0) continue;
        seq[k] = io::three_to_one(source_->atom(idx).resname);
    }
    return seq;
}

}  // namespace mapping
}  // namespace confens
