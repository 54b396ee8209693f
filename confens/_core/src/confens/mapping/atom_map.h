/**
 * Partial correspondence from a source structure's atoms onto the reference
 * frame.
 */

#pragma once

#include "confens/io/structure.h"

#include <memory>
#include <string>
#include <vector>

namespace confens {
namespace mapping {

class AtomMap {
public:
    /**
     * @param source Source structure the indices refer to
     * @param mapping For each reference position, the source atom index or -1
     * @param chain_ids Source chains contributing to this map
     */
    AtomMap(std::shared_ptr<const io::Structure> source, std::vector<int> mapping,
            std::string chain_ids);

    const io::Structure& source() const { return *source_; }

    /// Number of reference positions (matched or not).
    int num_atoms() const { return static_cast<int>(mapping_.size()); }

    /// Number of matched reference positions.
    int num_mapped() const;

    const std::vector<int>& mapping() const { return mapping_; }

    /// Reference positions covered by this map, ascending.
    std::vector<int> covered_indices() const;

    /// 1.0 at matched reference positions, 0.0 elsewhere.
    std::vector<float> matched_flags() const;

    /// Sorted, deduplicated source chain identifiers.
    const std::string& chain_ids() const { return chain_ids_; }

    int num_states() const { return source_->num_coordsets(); }
    int active_state() const { return source_->active_coordset(); }

    /**
     * Coordinates in reference order [num_atoms * 3]; zeros at unmatched
     * positions. -1 selects the source's active state.
     */
    std::vector<float> coords(int state = -1) const;

    /// One-letter residue codes in reference order, '-' at unmatched positions.
    std::string sequence() const;

private:
    std::shared_ptr<const io::Structure> source_;
    std::vector<int> mapping_;
    std::string chain_ids_;
};

}  // namespace mapping
}  // namespace confens
