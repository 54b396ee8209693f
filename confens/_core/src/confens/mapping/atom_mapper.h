/**
 * Atom mapping service interface.
 */

#pragma once

#include "atom_map.h"

#include <memory>
#include <vector>

namespace confens {
namespace mapping {

/**
 * Finds correspondences between a source structure and a reference structure.
 */
class AtomMapper {
public:
    virtual ~AtomMapper() = default;

    /**
     * Map source atoms onto the reference atoms.
     *
     * @return One AtomMap per matched chain group; empty when nothing matches
     */
    virtual std::vector<AtomMap> map(const std::shared_ptr<const io::Structure>& source,
                                     const io::Structure& reference) = 0;
};

}  // namespace mapping
}  // namespace confens
