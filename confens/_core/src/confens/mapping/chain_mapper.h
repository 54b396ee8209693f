/**
 * Default atom mapper: chain-by-chain sequence matching.
 *
 * For every reference chain, source chains are ranked by a global alignment
 * of their residue sequences. Candidates must reach the sequence identity
 * (over aligned residues) and overlap (aligned residues over the shorter
 * chain) thresholds. Candidates are then combined greedily into chain groups:
 * each group assigns at most one source chain to each reference chain, and a
 * source chain joins at most one group. Within aligned residue pairs atoms are
 * matched by name.
 *
 * A homodimer reference mapped against a homotetramer source therefore
 * yields two AtomMaps.
 */

#pragma once

#include "atom_mapper.h"
#include "sequence_align.h"

namespace confens {
namespace mapping {

struct ChainMapperConfig {
    float seqid = 90.0f;    // Minimum percent sequence identity
    float overlap = 70.0f;  // Minimum percent overlap
    GlobalAlignConfig align;

    ChainMapperConfig() = default;
};

class ChainMapper : public AtomMapper {
public:
    /**
     * @throws ValidationError if seqid or overlap is outside [0, 100]
     */
    explicit ChainMapper(const ChainMapperConfig& config = ChainMapperConfig());

    std::vector<AtomMap> map(const std::shared_ptr<const io::Structure>& source,
                             const io::Structure& reference) override;

    const ChainMapperConfig& config() const { return config_; }

private:
    ChainMapperConfig config_;
};

}  // namespace mapping
}  // namespace confens
