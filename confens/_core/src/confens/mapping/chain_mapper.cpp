#include "chain_mapper.h"

#include "confens/errors/validators.h"

#include <algorithm>

namespace confens {
namespace mapping {

namespace {

struct Candidate {
    int source_chain;
    float identity;
    float overlap;
    std::vector<std::pair<int, int>> pairs;  // (reference residue, source residue)
};

}  // namespace

ChainMapper::ChainMapper(const ChainMapperConfig& config) : config_(config) {
    validation::validate_range(config_.seqid, 0.0f, 100.0f, "seqid");
    validation::validate_range(config_.overlap, 0.0f, 100.0f, "overlap");
}

std::vector<AtomMap> ChainMapper::map(const std::shared_ptr<const io::Structure>& source,
                                      const io::Structure& reference) {
    std::vector<AtomMap> maps;
    if (!source || source->num_atoms() == 0 || reference.num_atoms() == 0) {
        return maps;
    }

    const std::vector<io::ChainView> ref_chains = reference.hierarchy();
    const std::vector<io::ChainView> src_chains = source->hierarchy();

    // Step 1: candidate source chains per reference chain
    std::vector<std::vector<Candidate>> candidates(ref_chains.size());
    std::vector<std::string> src_sequences;
    src_sequences.reserve(src_chains.size());
    for (const auto& chain : src_chains) {
        src_sequences.push_back(chain.sequence());
    }

    for (size_t r = 0; r < ref_chains.size(); r++) {
        const std::string ref_seq = ref_chains[r].sequence();

        for (size_t s = 0; s < src_chains.size(); s++) {
            const std::string& src_seq = src_sequences[s];
            Candidate candidate{static_cast<int>(s), 0.0f, 0.0f, {}};

            if (ref_seq == src_seq) {
                for (int k = 0; k < static_cast<int>(ref_seq.size()); k++) {
                    candidate.pairs.emplace_back(k, k);
                }
                candidate.identity = ref_seq.empty() ? 0.0f : 100.0f;
                candidate.overlap = ref_seq.empty() ? 0.0f : 100.0f;
            } else {
                SequenceAlignment aln = align_global(ref_seq, src_seq, config_.align);
                candidate.identity = aln.identity();
                candidate.overlap = aln.overlap(static_cast<int>(ref_seq.size()),
                                                static_cast<int>(src_seq.size()));
                candidate.pairs = std::move(aln.pairs);
            }

            if (!candidate.pairs.empty() && candidate.identity >= config_.seqid &&
                candidate.overlap >= config_.overlap) {
                candidates[r].push_back(std::move(candidate));
            }
        }

        std::stable_sort(candidates[r].begin(), candidates[r].end(),
                         [](const Candidate& a, const Candidate& b) {
                             if (a.identity != b.identity) return a.identity > b.identity;
                             return a.overlap > b.overlap;
                         });
    }

    // Step 2: greedy chain groups, each source chain used once
    std::vector<bool> used(src_chains.size(), false);
    while (true) {
        std::vector<const Candidate*> group(ref_chains.size(), nullptr);
        bool any = false;

        for (size_t r = 0; r < ref_chains.size(); r++) {
            for (const auto& candidate : candidates[r]) {
                if (used[candidate.source_chain]) continue;
                bool taken = false;
                for (const Candidate* chosen : group) {
                    if (chosen != nullptr && chosen->source_chain == candidate.source_chain) {
                        taken = true;
                        break;
                    }
                }
                if (taken) continue;
                group[r] = &candidate;
                any = true;
                break;
            }
        }
        if (!any) break;

        // Step 3: atoms matched by name within aligned residue pairs
        std::vector<int> mapping(reference.num_atoms(), -1);
        std::string chain_ids;
        int mapped = 0;

        for (size_t r = 0; r < ref_chains.size(); r++) {
            const Candidate* candidate = group[r];
            if (candidate == nullptr) continue;
            used[candidate->source_chain] = true;

            const io::ChainView& src_chain = src_chains[candidate->source_chain];
            chain_ids.push_back(src_chain.chain_id);

            for (const auto& pair : candidate->pairs) {
                const io::ResidueView& ref_res = ref_chains[r].residues[pair.first];
                const io::ResidueView& src_res = src_chain.residues[pair.second];
                for (int ref_atom : ref_res.atoms) {
                    int src_atom = src_res.find_atom(reference.atom(ref_atom).name, source->atoms());
                    if (src_atom >= 0) {
                        mapping[ref_atom] = src_atom;
                        mapped++;
                    }
                }
            }
        }

        if (mapped > 0) {
            maps.emplace_back(source, std::move(mapping), chain_ids);
        }
    }

    return maps;
}

}  // namespace mapping
}  // namespace confens
