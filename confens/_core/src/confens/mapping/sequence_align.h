/**
 * Global residue-sequence alignment (Needleman-Wunsch with affine gaps,
 * Gotoh recurrences).
 *
 * Used by the chain mapper to pair residues of a source chain with residues
 * of a reference chain.
 *
 * Recurrence (1-indexed):
 *   M[i,j] = s(a_i, b_j) + max(M[i-1,j-1], X[i-1,j-1], Y[i-1,j-1])
 *   X[i,j] = max(M[i-1,j] + gap_open, X[i-1,j] + gap_extend, Y[i-1,j] + gap_open)
 *   Y[i,j] = max(M[i,j-1] + gap_open, Y[i,j-1] + gap_extend, X[i,j-1] + gap_open)
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace confens {
namespace mapping {

/**
 * Scoring for global sequence alignment.
 */
struct GlobalAlignConfig {
    float match = 1.0f;
    float mismatch = 0.0f;
    float gap_open = -1.0f;    // First gap position (negative)
    float gap_extend = -0.1f;  // Each further gap position (negative)

    GlobalAlignConfig() = default;
};

/**
 * Result of a global alignment.
 */
struct SequenceAlignment {
    std::vector<std::pair<int, int>> pairs;  ///< Aligned (i, j) positions, no gaps
    int matches = 0;                         ///< Pairs with identical residues
    float score = 0.0f;

    /// Percent identity over aligned pairs (0 when nothing aligned).
    float identity() const;

    /// Percent of the shorter sequence covered by aligned pairs.
    float overlap(int length_a, int length_b) const;
};

/**
 * Align two one-letter sequences globally.
 */
SequenceAlignment align_global(const std::string& a, const std::string& b,
                               const GlobalAlignConfig& config = GlobalAlignConfig());

}  // namespace mapping
}  // namespace confens
