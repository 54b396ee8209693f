/**
 * Weighted RMSD without refitting
 *
 * Coordinates are compared as stored; callers superpose first when they want
 * the fitted value. Two weight vectors combine multiplicatively, so an atom
 * counts only when both sides resolved it:
 *
 *   RMSD = sqrt( Sigma wA_i wB_i ||A_i - B_i||^2 / Sigma wA_i wB_i )
 */

#pragma once

#include "confens/dispatch/backend_traits.h"

namespace confens {
namespace rmsd {

/**
 * Weighted RMSD between two coordinate sets.
 *
 * @tparam Backend Computation backend
 * @param A First coordinates [N * 3]
 * @param B Second coordinates [N * 3]
 * @param wA Weights of A [N] or nullptr (all ones)
 * @param wB Weights of B [N] or nullptr (all ones)
 * @param N Number of atoms
 * @return RMSD, or NaN when the combined weight is zero
 */
template <typename Backend>
float weighted_rmsd(const float* A, const float* B, const float* wA, const float* wB, int N);

/**
 * Symmetric pairwise RMSD matrix of M coordinate sets.
 *
 * @param coords Conformation coordinates [M * N * 3]
 * @param weights Per-conformation weights [M * N] or nullptr
 * @param M Number of coordinate sets
 * @param N Number of atoms per set
 * @param out Output matrix [M * M], zero diagonal
 */
template <typename Backend>
void pairwise_rmsd(const float* coords, const float* weights, int M, int N, float* out);

}  // namespace rmsd
}  // namespace confens
