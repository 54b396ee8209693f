/**
 * Weighted Kabsch Algorithm: Optimal Rigid-Body Superposition
 *
 * Finds the rotation R and translation t minimizing the weighted RMSD
 * between two sets of 3D points:
 *
 *   RMSD = sqrt( Sigma w_i ||R P_i + t - Q_i||^2 / Sigma w_i )
 *
 * Algorithm:
 * 1. Weighted centroids: c_P = Sigma w_i P_i / W, c_Q = Sigma w_i Q_i / W
 * 2. Weighted covariance: H = Sigma w_i (P_i - c_P)(Q_i - c_Q)^T (3*3)
 * 3. SVD of H: H = U Sigma V^T (Eigen::JacobiSVD)
 * 4. Rotation: R = V diag(1, 1, d) U^T with d = sign(det(V U^T))
 * 5. Translation: t = c_Q - R c_P
 *
 * A zero weight removes the point from every sum, so atoms that were never
 * resolved in a conformation cannot pull the fit.
 *
 * References:
 * - Kabsch, W. (1976). "A solution for the best rotation to relate two sets of vectors"
 */

#pragma once

#include "confens/dispatch/backend_traits.h"

namespace confens {
namespace kabsch {

/**
 * Weighted Kabsch superposition of P onto Q.
 *
 * @tparam Backend Computation backend (ScalarBackend)
 * @param P Mobile coordinates [N * 3] (row-major)
 * @param Q Target coordinates [N * 3] (row-major)
 * @param weights Per-point weights [N], or nullptr for uniform weights
 * @param N Number of point pairs
 * @param R Output rotation matrix [9] (3*3 row-major, det(R) = +1)
 * @param t Output translation vector [3]
 * @param rmsd Output weighted RMSD after alignment (can be nullptr)
 * @return false when the total weight is zero; R is then the identity and t zero
 *
 * Example usage:
 * ```cpp
 *   float R[9], t[3], rmsd;
 *   kabsch_align<ScalarBackend>(mobile, target, weights, N, R, t, &rmsd);
 *   apply_transformation<ScalarBackend>(R, t, mobile, mobile, N);
 * ```
 */
template <typename Backend>
bool kabsch_align(const float* P,        // [N * 3] mobile coordinates
                  const float* Q,        // [N * 3] target coordinates
                  const float* weights,  // [N] weights or nullptr
                  int N,                 // number of point pairs
                  float* R,              // [9] rotation matrix output
                  float* t,              // [3] translation vector output
                  float* rmsd            // RMSD output (can be nullptr)
);

/**
 * Apply a rotation and translation to N points: out = R @ in + t.
 *
 * coords_in and coords_out may alias.
 */
template <typename Backend>
void apply_transformation(const float* R,          // [9] rotation matrix (3*3 row-major)
                          const float* t,          // [3] translation vector
                          const float* coords_in,  // [N * 3] input coordinates
                          float* coords_out,       // [N * 3] output coordinates
                          int N                    // number of points
);

}  // namespace kabsch
}  // namespace confens
