/**
 * Scalar implementation of the weighted Kabsch algorithm.
 */

#include "kabsch_impl.h"

#include <Eigen/Dense>
#include <cmath>

namespace confens {
namespace kabsch {

// ============================================================================
// Main Kabsch Implementation
// ============================================================================

template <>
bool kabsch_align<ScalarBackend>(const float* P, const float* Q, const float* weights, int N,
                                 float* R, float* t, float* rmsd) {
    // Step 1: Weighted centroids (accumulated in double)
    Eigen::Vector3d cP = Eigen::Vector3d::Zero();
    Eigen::Vector3d cQ = Eigen::Vector3d::Zero();
    double W = 0.0;

    for (int i = 0; i < N; i++) {
        double w = weights != nullptr ? static_cast<double>(weights[i]) : 1.0;
        if (w == 0.0) continue;
        cP += w * Eigen::Vector3d(P[i * 3 + 0], P[i * 3 + 1], P[i * 3 + 2]);
        cQ += w * Eigen::Vector3d(Q[i * 3 + 0], Q[i * 3 + 1], Q[i * 3 + 2]);
        W += w;
    }

    if (!(W > 0.0)) {
        for (int k = 0; k < 9; k++) R[k] = (k % 4 == 0) ? 1.0f : 0.0f;
        t[0] = t[1] = t[2] = 0.0f;
        if (rmsd != nullptr) *rmsd = 0.0f;
        return false;
    }

    cP /= W;
    cQ /= W;

    // Step 2: Weighted covariance H = sum w_i (P_i - cP)(Q_i - cQ)^T
    Eigen::Matrix3d H = Eigen::Matrix3d::Zero();
    for (int i = 0; i < N; i++) {
        double w = weights != nullptr ? static_cast<double>(weights[i]) : 1.0;
        if (w == 0.0) continue;
        Eigen::Vector3d p = Eigen::Vector3d(P[i * 3 + 0], P[i * 3 + 1], P[i * 3 + 2]) - cP;
        Eigen::Vector3d q = Eigen::Vector3d(Q[i * 3 + 0], Q[i * 3 + 1], Q[i * 3 + 2]) - cQ;
        H.noalias() += w * p * q.transpose();
    }

    // Step 3: SVD of H
    Eigen::JacobiSVD<Eigen::Matrix3d> svd(H, Eigen::ComputeFullU | Eigen::ComputeFullV);
    const Eigen::Matrix3d& U = svd.matrixU();
    const Eigen::Matrix3d& V = svd.matrixV();

    // Step 4: R = V diag(1, 1, d) U^T, d corrects a reflection
    double d = (V * U.transpose()).determinant() < 0.0 ? -1.0 : 1.0;
    Eigen::Matrix3d D = Eigen::Matrix3d::Identity();
    D(2, 2) = d;
    Eigen::Matrix3d Rm = V * D * U.transpose();

    // Step 5: t = cQ - R cP
    Eigen::Vector3d tv = cQ - Rm * cP;

    for (int r = 0; r < 3; r++) {
        for (int c = 0; c < 3; c++) {
            R[r * 3 + c] = static_cast<float>(Rm(r, c));
        }
        t[r] = static_cast<float>(tv(r));
    }

    // Step 6: Weighted RMSD after the fit
    if (rmsd != nullptr) {
        double sum_sq = 0.0;
        for (int i = 0; i < N; i++) {
            double w = weights != nullptr ? static_cast<double>(weights[i]) : 1.0;
            if (w == 0.0) continue;
            Eigen::Vector3d p(P[i * 3 + 0], P[i * 3 + 1], P[i * 3 + 2]);
            Eigen::Vector3d q(Q[i * 3 + 0], Q[i * 3 + 1], Q[i * 3 + 2]);
            sum_sq += w * (Rm * p + tv - q).squaredNorm();
        }
        *rmsd = static_cast<float>(std::sqrt(sum_sq / W));
    }

    return true;
}

template <>
void apply_transformation<ScalarBackend>(const float* R, const float* t, const float* coords_in,
                                         float* coords_out, int N) {
    for (int i = 0; i < N; i++) {
        float x = coords_in[i * 3 + 0];
        float y = coords_in[i * 3 + 1];
        float z = coords_in[i * 3 + 2];

        coords_out[i * 3 + 0] = R[0] * x + R[1] * y + R[2] * z + t[0];
        coords_out[i * 3 + 1] = R[3] * x + R[4] * y + R[5] * z + t[1];
        coords_out[i * 3 + 2] = R[6] * x + R[7] * y + R[8] * z + t[2];
    }
}

}  // namespace kabsch
}  // namespace confens
