/**
 * Scalar implementation of the weighted RMSD kernels.
 */

#include "rmsd_impl.h"

#include <cmath>
#include <cstddef>
#include <limits>

namespace confens {
namespace rmsd {

template <>
float weighted_rmsd<ScalarBackend>(const float* A, const float* B, const float* wA,
                                   const float* wB, int N) {
    double sum_sq = 0.0;
    double W = 0.0;

    for (int i = 0; i < N; i++) {
        double w = (wA != nullptr ? static_cast<double>(wA[i]) : 1.0) *
                   (wB != nullptr ? static_cast<double>(wB[i]) : 1.0);
        if (w == 0.0) continue;

        double dx = static_cast<double>(A[i * 3 + 0]) - B[i * 3 + 0];
        double dy = static_cast<double>(A[i * 3 + 1]) - B[i * 3 + 1];
        double dz = static_cast<double>(A[i * 3 + 2]) - B[i * 3 + 2];
        sum_sq += w * (dx * dx + dy * dy + dz * dz);
        W += w;
    }

    if (!(W > 0.0)) {
        return std::numeric_limits<float>::quiet_NaN();
    }
    return static_cast<float>(std::sqrt(sum_sq / W));
}

template <>
void pairwise_rmsd<ScalarBackend>(const float* coords, const float* weights, int M, int N,
                                  float* out) {
    const size_t stride = static_cast<size_t>(N);

    for (int i = 0; i < M; i++) {
        out[static_cast<size_t>(i) * M + i] = 0.0f;
        for (int j = i + 1; j < M; j++) {
            const float* wi = weights != nullptr ? weights + i * stride : nullptr;
            const float* wj = weights != nullptr ? weights + j * stride : nullptr;
            float r = weighted_rmsd<ScalarBackend>(coords + i * stride * 3, coords + j * stride * 3,
                                                   wi, wj, N);
            out[static_cast<size_t>(i) * M + j] = r;
            out[static_cast<size_t>(j) * M + i] = r;
        }
    }
}

}  // namespace rmsd
}  // namespace confens
