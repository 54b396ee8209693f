#include "transformation.h"

#include "confens/dispatch/backend_traits.h"
#include "confens/primitives/kabsch/kabsch_impl.h"

#include <cmath>

namespace confens::types {

Transformation::Transformation()
    : rotation_{1.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f, 1.0f},
      translation_{0.0f, 0.0f, 0.0f} {
}

Transformation::Transformation(const float* rotation, const float* translation) {
    for (int k = 0; k < 9; k++) rotation_[k] = rotation[k];
    for (int k = 0; k < 3; k++) translation_[k] = translation[k];
}

Transformation Transformation::from_matrix(const float* m) {
    float R[9] = {m[0], m[1], m[2], m[4], m[5], m[6], m[8], m[9], m[10]};
    float t[3] = {m[3], m[7], m[11]};
    return Transformation(R, t);
}

std::array<float, 16> Transformation::matrix() const {
    const auto& R = rotation_;
    const auto& t = translation_;
    return {R[0], R[1], R[2], t[0],
            R[3], R[4], R[5], t[1],
            R[6], R[7], R[8], t[2],
            0.0f, 0.0f, 0.0f, 1.0f};
}

void Transformation::apply(const float* coords_in, float* coords_out, int N) const {
    kabsch::apply_transformation<ScalarBackend>(rotation_.data(), translation_.data(), coords_in,
                                                coords_out, N);
}

void Transformation::apply(std::vector<float>& coords) const {
    apply(coords.data(), coords.data(), static_cast<int>(coords.size() / 3));
}

Transformation Transformation::then(const Transformation& next) const {
    // next(this(x)) = Rn (R x + t) + tn = (Rn R) x + (Rn t + tn)
    const auto& A = rotation_;
    const auto& B = next.rotation_;
    float R[9];
    float t[3];

    for (int i = 0; i < 3; i++) {
        for (int j = 0; j < 3; j++) {
            double sum = 0.0;
            for (int k = 0; k < 3; k++) {
                sum += static_cast<double>(B[i * 3 + k]) * A[k * 3 + j];
            }
            R[i * 3 + j] = static_cast<float>(sum);
        }
        double ti = next.translation_[i];
        for (int k = 0; k < 3; k++) {
            ti += static_cast<double>(B[i * 3 + k]) * translation_[k];
        }
        t[i] = static_cast<float>(ti);
    }

    return Transformation(R, t);
}

bool Transformation::is_identity(float tol) const {
    for (int i = 0; i < 3; i++) {
        for (int j = 0; j < 3; j++) {
            float expected = (i == j) ? 1.0f : 0.0f;
            if (std::abs(rotation_[i * 3 + j] - expected) > tol) return false;
        }
        if (std::abs(translation_[i]) > tol) return false;
    }
    return true;
}

}  // namespace confens::types
