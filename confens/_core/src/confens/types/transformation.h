/**
 * Rigid-body transformation (rotation + translation).
 *
 * Stored as a 3*3 row-major rotation and a translation vector; exchanged with
 * the archive as a 4*4 homogeneous matrix:
 *
 *   [ R00 R01 R02 t0 ]
 *   [ R10 R11 R12 t1 ]
 *   [ R20 R21 R22 t2 ]
 *   [  0   0   0   1 ]
 */

#pragma once

#include <array>
#include <vector>

namespace confens::types {

class Transformation {
public:
    /// Identity transformation.
    Transformation();

    /**
     * Create from a rotation [9] (row-major) and translation [3], e.g. the
     * output of kabsch::kabsch_align.
     */
    Transformation(const float* rotation, const float* translation);

    static Transformation identity() { return Transformation(); }

    /// Create from a 4*4 row-major homogeneous matrix; the last row is ignored.
    static Transformation from_matrix(const float* matrix16);

    /// 4*4 row-major homogeneous matrix.
    std::array<float, 16> matrix() const;

    const std::array<float, 9>& rotation() const { return rotation_; }
    const std::array<float, 3>& translation() const { return translation_; }

    /**
     * Apply to N points: out = R @ in + t. in and out may alias.
     */
    void apply(const float* coords_in, float* coords_out, int N) const;

    /// Apply in place to a flat [N * 3] coordinate array.
    void apply(std::vector<float>& coords) const;

    /**
     * Composition: the result applies *this first, then next.
     *
     * (a.then(b)).apply(x) == b.apply(a.apply(x))
     */
    Transformation then(const Transformation& next) const;

    /// True when R is the identity and t is zero within tol.
    bool is_identity(float tol = 1e-6f) const;

private:
    std::array<float, 9> rotation_;
    std::array<float, 3> translation_;
};

}  // namespace confens::types
