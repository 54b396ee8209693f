/**
 * Ensemble superposition: one-shot fit onto the reference coordinates and
 * iterative fit onto the evolving mean.
 */

#include "ensemble.h"

#include "confens/common/perf_timer.h"
#include "confens/errors/confens_error.h"
#include "confens/primitives/kabsch/kabsch_impl.h"
#include "confens/primitives/rmsd/rmsd_impl.h"

#include <cmath>
#include <sstream>

namespace confens {
namespace ensemble {

void Ensemble::superpose() {
    check_frame_set("Ensemble::superpose");

    const std::vector<float> target = coords(true);
    const int n = num_atoms(true);
    const size_t stride = static_cast<size_t>(n_atoms_) * 3;

    for (int i = 0; i < num_confs_; i++) {
        std::vector<float> mobile = conformation_coords(i, true);
        std::vector<float> w = conformation_weights(i, true);

        float R[9];
        float t[3];
        bool fitted = kabsch::kabsch_align<ScalarBackend>(mobile.data(), target.data(), w.data(), n,
                                                          R, t, nullptr);

        // A conformation without any resolved active atom keeps its coordinates.
        types::Transformation fit = fitted ? types::Transformation(R, t)
                                           : types::Transformation::identity();

        float* conf = confs_.data() + static_cast<size_t>(i) * stride;
        fit.apply(conf, conf, n_atoms_);

        auto& stored = transformations_[i];
        stored = stored ? stored->then(fit) : fit;
    }
}

int Ensemble::iterpose(float tol, int max_iterations, common::Observer& observer) {
    check_frame_set("Ensemble::iterpose");
    if (max_iterations < 1) {
        throw errors::ValidationError("max_iterations", std::to_string(max_iterations),
                                      "at least 1");
    }

    perf::ScopedTimer timer("iterpose");
    const int n = num_atoms(true);

    int iteration = 0;
    float change = 0.0f;
    while (iteration < max_iterations) {
        iteration++;
        superpose();

        std::vector<float> previous = coords(true);
        std::vector<float> mean = mean_coords(false);
        coords_ = std::move(mean);
        std::vector<float> current = coords(true);

        change = rmsd::weighted_rmsd<ScalarBackend>(previous.data(), current.data(), nullptr,
                                                     nullptr, n);
        observer.progress(iteration, max_iterations,
                          "Iteration " + std::to_string(iteration), "iterpose");
        if (std::isnan(change) || change < tol) {
            break;
        }
    }
    observer.progress_done("iterpose");

    std::ostringstream oss;
    oss << "Ensemble (" << num_confs_ << " conformations) were iteratively superposed in "
        << iteration << " iterations (" << timer.elapsed_text() << ", final change " << change
        << ").";
    observer.info(oss.str());
    return iteration;
}

}  // namespace ensemble
}  // namespace confens
