#include "refine.h"

#include "confens/common/perf_timer.h"
#include "confens/errors/confens_error.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <numeric>

namespace confens {
namespace ensemble {

ConformationRef ConformationRef::at(int index) {
    ConformationRef ref;
    ref.type = Type::Index;
    ref.index = index;
    return ref;
}

ConformationRef ConformationRef::by_label(const std::string& label) {
    ConformationRef ref;
    ref.type = Type::Label;
    ref.label = label;
    return ref;
}

ConformationRef ConformationRef::parse(const std::string& spec) {
    bool numeric = !spec.empty() && std::all_of(spec.begin(), spec.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
    if (numeric && spec.size() < 10) {
        return at(std::stoi(spec));
    }
    return by_label(spec);
}

int ConformationRef::resolve(const Ensemble& ensemble) const {
    if (type == Type::Label) {
        return ensemble.find_label(label);
    }
    if (index < 0 || index >= ensemble.num_conformations()) {
        throw errors::ValidationError(
            "conformation index", std::to_string(index),
            "index in [0, " + std::to_string(ensemble.num_conformations()) + ")");
    }
    return index;
}

std::vector<int> prune_by_relation(const std::vector<bool>& violates, int M, int reference,
                                   const std::vector<int>& protected_set) {
    auto at = [&](int i, int j) { return violates[static_cast<size_t>(i) * M + j]; };

    std::vector<int> degree(M, 0);
    for (int i = 0; i < M; i++) {
        for (int j = 0; j < M; j++) {
            if (at(i, j)) degree[j]++;
        }
    }

    std::vector<int> order(M);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](int a, int b) { return degree[a] < degree[b]; });
    order.erase(std::find(order.begin(), order.end(), reference));
    order.insert(order.begin(), reference);

    std::vector<bool> is_protected(M, false);
    for (int p : protected_set) is_protected[p] = true;

    std::vector<bool> removed(M, false);
    for (int a = 0; a < M; a++) {
        const int i = order[a];
        for (int b = a + 1; b < M; b++) {
            const int j = order[b];
            if (removed[i] || removed[j]) continue;
            if (!at(i, j)) continue;

            if (!is_protected[j]) {
                removed[j] = true;
            } else if (!is_protected[i]) {
                removed[i] = true;
            } else if (i == reference) {
                removed[j] = true;
            } else if (j == reference) {
                removed[i] = true;
            } else {
                removed[std::max(i, j)] = true;
            }
        }
    }

    std::vector<int> survivors;
    for (int i = 0; i < M; i++) {
        if (!removed[i]) survivors.push_back(i);
    }
    return survivors;
}

Ensemble refine_ensemble(const Ensemble& ensemble, const RefineConfig& config,
                         common::Observer& observer) {
    const int M = ensemble.num_conformations();
    if (M == 0) {
        throw errors::PreconditionError("refine_ensemble",
                                        "an ensemble with at least one conformation");
    }

    perf::ScopedTimer timer("refine_ensemble");

    // Step 1: resolve selectors; the reference is protected first
    std::vector<int> protected_set;
    for (const auto& ref : config.protected_confs) {
        protected_set.push_back(ref.resolve(ensemble));
    }
    const int reference = config.reference.resolve(ensemble);
    if (std::find(protected_set.begin(), protected_set.end(), reference) == protected_set.end()) {
        protected_set.insert(protected_set.begin(), reference);
    }

    // Step 2: pairwise RMSDs (NaN pairs never violate)
    const std::vector<float> rmsds = ensemble.pairwise_rmsds(true);

    std::vector<int> lower_survivors(M);
    std::vector<int> upper_survivors(M);
    std::iota(lower_survivors.begin(), lower_survivors.end(), 0);
    std::iota(upper_survivors.begin(), upper_survivors.end(), 0);

    if (config.lower) {
        std::vector<bool> too_close(rmsds.size());
        for (size_t k = 0; k < rmsds.size(); k++) too_close[k] = rmsds[k] < *config.lower;
        lower_survivors = prune_by_relation(too_close, M, reference, protected_set);
    }
    if (config.upper) {
        std::vector<bool> too_far(rmsds.size());
        for (size_t k = 0; k < rmsds.size(); k++) too_far[k] = rmsds[k] > *config.upper;
        upper_survivors = prune_by_relation(too_far, M, reference, protected_set);
    }

    // Step 3: survivors of both passes, ascending
    std::vector<int> kept;
    std::set_intersection(lower_survivors.begin(), lower_survivors.end(),
                          upper_survivors.begin(), upper_survivors.end(),
                          std::back_inserter(kept));

    Ensemble refined = ensemble.subset(kept);

    observer.info("Ensemble was refined in " + timer.elapsed_text() + ".");
    observer.info(std::to_string(M - static_cast<int>(kept.size())) +
                  " conformations were removed from ensemble.");
    return refined;
}

}  // namespace ensemble
}  // namespace confens
