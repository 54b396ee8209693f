#include "sequence_align.h"

#include <algorithm>
#include <cstdint>

namespace confens {
namespace mapping {

namespace {

constexpr double NINF = -1e30;

enum State : uint8_t { kM = 0, kX = 1, kY = 2 };

// Index of the maximum of three values; ties prefer the lower state.
uint8_t argmax3(double m, double x, double y) {
    if (m >= x && m >= y) return kM;
    if (x >= y) return kX;
    return kY;
}

}  // namespace

float SequenceAlignment::identity() const {
    if (pairs.empty()) return 0.0f;
    return 100.0f * static_cast<float>(matches) / static_cast<float>(pairs.size());
}

float SequenceAlignment::overlap(int length_a, int length_b) const {
    int shorter = std::min(length_a, length_b);
    if (shorter <= 0) return 0.0f;
    return 100.0f * static_cast<float>(pairs.size()) / static_cast<float>(shorter);
}

SequenceAlignment align_global(const std::string& a, const std::string& b,
                               const GlobalAlignConfig& config) {
    SequenceAlignment result;
    const int L1 = static_cast<int>(a.size());
    const int L2 = static_cast<int>(b.size());
    if (L1 == 0 || L2 == 0) {
        return result;
    }

    const size_t W = static_cast<size_t>(L2) + 1;
    const size_t cells = (static_cast<size_t>(L1) + 1) * W;
    std::vector<double> M(cells, NINF), X(cells, NINF), Y(cells, NINF);
    std::vector<uint8_t> tM(cells, kM), tX(cells, kM), tY(cells, kM);

    auto at = [W](int i, int j) { return static_cast<size_t>(i) * W + j; };

    M[at(0, 0)] = 0.0;
    for (int i = 1; i <= L1; i++) {
        X[at(i, 0)] = config.gap_open + (i - 1) * static_cast<double>(config.gap_extend);
        tX[at(i, 0)] = (i == 1) ? kM : kX;
    }
    for (int j = 1; j <= L2; j++) {
        Y[at(0, j)] = config.gap_open + (j - 1) * static_cast<double>(config.gap_extend);
        tY[at(0, j)] = (j == 1) ? kM : kY;
    }

    for (int i = 1; i <= L1; i++) {
        for (int j = 1; j <= L2; j++) {
            double s = (a[i - 1] == b[j - 1]) ? config.match : config.mismatch;

            size_t d = at(i - 1, j - 1);
            uint8_t from = argmax3(M[d], X[d], Y[d]);
            double best = from == kM ? M[d] : (from == kX ? X[d] : Y[d]);
            M[at(i, j)] = best + s;
            tM[at(i, j)] = from;

            size_t u = at(i - 1, j);
            double xm = M[u] + config.gap_open;
            double xx = X[u] + config.gap_extend;
            double xy = Y[u] + config.gap_open;
            from = argmax3(xm, xx, xy);
            X[at(i, j)] = from == kM ? xm : (from == kX ? xx : xy);
            tX[at(i, j)] = from;

            size_t l = at(i, j - 1);
            double ym = M[l] + config.gap_open;
            double yx = X[l] + config.gap_open;
            double yy = Y[l] + config.gap_extend;
            from = argmax3(ym, yx, yy);
            Y[at(i, j)] = from == kM ? ym : (from == kX ? yx : yy);
            tY[at(i, j)] = from;
        }
    }

    // Traceback
    size_t end = at(L1, L2);
    uint8_t state = argmax3(M[end], X[end], Y[end]);
    result.score = static_cast<float>(state == kM ? M[end] : (state == kX ? X[end] : Y[end]));

    int i = L1;
    int j = L2;
    while (i > 0 || j > 0) {
        size_t c = at(i, j);
        if (state == kM) {
            result.pairs.emplace_back(i - 1, j - 1);
            if (a[i - 1] == b[j - 1]) result.matches++;
            state = tM[c];
            i--;
            j--;
        } else if (state == kX) {
            state = tX[c];
            i--;
        } else {
            state = tY[c];
            j--;
        }
    }
    std::reverse(result.pairs.begin(), result.pairs.end());
    return result;
}

}  // namespace mapping
}  // namespace confens
