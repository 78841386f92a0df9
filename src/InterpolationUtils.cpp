#include "InterpolationUtils.h"

#include <algorithm>
#include <cmath>

namespace InterpolationUtils {

std::optional<std::vector<double>> solveDense(std::vector<std::vector<double>> a, std::vector<double> b) {
    const size_t n = b.size();
    if (a.size() != n) return std::nullopt;
    for (const auto& row : a) {
        if (row.size() != n) return std::nullopt;
    }

    for (size_t i = 0; i < n; ++i) {
        size_t pivot = i;
        for (size_t r = i + 1; r < n; ++r) {
            if (std::abs(a[r][i]) > std::abs(a[pivot][i])) pivot = r;
        }
        if (std::abs(a[pivot][i]) < 1e-12) return std::nullopt;
        if (pivot != i) {
            std::swap(a[i], a[pivot]);
            std::swap(b[i], b[pivot]);
        }

        const double div = a[i][i];
        for (size_t c = i; c < n; ++c) a[i][c] /= div;
        b[i] /= div;

        for (size_t r = 0; r < n; ++r) {
            if (r == i) continue;
            const double factor = a[r][i];
            if (factor == 0.0) continue;
            for (size_t c = i; c < n; ++c) a[r][c] -= factor * a[i][c];
            b[r] -= factor * b[i];
        }
    }
    return b;
}

std::optional<std::vector<double>> notAKnotSecondDerivatives(const std::vector<double>& x, const std::vector<double>& y) {
    const size_t n = x.size();
    if (n < 4 || y.size() != n) return std::nullopt;

    std::vector<double> h(n - 1, 0.0);
    for (size_t i = 0; i + 1 < n; ++i) {
        h[i] = x[i + 1] - x[i];
        if (!(h[i] > 0.0)) return std::nullopt;
    }

    std::vector<std::vector<double>> a(n, std::vector<double>(n, 0.0));
    std::vector<double> rhs(n, 0.0);

    // Third derivative continuous across the second and the second-to-last knot.
    a[0][0] = h[1];
    a[0][1] = -(h[0] + h[1]);
    a[0][2] = h[0];

    for (size_t i = 1; i + 1 < n; ++i) {
        a[i][i - 1] = h[i - 1];
        a[i][i] = 2.0 * (h[i - 1] + h[i]);
        a[i][i + 1] = h[i];
        rhs[i] = 6.0 * ((y[i + 1] - y[i]) / h[i] - (y[i] - y[i - 1]) / h[i - 1]);
    }

    a[n - 1][n - 3] = h[n - 2];
    a[n - 1][n - 2] = -(h[n - 3] + h[n - 2]);
    a[n - 1][n - 1] = h[n - 3];

    return solveDense(std::move(a), std::move(rhs));
}

size_t segmentIndex(const std::vector<double>& x, double t) {
    if (x.size() < 2) return 0;
    auto it = std::upper_bound(x.begin(), x.end(), t);
    if (it == x.begin()) return 0;
    size_t idx = static_cast<size_t>(std::distance(x.begin(), it)) - 1;
    return std::min(idx, x.size() - 2);
}

double lerpSegment(const std::vector<double>& x, const std::vector<double>& y, size_t i, double t) {
    const double h = x[i + 1] - x[i];
    const double w = (t - x[i]) / h;
    return y[i] + w * (y[i + 1] - y[i]);
}

double splineSegment(const std::vector<double>& x,
                     const std::vector<double>& y,
                     const std::vector<double>& m,
                     size_t i,
                     double t) {
    const double h = x[i + 1] - x[i];
    const double left = x[i + 1] - t;
    const double right = t - x[i];
    return m[i] * left * left * left / (6.0 * h) +
           m[i + 1] * right * right * right / (6.0 * h) +
           (y[i] / h - m[i] * h / 6.0) * left +
           (y[i + 1] / h - m[i + 1] * h / 6.0) * right;
}

} // namespace InterpolationUtils
