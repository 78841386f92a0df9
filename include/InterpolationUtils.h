#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace InterpolationUtils {

/**
 * @brief Solves a dense square system A*x = b by Gauss-Jordan elimination with partial pivoting.
 * @pre a is n x n and b has n entries.
 * @post Returns std::nullopt for singular or near-singular systems.
 */
std::optional<std::vector<double>> solveDense(std::vector<std::vector<double>> a, std::vector<double> b);

/**
 * @brief Second derivatives of the not-a-knot cubic spline through (x, y).
 * @pre x strictly increasing, x.size() == y.size() >= 4.
 * @post Returns std::nullopt when the system cannot be solved.
 */
std::optional<std::vector<double>> notAKnotSecondDerivatives(const std::vector<double>& x, const std::vector<double>& y);

// Index i of the segment [x[i], x[i+1]] containing t, clamped to the first/last segment.
size_t segmentIndex(const std::vector<double>& x, double t);

double lerpSegment(const std::vector<double>& x, const std::vector<double>& y, size_t i, double t);

double splineSegment(const std::vector<double>& x,
                     const std::vector<double>& y,
                     const std::vector<double>& m,
                     size_t i,
                     double t);
}
