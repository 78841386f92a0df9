#pragma once

#include "SieveScale.h"

#include <cstddef>
#include <string>
#include <vector>

enum class InterpolationMethod { Linear, Cubic, Nearest };

/**
 * @brief Parses "linear", "cubic" or "nearest" (case-insensitive).
 * @throws Granulo::ValidationException for any other name.
 */
InterpolationMethod parseInterpolationMethod(const std::string& name);
std::string interpolationMethodName(InterpolationMethod method);

struct KnownPoint {
    double size = 0.0;
    double percent = 0.0;
};

/**
 * Continuous percent-passing function of one sample, interpolated in log10(size).
 * Built once per request and never mutated; switching method means building a new curve.
 */
class GradationCurve {
public:
    static constexpr size_t kMinLinearPoints = 2;
    static constexpr size_t kMinCubicPoints = 4;
    static constexpr size_t kInverseStepsPerSegment = 64;

    /**
     * @brief Pairs every present value with its sieve size and prepares the interpolant.
     * @pre scale.validateSample(sample) holds.
     * @post Known points are sorted by size ascending; a repeated size keeps the later input entry.
     * @throws Granulo::ValidationException on a count mismatch.
     * @throws Granulo::InsufficientDataException with fewer than 2 known points,
     *         or fewer than 4 when method is Cubic.
     */
    static GradationCurve build(const SampleInput& sample, const SieveScale& scale, InterpolationMethod method);

    /**
     * @brief Percent passing at an opening size, clamped to [0,100].
     * Outside the measured range the boundary value is returned.
     * @throws Granulo::OutOfRangeException if size is not a positive finite number.
     */
    double percentPassingAt(double size) const;

    /**
     * @brief Opening size at which the curve first reaches percent, scanning fine to coarse.
     * @throws Granulo::OutOfRangeException when the curve never crosses percent.
     */
    double sizeAtPercent(double percent) const;

    const std::string& name() const { return sample_.name; }
    const SampleInput& sample() const { return sample_; }
    InterpolationMethod method() const { return method_; }
    const std::vector<KnownPoint>& knownPoints() const { return points_; }

    double minKnownSize() const { return points_.front().size; }
    double maxKnownSize() const { return points_.back().size; }
    double minKnownPercent() const;
    double maxKnownPercent() const;

private:
    GradationCurve(SampleInput sample, InterpolationMethod method, std::vector<KnownPoint> points);

    // Unclamped value of the interpolant at log10(size).
    double evaluateLog(double logSize) const;
    double nearestLog(double logSize) const;

    SampleInput sample_;
    InterpolationMethod method_;
    std::vector<KnownPoint> points_;
    std::vector<double> logSizes_;
    std::vector<double> percents_;
    std::vector<double> secondDerivatives_;
};
