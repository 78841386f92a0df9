#include "GradationCurve.h"

#include "CommonUtils.h"
#include "GranuloExceptions.h"
#include "InterpolationUtils.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace {
constexpr double kMinPercent = 0.0;
constexpr double kMaxPercent = 100.0;
constexpr int kBisectionIterations = 200;

struct IndexedPoint {
    KnownPoint point;
    size_t inputIndex = 0;
};

struct GridNode {
    double logSize = 0.0;
    double size = 0.0;
};

std::string describeNumber(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}
} // namespace

InterpolationMethod parseInterpolationMethod(const std::string& name) {
    const std::string key = CommonUtils::toLower(CommonUtils::trim(name));
    if (key == "linear") return InterpolationMethod::Linear;
    if (key == "cubic") return InterpolationMethod::Cubic;
    if (key == "nearest") return InterpolationMethod::Nearest;
    throw Granulo::ValidationException("unknown interpolation method '" + name + "' (allowed: linear, cubic, nearest)");
}

std::string interpolationMethodName(InterpolationMethod method) {
    switch (method) {
        case InterpolationMethod::Linear: return "linear";
        case InterpolationMethod::Cubic: return "cubic";
        case InterpolationMethod::Nearest: return "nearest";
    }
    return "linear";
}

GradationCurve::GradationCurve(SampleInput sample, InterpolationMethod method, std::vector<KnownPoint> points)
    : sample_(std::move(sample)), method_(method), points_(std::move(points)) {
    logSizes_.reserve(points_.size());
    percents_.reserve(points_.size());
    for (const auto& p : points_) {
        logSizes_.push_back(std::log10(p.size));
        percents_.push_back(p.percent);
    }
}

GradationCurve GradationCurve::build(const SampleInput& sample, const SieveScale& scale, InterpolationMethod method) {
    scale.validateSample(sample);

    std::vector<IndexedPoint> indexed;
    indexed.reserve(sample.values.size());
    for (size_t i = 0; i < sample.values.size(); ++i) {
        const std::optional<double>& value = sample.values[i];
        if (!value.has_value()) continue;
        const double percent = *value;
        if (!std::isfinite(percent) || percent < kMinPercent || percent > kMaxPercent) {
            throw Granulo::ValidationException("sample '" + sample.name + "' has percent passing " +
                                               describeNumber(percent) + " at " + describeNumber(scale.at(i)) +
                                               " mm, expected a value within [0,100]");
        }
        indexed.push_back({{scale.at(i), percent}, i});
    }

    std::stable_sort(indexed.begin(), indexed.end(), [](const IndexedPoint& a, const IndexedPoint& b) {
        return a.point.size < b.point.size;
    });

    std::vector<KnownPoint> points;
    points.reserve(indexed.size());
    for (size_t i = 0; i < indexed.size(); ++i) {
        const bool lastOfRun = (i + 1 == indexed.size()) || (indexed[i + 1].point.size != indexed[i].point.size);
        if (lastOfRun) points.push_back(indexed[i].point);
    }

    if (points.size() < kMinLinearPoints) {
        throw Granulo::InsufficientDataException("sample '" + sample.name + "' has " + std::to_string(points.size()) +
                                                 " measured value(s); at least " + std::to_string(kMinLinearPoints) +
                                                 " are needed to interpolate");
    }
    if (method == InterpolationMethod::Cubic && points.size() < kMinCubicPoints) {
        throw Granulo::InsufficientDataException("sample '" + sample.name + "' has " + std::to_string(points.size()) +
                                                 " measured values; cubic interpolation needs at least " +
                                                 std::to_string(kMinCubicPoints));
    }

    GradationCurve curve(sample, method, std::move(points));
    if (method == InterpolationMethod::Cubic) {
        auto m = InterpolationUtils::notAKnotSecondDerivatives(curve.logSizes_, curve.percents_);
        if (!m) {
            throw Granulo::InsufficientDataException("sample '" + sample.name + "' cannot be fitted with a cubic spline");
        }
        curve.secondDerivatives_ = std::move(*m);
    }
    return curve;
}

double GradationCurve::minKnownPercent() const {
    return *std::min_element(percents_.begin(), percents_.end());
}

double GradationCurve::maxKnownPercent() const {
    return *std::max_element(percents_.begin(), percents_.end());
}

double GradationCurve::nearestLog(double logSize) const {
    const size_t i = InterpolationUtils::segmentIndex(logSizes_, logSize);
    const double toLower = logSize - logSizes_[i];
    const double toUpper = logSizes_[i + 1] - logSize;
    return (toUpper < toLower) ? percents_[i + 1] : percents_[i];
}

double GradationCurve::evaluateLog(double logSize) const {
    if (logSize <= logSizes_.front()) return percents_.front();
    if (logSize >= logSizes_.back()) return percents_.back();

    switch (method_) {
        case InterpolationMethod::Linear: {
            const size_t i = InterpolationUtils::segmentIndex(logSizes_, logSize);
            return InterpolationUtils::lerpSegment(logSizes_, percents_, i, logSize);
        }
        case InterpolationMethod::Cubic: {
            const size_t i = InterpolationUtils::segmentIndex(logSizes_, logSize);
            return InterpolationUtils::splineSegment(logSizes_, percents_, secondDerivatives_, i, logSize);
        }
        case InterpolationMethod::Nearest:
            return nearestLog(logSize);
    }
    return percents_.front();
}

double GradationCurve::percentPassingAt(double size) const {
    if (!std::isfinite(size) || size <= 0.0) {
        throw Granulo::OutOfRangeException("size must be a positive number, got " + describeNumber(size));
    }
    return std::clamp(evaluateLog(std::log10(size)), kMinPercent, kMaxPercent);
}

double GradationCurve::sizeAtPercent(double percent) const {
    if (!std::isfinite(percent)) {
        throw Granulo::OutOfRangeException("percent must be finite for sample '" + sample_.name + "'");
    }

    auto residual = [this, percent](double logSize) {
        return std::clamp(evaluateLog(logSize), kMinPercent, kMaxPercent) - percent;
    };

    std::vector<GridNode> grid;
    grid.reserve((points_.size() - 1) * kInverseStepsPerSegment + 1);
    for (size_t i = 0; i + 1 < points_.size(); ++i) {
        grid.push_back({logSizes_[i], points_[i].size});
        const double h = logSizes_[i + 1] - logSizes_[i];
        for (size_t k = 1; k < kInverseStepsPerSegment; ++k) {
            const double t = logSizes_[i] + h * static_cast<double>(k) / static_cast<double>(kInverseStepsPerSegment);
            grid.push_back({t, std::pow(10.0, t)});
        }
    }
    grid.push_back({logSizes_.back(), points_.back().size});

    double prevResidual = residual(grid.front().logSize);
    if (prevResidual == 0.0) return grid.front().size;

    for (size_t j = 1; j < grid.size(); ++j) {
        const double r = residual(grid[j].logSize);
        if (r == 0.0) return grid[j].size;
        if ((prevResidual < 0.0) != (r < 0.0)) {
            double lo = grid[j - 1].logSize;
            double hi = grid[j].logSize;
            const bool loNegative = prevResidual < 0.0;
            for (int iter = 0; iter < kBisectionIterations; ++iter) {
                const double mid = 0.5 * (lo + hi);
                if (mid <= lo || mid >= hi) break;
                const double rm = residual(mid);
                if (rm == 0.0) return std::pow(10.0, mid);
                if ((rm < 0.0) == loNegative) {
                    lo = mid;
                } else {
                    hi = mid;
                }
            }
            return std::pow(10.0, 0.5 * (lo + hi));
        }
        prevResidual = r;
    }

    throw Granulo::OutOfRangeException("sample '" + sample_.name + "' never reaches " + describeNumber(percent) +
                                       "% passing (measured range " + describeNumber(minKnownPercent()) + "-" +
                                       describeNumber(maxKnownPercent()) + "%)");
}
