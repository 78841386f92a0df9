#include "ParameterExtractor.h"

#include "GranuloExceptions.h"

#include <cmath>

namespace {
std::optional<double> effectiveSize(const GradationCurve& curve, double percent) {
    try {
        const double size = curve.sizeAtPercent(percent);
        if (!std::isfinite(size) || size <= 0.0) return std::nullopt;
        return size;
    } catch (const Granulo::OutOfRangeException&) {
        return std::nullopt;
    }
}
} // namespace

std::string gradationClassName(GradationClass value) {
    switch (value) {
        case GradationClass::WellGraded: return "Well-graded";
        case GradationClass::PoorlyGraded: return "Poorly-graded";
        case GradationClass::Undetermined: return "Insufficient data";
    }
    return "Insufficient data";
}

std::string GradationParameters::classificationLabel() const {
    std::string label = gradationClassName(classification);
    if (!classificationReasons.empty()) {
        label += " (";
        for (size_t i = 0; i < classificationReasons.size(); ++i) {
            if (i > 0) label += ", ";
            label += classificationReasons[i];
        }
        label += ")";
    }
    return label;
}

namespace ParameterExtractor {

GradationParameters extract(const GradationCurve& curve) {
    GradationParameters params;
    params.d10 = effectiveSize(curve, 10.0);
    params.d30 = effectiveSize(curve, 30.0);
    params.d60 = effectiveSize(curve, 60.0);

    if (params.d10 && params.d30 && params.d60) {
        const double d10 = *params.d10;
        const double d30 = *params.d30;
        const double d60 = *params.d60;
        params.cu = d60 / d10;
        params.cc = (d30 * d30) / (d10 * d60);
    }

    classify(params);
    return params;
}

void classify(GradationParameters& params) {
    params.classificationReasons.clear();
    if (!params.coefficientsDefined()) {
        params.classification = GradationClass::Undetermined;
        return;
    }

    const double cu = *params.cu;
    const double cc = *params.cc;
    if (cu > kWellGradedMinCu && cc >= kWellGradedMinCc && cc <= kWellGradedMaxCc) {
        params.classification = GradationClass::WellGraded;
        return;
    }

    params.classification = GradationClass::PoorlyGraded;
    if (cu <= kWellGradedMinCu) params.classificationReasons.push_back("Cu <= 4");
    if (cc < kWellGradedMinCc || cc > kWellGradedMaxCc) params.classificationReasons.push_back("Cc outside 1-3");
}

} // namespace ParameterExtractor
