#pragma once

#include "GradationCurve.h"

#include <optional>
#include <string>
#include <vector>

enum class GradationClass { WellGraded, PoorlyGraded, Undetermined };

std::string gradationClassName(GradationClass value);

struct GradationParameters {
    std::optional<double> d10;
    std::optional<double> d30;
    std::optional<double> d60;
    std::optional<double> cu; // D60 / D10
    std::optional<double> cc; // D30^2 / (D10 * D60)

    GradationClass classification = GradationClass::Undetermined;
    std::vector<std::string> classificationReasons;

    bool coefficientsDefined() const { return cu.has_value() && cc.has_value(); }
    std::string classificationLabel() const;
};

namespace ParameterExtractor {

constexpr double kWellGradedMinCu = 4.0;
constexpr double kWellGradedMinCc = 1.0;
constexpr double kWellGradedMaxCc = 3.0;

/**
 * @brief Derives effective sizes and coefficients from a built curve.
 * @post Each D-value is resolved independently; a percentile the curve does not reach is left empty.
 * @post cu/cc are set only when d10, d30 and d60 are all defined.
 */
GradationParameters extract(const GradationCurve& curve);

/**
 * @brief Well-graded when Cu > 4 and 1 <= Cc <= 3; undetermined without coefficients.
 */
void classify(GradationParameters& params);
}
