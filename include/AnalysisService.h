#pragma once

#include "GradationCurve.h"
#include "ParameterExtractor.h"
#include "PlotRenderer.h"
#include "SieveScale.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct AnalysisRequest {
    std::vector<SampleInput> samples;
    InterpolationMethod method = InterpolationMethod::Linear;
    bool useColor = true;
};

enum class AnalysisStatus {
    Ok,
    InvalidRequest,       // malformed shape
    NoAnalyzableSamples,  // every sample was rejected
    InternalError
};

struct SampleIssue {
    std::string sample;
    std::string reason;
};

struct SampleReport {
    std::string name;
    size_t inputIndex = 0;
    bool analyzed = false;
    size_t knownPoints = 0;
    std::string color;                        // set only for plotted samples
    std::optional<GradationParameters> parameters;
    std::string failureReason;
};

struct AnalysisResponse {
    bool success = false;
    AnalysisStatus status = AnalysisStatus::InvalidRequest;
    std::string error;
    std::string method;
    std::optional<PlotArtifact> plot;
    std::string plotError;                    // set when the rasterizer failed; success is unaffected
    std::vector<SampleReport> samples;
    std::vector<SampleIssue> issues;

    size_t analyzedCount() const;
};

class AnalysisService {
public:
    AnalysisService(SieveScale scale, PlotRasterizer& rasterizer, size_t plotResolution, bool verbose = false);

    /**
     * @brief Runs one complete analysis: validation, per-sample curves, parameters and plot.
     * @post Never throws; every failure is reported through the response.
     * @post A sample that cannot be analyzed is listed in issues and does not affect the others.
     * @post A rasterizer failure leaves plot empty and sets plotError; the parameters are still returned.
     */
    AnalysisResponse analyze(const AnalysisRequest& request) const;

    const SieveScale& scale() const { return scale_; }

    /**
     * @brief Request-level checks: at least one sample and one value per sieve.
     * Value ranges are checked per sample when its curve is built.
     * @throws Granulo::ValidationException on the first violation.
     */
    void validateRequest(const AnalysisRequest& request) const;

private:
    SieveScale scale_;
    PlotRenderer renderer_;
    bool verbose_;
};
