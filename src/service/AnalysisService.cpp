#include "AnalysisService.h"

#include "GranuloExceptions.h"

#include <iostream>
#include <utility>

namespace {
struct SampleOutcome {
    std::optional<GradationCurve> curve;
    std::string reason;
};

SampleOutcome buildSample(const SampleInput& sample, const SieveScale& scale, InterpolationMethod method) {
    SampleOutcome outcome;
    try {
        outcome.curve = GradationCurve::build(sample, scale, method);
    } catch (const Granulo::GranuloException& e) {
        outcome.reason = e.what();
    }
    return outcome;
}

AnalysisResponse failure(AnalysisStatus status, std::string error, AnalysisResponse base = {}) {
    base.success = false;
    base.status = status;
    base.error = std::move(error);
    base.plot.reset();
    return base;
}
} // namespace

size_t AnalysisResponse::analyzedCount() const {
    size_t n = 0;
    for (const auto& s : samples) {
        if (s.analyzed) ++n;
    }
    return n;
}

AnalysisService::AnalysisService(SieveScale scale, PlotRasterizer& rasterizer, size_t plotResolution, bool verbose)
    : scale_(std::move(scale)), renderer_(rasterizer, plotResolution), verbose_(verbose) {}

void AnalysisService::validateRequest(const AnalysisRequest& request) const {
    if (request.samples.empty()) {
        throw Granulo::ValidationException("request contains no samples");
    }
    for (const auto& sample : request.samples) {
        scale_.validateSample(sample);
    }
}

AnalysisResponse AnalysisService::analyze(const AnalysisRequest& request) const {
    AnalysisResponse response;
    response.method = interpolationMethodName(request.method);

    try {
        validateRequest(request);
    } catch (const std::exception& e) {
        return failure(AnalysisStatus::InvalidRequest, e.what(), std::move(response));
    }

    try {
        std::vector<GradationCurve> curves;
        std::vector<size_t> colorSlots;
        curves.reserve(request.samples.size());

        for (size_t i = 0; i < request.samples.size(); ++i) {
            const SampleInput& sample = request.samples[i];
            SampleOutcome outcome = buildSample(sample, scale_, request.method);

            SampleReport report;
            report.name = sample.name;
            report.inputIndex = i;
            if (outcome.curve) {
                report.analyzed = true;
                report.knownPoints = outcome.curve->knownPoints().size();
                report.parameters = ParameterExtractor::extract(*outcome.curve);
                report.color = PlotRenderer::colorFor(i, request.useColor);
                colorSlots.push_back(i);
                curves.push_back(std::move(*outcome.curve));
            } else {
                report.failureReason = outcome.reason;
                response.issues.push_back({sample.name, outcome.reason});
                std::cerr << "[Granulo] sample rejected name='" << sample.name << "' reason='" << outcome.reason << "'\n";
            }

            if (verbose_ && report.parameters) {
                const GradationParameters& p = *report.parameters;
                std::cout << "[Granulo] sample name='" << sample.name << "'"
                          << " method=" << response.method
                          << " points=" << report.knownPoints
                          << " d10=" << (p.d10 ? std::to_string(*p.d10) : "undefined")
                          << " d30=" << (p.d30 ? std::to_string(*p.d30) : "undefined")
                          << " d60=" << (p.d60 ? std::to_string(*p.d60) : "undefined")
                          << " class='" << p.classificationLabel() << "'\n";
            }
            response.samples.push_back(std::move(report));
        }

        if (curves.empty()) {
            std::string message = "no sample could be analyzed";
            for (size_t i = 0; i < response.issues.size(); ++i) {
                message += (i == 0) ? ": " : "; ";
                message += response.issues[i].reason;
            }
            return failure(AnalysisStatus::NoAnalyzableSamples, std::move(message), std::move(response));
        }

        // The parameters stand on their own; a rasterizer failure only costs the image.
        try {
            response.plot = renderer_.render(curves, scale_, request.useColor, colorSlots);
        } catch (const Granulo::RenderException& e) {
            response.plotError = e.what();
            std::cerr << "[Granulo][Plot] render failed curves=" << curves.size() << " reason='" << e.what() << "'\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[Granulo] analysis failed: " << e.what() << "\n";
        return failure(AnalysisStatus::InternalError, e.what(), std::move(response));
    }

    response.success = true;
    response.status = AnalysisStatus::Ok;
    return response;
}
