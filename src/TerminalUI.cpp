#include "TerminalUI.h"
#include "CommonUtils.h"
#include "RequestCodec.h"
#include <algorithm>
#include <iomanip>
#include <optional>

namespace {
std::string cell(const std::optional<double>& value) {
    if (!value) return "-";
    return CommonUtils::formatFixed(CommonUtils::roundTo(*value, RequestCodec::kReportedDigits), RequestCodec::kReportedDigits);
}
} // namespace

void TerminalUI::printRunHeader(const std::string& requestPath, const AnalysisRequest& request, const SieveScale& scale,
                                std::ostream& out) {
    out << "[Granulo] request='" << requestPath << "'"
        << " samples=" << request.samples.size()
        << " method=" << interpolationMethodName(request.method)
        << " palette=" << (request.useColor ? "color" : "grayscale")
        << " sieves=" << scale.size()
        << " range_mm=" << scale.minSize() << "-" << scale.maxSize() << "\n";
}

void TerminalUI::printParameterTable(const AnalysisResponse& response, std::ostream& out) {
    size_t maxNameLen = 12;
    for (const auto& s : response.samples) maxNameLen = std::max(maxNameLen, s.name.length());

    const int w = static_cast<int>(maxNameLen) + 2;
    out << "\n=========================================== GRADATION PARAMETERS ===========================================\n";
    out << std::left
        << std::setw(w) << "Sample"
        << std::setw(10) << "D10"
        << std::setw(10) << "D30"
        << std::setw(10) << "D60"
        << std::setw(10) << "Cu"
        << std::setw(10) << "Cc"
        << "Classification\n";
    out << std::string(w + 10 * 5 + 14, '-') << "\n";

    for (const auto& report : response.samples) {
        out << std::left << std::setw(w) << report.name;
        if (!report.parameters) {
            out << "not analyzed: " << report.failureReason << "\n";
            continue;
        }
        const GradationParameters& p = *report.parameters;
        out << std::setw(10) << cell(p.d10)
            << std::setw(10) << cell(p.d30)
            << std::setw(10) << cell(p.d60)
            << std::setw(10) << cell(p.cu)
            << std::setw(10) << cell(p.cc)
            << p.classificationLabel() << "\n";
    }
    out << "============================================================================================================\n";
    out << "Sizes in mm. '-' marks a percentile the curve does not reach.\n";
}

void TerminalUI::printIssues(const AnalysisResponse& response, std::ostream& out) {
    if (response.issues.empty()) return;
    out << "\n[Granulo] " << response.issues.size() << " sample(s) could not be analyzed:\n";
    for (const auto& issue : response.issues) {
        out << "        -> " << issue.sample << ": " << issue.reason << "\n";
    }
}
