#include "PlotRenderer.h"

#include "GranuloExceptions.h"

#include <algorithm>
#include <array>
#include <cmath>

namespace {
constexpr std::array<const char*, 10> kColorPalette = {
    "#1f77b4", "#ff7f0e", "#2ca02c", "#d62728", "#9467bd",
    "#8c564b", "#e377c2", "#7f7f7f", "#bcbd22", "#17becf"
};

constexpr std::array<const char*, 4> kGrayPalette = {
    "#000000", "#404040", "#808080", "#b0b0b0"
};

std::vector<double> logSpacedGrid(double lo, double hi, size_t n) {
    std::vector<double> out;
    out.reserve(n);
    const double logLo = std::log10(lo);
    const double logHi = std::log10(hi);
    for (size_t k = 0; k < n; ++k) {
        const double t = static_cast<double>(k) / static_cast<double>(n - 1);
        out.push_back(std::pow(10.0, logLo + t * (logHi - logLo)));
    }
    out.front() = lo;
    out.back() = hi;
    return out;
}
} // namespace

std::string base64Encode(const std::vector<uint8_t>& data) {
    static constexpr char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);
    size_t i = 0;
    while (i + 2 < data.size()) {
        const uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                           (static_cast<uint32_t>(data[i + 1]) << 8) |
                           static_cast<uint32_t>(data[i + 2]);
        out.push_back(alphabet[(n >> 18) & 63]);
        out.push_back(alphabet[(n >> 12) & 63]);
        out.push_back(alphabet[(n >> 6) & 63]);
        out.push_back(alphabet[n & 63]);
        i += 3;
    }
    if (i < data.size()) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        out.push_back(alphabet[(n >> 18) & 63]);
        out.push_back(alphabet[(n >> 12) & 63]);
        if (i + 1 < data.size()) {
            out.push_back(alphabet[(n >> 6) & 63]);
            out.push_back('=');
        } else {
            out.push_back('=');
            out.push_back('=');
        }
    }
    return out;
}

std::vector<uint8_t> base64Decode(const std::string& text) {
    std::vector<uint8_t> out;
    out.reserve((text.size() / 4) * 3);
    uint32_t buffer = 0;
    int bits = 0;
    for (char c : text) {
        int v = -1;
        if (c >= 'A' && c <= 'Z') v = c - 'A';
        else if (c >= 'a' && c <= 'z') v = c - 'a' + 26;
        else if (c >= '0' && c <= '9') v = c - '0' + 52;
        else if (c == '+') v = 62;
        else if (c == '/') v = 63;
        else if (c == '=') break;
        else if (c == '\n' || c == '\r') continue;
        else throw Granulo::ValidationException("invalid base64 character");

        buffer = (buffer << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }
    return out;
}

PlotRenderer::PlotRenderer(PlotRasterizer& rasterizer, size_t resolution)
    : rasterizer_(rasterizer), resolution_(std::max<size_t>(2, resolution)) {}

std::string PlotRenderer::colorFor(size_t slot, bool useColor) {
    if (useColor) return kColorPalette[slot % kColorPalette.size()];
    return kGrayPalette[slot % kGrayPalette.size()];
}

PlotLayout PlotRenderer::layout(const std::vector<GradationCurve>& curves,
                                const SieveScale& scale,
                                bool useColor,
                                const std::vector<size_t>& colorSlots) const {
    if (curves.empty()) {
        throw Granulo::RenderException("no gradation curves to plot");
    }
    if (!colorSlots.empty() && colorSlots.size() != curves.size()) {
        throw Granulo::RenderException("color slot count " + std::to_string(colorSlots.size()) +
                                       " does not match curve count " + std::to_string(curves.size()));
    }

    PlotLayout out;
    out.xMin = scale.minSize();
    out.xMax = scale.maxSize();
    out.grayscale = !useColor;

    const std::vector<double> grid = logSpacedGrid(out.xMin, out.xMax, resolution_);
    out.series.reserve(curves.size());
    for (size_t i = 0; i < curves.size(); ++i) {
        const GradationCurve& curve = curves[i];
        PlotSeries series;
        series.label = curve.name();
        series.styleIndex = colorSlots.empty() ? i : colorSlots[i];
        series.color = colorFor(series.styleIndex, useColor);
        series.x = grid;
        series.y.reserve(grid.size());
        for (double size : grid) {
            series.y.push_back(curve.percentPassingAt(size));
        }
        series.markers = curve.knownPoints();
        out.series.push_back(std::move(series));
    }
    return out;
}

PlotArtifact PlotRenderer::render(const std::vector<GradationCurve>& curves,
                                  const SieveScale& scale,
                                  bool useColor,
                                  const std::vector<size_t>& colorSlots) const {
    const PlotLayout plot = layout(curves, scale, useColor, colorSlots);
    RasterImage image = rasterizer_.rasterize(plot);
    if (image.bytes.empty()) {
        throw Granulo::RenderException("plot backend returned an empty image");
    }

    PlotArtifact artifact;
    artifact.mimeType = image.mimeType;
    artifact.width = image.width;
    artifact.height = image.height;
    artifact.base64 = base64Encode(image.bytes);
    return artifact;
}
