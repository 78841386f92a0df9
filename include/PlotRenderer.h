#pragma once

#include "GradationCurve.h"
#include "SieveScale.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct PlotSeries {
    std::string label;
    std::string color;       // "#rrggbb"
    size_t styleIndex = 0;   // palette slot, keyed by input position
    std::vector<double> x;   // sizes (mm), shared grid across series
    std::vector<double> y;   // percent passing
    std::vector<KnownPoint> markers;
};

struct PlotLayout {
    std::string title = "Particle Size Distribution Curve";
    std::string xLabel = "Particle Size (mm)";
    std::string yLabel = "Percent Passing (%)";
    double xMin = 0.0;
    double xMax = 0.0;
    double yMin = 0.0;
    double yMax = 100.0;
    bool grayscale = false;
    std::vector<PlotSeries> series;
};

struct RasterImage {
    std::vector<uint8_t> bytes;
    std::string mimeType;
    int width = 0;
    int height = 0;
};

struct PlotArtifact {
    std::string mimeType;
    int width = 0;
    int height = 0;
    std::string base64;
};

/**
 * Backend that turns a laid-out plot into image bytes.
 */
class PlotRasterizer {
public:
    virtual ~PlotRasterizer() = default;

    /**
     * @throws Granulo::RenderException when no image could be produced.
     */
    virtual RasterImage rasterize(const PlotLayout& layout) = 0;
};

class PlotRenderer {
public:
    static constexpr size_t kDefaultResolution = 200;

    explicit PlotRenderer(PlotRasterizer& rasterizer, size_t resolution = kDefaultResolution);

    /**
     * @brief Samples every curve across the full sieve range on a log-spaced grid.
     * @param colorSlots Palette slot per curve; empty means the curve's position in `curves`.
     * @post Identical input yields identical series, labels and colors.
     * @throws Granulo::RenderException if curves is empty.
     */
    PlotLayout layout(const std::vector<GradationCurve>& curves,
                      const SieveScale& scale,
                      bool useColor = true,
                      const std::vector<size_t>& colorSlots = {}) const;

    /**
     * @brief Lays out and rasterizes the curves, returning the base64-encoded image.
     * @throws Granulo::RenderException on an empty curve set or rasterizer failure.
     */
    PlotArtifact render(const std::vector<GradationCurve>& curves,
                        const SieveScale& scale,
                        bool useColor = true,
                        const std::vector<size_t>& colorSlots = {}) const;

    static std::string colorFor(size_t slot, bool useColor);
    size_t resolution() const { return resolution_; }

private:
    PlotRasterizer& rasterizer_;
    size_t resolution_;
};

std::string base64Encode(const std::vector<uint8_t>& data);

/**
 * @throws Granulo::ValidationException on characters outside the standard alphabet.
 */
std::vector<uint8_t> base64Decode(const std::string& text);
