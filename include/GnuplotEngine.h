#pragma once
#include "AppConfig.h"
#include "PlotRenderer.h"
#include <string>

class GnuplotEngine : public PlotRasterizer {
public:
    /**
     * @brief Initializes plotting backend and work directory.
     * @param gnuplotPath Explicit executable; empty resolves "gnuplot" from PATH.
     * @post work directory is created if possible.
     */
    GnuplotEngine(std::string workDir, PlotConfig cfg, std::string gnuplotPath = "");

    /**
     * @brief Checks whether a gnuplot executable was resolved.
     */
    bool isAvailable() const;

    /**
     * @brief True when gnuplot children start with only stdin, stdout and stderr open
     * (POSIX_SPAWN_CLOEXEC_DEFAULT, or posix_spawn_file_actions_addclosefrom_np on glibc 2.34+).
     */
    static bool isolatesChildDescriptors();

    /**
     * @brief Writes data and script, runs gnuplot and returns the image bytes.
     * @post Temporary files for this plot are removed.
     * @throws Granulo::RenderException when gnuplot is missing or fails.
     */
    RasterImage rasterize(const PlotLayout& layout) override;

    /**
     * @brief Whitespace separated data: block 0 holds the shared grid and one column per series,
     * followed by one block of measured points per series.
     */
    static std::string buildData(const PlotLayout& layout);

    std::string buildScript(const PlotLayout& layout, const std::string& dataFile, const std::string& outputFile) const;

    std::string mimeType() const;

private:
    std::string workDir_;
    PlotConfig cfg_;
    std::string gnuplotExe_;

    static std::string quoteForGnuplot(const std::string& value);
    static std::string terminalForFormat(const std::string& format, int width, int height);
    std::string styledHeader(const std::string& title, const std::string& outputFile) const;
};
