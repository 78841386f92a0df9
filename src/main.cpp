#include "AnalysisService.h"
#include "AppConfig.h"
#include "GnuplotEngine.h"
#include "GradationService.h"
#include "GranuloExceptions.h"
#include "RequestCodec.h"
#include "SieveScale.h"
#include "TerminalUI.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {
void printUsage(const std::string& prog) {
    std::cout << "Usage: " << prog << " <serve|analyze> [request.json] [options]\n"
              << "Commands:\n"
              << "  serve                            Run the HTTP service (POST /analyze, GET /sieve_sizes, GET /health)\n"
              << "  analyze <request.json>           Analyze one request document and print the parameter table\n"
              << "Options:\n"
              << "  --config <file>                  Load key: value settings (flags given here override it)\n"
              << "  --host <addr>                    Listen address (default: 0.0.0.0)\n"
              << "  --port <N>                       Listen port (default: 5000)\n"
              << "  --threads <N>                    Worker threads (default: 8)\n"
              << "  --sieve-sizes <list>             Sieve openings in mm, coarse to fine (default: IS series)\n"
              << "  --plot-format <png|svg>          Image format (default: png)\n"
              << "  --plot-width <N>                 Image width in pixels (default: 1200)\n"
              << "  --plot-height <N>                Image height in pixels (default: 800)\n"
              << "  --plot-theme <light|dark>        Plot theme (default: light)\n"
              << "  --plot-grid <true|false>         Draw grid lines (default: true)\n"
              << "  --plot-line-width <val>          Curve line width (default: 2.0)\n"
              << "  --plot-point-size <val>          Measured point marker size (default: 1.2)\n"
              << "  --plot-resolution <N>            Points sampled per curve (default: 200)\n"
              << "  --work-dir <path>                Scratch directory for gnuplot files\n"
              << "  --gnuplot <path>                 gnuplot executable (default: found on PATH)\n"
              << "  --verbose <true|false>           Log one line per analyzed sample\n"
              << "  --plot-out <file>                analyze: write the rendered image to file\n"
              << "  --json                           analyze: print the response document\n"
              << "  --help                           Show this help message\n";
}

std::string readTextFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw Granulo::ConfigurationException("Could not open request file: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

int runAnalyze(const AppConfig& config, AnalysisService& service) {
    AnalysisRequest request;
    try {
        request = RequestCodec::parseAnalysisRequest(readTextFile(config.requestPath));
    } catch (const Granulo::ValidationException& e) {
        std::cerr << "[Granulo] invalid request '" << config.requestPath << "': " << e.what() << "\n";
        return 2;
    }

    TerminalUI::printRunHeader(config.requestPath, request, service.scale());
    const AnalysisResponse response = service.analyze(request);

    if (!response.samples.empty()) {
        TerminalUI::printParameterTable(response);
    }
    TerminalUI::printIssues(response);

    if (config.printJson) {
        std::cout << RequestCodec::serializeResponse(response) << "\n";
    }

    if (!response.success) {
        std::cerr << "[Granulo] analysis failed: " << response.error << "\n";
        return 2;
    }

    if (!response.plotError.empty()) {
        std::cerr << "[Granulo][Plot] no image produced: " << response.plotError << "\n";
        if (!config.plotOutputPath.empty()) return 2;
    }

    if (!config.plotOutputPath.empty() && response.plot) {
        const std::vector<uint8_t> bytes = base64Decode(response.plot->base64);
        std::ofstream out(config.plotOutputPath, std::ios::binary);
        if (!out) {
            std::cerr << "[Granulo] could not write plot to '" << config.plotOutputPath << "'\n";
            return 2;
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        std::cout << "[Granulo] plot written path='" << config.plotOutputPath << "'"
                  << " mime=" << response.plot->mimeType
                  << " bytes=" << bytes.size() << "\n";
    }
    return 0;
}
} // namespace

int main(int argc, char* argv[]) {
    if (argc >= 2) {
        const std::string first = argv[1];
        if (first == "--help" || first == "-h" || first == "help") {
            printUsage(argv[0]);
            return 0;
        }
    }

    try {
        const AppConfig config = AppConfig::fromArgs(argc, argv);
        SieveScale scale(config.sieveSizes);

        GnuplotEngine plotter(config.resolvedWorkDir(), config.plot, config.gnuplotPath);
        if (!plotter.isAvailable()) {
            std::cerr << "[Granulo][Plot] gnuplot not found; analyses will return parameters without a plot\n";
        }

        AnalysisService analysis(scale, plotter, config.plot.resolution, config.verbose);

        if (config.command == "analyze") {
            return runAnalyze(config, analysis);
        }

        RequestMonitor monitor;
        GradationService service(analysis, monitor);
        return service.start(config.service);
    } catch (const Granulo::ConfigurationException& e) {
        std::cerr << "[Granulo] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Granulo] fatal: " << e.what() << "\n";
        return 1;
    }
}
