#pragma once
#include <cstddef>
#include <string>
#include <vector>

struct PlotConfig {
    std::string format = "png";
    int width = 1200;
    int height = 800;
    std::string theme = "light";
    bool showGrid = true;
    double lineWidth = 2.0;
    double pointSize = 1.2;
    // Points sampled per curve across the sieve range.
    size_t resolution = 200;
};

struct ServiceConfig {
    std::string host = "0.0.0.0";
    int port = 5000;
    size_t threads = 8;
};

struct AppConfig {
    std::string command = "serve";          // serve|analyze
    std::string requestPath;                // analyze: request document
    std::string plotOutputPath;             // analyze: optional decoded image
    bool printJson = false;                 // analyze: echo the response document

    // Opening sizes in mm, coarse to fine (IS series by default).
    std::vector<double> sieveSizes = {53.0, 40.0, 20.0, 10.0, 4.75, 2.36, 1.18, 0.6, 0.3, 0.15, 0.075};
    std::string workDir;                    // empty => <tmp>/granulo_plots
    std::string gnuplotPath;                // empty => resolved from PATH
    bool verbose = false;

    PlotConfig plot;
    ServiceConfig service;

    /**
     * @brief Builds config from CLI args and optional config file override.
     * @pre argv[1] names the command (serve|analyze).
     * @post Returns a validated config object.
     * @throws Granulo::ConfigurationException on invalid arguments or values.
     */
    static AppConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @pre configPath points to a readable text file.
     * @post Returns merged config using `base` as defaults.
     * @throws Granulo::ConfigurationException on parse/validation failures.
     */
    static AppConfig fromFile(const std::string& configPath, const AppConfig& base);

    /**
     * @brief Validates merged configuration, including the sieve scale.
     * @throws Granulo::ConfigurationException on invalid values.
     */
    void validate() const;

    std::string resolvedWorkDir() const;
};
