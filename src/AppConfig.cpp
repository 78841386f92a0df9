#include "AppConfig.h"
#include "CommonUtils.h"
#include "GranuloExceptions.h"
#include "SieveScale.h"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <unordered_map>
#include <utility>

namespace {
const char* kUsage =
    "Usage: granulo <serve|analyze> [request.json] [--config path] [--host addr] [--port N] [--threads N] "
    "[--sieve-sizes 53,40,...] [--plot-format png|svg] [--plot-width N] [--plot-height N] [--plot-theme light|dark] "
    "[--plot-grid true|false] [--plot-line-width >0] [--plot-point-size >0] [--plot-resolution N] [--work-dir path] "
    "[--gnuplot path] [--verbose true|false] [--plot-out file] [--json]";

std::string unquote(const std::string& text) {
    std::string value = CommonUtils::trim(text);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

// Accepts "key: value" (YAML style) and "\"key\": value," (one JSON member per line).
// Keys never contain ':', so the first one separates key from value.
std::optional<std::pair<std::string, std::string>> splitConfigLine(std::string line) {
    if (line.empty() || line[0] == '#' || line == "{" || line == "}") return std::nullopt;
    if (line.back() == ',') line = CommonUtils::trim(line.substr(0, line.size() - 1));

    const size_t sep = line.find(':');
    if (sep == std::string::npos) return std::nullopt;

    std::string key = CommonUtils::toLower(unquote(line.substr(0, sep)));
    std::replace(key.begin(), key.end(), '-', '_');
    return std::make_pair(key, unquote(line.substr(sep + 1)));
}

double parseNumber(const std::string& value, const std::string& key, const char* kind) {
    const std::string text = CommonUtils::trim(value);
    char* end = nullptr;
    errno = 0;
    const double parsed = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(parsed)) {
        throw Granulo::ConfigurationException(std::string("Invalid ") + kind + " for " + key + ": " + value);
    }
    return parsed;
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    const double parsed = parseNumber(value, key, "integer");
    if (parsed != std::floor(parsed) || parsed > std::numeric_limits<int>::max()) {
        throw Granulo::ConfigurationException("Invalid integer for " + key + ": " + value);
    }
    if (parsed < minValue) {
        throw Granulo::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return static_cast<int>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    const double parsed = parseNumber(value, key, "number");
    if (parsed < minValue) {
        throw Granulo::ConfigurationException("Value for " + key + " must be >= " + CommonUtils::formatFixed(minValue, 1));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Granulo::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

std::vector<double> parseSieveSizes(const std::string& value, const std::string& key) {
    std::string cleaned = value;
    cleaned.erase(std::remove_if(cleaned.begin(), cleaned.end(), [](char c) { return c == '[' || c == ']'; }),
                  cleaned.end());
    std::vector<double> out;
    for (const std::string& token : CommonUtils::splitList(cleaned)) {
        out.push_back(parseNumber(token, key, "sieve size"));
    }
    if (out.empty()) {
        throw Granulo::ConfigurationException(key + " expects a comma separated list of sizes");
    }
    return out;
}

void assignKeyValue(AppConfig& config, const std::string& key, const std::string& value) {
    struct PlotIntRule {
        int PlotConfig::*member;
        int minValue;
    };
    struct PlotDoubleRule {
        double PlotConfig::*member;
        double minValue;
    };

    static const std::unordered_map<std::string, std::string AppConfig::*> rawStringFields = {
        {"work_dir", &AppConfig::workDir},
        {"gnuplot_path", &AppConfig::gnuplotPath},
        {"request", &AppConfig::requestPath},
        {"plot_out", &AppConfig::plotOutputPath}
    };
    static const std::unordered_map<std::string, PlotIntRule> plotIntFields = {
        {"plot_width", {&PlotConfig::width, 320}},
        {"plot_height", {&PlotConfig::height, 240}}
    };
    static const std::unordered_map<std::string, PlotDoubleRule> plotDoubleFields = {
        {"plot_point_size", {&PlotConfig::pointSize, 0.1}},
        {"plot_line_width", {&PlotConfig::lineWidth, 0.1}}
    };

    if (key == "sieve_sizes") {
        config.sieveSizes = parseSieveSizes(value, key);
        return;
    }
    if (key == "host") {
        config.service.host = value;
        return;
    }
    if (key == "port") {
        config.service.port = parseIntStrict(value, key, 1);
        return;
    }
    if (key == "threads") {
        config.service.threads = static_cast<size_t>(parseIntStrict(value, key, 1));
        return;
    }
    if (key == "plot_format") {
        config.plot.format = CommonUtils::toLower(value);
        return;
    }
    if (key == "plot_theme") {
        config.plot.theme = CommonUtils::toLower(value);
        return;
    }
    if (key == "plot_grid") {
        config.plot.showGrid = parseBoolStrict(value, key);
        return;
    }
    if (key == "plot_resolution") {
        config.plot.resolution = static_cast<size_t>(parseIntStrict(value, key, 2));
        return;
    }
    if (key == "verbose") {
        config.verbose = parseBoolStrict(value, key);
        return;
    }

    if (const auto it = rawStringFields.find(key); it != rawStringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (const auto it = plotIntFields.find(key); it != plotIntFields.end()) {
        config.plot.*(it->second.member) = parseIntStrict(value, key, it->second.minValue);
        return;
    }
    if (const auto it = plotDoubleFields.find(key); it != plotDoubleFields.end()) {
        config.plot.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return;
    }

    std::cerr << "[Granulo][Config] ignoring unknown key '" << key << "'\n";
}
} // namespace

AppConfig AppConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw Granulo::ConfigurationException(kUsage);
    }

    AppConfig config;
    config.command = CommonUtils::toLower(argv[1]);

    int first = 2;
    if (config.command == "analyze" && argc >= 3 && std::string(argv[2]).rfind("--", 0) != 0) {
        config.requestPath = argv[2];
        first = 3;
    }

    // The config file supplies defaults; explicit flags override it.
    for (int i = first; i < argc; ++i) {
        if (std::string(argv[i]) == "--config" && i + 1 < argc) {
            config = fromFile(argv[i + 1], config);
            break;
        }
    }

    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            ++i;
        } else if (arg == "--host" && i + 1 < argc) {
            config.service.host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            config.service.port = parseIntStrict(argv[++i], "--port", 1);
        } else if (arg == "--threads" && i + 1 < argc) {
            config.service.threads = static_cast<size_t>(parseIntStrict(argv[++i], "--threads", 1));
        } else if (arg == "--sieve-sizes" && i + 1 < argc) {
            config.sieveSizes = parseSieveSizes(argv[++i], "--sieve-sizes");
        } else if (arg == "--plot-format" && i + 1 < argc) {
            config.plot.format = CommonUtils::toLower(argv[++i]);
        } else if (arg == "--plot-width" && i + 1 < argc) {
            config.plot.width = parseIntStrict(argv[++i], "--plot-width", 320);
        } else if (arg == "--plot-height" && i + 1 < argc) {
            config.plot.height = parseIntStrict(argv[++i], "--plot-height", 240);
        } else if (arg == "--plot-theme" && i + 1 < argc) {
            config.plot.theme = CommonUtils::toLower(argv[++i]);
        } else if (arg == "--plot-grid" && i + 1 < argc) {
            config.plot.showGrid = parseBoolStrict(argv[++i], "--plot-grid");
        } else if (arg == "--plot-line-width" && i + 1 < argc) {
            config.plot.lineWidth = parseDoubleStrict(argv[++i], "--plot-line-width", 0.1);
        } else if (arg == "--plot-point-size" && i + 1 < argc) {
            config.plot.pointSize = parseDoubleStrict(argv[++i], "--plot-point-size", 0.1);
        } else if (arg == "--plot-resolution" && i + 1 < argc) {
            config.plot.resolution = static_cast<size_t>(parseIntStrict(argv[++i], "--plot-resolution", 2));
        } else if (arg == "--work-dir" && i + 1 < argc) {
            config.workDir = argv[++i];
        } else if (arg == "--gnuplot" && i + 1 < argc) {
            config.gnuplotPath = argv[++i];
        } else if (arg == "--verbose" && i + 1 < argc) {
            config.verbose = parseBoolStrict(argv[++i], "--verbose");
        } else if (arg == "--plot-out" && i + 1 < argc) {
            config.plotOutputPath = argv[++i];
        } else if (arg == "--json") {
            config.printJson = true;
        } else {
            throw Granulo::ConfigurationException("Unknown or incomplete option '" + arg + "'\n" + kUsage);
        }
    }

    config.validate();
    return config;
}

AppConfig AppConfig::fromFile(const std::string& configPath, const AppConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Granulo::ConfigurationException("Could not open config file: " + configPath);

    AppConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        const auto entry = splitConfigLine(line);
        if (!entry) continue;

        try {
            assignKeyValue(config, entry->first, entry->second);
        } catch (const Granulo::GranuloException& ex) {
            throw Granulo::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();

    return config;
}

void AppConfig::validate() const {
    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (!isIn(command, {"serve", "analyze"})) {
        throw Granulo::ConfigurationException("command must be one of: serve, analyze (got '" + command + "')");
    }
    if (command == "analyze" && requestPath.empty()) {
        throw Granulo::ConfigurationException("analyze requires a request document path");
    }
    if (!isIn(plot.format, {"png", "svg"})) {
        throw Granulo::ConfigurationException("plot_format must be one of: png, svg");
    }
    if (!isIn(plot.theme, {"light", "dark"})) {
        throw Granulo::ConfigurationException("plot_theme must be one of: light, dark");
    }
    if (plot.pointSize <= 0.0 || plot.lineWidth <= 0.0) {
        throw Granulo::ConfigurationException("plot_point_size and plot_line_width must be > 0");
    }
    if (plot.width < 320 || plot.height < 240) {
        throw Granulo::ConfigurationException("plot_width must be >= 320 and plot_height >= 240");
    }
    if (plot.resolution < 2) {
        throw Granulo::ConfigurationException("plot_resolution must be >= 2");
    }
    if (service.port < 1 || service.port > 65535) {
        throw Granulo::ConfigurationException("port must be within [1,65535]");
    }
    if (service.threads < 1) {
        throw Granulo::ConfigurationException("threads must be >= 1");
    }

    // Throws on a malformed scale.
    SieveScale scale(sieveSizes);
    (void)scale;
}

std::string AppConfig::resolvedWorkDir() const {
    if (!workDir.empty()) return workDir;
    std::error_code ec;
    std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
    if (ec) tmp = ".";
    return (tmp / "granulo_plots").string();
}
