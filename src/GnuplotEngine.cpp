#include "GnuplotEngine.h"

#include "GranuloExceptions.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <spawn.h>
#include <sstream>
#include <string_view>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

#if defined(__GLIBC__) && defined(__GLIBC_PREREQ)
#if __GLIBC_PREREQ(2, 34)
#define GRANULO_HAS_ADDCLOSEFROM 1
#endif
#endif
#ifndef GRANULO_HAS_ADDCLOSEFROM
#define GRANULO_HAS_ADDCLOSEFROM 0
#endif

extern char** environ;

namespace {
std::string normalizePlotLabel(const std::string& label, size_t maxLen = 28) {
    std::string out;
    out.reserve(label.size());
    for (char ch : label) {
        const unsigned char uc = static_cast<unsigned char>(ch);
        if (uc < 32) {
            if (!out.empty() && out.back() != ' ') out.push_back(' ');
            continue;
        }
        out.push_back(ch);
    }
    if (out.empty()) out = "Unnamed";
    if (out.size() > maxLen) {
        out = out.substr(0, maxLen - 3) + "...";
    }
    return out;
}

std::string randomToken(size_t n = 12) {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    static constexpr std::string_view alphabet = "abcdefghijklmnopqrstuvwxyz0123456789";
    std::uniform_int_distribution<size_t> dist(0, alphabet.size() - 1);
    std::string out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) out.push_back(alphabet[dist(rng)]);
    return out;
}

std::string findExecutableInPath(const std::string& command) {
    const char* pathEnv = std::getenv("PATH");
    if (command.empty() || pathEnv == nullptr) return "";

    const std::string searchPath = pathEnv;
    size_t begin = 0;
    while (begin <= searchPath.size()) {
        size_t end = searchPath.find(':', begin);
        if (end == std::string::npos) end = searchPath.size();
        const std::string dir = (end == begin) ? "." : searchPath.substr(begin, end - begin);
        const std::filesystem::path candidate = std::filesystem::path(dir) / command;
        if (::access(candidate.c_str(), X_OK) == 0) return candidate.string();
        begin = end + 1;
    }
    return "";
}

// posix_spawn state for one gnuplot run. Every handle is released on scope exit.
class GnuplotLaunch {
public:
    explicit GnuplotLaunch(const std::string& stderrPath)
        : errFd_(::open(stderrPath.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644)) {
        if (errFd_ < 0) return;
        actionsReady_ = ::posix_spawn_file_actions_init(&actions_) == 0;
        attrReady_ = ::posix_spawnattr_init(&attr_) == 0;
        ok_ = actionsReady_ && attrReady_ &&
              ::posix_spawn_file_actions_adddup2(&actions_, errFd_, STDERR_FILENO) == 0 &&
              ::posix_spawn_file_actions_addclose(&actions_, errFd_) == 0 &&
              closeInheritedDescriptors();
    }

    ~GnuplotLaunch() {
        if (attrReady_) ::posix_spawnattr_destroy(&attr_);
        if (actionsReady_) ::posix_spawn_file_actions_destroy(&actions_);
        if (errFd_ >= 0) ::close(errFd_);
    }

    GnuplotLaunch(const GnuplotLaunch&) = delete;
    GnuplotLaunch& operator=(const GnuplotLaunch&) = delete;

    /// Exit code of gnuplot, or -1 when it could not be started or did not exit normally.
    int run(const std::string& executable, const std::string& scriptPath) {
        if (!ok_) return -1;
        const char* argvRaw[] = {executable.c_str(), scriptPath.c_str(), nullptr};
        pid_t pid = -1;
        if (::posix_spawn(&pid, executable.c_str(), &actions_, &attr_, const_cast<char* const*>(argvRaw), environ) != 0 ||
            pid <= 0) {
            return -1;
        }

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) return -1;
        }
        return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }

private:
    // Renders run on several server threads at once; descriptors another thread
    // opened without O_CLOEXEC must not leak into this child.
    bool closeInheritedDescriptors() {
#ifdef POSIX_SPAWN_CLOEXEC_DEFAULT
        return ::posix_spawnattr_setflags(&attr_, POSIX_SPAWN_CLOEXEC_DEFAULT) == 0;
#elif GRANULO_HAS_ADDCLOSEFROM
        return ::posix_spawn_file_actions_addclosefrom_np(&actions_, STDERR_FILENO + 1) == 0;
#else
        return true;
#endif
    }

    int errFd_;
    posix_spawn_file_actions_t actions_{};
    posix_spawnattr_t attr_{};
    bool actionsReady_ = false;
    bool attrReady_ = false;
    bool ok_ = false;
};

bool writeTextFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    if (!out) return false;
    out << content;
    return out.good();
}

std::string firstLineOf(const std::string& path) {
    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    return line;
}
} // namespace

std::string GnuplotEngine::quoteForGnuplot(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            escaped += "''";
        } else {
            escaped.push_back(ch);
        }
    }
    escaped.push_back('\'');
    return escaped;
}

std::string GnuplotEngine::terminalForFormat(const std::string& format, int width, int height) {
    if (format == "svg") return "svg size " + std::to_string(width) + "," + std::to_string(height);
    return "pngcairo size " + std::to_string(width) + "," + std::to_string(height);
}

std::string GnuplotEngine::styledHeader(const std::string& title, const std::string& outputFile) const {
    const bool darkTheme = (cfg_.theme == "dark");
    const std::string titleColor = darkTheme ? "#f9fafb" : "#1f2937";
    const std::string borderColor = darkTheme ? "#6b7280" : "#9ca3af";
    const std::string ticColor = darkTheme ? "#e5e7eb" : "#374151";
    const std::string gridColor = darkTheme ? "#374151" : "#d1d5db";
    const std::string bgColor = darkTheme ? "#111827" : "#ffffff";

    std::ostringstream script;
    script << "set terminal " << terminalForFormat(cfg_.format, cfg_.width, cfg_.height) << " noenhanced\n";
    script << "set output " << quoteForGnuplot(outputFile) << "\n";
    script << "set object 999 rect from graph 0,0 to graph 1,1 behind fc rgb " << quoteForGnuplot(bgColor) << " fs solid 1.0 noborder\n";
    script << "set title " << quoteForGnuplot(title)
           << " tc rgb " << quoteForGnuplot(titleColor)
           << " font ',14'\n";
    script << "set tmargin 3.4\nset bmargin 4.6\nset lmargin 8.6\nset rmargin 3.2\n";
    script << "set border linewidth 1 lc rgb " << quoteForGnuplot(borderColor) << "\n";
    script << "set tics textcolor rgb " << quoteForGnuplot(ticColor) << " font ',10'\n";
    script << "set tics out nomirror\n";
    if (cfg_.showGrid) {
        script << "set grid xtics mxtics ytics back lc rgb " << quoteForGnuplot(gridColor) << " lw 1 dt 2\n";
    } else {
        script << "unset grid\n";
    }
    script << "set key top left opaque box lc rgb " << quoteForGnuplot(borderColor) << " font ',10'\n";
    return script.str();
}

GnuplotEngine::GnuplotEngine(std::string workDir, PlotConfig cfg, std::string gnuplotPath)
    : workDir_(std::move(workDir)), cfg_(std::move(cfg)) {
    gnuplotExe_ = gnuplotPath.empty() ? findExecutableInPath("gnuplot") : gnuplotPath;
    std::error_code ec;
    std::filesystem::create_directories(workDir_, ec);
    if (ec) {
        std::cerr << "[Granulo][Plot] Could not create work directory '" << workDir_ << "': " << ec.message() << "\n";
    }
}

bool GnuplotEngine::isolatesChildDescriptors() {
#ifdef POSIX_SPAWN_CLOEXEC_DEFAULT
    return true;
#else
    return GRANULO_HAS_ADDCLOSEFROM != 0;
#endif
}

bool GnuplotEngine::isAvailable() const {
    return !gnuplotExe_.empty();
}

std::string GnuplotEngine::mimeType() const {
    return cfg_.format == "svg" ? "image/svg+xml" : "image/png";
}

std::string GnuplotEngine::buildData(const PlotLayout& layout) {
    std::ostringstream data;
    data.precision(10);
    const size_t n = layout.series.empty() ? 0 : layout.series.front().x.size();
    for (size_t i = 0; i < n; ++i) {
        data << layout.series.front().x[i];
        for (const auto& series : layout.series) {
            data << " " << (i < series.y.size() ? series.y[i] : 0.0);
        }
        data << "\n";
    }
    for (const auto& series : layout.series) {
        data << "\n\n";
        for (const auto& point : series.markers) {
            data << point.size << " " << point.percent << "\n";
        }
    }
    return data.str();
}

std::string GnuplotEngine::buildScript(const PlotLayout& layout,
                                       const std::string& dataFile,
                                       const std::string& outputFile) const {
    const std::string axisColor = (cfg_.theme == "dark") ? "#e5e7eb" : "#374151";

    std::ostringstream script;
    script << styledHeader(layout.title, outputFile);
    script << "set xlabel " << quoteForGnuplot(layout.xLabel) << " tc rgb " << quoteForGnuplot(axisColor) << " font ',11'\n";
    script << "set ylabel " << quoteForGnuplot(layout.yLabel) << " tc rgb " << quoteForGnuplot(axisColor) << " font ',11'\n";
    script << "set logscale x 10\n";
    script << "set xrange [" << layout.xMin << ":" << layout.xMax << "]\n";
    script << "set yrange [" << layout.yMin << ":" << layout.yMax << "]\n";
    script << "set format x '%g'\n";
    script << "set mxtics 10\n";
    script << "set ytics 0,10,100\n";

    for (size_t j = 0; j < layout.series.size(); ++j) {
        const PlotSeries& series = layout.series[j];
        script << "set style line " << (j + 1)
               << " lc rgb " << quoteForGnuplot(series.color)
               << " lw " << cfg_.lineWidth
               << " pt 7 ps " << cfg_.pointSize;
        if (layout.grayscale) {
            script << " dt " << ((series.styleIndex % 4) + 1);
        }
        script << "\n";
    }

    script << "plot ";
    for (size_t j = 0; j < layout.series.size(); ++j) {
        if (j > 0) script << ", \\\n     ";
        script << quoteForGnuplot(dataFile)
               << " index 0 using 1:" << (j + 2)
               << " with lines ls " << (j + 1)
               << " title " << quoteForGnuplot(normalizePlotLabel(layout.series[j].label));
        script << ", \\\n     " << quoteForGnuplot(dataFile)
               << " index " << (j + 1)
               << " using 1:2 with points ls " << (j + 1)
               << " notitle";
    }
    script << "\n";
    return script.str();
}

RasterImage GnuplotEngine::rasterize(const PlotLayout& layout) {
    if (gnuplotExe_.empty()) {
        throw Granulo::RenderException("gnuplot executable not found in PATH");
    }
    if (layout.series.empty()) {
        throw Granulo::RenderException("no series to draw");
    }

    const std::string id = "gradation_" + randomToken();
    const std::string dataFile = workDir_ + "/" + id + ".dat";
    const std::string scriptFile = workDir_ + "/" + id + ".plt";
    const std::string outputFile = workDir_ + "/" + id + "." + cfg_.format;
    const std::string errFile = workDir_ + "/" + id + ".err.log";

    std::error_code ec;
    if (!writeTextFile(dataFile, buildData(layout)) ||
        !writeTextFile(scriptFile, buildScript(layout, dataFile, outputFile))) {
        std::filesystem::remove(dataFile, ec);
        std::filesystem::remove(scriptFile, ec);
        throw Granulo::RenderException("could not write plot files under '" + workDir_ + "'");
    }

    int rc = -1;
    {
        GnuplotLaunch launch(errFile);
        rc = launch.run(gnuplotExe_, scriptFile);
    }

    std::filesystem::remove(dataFile, ec);
    std::filesystem::remove(scriptFile, ec);

    if (rc != 0 || !std::filesystem::exists(outputFile)) {
        const std::string firstLine = firstLineOf(errFile);
        std::cerr << "[Granulo][Plot] Generation failed for id='" << id
                  << "' rc=" << rc
                  << " output='" << outputFile
                  << "' stderr='" << firstLine << "'\n";
        std::filesystem::remove(errFile, ec);
        std::filesystem::remove(outputFile, ec);
        throw Granulo::RenderException("gnuplot exited with code " + std::to_string(rc) +
                                       (firstLine.empty() ? std::string() : ": " + firstLine));
    }
    std::filesystem::remove(errFile, ec);

    RasterImage image;
    {
        std::ifstream in(outputFile, std::ios::binary);
        if (!in) {
            std::filesystem::remove(outputFile, ec);
            throw Granulo::RenderException("could not read rendered plot '" + outputFile + "'");
        }
        image.bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    std::filesystem::remove(outputFile, ec);

    image.mimeType = mimeType();
    image.width = cfg_.width;
    image.height = cfg_.height;
    return image;
}
