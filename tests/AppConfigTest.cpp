#include "AppConfig.h"
#include "GranuloExceptions.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {
AppConfig parseArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "granulo");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    return AppConfig::fromArgs(static_cast<int>(args.size()), argv.data());
}

std::string writeConfig(const std::string& name, const std::string& content) {
    const std::filesystem::path path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}
} // namespace

TEST(AppConfigTest, ServeDefaults) {
    const AppConfig config = parseArgs({"serve"});
    EXPECT_EQ(config.command, "serve");
    EXPECT_EQ(config.service.port, 5000);
    EXPECT_EQ(config.service.host, "0.0.0.0");
    EXPECT_EQ(config.plot.format, "png");
    EXPECT_EQ(config.plot.resolution, 200u);
    ASSERT_EQ(config.sieveSizes.size(), 11u);
    EXPECT_DOUBLE_EQ(config.sieveSizes.front(), 53.0);
    EXPECT_FALSE(config.resolvedWorkDir().empty());
}

TEST(AppConfigTest, AnalyzeTakesRequestPathAndFlags) {
    const AppConfig config = parseArgs({"analyze", "req.json", "--plot-out", "curve.png", "--json",
                                        "--plot-format", "SVG", "--sieve-sizes", "10,4.75,2"});
    EXPECT_EQ(config.command, "analyze");
    EXPECT_EQ(config.requestPath, "req.json");
    EXPECT_EQ(config.plotOutputPath, "curve.png");
    EXPECT_TRUE(config.printJson);
    EXPECT_EQ(config.plot.format, "svg");
    EXPECT_EQ(config.sieveSizes, (std::vector<double>{10.0, 4.75, 2.0}));
}

TEST(AppConfigTest, RejectsInvalidArguments) {
    EXPECT_THROW(parseArgs({}), Granulo::ConfigurationException);
    EXPECT_THROW(parseArgs({"train"}), Granulo::ConfigurationException);
    EXPECT_THROW(parseArgs({"analyze"}), Granulo::ConfigurationException);
    EXPECT_THROW(parseArgs({"serve", "--port", "0"}), Granulo::ConfigurationException);
    EXPECT_THROW(parseArgs({"serve", "--port", "70000"}), Granulo::ConfigurationException);
    EXPECT_THROW(parseArgs({"serve", "--port", "80x"}), Granulo::ConfigurationException);
    EXPECT_THROW(parseArgs({"serve", "--plot-theme", "neon"}), Granulo::ConfigurationException);
    EXPECT_THROW(parseArgs({"serve", "--sieve-sizes", "1,2,3"}), Granulo::ConfigurationException);
    EXPECT_THROW(parseArgs({"serve", "--frobnicate"}), Granulo::ConfigurationException);
    EXPECT_THROW(parseArgs({"serve", "--port"}), Granulo::ConfigurationException);
}

TEST(AppConfigTest, ConfigFileIsOverriddenByFlags) {
    const std::string path = writeConfig("granulo_config_test.yaml",
                                         "# service\n"
                                         "host: 127.0.0.1\n"
                                         "port: 6001\n"
                                         "threads: 2\n"
                                         "sieve_sizes: [20, 10, 4.75, 0.075]\n"
                                         "plot-theme: dark\n"
                                         "plot_grid: false\n"
                                         "verbose: yes\n"
                                         "unknown_key: 1\n");
    const AppConfig config = parseArgs({"serve", "--config", path, "--port", "7002"});
    EXPECT_EQ(config.service.host, "127.0.0.1");
    EXPECT_EQ(config.service.port, 7002);
    EXPECT_EQ(config.service.threads, 2u);
    EXPECT_EQ(config.sieveSizes, (std::vector<double>{20.0, 10.0, 4.75, 0.075}));
    EXPECT_EQ(config.plot.theme, "dark");
    EXPECT_FALSE(config.plot.showGrid);
    EXPECT_TRUE(config.verbose);
    std::filesystem::remove(path);
}

TEST(AppConfigTest, JsonStyleConfigFile) {
    const std::string path = writeConfig("granulo_config_test.json",
                                         "{\n"
                                         "  \"plot_width\": 800,\n"
                                         "  \"plot_height\": 600,\n"
                                         "  \"work_dir\": \"/tmp/granulo work\"\n"
                                         "}\n");
    AppConfig base;
    const AppConfig config = AppConfig::fromFile(path, base);
    EXPECT_EQ(config.plot.width, 800);
    EXPECT_EQ(config.plot.height, 600);
    EXPECT_EQ(config.workDir, "/tmp/granulo work");
    EXPECT_EQ(config.resolvedWorkDir(), "/tmp/granulo work");
    std::filesystem::remove(path);
}

TEST(AppConfigTest, BadConfigValueReportsLine) {
    const std::string path = writeConfig("granulo_config_bad.yaml", "port: 80\nplot_width: 100\n");
    try {
        AppConfig::fromFile(path, AppConfig{});
        FAIL() << "expected ConfigurationException";
    } catch (const Granulo::ConfigurationException& e) {
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos) << e.what();
    }
    std::filesystem::remove(path);
    EXPECT_THROW(AppConfig::fromFile("/nonexistent/granulo.yaml", AppConfig{}), Granulo::ConfigurationException);
}

TEST(AppConfigTest, ValuesKeepColonsAndIntegersStayIntegral) {
    const std::string path = writeConfig("granulo_config_colon.yaml",
                                         "work_dir: \"/srv/granulo:plots\"\n"
                                         "plot_line_width: 1.5\n");
    const AppConfig config = AppConfig::fromFile(path, AppConfig{});
    EXPECT_EQ(config.workDir, "/srv/granulo:plots");
    EXPECT_DOUBLE_EQ(config.plot.lineWidth, 1.5);
    std::filesystem::remove(path);

    EXPECT_THROW(parseArgs({"serve", "--port", "80.5"}), Granulo::ConfigurationException);
    EXPECT_THROW(parseArgs({"serve", "--threads", "4x"}), Granulo::ConfigurationException);
    EXPECT_THROW(parseArgs({"serve", "--plot-line-width", "nan"}), Granulo::ConfigurationException);
}
