#include "TerminalUI.h"
#include "TestHelpers.h"

#include <gtest/gtest.h>

#include <sstream>

using granulo_test::FakeRasterizer;
using granulo_test::exampleScale;
using granulo_test::sample;
using granulo_test::sampleA;

TEST(TerminalUITest, ParameterTableListsEverySample) {
    FakeRasterizer rasterizer;
    AnalysisService service(exampleScale(), rasterizer, 20);
    AnalysisRequest request;
    request.samples = {sampleA(), sample("thin", {std::nullopt, std::nullopt, 50.0, std::nullopt, std::nullopt, std::nullopt})};
    const AnalysisResponse response = service.analyze(request);

    std::ostringstream out;
    TerminalUI::printParameterTable(response, out);
    const std::string table = out.str();
    EXPECT_NE(table.find("GRADATION PARAMETERS"), std::string::npos);
    EXPECT_NE(table.find("2.000"), std::string::npos);
    EXPECT_NE(table.find("7.802"), std::string::npos);
    EXPECT_NE(table.find("Poorly-graded (Cu <= 4, Cc outside 1-3)"), std::string::npos);
    EXPECT_NE(table.find("thin"), std::string::npos);
    EXPECT_NE(table.find("not analyzed:"), std::string::npos);

    std::ostringstream issues;
    TerminalUI::printIssues(response, issues);
    EXPECT_NE(issues.str().find("1 sample(s) could not be analyzed"), std::string::npos);
}

TEST(TerminalUITest, UndefinedValuesPrintAsDash) {
    AnalysisResponse response;
    SampleReport report;
    report.name = "coarse";
    report.analyzed = true;
    report.parameters = GradationParameters{};
    response.samples.push_back(report);

    std::ostringstream out;
    TerminalUI::printParameterTable(response, out);
    EXPECT_NE(out.str().find("-         -         -"), std::string::npos);
    EXPECT_NE(out.str().find("Insufficient data"), std::string::npos);

    std::ostringstream none;
    TerminalUI::printIssues(response, none);
    EXPECT_TRUE(none.str().empty());
}

TEST(TerminalUITest, RunHeaderDescribesRequest) {
    AnalysisRequest request;
    request.samples = {sampleA()};
    request.method = InterpolationMethod::Nearest;
    request.useColor = false;

    std::ostringstream out;
    TerminalUI::printRunHeader("req.json", request, exampleScale(), out);
    const std::string line = out.str();
    EXPECT_NE(line.find("request='req.json'"), std::string::npos);
    EXPECT_NE(line.find("method=nearest"), std::string::npos);
    EXPECT_NE(line.find("palette=grayscale"), std::string::npos);
    EXPECT_NE(line.find("sieves=6"), std::string::npos);
}
