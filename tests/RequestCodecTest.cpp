#include "GranuloExceptions.h"
#include "RequestCodec.h"

#include <gtest/gtest.h>

TEST(RequestCodecTest, ParsesSieveDataInOrder) {
    const AnalysisRequest request = RequestCodec::parseAnalysisRequest(
        R"({"sieve_data": {"Zeta": [100, 90.5, null], "Alpha": ["100", "", " 42 "]},
            "interpolation_method": "cubic", "use_color": false})");

    ASSERT_EQ(request.samples.size(), 2u);
    EXPECT_EQ(request.samples[0].name, "Zeta");
    EXPECT_EQ(request.samples[1].name, "Alpha");
    EXPECT_EQ(request.method, InterpolationMethod::Cubic);
    EXPECT_FALSE(request.useColor);

    const auto& z = request.samples[0].values;
    ASSERT_EQ(z.size(), 3u);
    EXPECT_DOUBLE_EQ(*z[0], 100.0);
    EXPECT_DOUBLE_EQ(*z[1], 90.5);
    EXPECT_FALSE(z[2].has_value());

    const auto& a = request.samples[1].values;
    EXPECT_DOUBLE_EQ(*a[0], 100.0);
    EXPECT_FALSE(a[1].has_value());
    EXPECT_DOUBLE_EQ(*a[2], 42.0);
}

TEST(RequestCodecTest, AppliesDefaults) {
    const AnalysisRequest request = RequestCodec::parseAnalysisRequest(R"({"sieve_data": {"A": [1, 2]}})");
    EXPECT_EQ(request.method, InterpolationMethod::Linear);
    EXPECT_TRUE(request.useColor);
}

TEST(RequestCodecTest, NamesEmptyAndRepeatedSamples) {
    const AnalysisRequest request = RequestCodec::parseAnalysisRequest(
        R"({"sieve_data": {"A": [1], "  ": [2], "A": [3], "Sample 2": [4]}})");
    ASSERT_EQ(request.samples.size(), 4u);
    EXPECT_EQ(request.samples[0].name, "A");
    EXPECT_EQ(request.samples[1].name, "Sample 2");
    EXPECT_EQ(request.samples[2].name, "A (2)");
    EXPECT_EQ(request.samples[3].name, "Sample 2 (2)");
}

TEST(RequestCodecTest, RejectsMalformedShapes) {
    const char* bodies[] = {
        "not json",
        "[1, 2]",
        R"({"samples": {}})",
        R"({"sieve_data": [1, 2]})",
        R"({"sieve_data": {"A": 5}})",
        R"({"sieve_data": {"A": ["abc"]}})",
        R"({"sieve_data": {"A": [true]}})",
        R"({"sieve_data": {"A": [1]}, "interpolation_method": "spline"})",
        R"({"sieve_data": {"A": [1]}, "interpolation_method": 3})",
        R"({"sieve_data": {"A": [1]}, "use_color": "maybe"})",
    };
    for (const char* body : bodies) {
        EXPECT_THROW(RequestCodec::parseAnalysisRequest(std::string(body)), Granulo::ValidationException) << body;
    }
}

TEST(RequestCodecTest, SuccessDocumentRoundsAndUsesNullForUndefined) {
    AnalysisResponse response;
    response.success = true;
    response.status = AnalysisStatus::Ok;
    response.method = "linear";
    response.plot = PlotArtifact{"image/png", 640, 480, "YWJj"};

    SampleReport good;
    good.name = "A";
    good.analyzed = true;
    good.knownPoints = 6;
    good.color = "#1f77b4";
    GradationParameters p;
    p.d10 = 2.0;
    p.d30 = 3.56018367;
    p.d60 = 7.80245375;
    p.cu = 3.90122687;
    p.cc = 0.81223857;
    ParameterExtractor::classify(p);
    good.parameters = p;

    SampleReport partial;
    partial.name = "B";
    partial.analyzed = true;
    partial.knownPoints = 6;
    partial.color = "#ff7f0e";
    GradationParameters q;
    q.d60 = 0.6;
    ParameterExtractor::classify(q);
    partial.parameters = q;

    SampleReport failed;
    failed.name = "C";
    failed.failureReason = "too few points";
    response.samples = {good, partial, failed};
    response.issues.push_back({"C", "too few points"});

    const std::string doc = RequestCodec::serializeResponse(response);
    EXPECT_NE(doc.find(R"("success":true)"), std::string::npos);
    EXPECT_NE(doc.find(R"("plot":"YWJj")"), std::string::npos);
    EXPECT_NE(doc.find(R"("plot_mime":"image/png")"), std::string::npos);
    EXPECT_NE(doc.find(R"j("A":{"D10":2,"D30":3.56,"D60":7.802,"Cu":3.901,"Cc":0.812,"classification":"Poorly-graded (Cu <= 4, Cc outside 1-3)"})j"),
              std::string::npos) << doc;
    EXPECT_NE(doc.find(R"("B":{"D10":null,"D30":null,"D60":0.6,"Cu":null,"Cc":null,"classification":"Insufficient data"})"),
              std::string::npos) << doc;
    EXPECT_EQ(doc.find(R"("C":{)"), std::string::npos);
    EXPECT_NE(doc.find(R"({"name":"C","analyzed":false,"error":"too few points"})"), std::string::npos);
    EXPECT_NE(doc.find(R"("warnings":[{"sample":"C","reason":"too few points"}])"), std::string::npos);
}

TEST(RequestCodecTest, FailureDocumentCarriesError) {
    AnalysisResponse response;
    response.status = AnalysisStatus::NoAnalyzableSamples;
    response.error = "no sample could be analyzed";
    EXPECT_EQ(RequestCodec::serializeResponse(response), R"({"success":false,"error":"no sample could be analyzed"})");
    EXPECT_EQ(RequestCodec::serializeError("bad"), R"({"success":false,"error":"bad"})");
}

TEST(RequestCodecTest, MissingPlotKeepsCoefficients) {
    AnalysisResponse response;
    response.success = true;
    response.status = AnalysisStatus::Ok;
    response.method = "cubic";
    response.plotError = "Render Error: gnuplot not found";

    SampleReport report;
    report.name = "A";
    report.analyzed = true;
    report.knownPoints = 6;
    report.parameters = GradationParameters{};
    report.parameters->d60 = 7.8;
    response.samples = {report};

    const std::string doc = RequestCodec::serializeResponse(response);
    EXPECT_NE(doc.find(R"("success":true,"plot":null,"plot_error":"Render Error: gnuplot not found")"), std::string::npos)
        << doc;
    EXPECT_NE(doc.find(R"("D60":7.8)"), std::string::npos) << doc;
}

TEST(RequestCodecTest, StatusMapping) {
    EXPECT_EQ(RequestCodec::httpStatusFor(AnalysisStatus::Ok), 200);
    EXPECT_EQ(RequestCodec::httpStatusFor(AnalysisStatus::InvalidRequest), 400);
    EXPECT_EQ(RequestCodec::httpStatusFor(AnalysisStatus::NoAnalyzableSamples), 422);
    EXPECT_EQ(RequestCodec::httpStatusFor(AnalysisStatus::InternalError), 500);
}

TEST(RequestCodecTest, ScaleDocument) {
    EXPECT_EQ(RequestCodec::scaleToJson(SieveScale({10.0, 4.75})).dump(),
              R"({"unit":"mm","sieve_sizes":[10,4.75]})");
}
