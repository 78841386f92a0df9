#include "PlotRenderer.h"
#include "TestHelpers.h"

#include <gtest/gtest.h>

#include <cmath>

using granulo_test::FakeRasterizer;
using granulo_test::exampleScale;
using granulo_test::sample;
using granulo_test::sampleA;

class PlotRendererTest : public ::testing::Test {
protected:
    void SetUp() override {
        curves.push_back(GradationCurve::build(sampleA(), scale, InterpolationMethod::Linear));
        curves.push_back(GradationCurve::build(sample("B", {100.0, 98.0, 90.0, 75.0, 50.0, 5.0}), scale,
                                               InterpolationMethod::Linear));
    }

    SieveScale scale = exampleScale();
    std::vector<GradationCurve> curves;
    FakeRasterizer rasterizer;
};

TEST_F(PlotRendererTest, LayoutSpansFullScaleOnLogGrid) {
    PlotRenderer renderer(rasterizer, 50);
    const PlotLayout layout = renderer.layout(curves, scale);

    EXPECT_DOUBLE_EQ(layout.xMin, 0.075);
    EXPECT_DOUBLE_EQ(layout.xMax, 50.0);
    EXPECT_DOUBLE_EQ(layout.yMin, 0.0);
    EXPECT_DOUBLE_EQ(layout.yMax, 100.0);
    EXPECT_EQ(layout.title, "Particle Size Distribution Curve");
    EXPECT_EQ(layout.xLabel, "Particle Size (mm)");
    EXPECT_EQ(layout.yLabel, "Percent Passing (%)");

    ASSERT_EQ(layout.series.size(), 2u);
    const PlotSeries& first = layout.series.front();
    ASSERT_EQ(first.x.size(), 50u);
    ASSERT_EQ(first.y.size(), 50u);
    EXPECT_DOUBLE_EQ(first.x.front(), 0.075);
    EXPECT_DOUBLE_EQ(first.x.back(), 50.0);
    const double ratio = first.x[1] / first.x[0];
    EXPECT_NEAR(first.x[2] / first.x[1], ratio, 1e-9);
    EXPECT_DOUBLE_EQ(first.y.front(), 0.0);
    EXPECT_DOUBLE_EQ(first.y.back(), 100.0);
}

TEST_F(PlotRendererTest, SeriesCarryLabelsColorsAndMarkers) {
    PlotRenderer renderer(rasterizer);
    const PlotLayout layout = renderer.layout(curves, scale);
    EXPECT_EQ(layout.series[0].label, "A");
    EXPECT_EQ(layout.series[1].label, "B");
    EXPECT_EQ(layout.series[0].color, "#1f77b4");
    EXPECT_EQ(layout.series[1].color, "#ff7f0e");
    EXPECT_EQ(layout.series[0].markers.size(), 6u);
    EXPECT_FALSE(layout.grayscale);
}

TEST_F(PlotRendererTest, GrayscalePaletteAndExplicitSlots) {
    PlotRenderer renderer(rasterizer);
    const PlotLayout layout = renderer.layout(curves, scale, false, {2, 5});
    EXPECT_TRUE(layout.grayscale);
    EXPECT_EQ(layout.series[0].color, "#808080");
    EXPECT_EQ(layout.series[1].color, "#404040");
    EXPECT_EQ(layout.series[1].styleIndex, 5u);
    EXPECT_THROW(renderer.layout(curves, scale, true, {0}), Granulo::RenderException);
}

TEST_F(PlotRendererTest, PaletteWrapsAround) {
    EXPECT_EQ(PlotRenderer::colorFor(10, true), PlotRenderer::colorFor(0, true));
    EXPECT_EQ(PlotRenderer::colorFor(4, false), PlotRenderer::colorFor(0, false));
}

TEST_F(PlotRendererTest, LayoutIsDeterministic) {
    PlotRenderer renderer(rasterizer);
    const PlotLayout a = renderer.layout(curves, scale);
    const PlotLayout b = renderer.layout(curves, scale);
    ASSERT_EQ(a.series.size(), b.series.size());
    for (size_t i = 0; i < a.series.size(); ++i) {
        EXPECT_EQ(a.series[i].label, b.series[i].label);
        EXPECT_EQ(a.series[i].color, b.series[i].color);
        EXPECT_EQ(a.series[i].x, b.series[i].x);
        EXPECT_EQ(a.series[i].y, b.series[i].y);
    }
}

TEST_F(PlotRendererTest, RenderEncodesRasterAsBase64) {
    PlotRenderer renderer(rasterizer);
    const PlotArtifact artifact = renderer.render(curves, scale);
    EXPECT_EQ(rasterizer.calls, 1);
    EXPECT_EQ(artifact.base64, "YWJj");
    EXPECT_EQ(artifact.mimeType, "image/png");
    EXPECT_EQ(artifact.width, 640);
    EXPECT_EQ(artifact.height, 480);
}

TEST_F(PlotRendererTest, EmptyInputOrOutputIsRenderError) {
    PlotRenderer renderer(rasterizer);
    EXPECT_THROW(renderer.render({}, scale), Granulo::RenderException);
    EXPECT_EQ(rasterizer.calls, 0);

    rasterizer.payload.clear();
    EXPECT_THROW(renderer.render(curves, scale), Granulo::RenderException);
}

TEST_F(PlotRendererTest, BackendFailurePropagates) {
    rasterizer.failure = "backend down";
    PlotRenderer renderer(rasterizer);
    EXPECT_THROW(renderer.render(curves, scale), Granulo::RenderException);
}

TEST(Base64Test, EncodesWithPadding) {
    EXPECT_EQ(base64Encode({}), "");
    EXPECT_EQ(base64Encode({'a'}), "YQ==");
    EXPECT_EQ(base64Encode({'a', 'b'}), "YWI=");
    EXPECT_EQ(base64Encode({'M', 'a', 'n'}), "TWFu");
}

TEST(Base64Test, DecodesEncodedBytes) {
    const std::vector<uint8_t> bytes = {0x89, 'P', 'N', 'G', 0x0d, 0x0a, 0x1a, 0x0a, 0x00, 0xff};
    EXPECT_EQ(base64Decode(base64Encode(bytes)), bytes);
    EXPECT_THROW(base64Decode("ab*c"), Granulo::ValidationException);
}
