#include "ParameterExtractor.h"
#include "TestHelpers.h"

#include <gtest/gtest.h>

#include <cmath>

using granulo_test::exampleScale;
using granulo_test::sample;
using granulo_test::sampleA;

TEST(ParameterExtractorTest, SampleALinear) {
    const GradationCurve curve = GradationCurve::build(sampleA(), exampleScale(), InterpolationMethod::Linear);
    const GradationParameters p = ParameterExtractor::extract(curve);

    ASSERT_TRUE(p.d10 && p.d30 && p.d60);
    const double d10 = 2.0;
    const double d30 = 2.0 * std::pow(4.75 / 2.0, 2.0 / 3.0);
    const double d60 = 4.75 * std::pow(10.0 / 4.75, 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(*p.d10, d10);
    EXPECT_NEAR(*p.d30, d30, 1e-6);
    EXPECT_NEAR(*p.d60, d60, 1e-6);

    ASSERT_TRUE(p.coefficientsDefined());
    EXPECT_NEAR(*p.cu, d60 / d10, 1e-6);
    EXPECT_NEAR(*p.cc, d30 * d30 / (d10 * d60), 1e-6);
}

TEST(ParameterExtractorTest, EffectiveSizesAreOrdered) {
    for (InterpolationMethod method : {InterpolationMethod::Linear, InterpolationMethod::Cubic}) {
        const GradationCurve curve = GradationCurve::build(sampleA(), exampleScale(), method);
        const GradationParameters p = ParameterExtractor::extract(curve);
        ASSERT_TRUE(p.d10 && p.d30 && p.d60);
        EXPECT_LT(*p.d10, *p.d30);
        EXPECT_LT(*p.d30, *p.d60);
    }
}

TEST(ParameterExtractorTest, MissingD10LeavesCoefficientsUndefined) {
    const SampleInput coarse = sample("B", {100.0, 95.0, 80.0, 50.0, 30.0, 20.0});
    const GradationCurve curve = GradationCurve::build(coarse, exampleScale(), InterpolationMethod::Linear);
    const GradationParameters p = ParameterExtractor::extract(curve);

    EXPECT_FALSE(p.d10.has_value());
    EXPECT_TRUE(p.d30.has_value());
    EXPECT_TRUE(p.d60.has_value());
    EXPECT_FALSE(p.cu.has_value());
    EXPECT_FALSE(p.cc.has_value());
    EXPECT_EQ(p.classification, GradationClass::Undetermined);
    EXPECT_EQ(p.classificationLabel(), "Insufficient data");
}

TEST(ParameterExtractorTest, SampleAIsPoorlyGraded) {
    const GradationCurve curve = GradationCurve::build(sampleA(), exampleScale(), InterpolationMethod::Linear);
    const GradationParameters p = ParameterExtractor::extract(curve);
    // Cu ~ 3.90, Cc ~ 0.81
    EXPECT_EQ(p.classification, GradationClass::PoorlyGraded);
    EXPECT_EQ(p.classificationLabel(), "Poorly-graded (Cu <= 4, Cc outside 1-3)");
}

TEST(ParameterExtractorTest, ClassifyWellGraded) {
    GradationParameters p;
    p.cu = 6.0;
    p.cc = 2.0;
    ParameterExtractor::classify(p);
    EXPECT_EQ(p.classification, GradationClass::WellGraded);
    EXPECT_TRUE(p.classificationReasons.empty());
    EXPECT_EQ(p.classificationLabel(), "Well-graded");
}

TEST(ParameterExtractorTest, ClassifyBoundaries) {
    GradationParameters p;
    p.cu = 4.0;
    p.cc = 1.0;
    ParameterExtractor::classify(p);
    EXPECT_EQ(p.classification, GradationClass::PoorlyGraded);
    ASSERT_EQ(p.classificationReasons.size(), 1u);
    EXPECT_EQ(p.classificationReasons[0], "Cu <= 4");

    p.cu = 4.5;
    p.cc = 3.0;
    ParameterExtractor::classify(p);
    EXPECT_EQ(p.classification, GradationClass::WellGraded);

    p.cc = 3.5;
    ParameterExtractor::classify(p);
    EXPECT_EQ(p.classification, GradationClass::PoorlyGraded);
    ASSERT_EQ(p.classificationReasons.size(), 1u);
    EXPECT_EQ(p.classificationReasons[0], "Cc outside 1-3");
}
