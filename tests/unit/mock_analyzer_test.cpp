#include "services/analysis/mock_analyzer.hpp"

#include "../test_utils/radiograph_generator.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

namespace dentescope::services {
namespace {

class MockAnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto image = test_utils::createPanoramic(400, 200, {{250.0, 60.0, 40.0, 50.0}});
        input_ = {"pano.png", test_utils::encodePng(image)};
    }

    ImageInput input_;
};

TEST_F(MockAnalyzerTest, Fnv1aKnownValues) {
    EXPECT_EQ(MockAnalyzer::fnv1a({}), 14695981039346656037ULL);

    const std::string a = "a";
    std::vector<uint8_t> bytes(a.begin(), a.end());
    EXPECT_EQ(MockAnalyzer::fnv1a(bytes), 0xaf63dc4c8601ec8cULL);
}

TEST_F(MockAnalyzerTest, ProducesOnePlausiblePair) {
    MockAnalyzer analyzer;

    auto result = analyzer.analyze(input_, {});
    ASSERT_TRUE(result.has_value()) << result.error().toString();
    ASSERT_EQ(result->pairs.size(), 1u);
    EXPECT_EQ(result->analyzerName, "MockAnalyzer");
    EXPECT_EQ(result->detectedTeethCount, 2u);
    EXPECT_EQ(result->imageQuality.resolution, "400x200");

    const auto& report = result->pairs[0];
    EXPECT_GE(report.molarMeasurement.widthMm, 10.5 - 1e-9);
    EXPECT_LE(report.molarMeasurement.widthMm, 12.5 + 1e-9);
    EXPECT_GE(report.premolarMeasurement.widthMm, 8.2 - 1e-9);
    EXPECT_LE(report.premolarMeasurement.widthMm, 9.7 + 1e-9);
    EXPECT_GT(report.widthDifference.valueMm, 0.0);
    EXPECT_FALSE(report.sizeClamped);

    EXPECT_GE(report.pair.molar.rawConfidence(), 0.85);
    EXPECT_LE(report.pair.molar.rawConfidence(), 0.95);
    EXPECT_EQ(report.pair.molar.detection.classLabel, "primary_second_molar");
    EXPECT_EQ(report.pair.premolar.detection.classLabel, "second_premolar");
    EXPECT_GT(report.pair.molar.detection.centroid().x,
              report.pair.premolar.detection.centroid().x);
}

TEST_F(MockAnalyzerTest, SameBytesGiveSameResult) {
    MockAnalyzer analyzer;

    auto first = analyzer.analyze(input_, {});
    auto second = analyzer.analyze(input_, {});
    ASSERT_TRUE(first && second);
    EXPECT_DOUBLE_EQ(first->pairs[0].molarMeasurement.widthMm,
                     second->pairs[0].molarMeasurement.widthMm);
    EXPECT_DOUBLE_EQ(first->pairs[0].premolarMeasurement.widthMm,
                     second->pairs[0].premolarMeasurement.widthMm);
    EXPECT_DOUBLE_EQ(first->pairs[0].pair.pairConfidence,
                     second->pairs[0].pair.pairConfidence);
}

TEST_F(MockAnalyzerTest, DifferentBytesGiveDifferentResult) {
    MockAnalyzer analyzer;
    auto other = test_utils::createPanoramic(400, 200, {{100.0, 60.0, 40.0, 50.0}});

    auto first = analyzer.analyze(input_, {});
    auto second = analyzer.analyze({"other.png", test_utils::encodePng(other)}, {});
    ASSERT_TRUE(first && second);
    EXPECT_NE(first->pairs[0].molarMeasurement.widthMm,
              second->pairs[0].molarMeasurement.widthMm);
}

TEST_F(MockAnalyzerTest, CorruptImageIsDecodeError) {
    MockAnalyzer analyzer;

    auto result = analyzer.analyze({"junk.bin", std::vector<uint8_t>(32, 0x01)}, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, core::AnalysisError::Code::ImageDecodeError);
}

TEST_F(MockAnalyzerTest, ZeroMagnificationIsMisconfigured) {
    MockAnalyzer analyzer;
    core::AnalysisOptions options;
    options.magnificationFactor = 0.0;

    auto result = analyzer.analyze(input_, options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, core::AnalysisError::Code::CalibrationMisconfigured);
}

TEST_F(MockAnalyzerTest, PastDeadlineIsTimeout) {
    MockAnalyzer analyzer;
    core::AnalysisOptions options;
    options.deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);

    auto result = analyzer.analyze(input_, options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, core::AnalysisError::Code::Timeout);
    EXPECT_TRUE(result.error().isRetryable());
}

TEST_F(MockAnalyzerTest, GenerousDeadlineSucceeds) {
    MockAnalyzer analyzer;
    core::AnalysisOptions options;
    options.deadline = std::chrono::steady_clock::now() + std::chrono::minutes(1);

    auto result = analyzer.analyze(input_, options);
    ASSERT_TRUE(result.has_value()) << result.error().toString();
    EXPECT_EQ(result->pairs.size(), 1u);
}

TEST_F(MockAnalyzerTest, WidthsIndependentOfCalibration) {
    MockAnalyzer analyzer;
    core::AnalysisOptions options;
    options.calibrationMmPerPixel = 0.05;

    auto base = analyzer.analyze(input_, {});
    auto recalibrated = analyzer.analyze(input_, options);
    ASSERT_TRUE(base && recalibrated);
    EXPECT_NEAR(base->pairs[0].molarMeasurement.widthMm,
                recalibrated->pairs[0].molarMeasurement.widthMm, 1e-9);
    EXPECT_NE(base->pairs[0].molarMeasurement.widthPx,
              recalibrated->pairs[0].molarMeasurement.widthPx);
}

}  // anonymous namespace
}  // namespace dentescope::services
