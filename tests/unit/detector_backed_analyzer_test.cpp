// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "services/analysis/detector_backed_analyzer.hpp"

#include "../test_utils/fake_detector.hpp"
#include "../test_utils/radiograph_generator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <thread>

namespace dentescope::services {
namespace {

using test_utils::FailingDetector;
using test_utils::FixedDetector;
using test_utils::SlowDetector;
using test_utils::makeDetection;

class DetectorBackedAnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto layout = test_utils::standardPairLayout();
        auto image = test_utils::createPanoramic(1000, 500, layout);
        input_ = {"pano.png", test_utils::encodePng(image)};

        for (const auto& box : layout) {
            layoutDetections_.push_back(makeDetection(box.x, box.y, box.width, box.height));
        }

        config_.measurementMethod = core::MeasurementMethod::BoundingBox;
    }

    static bool hasWarningContaining(const AnalysisResult& result, const std::string& text) {
        return std::any_of(result.warnings.begin(), result.warnings.end(),
                           [&](const std::string& w) {
                               return w.find(text) != std::string::npos;
                           });
    }

    ImageInput input_;
    std::vector<Detection> layoutDetections_;
    core::AnalysisConfig config_;
};

// =============================================================================
// Successful analysis
// =============================================================================

TEST_F(DetectorBackedAnalyzerTest, StandardLayoutGivesOnePair) {
    DetectorBackedAnalyzer analyzer(std::make_shared<FixedDetector>(layoutDetections_),
                                    config_);

    auto result = analyzer.analyze(input_, {});
    ASSERT_TRUE(result.has_value()) << result.error().toString();
    ASSERT_EQ(result->pairs.size(), 1u);
    EXPECT_EQ(result->emptyReason, EmptyReason::None);
    EXPECT_EQ(result->detectedTeethCount, 2u);
    EXPECT_EQ(result->imageQuality.resolution, "1000x500");
    EXPECT_EQ(result->analyzerName, "DetectorBackedAnalyzer(FixedDetector)");

    const auto& report = result->pairs[0];
    EXPECT_DOUBLE_EQ(report.pair.molar.detection.box.x, 680.0);
    EXPECT_DOUBLE_EQ(report.pair.premolar.detection.box.x, 510.0);
    EXPECT_DOUBLE_EQ(report.molarMeasurement.widthMm, 8.0);
    EXPECT_DOUBLE_EQ(report.premolarMeasurement.widthMm, 6.4);
    EXPECT_NEAR(report.widthDifference.valueMm, 1.6, 1e-9);
    EXPECT_NEAR(report.widthDifference.percentage, 25.0, 1e-9);
    EXPECT_EQ(report.widthDifference.severity, core::Severity::Moderate);
    EXPECT_FALSE(report.sizeClamped);
    EXPECT_FALSE(result->clinicalRecommendations.empty());
}

TEST_F(DetectorBackedAnalyzerTest, PrincipalAxisExtractsContours) {
    config_.measurementMethod = core::MeasurementMethod::PrincipalAxis;
    DetectorBackedAnalyzer analyzer(std::make_shared<FixedDetector>(layoutDetections_),
                                    config_);

    auto result = analyzer.analyze(input_, {});
    ASSERT_TRUE(result.has_value()) << result.error().toString();
    ASSERT_EQ(result->pairs.size(), 1u);

    const auto& report = result->pairs[0];
    EXPECT_EQ(report.molarMeasurement.method, core::MeasurementMethod::PrincipalAxis);
    EXPECT_FALSE(report.pair.molar.detection.contour.empty());
    EXPECT_NEAR(report.molarMeasurement.widthMm, 8.0, 0.6);
    EXPECT_NEAR(report.premolarMeasurement.widthMm, 6.4, 0.6);
}

TEST_F(DetectorBackedAnalyzerTest, ResizedInputMapsBackToOriginalPixels) {
    config_.preprocessing.targetWidth = 500;
    std::vector<Detection> processed;
    for (const auto& detection : layoutDetections_) {
        processed.push_back(detection.scaled(0.5, 0.5));
    }
    DetectorBackedAnalyzer analyzer(std::make_shared<FixedDetector>(processed), config_);

    auto result = analyzer.analyze(input_, {});
    ASSERT_TRUE(result.has_value()) << result.error().toString();
    ASSERT_EQ(result->pairs.size(), 1u);
    EXPECT_DOUBLE_EQ(result->pairs[0].pair.molar.detection.box.x, 680.0);
    EXPECT_DOUBLE_EQ(result->pairs[0].molarMeasurement.widthMm, 8.0);
}

TEST_F(DetectorBackedAnalyzerTest, OptionsOverrideThresholdAndCalibration) {
    auto detector = std::make_shared<FixedDetector>(layoutDetections_);
    DetectorBackedAnalyzer analyzer(detector, config_);

    core::AnalysisOptions options;
    options.confidenceThreshold = 0.6;
    options.calibrationMmPerPixel = 0.2;

    auto result = analyzer.analyze(input_, options);
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(detector->lastThreshold(), 0.6);
    EXPECT_DOUBLE_EQ(result->calibrationMmPerPixel, 0.2);
    EXPECT_DOUBLE_EQ(result->pairs[0].molarMeasurement.widthMm, 16.0);
    EXPECT_TRUE(result->pairs[0].implausibleWidth);
}

TEST_F(DetectorBackedAnalyzerTest, WiderPremolarIsClamped) {
    std::vector<Detection> swapped = {
        makeDetection(690.0, 210.0, 80.0, 90.0),   // molar position, smaller
        makeDetection(500.0, 200.0, 100.0, 110.0)  // premolar position, larger
    };
    DetectorBackedAnalyzer analyzer(std::make_shared<FixedDetector>(swapped), config_);

    auto result = analyzer.analyze(input_, {});
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->pairs.size(), 1u);

    const auto& report = result->pairs[0];
    EXPECT_TRUE(report.sizeClamped);
    EXPECT_DOUBLE_EQ(report.rawPremolarWidthMm, 8.0);
    EXPECT_NEAR(report.premolarMeasurement.widthMm, 6.4 * 0.85, 1e-9);
    EXPECT_LE(report.premolarMeasurement.widthMm, report.molarMeasurement.widthMm);
    EXPECT_TRUE(hasWarningContaining(*result, "clamped"));
}

TEST_F(DetectorBackedAnalyzerTest, PremolarsPairedAtMostOnce) {
    std::vector<Detection> crowded = {
        makeDetection(680.0, 200.0, 100.0, 110.0, "tooth", 0.95),
        makeDetection(800.0, 200.0, 100.0, 110.0, "tooth", 0.90),
        makeDetection(510.0, 210.0, 80.0, 90.0, "tooth", 0.90)
    };
    DetectorBackedAnalyzer analyzer(std::make_shared<FixedDetector>(crowded), config_);

    auto result = analyzer.analyze(input_, {});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->pairs.size(), 1u);
    EXPECT_EQ(result->unpairedMolars, 1u);
}

TEST_F(DetectorBackedAnalyzerTest, RepeatedRequestsAreIdentical) {
    DetectorBackedAnalyzer analyzer(std::make_shared<FixedDetector>(layoutDetections_),
                                    config_);

    auto first = analyzer.analyze(input_, {});
    auto second = analyzer.analyze(input_, {});
    ASSERT_TRUE(first && second);
    ASSERT_EQ(first->pairs.size(), second->pairs.size());
    EXPECT_DOUBLE_EQ(first->pairs[0].widthDifference.valueMm,
                     second->pairs[0].widthDifference.valueMm);
    EXPECT_EQ(first->clinicalRecommendations, second->clinicalRecommendations);
}

// =============================================================================
// Empty results
// =============================================================================

TEST_F(DetectorBackedAnalyzerTest, NoDetectionsIsEmptySuccess) {
    DetectorBackedAnalyzer analyzer(std::make_shared<FixedDetector>(std::vector<Detection>{}),
                                    config_);

    auto result = analyzer.analyze(input_, {});
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->isEmpty());
    EXPECT_EQ(result->emptyReason, EmptyReason::NoDetections);
    EXPECT_EQ(result->clinicalRecommendations.front(), "Insufficient detections for analysis");
}

TEST_F(DetectorBackedAnalyzerTest, OnlyMolarsIsNoEligibleTeeth) {
    std::vector<Detection> molars = {makeDetection(800.0, 200.0, 100.0, 110.0)};
    DetectorBackedAnalyzer analyzer(std::make_shared<FixedDetector>(molars), config_);

    auto result = analyzer.analyze(input_, {});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->emptyReason, EmptyReason::NoEligibleTeeth);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(DetectorBackedAnalyzerTest, CorruptImageIsDecodeError) {
    DetectorBackedAnalyzer analyzer(std::make_shared<FixedDetector>(layoutDetections_),
                                    config_);

    auto result = analyzer.analyze({"broken.png", std::vector<uint8_t>(64, 0x17)}, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, core::AnalysisError::Code::ImageDecodeError);
}

TEST_F(DetectorBackedAnalyzerTest, MissingDetectorIsUnavailable) {
    DetectorBackedAnalyzer analyzer(nullptr, config_);

    auto result = analyzer.analyze(input_, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, core::AnalysisError::Code::DetectorUnavailable);
    EXPECT_TRUE(result.error().isRetryable());
}

TEST_F(DetectorBackedAnalyzerTest, DetectorFailureIsUnavailable) {
    DetectorBackedAnalyzer analyzer(
        std::make_shared<FailingDetector>(DetectorError::Code::InferenceFailed), config_);

    auto result = analyzer.analyze(input_, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, core::AnalysisError::Code::DetectorUnavailable);
}

TEST_F(DetectorBackedAnalyzerTest, ZeroCalibrationIsMisconfigured) {
    auto detector = std::make_shared<FixedDetector>(layoutDetections_);
    DetectorBackedAnalyzer analyzer(detector, config_);

    core::AnalysisOptions options;
    options.calibrationMmPerPixel = 0.0;

    auto result = analyzer.analyze(input_, options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, core::AnalysisError::Code::CalibrationMisconfigured);
    EXPECT_EQ(detector->calls(), 0);
}

TEST_F(DetectorBackedAnalyzerTest, PastDeadlineIsTimeout) {
    auto detector = std::make_shared<FixedDetector>(layoutDetections_);
    DetectorBackedAnalyzer analyzer(detector, config_);

    core::AnalysisOptions options;
    options.deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);

    auto result = analyzer.analyze(input_, options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, core::AnalysisError::Code::Timeout);
    EXPECT_EQ(detector->calls(), 0);
}

TEST_F(DetectorBackedAnalyzerTest, SlowDetectorMissesDeadline) {
    auto detector = std::make_shared<SlowDetector>(std::chrono::milliseconds(200),
                                                   layoutDetections_);
    DetectorBackedAnalyzer analyzer(detector, config_);

    core::AnalysisOptions options;
    options.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(100);

    auto result = analyzer.analyze(input_, options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, core::AnalysisError::Code::Timeout);
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_F(DetectorBackedAnalyzerTest, InferenceSlotsBoundDetectorConcurrency) {
    config_.inferenceSlots = 1;
    auto detector = std::make_shared<SlowDetector>(std::chrono::milliseconds(30),
                                                   layoutDetections_);
    DetectorBackedAnalyzer analyzer(detector, config_);

    std::vector<std::thread> threads;
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([&]() {
            auto result = analyzer.analyze(input_, {});
            EXPECT_TRUE(result.has_value());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(detector->calls(), 3);
    EXPECT_EQ(detector->peakConcurrency(), 1);
}

TEST_F(DetectorBackedAnalyzerTest, UnsafeDetectorIsSerialized) {
    config_.inferenceSlots = 4;
    auto detector = std::make_shared<SlowDetector>(std::chrono::milliseconds(30),
                                                   layoutDetections_, false);
    DetectorBackedAnalyzer analyzer(detector, config_);
    EXPECT_EQ(analyzer.name(), "DetectorBackedAnalyzer(Serialized(SlowDetector))");

    std::vector<std::thread> threads;
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([&]() {
            auto result = analyzer.analyze(input_, {});
            EXPECT_TRUE(result.has_value());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(detector->peakConcurrency(), 1);
}

}  // anonymous namespace
}  // namespace dentescope::services
