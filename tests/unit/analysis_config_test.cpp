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

#include "core/analysis_config.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

namespace dentescope::core {
namespace {

class AnalysisConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "dentescope_config_test";
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    std::filesystem::path tempDir_;
};

// =============================================================================
// Defaults
// =============================================================================

TEST_F(AnalysisConfigTest, DefaultsMatchPanoramicPreset) {
    AnalysisConfig config;

    EXPECT_DOUBLE_EQ(config.confidenceThreshold, 0.25);
    EXPECT_DOUBLE_EQ(config.iouThreshold, 0.45);
    EXPECT_DOUBLE_EQ(config.calibrationMmPerPixel, 0.1);
    EXPECT_DOUBLE_EQ(config.magnificationFactor, 1.25);
    EXPECT_EQ(config.measurementMethod, MeasurementMethod::PrincipalAxis);
    EXPECT_EQ(config.scanType, ScanType::Panoramic);
    EXPECT_EQ(config.timeout, std::chrono::milliseconds(300000));
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(AnalysisConfigTest, AnatomicalDefaults) {
    AnatomicalConfig anatomy;

    EXPECT_DOUBLE_EQ(anatomy.molarHorizontal.min, 0.55);
    EXPECT_DOUBLE_EQ(anatomy.molarHorizontal.max, 0.90);
    EXPECT_DOUBLE_EQ(anatomy.premolarHorizontal.min, 0.35);
    EXPECT_DOUBLE_EQ(anatomy.premolarHorizontal.max, 0.75);
    EXPECT_EQ(anatomy.sideConvention, SideConvention::PosteriorRight);
    EXPECT_TRUE(anatomy.premolarClampEnabled);
    EXPECT_DOUBLE_EQ(anatomy.premolarClampRatio, 0.85);
    EXPECT_DOUBLE_EQ(anatomy.maxPairDistancePx, 0.0);
}

TEST_F(AnalysisConfigTest, IntraoralPresetWidensVerticalBands) {
    auto config = AnalysisConfig::forScanType(ScanType::Intraoral);

    EXPECT_EQ(config.scanType, ScanType::Intraoral);
    EXPECT_DOUBLE_EQ(config.calibrationMmPerPixel, 0.05);
    EXPECT_DOUBLE_EQ(config.anatomy.molarVertical.min, 0.10);
    EXPECT_DOUBLE_EQ(config.anatomy.molarVertical.max, 0.90);
    EXPECT_DOUBLE_EQ(config.anatomy.premolarVertical.min, 0.10);
    EXPECT_DOUBLE_EQ(config.anatomy.premolarVertical.max, 0.90);
}

TEST_F(AnalysisConfigTest, DefaultBandTableIsMonotonic) {
    ClinicalBandTable table;

    ASSERT_EQ(table.bands.size(), 3u);
    EXPECT_EQ(table.basis, ClassificationBasis::ValueMm);
    EXPECT_TRUE(table.isMonotonic());

    std::swap(table.bands[0], table.bands[2]);
    EXPECT_FALSE(table.isMonotonic());
}

TEST_F(AnalysisConfigTest, EffectiveInferenceSlotsNeverZero) {
    AnalysisConfig config;
    config.inferenceSlots = 0;
    EXPECT_GE(config.effectiveInferenceSlots(), 1u);

    config.inferenceSlots = 3;
    EXPECT_EQ(config.effectiveInferenceSlots(), 3u);
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(AnalysisConfigTest, NonPositiveCalibrationIsMisconfigured) {
    AnalysisConfig config;
    config.calibrationMmPerPixel = 0.0;

    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, AnalysisError::Code::CalibrationMisconfigured);

    config.calibrationMmPerPixel = -0.1;
    EXPECT_EQ(config.validate().error().code, AnalysisError::Code::CalibrationMisconfigured);
}

TEST_F(AnalysisConfigTest, NonPositiveMagnificationIsMisconfigured) {
    AnalysisConfig config;
    config.magnificationFactor = 0.0;

    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, AnalysisError::Code::CalibrationMisconfigured);
}

TEST_F(AnalysisConfigTest, ThresholdOutOfRangeIsInvalid) {
    AnalysisConfig config;
    config.confidenceThreshold = 1.5;

    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, AnalysisError::Code::InvalidConfiguration);
}

TEST_F(AnalysisConfigTest, InvertedBandIsInvalid) {
    AnalysisConfig config;
    config.anatomy.molarHorizontal = {0.9, 0.5};

    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, AnalysisError::Code::InvalidConfiguration);
}

TEST_F(AnalysisConfigTest, ClampRatioMustBeInUnitInterval) {
    AnalysisConfig config;
    config.anatomy.premolarClampRatio = 0.0;
    EXPECT_FALSE(config.validate().has_value());

    config.anatomy.premolarClampRatio = 1.2;
    EXPECT_FALSE(config.validate().has_value());

    config.anatomy.premolarClampRatio = 1.0;
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(AnalysisConfigTest, NonMonotonicBandTableIsInvalid) {
    AnalysisConfig config;
    config.bands.bands[1].minValueMm = 5.0;

    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, AnalysisError::Code::InvalidConfiguration);
}

// =============================================================================
// Overrides
// =============================================================================

TEST_F(AnalysisConfigTest, OverridesReplaceOnlyGivenValues) {
    AnalysisConfig config;
    AnalysisOptions options;
    options.calibrationMmPerPixel = 0.08;

    auto merged = config.withOverrides(options);
    EXPECT_DOUBLE_EQ(merged.calibrationMmPerPixel, 0.08);
    EXPECT_DOUBLE_EQ(merged.magnificationFactor, 1.25);
    EXPECT_DOUBLE_EQ(merged.confidenceThreshold, 0.25);
}

// =============================================================================
// JSON persistence
// =============================================================================

TEST_F(AnalysisConfigTest, JsonRoundTripPreservesValues) {
    AnalysisConfig config;
    config.calibrationMmPerPixel = 0.12;
    config.measurementMethod = MeasurementMethod::BoundingBox;
    config.anatomy.sideConvention = SideConvention::MidlineOut;
    config.anatomy.premolarClampEnabled = false;
    config.bands.basis = ClassificationBasis::Either;
    config.preprocessing.denoise = DenoiseMethod::Median;
    config.inferenceSlots = 2;

    auto restored = AnalysisConfig::fromJson(config.toJson());
    ASSERT_TRUE(restored.has_value()) << restored.error().toString();

    EXPECT_DOUBLE_EQ(restored->calibrationMmPerPixel, 0.12);
    EXPECT_EQ(restored->measurementMethod, MeasurementMethod::BoundingBox);
    EXPECT_EQ(restored->anatomy.sideConvention, SideConvention::MidlineOut);
    EXPECT_FALSE(restored->anatomy.premolarClampEnabled);
    EXPECT_EQ(restored->bands.basis, ClassificationBasis::Either);
    EXPECT_EQ(restored->preprocessing.denoise, DenoiseMethod::Median);
    EXPECT_EQ(restored->inferenceSlots, 2u);
    EXPECT_EQ(restored->bands.bands.size(), 3u);
}

TEST_F(AnalysisConfigTest, MissingKeysKeepDefaults) {
    auto restored = AnalysisConfig::fromJson(nlohmann::json{{"confidence_threshold", 0.4}});
    ASSERT_TRUE(restored.has_value());

    EXPECT_DOUBLE_EQ(restored->confidenceThreshold, 0.4);
    EXPECT_DOUBLE_EQ(restored->calibrationMmPerPixel, 0.1);
    EXPECT_DOUBLE_EQ(restored->anatomy.premolarClampRatio, 0.85);
}

TEST_F(AnalysisConfigTest, UnknownEnumValueIsRejected) {
    auto restored = AnalysisConfig::fromJson(nlohmann::json{{"measurement_method", "laser"}});
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code, ConfigError::Code::InvalidValue);
}

TEST_F(AnalysisConfigTest, LandmarkIsNotAPipelineMethod) {
    auto restored = AnalysisConfig::fromJson(nlohmann::json{{"measurement_method", "landmark"}});
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code, ConfigError::Code::InvalidValue);
}

TEST_F(AnalysisConfigTest, TypeMismatchIsRejected) {
    auto restored = AnalysisConfig::fromJson(nlohmann::json{{"calibration_mm_per_pixel", "x"}});
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code, ConfigError::Code::InvalidValue);
}

TEST_F(AnalysisConfigTest, SaveAndLoadFile) {
    AnalysisConfig config;
    config.magnificationFactor = 1.3;

    auto path = tempDir_ / "config.json";
    ASSERT_TRUE(config.saveToFile(path).has_value());

    auto loaded = AnalysisConfig::loadFromFile(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_DOUBLE_EQ(loaded->magnificationFactor, 1.3);
}

TEST_F(AnalysisConfigTest, LoadMissingFileFails) {
    auto loaded = AnalysisConfig::loadFromFile(tempDir_ / "missing.json");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ConfigError::Code::FileNotFound);
}

TEST_F(AnalysisConfigTest, LoadMalformedFileFails) {
    auto path = tempDir_ / "broken.json";
    std::ofstream(path) << "{ not json";

    auto loaded = AnalysisConfig::loadFromFile(path);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ConfigError::Code::InvalidJson);
}

}  // anonymous namespace
}  // namespace dentescope::core
