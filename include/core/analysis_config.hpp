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

/**
 * @file analysis_config.hpp
 * @brief Injectable configuration for the radiograph analysis pipeline
 * @details Collects every tunable of the pipeline in one place: detector
 *          thresholds, calibration, anatomical region fractions, the width
 *          clamp policy, preprocessing parameters and the clinical
 *          significance table. Configurations are persisted as JSON.
 *
 * ## Thread Safety
 * - AnalysisConfig is a value type; analyzers copy it at construction and
 *   never mutate it afterwards, so it may be shared freely between threads.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/analysis_error.hpp"
#include "core/logging.hpp"

#include <array>
#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace dentescope::core {

/// Radiograph acquisition type, selects anatomical and calibration presets
enum class ScanType {
    Panoramic,
    Intraoral
};

/// Which side of the image is posterior (distal) in horizontal fractions
enum class SideConvention {
    PosteriorRight,  ///< fraction = x / width
    PosteriorLeft,   ///< fraction = 1 - x / width
    MidlineOut       ///< fraction = |x - width/2| / (width/2), full-arch panoramic
};

/// Width measurement strategy
enum class MeasurementMethod {
    BoundingBox,
    PrincipalAxis,
    Landmark       ///< Two operator-placed edge points; never a pipeline setting
};

/// Denoising filter applied after contrast enhancement
enum class DenoiseMethod {
    None,
    Median,
    Bilateral
};

/// Quantity compared against the clinical band thresholds
enum class ClassificationBasis {
    ValueMm,     ///< |value_mm| only
    Percentage,  ///< |percentage| only
    Either       ///< band applies when either threshold is exceeded
};

/// Clinical severity, ordered from least to most severe
enum class Severity {
    Normal = 0,
    Moderate = 1,
    Significant = 2,
    HighlySignificant = 3
};

/// Closed interval of normalized image coordinates
struct FractionRange {
    double min = 0.0;
    double max = 1.0;

    [[nodiscard]] bool contains(double value) const noexcept {
        return value >= min && value <= max;
    }

    [[nodiscard]] double center() const noexcept {
        return (min + max) * 0.5;
    }

    [[nodiscard]] bool isValid() const noexcept {
        return min >= 0.0 && max <= 1.0 && min <= max;
    }
};

/**
 * @brief Anatomical priors used by classification, pairing and measurement
 *
 * Defaults describe a panoramic radiograph oriented with the posterior
 * region of the imaged quadrant towards the right edge.
 */
struct AnatomicalConfig {
    /// Horizontal band where primary second molars are expected
    FractionRange molarHorizontal{0.55, 0.90};

    /// Horizontal band where second premolars are expected
    FractionRange premolarHorizontal{0.35, 0.75};

    /// Vertical dental-arch band for primary molars
    FractionRange molarVertical{0.25, 0.75};

    /// Vertical band for premolars (overlaps the molar band)
    FractionRange premolarVertical{0.35, 0.80};

    SideConvention sideConvention = SideConvention::PosteriorRight;

    /// Let detector class labels resolve band ties
    bool useDetectorLabels = true;

    /// Demote molar candidates that are small relative to the other detections
    bool enforceRelativeSize = true;

    /// Minimum area percentile (0-1] a molar candidate must reach
    double molarMinAreaPercentile = 0.35;

    /// Post-hoc confidence bonus for detections inside their band
    double positionalBonus = 0.10;

    /// Clamp premolar width when it exceeds the paired molar width
    bool premolarClampEnabled = true;

    /// Clamped premolar width = molar width * ratio
    double premolarClampRatio = 0.85;

    /// Maximum centroid distance for a pair in pixels, 0 disables the check
    double maxPairDistancePx = 0.0;

    /// Plausible mesiodistal width range in mm, outside values raise warnings
    double minWidthMm = 2.0;
    double maxWidthMm = 15.0;

    [[nodiscard]] static AnatomicalConfig forScanType(ScanType scanType);
};

/**
 * @brief Preprocessing filter parameters
 */
struct PreprocessingParameters {
    /// CLAHE clip limit (0.1 - 10.0)
    double claheClipLimit = 2.0;

    /// CLAHE tile size in pixels (1 - 64)
    unsigned int claheTileSize = 8;

    DenoiseMethod denoise = DenoiseMethod::Bilateral;

    /// Bilateral spatial sigma in pixels
    double bilateralDomainSigma = 2.0;

    /// Bilateral intensity sigma on the 0-255 scale
    double bilateralRangeSigma = 40.0;

    /// Median filter radius in pixels
    unsigned int medianRadius = 1;

    /// Resize to this width keeping the aspect ratio, 0 keeps the original size
    unsigned int targetWidth = 0;

    [[nodiscard]] bool isValid() const noexcept {
        if (claheClipLimit < 0.1 || claheClipLimit > 10.0) {
            return false;
        }
        if (claheTileSize < 1 || claheTileSize > 64) {
            return false;
        }
        if (bilateralDomainSigma <= 0.0 || bilateralRangeSigma <= 0.0) {
            return false;
        }
        return true;
    }
};

/**
 * @brief One row of the clinical significance table
 */
struct SignificanceBand {
    Severity severity = Severity::Normal;
    std::string label;
    double minValueMm = 0.0;     ///< band applies when |value_mm| > minValueMm
    double minPercentage = 0.0;  ///< band applies when |percentage| > minPercentage
};

/**
 * @brief Clinical significance table, rows ordered from most to least severe
 */
struct ClinicalBandTable {
    ClassificationBasis basis = ClassificationBasis::ValueMm;

    std::vector<SignificanceBand> bands = {
        {Severity::HighlySignificant, "Highly Significant", 3.0, 25.0},
        {Severity::Significant, "Significant", 2.0, 15.0},
        {Severity::Moderate, "Moderate", 1.0, 8.0},
    };

    std::string normalLabel = "Normal";

    /// Clinical leeway reference range for value_mm
    double normalRangeMinMm = 2.0;
    double normalRangeMaxMm = 2.8;

    /// Rows strictly decrease in severity and never increase in thresholds
    [[nodiscard]] bool isMonotonic() const noexcept;
};

/**
 * @brief Per-request overrides merged on top of AnalysisConfig
 */
struct AnalysisOptions {
    std::optional<double> confidenceThreshold;
    std::optional<double> calibrationMmPerPixel;
    std::optional<double> magnificationFactor;
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

/**
 * @brief Error information for configuration persistence
 */
struct ConfigError {
    enum class Code {
        Success,
        FileNotFound,
        FileAccessDenied,
        InvalidJson,
        InvalidValue
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::FileNotFound: return "File not found: " + message;
            case Code::FileAccessDenied: return "File access denied: " + message;
            case Code::InvalidJson: return "Invalid JSON: " + message;
            case Code::InvalidValue: return "Invalid value: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Complete pipeline configuration
 *
 * @example
 * @code
 * auto config = AnalysisConfig::loadFromFile("dentescope.json");
 * if (!config) {
 *     std::cerr << config.error().toString() << std::endl;
 * }
 * if (auto valid = config->validate(); !valid) {
 *     // CalibrationMisconfigured / InvalidConfiguration
 * }
 * @endcode
 */
struct AnalysisConfig {
    /// Detections below this confidence are discarded by the detector
    double confidenceThreshold = 0.25;

    /// IoU threshold forwarded to the detector's non-max suppression
    double iouThreshold = 0.45;

    /// Pixel size of the radiograph in mm
    double calibrationMmPerPixel = 0.1;

    /// Panoramic geometric magnification compensation
    double magnificationFactor = 1.25;

    MeasurementMethod measurementMethod = MeasurementMethod::PrincipalAxis;

    ScanType scanType = ScanType::Panoramic;

    AnatomicalConfig anatomy;

    ClinicalBandTable bands;

    PreprocessingParameters preprocessing;

    /// Deadline applied to a request when the caller supplies none
    std::chrono::milliseconds timeout{300000};

    /// Concurrent detector invocations allowed, 0 = hardware concurrency
    unsigned int inferenceSlots = 0;

    logging::LogConfig logging;

    /// Presets for a scan type (anatomical bands and calibration)
    [[nodiscard]] static AnalysisConfig forScanType(ScanType scanType);

    /**
     * @brief Check the configuration before any image is processed
     * @return CalibrationMisconfigured for non-positive calibration or
     *         magnification, InvalidConfiguration for other inconsistencies
     */
    [[nodiscard]] std::expected<void, AnalysisError> validate() const;

    /// Copy with per-request overrides applied
    [[nodiscard]] AnalysisConfig withOverrides(const AnalysisOptions& options) const;

    /// Effective inference slot count (never 0)
    [[nodiscard]] unsigned int effectiveInferenceSlots() const noexcept;

    [[nodiscard]] nlohmann::json toJson() const;

    /// Missing keys keep their default values
    [[nodiscard]] static std::expected<AnalysisConfig, ConfigError>
    fromJson(const nlohmann::json& json);

    [[nodiscard]] static std::expected<AnalysisConfig, ConfigError>
    loadFromFile(const std::filesystem::path& filePath);

    [[nodiscard]] std::expected<void, ConfigError>
    saveToFile(const std::filesystem::path& filePath) const;
};

[[nodiscard]] std::string toString(ScanType scanType);
[[nodiscard]] std::string toString(SideConvention convention);
[[nodiscard]] std::string toString(MeasurementMethod method);
[[nodiscard]] std::string toString(DenoiseMethod method);
[[nodiscard]] std::string toString(ClassificationBasis basis);
[[nodiscard]] std::string toString(Severity severity);

}  // namespace dentescope::core
