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

#include <algorithm>
#include <cstdint>
#include <format>
#include <fstream>
#include <thread>

#include <nlohmann/json.hpp>

namespace dentescope::core {

using json = nlohmann::json;

namespace {

// =============================================================================
// Enum <-> string helpers
// =============================================================================

template <typename Enum, size_t N>
std::optional<Enum> enumFromString(const std::string& text,
                                   const std::array<Enum, N>& values) {
    for (Enum value : values) {
        if (toString(value) == text) {
            return value;
        }
    }
    return std::nullopt;
}

constexpr std::array kScanTypes = {ScanType::Panoramic, ScanType::Intraoral};
constexpr std::array kSideConventions = {
    SideConvention::PosteriorRight, SideConvention::PosteriorLeft, SideConvention::MidlineOut};
// Landmark needs operator input and is not selectable for the pipeline
constexpr std::array kMeasurementMethods = {
    MeasurementMethod::BoundingBox, MeasurementMethod::PrincipalAxis};
constexpr std::array kDenoiseMethods = {
    DenoiseMethod::None, DenoiseMethod::Median, DenoiseMethod::Bilateral};
constexpr std::array kBases = {
    ClassificationBasis::ValueMm, ClassificationBasis::Percentage, ClassificationBasis::Either};
constexpr std::array kSeverities = {
    Severity::Normal, Severity::Moderate, Severity::Significant, Severity::HighlySignificant};

json rangeToJson(const FractionRange& range) {
    return json::array({range.min, range.max});
}

FractionRange jsonToRange(const json& j, const FractionRange& fallback) {
    if (j.is_array() && j.size() >= 2) {
        return FractionRange{j[0].get<double>(), j[1].get<double>()};
    }
    return fallback;
}

json anatomyToJson(const AnatomicalConfig& a) {
    return {
        {"molar_horizontal", rangeToJson(a.molarHorizontal)},
        {"premolar_horizontal", rangeToJson(a.premolarHorizontal)},
        {"molar_vertical", rangeToJson(a.molarVertical)},
        {"premolar_vertical", rangeToJson(a.premolarVertical)},
        {"side_convention", toString(a.sideConvention)},
        {"use_detector_labels", a.useDetectorLabels},
        {"enforce_relative_size", a.enforceRelativeSize},
        {"molar_min_area_percentile", a.molarMinAreaPercentile},
        {"positional_bonus", a.positionalBonus},
        {"premolar_clamp_enabled", a.premolarClampEnabled},
        {"premolar_clamp_ratio", a.premolarClampRatio},
        {"max_pair_distance_px", a.maxPairDistancePx},
        {"min_width_mm", a.minWidthMm},
        {"max_width_mm", a.maxWidthMm}
    };
}

std::expected<AnatomicalConfig, ConfigError>
jsonToAnatomy(const json& j, AnatomicalConfig a) {
    a.molarHorizontal = jsonToRange(j.value("molar_horizontal", json()), a.molarHorizontal);
    a.premolarHorizontal =
        jsonToRange(j.value("premolar_horizontal", json()), a.premolarHorizontal);
    a.molarVertical = jsonToRange(j.value("molar_vertical", json()), a.molarVertical);
    a.premolarVertical = jsonToRange(j.value("premolar_vertical", json()), a.premolarVertical);

    if (j.contains("side_convention")) {
        auto text = j["side_convention"].get<std::string>();
        auto convention = enumFromString(text, kSideConventions);
        if (!convention) {
            return std::unexpected(ConfigError{
                ConfigError::Code::InvalidValue,
                "Unknown side_convention '" + text + "'"
            });
        }
        a.sideConvention = *convention;
    }

    a.useDetectorLabels = j.value("use_detector_labels", a.useDetectorLabels);
    a.enforceRelativeSize = j.value("enforce_relative_size", a.enforceRelativeSize);
    a.molarMinAreaPercentile = j.value("molar_min_area_percentile", a.molarMinAreaPercentile);
    a.positionalBonus = j.value("positional_bonus", a.positionalBonus);
    a.premolarClampEnabled = j.value("premolar_clamp_enabled", a.premolarClampEnabled);
    a.premolarClampRatio = j.value("premolar_clamp_ratio", a.premolarClampRatio);
    a.maxPairDistancePx = j.value("max_pair_distance_px", a.maxPairDistancePx);
    a.minWidthMm = j.value("min_width_mm", a.minWidthMm);
    a.maxWidthMm = j.value("max_width_mm", a.maxWidthMm);
    return a;
}

json preprocessingToJson(const PreprocessingParameters& p) {
    return {
        {"clahe_clip_limit", p.claheClipLimit},
        {"clahe_tile_size", p.claheTileSize},
        {"denoise", toString(p.denoise)},
        {"bilateral_domain_sigma", p.bilateralDomainSigma},
        {"bilateral_range_sigma", p.bilateralRangeSigma},
        {"median_radius", p.medianRadius},
        {"target_width", p.targetWidth}
    };
}

std::expected<PreprocessingParameters, ConfigError>
jsonToPreprocessing(const json& j, PreprocessingParameters p) {
    p.claheClipLimit = j.value("clahe_clip_limit", p.claheClipLimit);
    p.claheTileSize = j.value("clahe_tile_size", p.claheTileSize);
    if (j.contains("denoise")) {
        auto text = j["denoise"].get<std::string>();
        auto method = enumFromString(text, kDenoiseMethods);
        if (!method) {
            return std::unexpected(ConfigError{
                ConfigError::Code::InvalidValue,
                "Unknown denoise method '" + text + "'"
            });
        }
        p.denoise = *method;
    }
    p.bilateralDomainSigma = j.value("bilateral_domain_sigma", p.bilateralDomainSigma);
    p.bilateralRangeSigma = j.value("bilateral_range_sigma", p.bilateralRangeSigma);
    p.medianRadius = j.value("median_radius", p.medianRadius);
    p.targetWidth = j.value("target_width", p.targetWidth);
    return p;
}

json bandsToJson(const ClinicalBandTable& table) {
    json rows = json::array();
    for (const auto& band : table.bands) {
        rows.push_back({
            {"severity", toString(band.severity)},
            {"label", band.label},
            {"min_value_mm", band.minValueMm},
            {"min_percentage", band.minPercentage}
        });
    }
    return {
        {"basis", toString(table.basis)},
        {"bands", rows},
        {"normal_label", table.normalLabel},
        {"normal_range_mm", json::array({table.normalRangeMinMm, table.normalRangeMaxMm})}
    };
}

std::expected<ClinicalBandTable, ConfigError>
jsonToBands(const json& j, ClinicalBandTable table) {
    if (j.contains("basis")) {
        auto text = j["basis"].get<std::string>();
        auto basis = enumFromString(text, kBases);
        if (!basis) {
            return std::unexpected(ConfigError{
                ConfigError::Code::InvalidValue,
                "Unknown classification basis '" + text + "'"
            });
        }
        table.basis = *basis;
    }

    if (j.contains("bands") && j["bands"].is_array()) {
        table.bands.clear();
        for (const auto& row : j["bands"]) {
            auto text = row.value("severity", std::string{});
            auto severity = enumFromString(text, kSeverities);
            if (!severity || *severity == Severity::Normal) {
                return std::unexpected(ConfigError{
                    ConfigError::Code::InvalidValue,
                    "Invalid band severity '" + text + "'"
                });
            }
            table.bands.push_back(SignificanceBand{
                *severity,
                row.value("label", toString(*severity)),
                row.value("min_value_mm", 0.0),
                row.value("min_percentage", 0.0)
            });
        }
    }

    table.normalLabel = j.value("normal_label", table.normalLabel);
    if (j.contains("normal_range_mm")) {
        const auto& range = j["normal_range_mm"];
        if (range.is_array() && range.size() >= 2) {
            table.normalRangeMinMm = range[0].get<double>();
            table.normalRangeMaxMm = range[1].get<double>();
        }
    }
    return table;
}

}  // anonymous namespace

// =============================================================================
// String conversions
// =============================================================================

std::string toString(ScanType scanType) {
    switch (scanType) {
        case ScanType::Panoramic: return "panoramic";
        case ScanType::Intraoral: return "intraoral";
    }
    return "panoramic";
}

std::string toString(SideConvention convention) {
    switch (convention) {
        case SideConvention::PosteriorRight: return "posterior_right";
        case SideConvention::PosteriorLeft: return "posterior_left";
        case SideConvention::MidlineOut: return "midline_out";
    }
    return "posterior_right";
}

std::string toString(MeasurementMethod method) {
    switch (method) {
        case MeasurementMethod::BoundingBox: return "bounding_box";
        case MeasurementMethod::PrincipalAxis: return "principal_axis";
        case MeasurementMethod::Landmark: return "landmark";
    }
    return "bounding_box";
}

std::string toString(DenoiseMethod method) {
    switch (method) {
        case DenoiseMethod::None: return "none";
        case DenoiseMethod::Median: return "median";
        case DenoiseMethod::Bilateral: return "bilateral";
    }
    return "none";
}

std::string toString(ClassificationBasis basis) {
    switch (basis) {
        case ClassificationBasis::ValueMm: return "value_mm";
        case ClassificationBasis::Percentage: return "percentage";
        case ClassificationBasis::Either: return "either";
    }
    return "value_mm";
}

std::string toString(Severity severity) {
    switch (severity) {
        case Severity::Normal: return "normal";
        case Severity::Moderate: return "moderate";
        case Severity::Significant: return "significant";
        case Severity::HighlySignificant: return "highly_significant";
    }
    return "normal";
}

// =============================================================================
// AnatomicalConfig / ClinicalBandTable
// =============================================================================

AnatomicalConfig AnatomicalConfig::forScanType(ScanType scanType) {
    AnatomicalConfig config;
    if (scanType == ScanType::Intraoral) {
        // Intraoral films frame fewer teeth, the arch fills most of the height
        config.molarVertical = {0.10, 0.90};
        config.premolarVertical = {0.10, 0.90};
    }
    return config;
}

bool ClinicalBandTable::isMonotonic() const noexcept {
    for (size_t i = 1; i < bands.size(); ++i) {
        const auto& prev = bands[i - 1];
        const auto& cur = bands[i];
        if (static_cast<int>(cur.severity) >= static_cast<int>(prev.severity)) {
            return false;
        }
        if (cur.minValueMm > prev.minValueMm || cur.minPercentage > prev.minPercentage) {
            return false;
        }
    }
    for (const auto& band : bands) {
        if (band.severity == Severity::Normal) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// AnalysisConfig
// =============================================================================

AnalysisConfig AnalysisConfig::forScanType(ScanType scanType) {
    AnalysisConfig config;
    config.scanType = scanType;
    config.anatomy = AnatomicalConfig::forScanType(scanType);
    config.calibrationMmPerPixel = (scanType == ScanType::Intraoral) ? 0.05 : 0.1;
    return config;
}

std::expected<void, AnalysisError> AnalysisConfig::validate() const {
    if (!(calibrationMmPerPixel > 0.0)) {
        return std::unexpected(AnalysisError{
            AnalysisError::Code::CalibrationMisconfigured,
            std::format("calibration_mm_per_pixel must be positive (got {})",
                        calibrationMmPerPixel)
        });
    }
    if (!(magnificationFactor > 0.0)) {
        return std::unexpected(AnalysisError{
            AnalysisError::Code::CalibrationMisconfigured,
            std::format("magnification_factor must be positive (got {})",
                        magnificationFactor)
        });
    }
    if (confidenceThreshold < 0.0 || confidenceThreshold > 1.0 ||
        iouThreshold < 0.0 || iouThreshold > 1.0) {
        return std::unexpected(AnalysisError{
            AnalysisError::Code::InvalidConfiguration,
            "confidence and IoU thresholds must lie in [0, 1]"
        });
    }
    if (!anatomy.molarHorizontal.isValid() || !anatomy.premolarHorizontal.isValid() ||
        !anatomy.molarVertical.isValid() || !anatomy.premolarVertical.isValid()) {
        return std::unexpected(AnalysisError{
            AnalysisError::Code::InvalidConfiguration,
            "anatomical bands must be ordered fractions within [0, 1]"
        });
    }
    if (anatomy.premolarClampRatio <= 0.0 || anatomy.premolarClampRatio > 1.0) {
        return std::unexpected(AnalysisError{
            AnalysisError::Code::InvalidConfiguration,
            "premolar_clamp_ratio must lie in (0, 1]"
        });
    }
    if (anatomy.molarMinAreaPercentile < 0.0 || anatomy.molarMinAreaPercentile > 1.0 ||
        anatomy.positionalBonus < 0.0 || anatomy.positionalBonus > 1.0 ||
        anatomy.maxPairDistancePx < 0.0 || anatomy.minWidthMm > anatomy.maxWidthMm) {
        return std::unexpected(AnalysisError{
            AnalysisError::Code::InvalidConfiguration,
            "anatomical limits out of range"
        });
    }
    if (!bands.isMonotonic()) {
        return std::unexpected(AnalysisError{
            AnalysisError::Code::InvalidConfiguration,
            "clinical band table must be ordered by decreasing severity and thresholds"
        });
    }
    if (!preprocessing.isValid()) {
        return std::unexpected(AnalysisError{
            AnalysisError::Code::InvalidConfiguration,
            "preprocessing parameters out of range: check clahe_clip_limit (0.1-10.0), "
            "clahe_tile_size (1-64), bilateral sigmas (> 0)"
        });
    }
    if (timeout.count() <= 0) {
        return std::unexpected(AnalysisError{
            AnalysisError::Code::InvalidConfiguration,
            "timeout must be positive"
        });
    }
    return {};
}

AnalysisConfig AnalysisConfig::withOverrides(const AnalysisOptions& options) const {
    AnalysisConfig merged = *this;
    if (options.confidenceThreshold) {
        merged.confidenceThreshold = *options.confidenceThreshold;
    }
    if (options.calibrationMmPerPixel) {
        merged.calibrationMmPerPixel = *options.calibrationMmPerPixel;
    }
    if (options.magnificationFactor) {
        merged.magnificationFactor = *options.magnificationFactor;
    }
    return merged;
}

unsigned int AnalysisConfig::effectiveInferenceSlots() const noexcept {
    if (inferenceSlots > 0) {
        return inferenceSlots;
    }
    return std::max(1u, std::thread::hardware_concurrency());
}

json AnalysisConfig::toJson() const {
    return {
        {"confidence_threshold", confidenceThreshold},
        {"iou_threshold", iouThreshold},
        {"calibration_mm_per_pixel", calibrationMmPerPixel},
        {"magnification_factor", magnificationFactor},
        {"measurement_method", toString(measurementMethod)},
        {"scan_type", toString(scanType)},
        {"anatomy", anatomyToJson(anatomy)},
        {"clinical_bands", bandsToJson(bands)},
        {"preprocessing", preprocessingToJson(preprocessing)},
        {"timeout_ms", timeout.count()},
        {"inference_slots", inferenceSlots},
        {"logging", {
            {"level", logging::toString(logging.level)},
            {"file_logging", logging.enableFileLogging},
            {"log_directory", logging.logDirectory.string()},
            {"file_name", logging.fileName}
        }}
    };
}

std::expected<AnalysisConfig, ConfigError> AnalysisConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidJson,
            "Configuration root must be an object"
        });
    }

    try {
        // Scan type first: its presets are the base the other keys override
        AnalysisConfig config;
        if (j.contains("scan_type")) {
            auto text = j["scan_type"].get<std::string>();
            auto scanType = enumFromString(text, kScanTypes);
            if (!scanType) {
                return std::unexpected(ConfigError{
                    ConfigError::Code::InvalidValue,
                    "Unknown scan_type '" + text + "'"
                });
            }
            config = forScanType(*scanType);
        }

        config.confidenceThreshold = j.value("confidence_threshold", config.confidenceThreshold);
        config.iouThreshold = j.value("iou_threshold", config.iouThreshold);
        config.calibrationMmPerPixel =
            j.value("calibration_mm_per_pixel", config.calibrationMmPerPixel);
        config.magnificationFactor = j.value("magnification_factor", config.magnificationFactor);

        if (j.contains("measurement_method")) {
            auto text = j["measurement_method"].get<std::string>();
            auto method = enumFromString(text, kMeasurementMethods);
            if (!method) {
                return std::unexpected(ConfigError{
                    ConfigError::Code::InvalidValue,
                    "Unknown measurement_method '" + text + "'"
                });
            }
            config.measurementMethod = *method;
        }

        if (j.contains("anatomy")) {
            auto anatomy = jsonToAnatomy(j["anatomy"], config.anatomy);
            if (!anatomy) {
                return std::unexpected(anatomy.error());
            }
            config.anatomy = *anatomy;
        }

        if (j.contains("clinical_bands")) {
            auto bands = jsonToBands(j["clinical_bands"], config.bands);
            if (!bands) {
                return std::unexpected(bands.error());
            }
            config.bands = *bands;
        }

        if (j.contains("preprocessing")) {
            auto preprocessing = jsonToPreprocessing(j["preprocessing"], config.preprocessing);
            if (!preprocessing) {
                return std::unexpected(preprocessing.error());
            }
            config.preprocessing = *preprocessing;
        }

        config.timeout = std::chrono::milliseconds(
            j.value("timeout_ms", static_cast<int64_t>(config.timeout.count())));
        config.inferenceSlots = j.value("inference_slots", config.inferenceSlots);

        if (j.contains("logging")) {
            const auto& log = j["logging"];
            if (log.contains("level")) {
                config.logging.level = logging::parseLogLevel(log["level"].get<std::string>());
            }
            config.logging.enableFileLogging =
                log.value("file_logging", config.logging.enableFileLogging);
            if (log.contains("log_directory")) {
                config.logging.logDirectory = log["log_directory"].get<std::string>();
            }
            config.logging.fileName = log.value("file_name", config.logging.fileName);
        }

        return config;
    } catch (const json::exception& e) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            std::string("Type mismatch: ") + e.what()
        });
    }
}

std::expected<AnalysisConfig, ConfigError>
AnalysisConfig::loadFromFile(const std::filesystem::path& filePath) {
    if (!std::filesystem::exists(filePath)) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileNotFound,
            filePath.string()
        });
    }

    std::ifstream file(filePath);
    if (!file.is_open()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileAccessDenied,
            filePath.string()
        });
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidJson,
            e.what()
        });
    }

    return fromJson(j);
}

std::expected<void, ConfigError>
AnalysisConfig::saveToFile(const std::filesystem::path& filePath) const {
    std::ofstream file(filePath);
    if (!file.is_open()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileAccessDenied,
            filePath.string()
        });
    }

    file << toJson().dump(2);
    if (!file.good()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileAccessDenied,
            "Failed to write " + filePath.string()
        });
    }
    return {};
}

}  // namespace dentescope::core
