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

#include "services/export/result_serializer.hpp"

#include <QFile>
#include <QString>
#include <QTextStream>

#include <exception>

namespace dentescope::services {

using json = nlohmann::json;

namespace {

json boxToJson(const BoundingBox& box) {
    return {
        {"x", box.x},
        {"y", box.y},
        {"width", box.width},
        {"height", box.height}
    };
}

json toothToJson(const ClassifiedTooth& tooth, const Measurement& measurement) {
    return {
        {"class_label", tooth.detection.classLabel},
        {"width_mm", measurement.widthMm},
        {"width_px", measurement.widthPx},
        {"confidence", tooth.rawConfidence()},
        {"adjusted_confidence", tooth.adjustedConfidence()},
        {"bbox", boxToJson(tooth.detection.box)},
        {"measurement_method", core::toString(measurement.method)},
        {"fell_back", measurement.fellBack}
    };
}

json differenceToJson(const WidthDifferenceResult& difference) {
    return {
        {"value_mm", difference.valueMm},
        {"percentage", difference.percentage},
        {"clinical_significance", difference.clinicalSignificance},
        {"severity", core::toString(difference.severity)},
        {"within_normal_range", difference.withinNormalRange}
    };
}

json pairToJson(const PairReport& report) {
    json premolar = toothToJson(report.pair.premolar, report.premolarMeasurement);
    premolar["size_clamped"] = report.sizeClamped;
    premolar["size_constraint_violated"] = report.sizeConstraintViolated;
    premolar["raw_width_mm"] = report.rawPremolarWidthMm;

    return {
        {"primary_molar", toothToJson(report.pair.molar, report.molarMeasurement)},
        {"premolar", std::move(premolar)},
        {"width_difference", differenceToJson(report.widthDifference)},
        {"pair_confidence", report.pair.pairConfidence},
        {"centroid_distance_px", report.pair.centroidDistancePx},
        {"implausible_width", report.implausibleWidth}
    };
}

json qualityToJson(const ImageQuality& quality) {
    return {
        {"resolution", quality.resolution},
        {"brightness", quality.brightness},
        {"contrast", quality.contrast},
        {"sharpness", quality.sharpness}
    };
}

json summaryToJson(const BatchSummary& summary) {
    json counts = json::object();
    for (auto severity : {core::Severity::HighlySignificant, core::Severity::Significant,
                          core::Severity::Moderate, core::Severity::Normal}) {
        counts[core::toString(severity)] = summary.countFor(severity);
    }

    return {
        {"total_files", summary.totalFiles},
        {"processed_files", summary.processedFiles},
        {"failed_files", summary.failedFiles},
        {"total_processing_time_ms", summary.totalProcessingTimeMs},
        {"average_width_difference", summary.averageWidthDifference},
        {"significance_counts", std::move(counts)}
    };
}

}  // anonymous namespace

json ResultSerializer::toJson(const AnalysisResult& result) {
    json pairs = json::array();
    for (const auto& report : result.pairs) {
        pairs.push_back(pairToJson(report));
    }

    return {
        {"version", CURRENT_VERSION},
        {"source_name", result.sourceName},
        {"analyzer", result.analyzerName},
        {"pairs", std::move(pairs)},
        {"total_pairs_detected", result.totalPairsDetected()},
        {"image_quality", qualityToJson(result.imageQuality)},
        {"clinical_recommendations", result.clinicalRecommendations},
        {"processing_time_ms", result.processingTimeMs},
        {"empty_reason", toString(result.emptyReason)},
        {"warnings", result.warnings},
        {"calibration_mm_per_pixel", result.calibrationMmPerPixel},
        {"magnification_factor", result.magnificationFactor},
        {"detected_teeth_count", result.detectedTeethCount},
        {"unpaired_molars", result.unpairedMolars}
    };
}

json ResultSerializer::errorToJson(const core::AnalysisError& error) {
    json document = {
        {"error", error.toString()},
        {"error_code", core::toErrorId(error.code)},
        {"retryable", error.isRetryable()}
    };
    if (error.isRetryable()) {
        document["retry_guidance"] = error.retryGuidance();
    }
    return document;
}

json ResultSerializer::toJson(const BatchResult& batch) {
    json results = json::array();
    for (const auto& item : batch.items) {
        json entry = item.succeeded() ? toJson(*item.outcome) : errorToJson(item.outcome.error());
        entry["file_name"] = item.fileName;
        entry["file_size"] = item.fileSize;
        entry["status"] = item.succeeded() ? "success" : "error";
        results.push_back(std::move(entry));
    }

    return {
        {"version", CURRENT_VERSION},
        {"results", std::move(results)},
        {"summary", summaryToJson(batch.summary)}
    };
}

std::string ResultSerializer::toText(const json& document) {
    return document.dump(2, ' ', false, json::error_handler_t::replace);
}

std::expected<void, SerializationError> ResultSerializer::save(
    const json& document,
    const std::filesystem::path& filePath) const {

    const std::string text = toText(document);

    QFile file(QString::fromStdString(filePath.string()));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        return std::unexpected(SerializationError{
            SerializationError::Code::FileAccessDenied,
            "Cannot open file for writing: " + filePath.string()
        });
    }

    QTextStream stream(&file);
    stream.setEncoding(QStringConverter::Utf8);
    stream << QString::fromStdString(text) << '\n';

    file.close();
    return {};
}

}  // namespace dentescope::services
