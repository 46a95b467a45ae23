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
 * @file recorded_detector.hpp
 * @brief Detector backend that replays exported detector output
 * @details Reads detector output previously exported to JSON, so the
 *          pipeline can run against a model's results without linking the
 *          model runtime. Two layouts are accepted:
 *
 * @code
 * { "detections": [ {"bbox": [x1, y1, x2, y2], "confidence": 0.91,
 *                    "class_id": 4, "class_name": "primary_second_molar"} ] }
 *
 * { "images":  { "pano_001.png": [ ... ], "pano_002.png": [ ... ] },
 *   "default": [ ... ] }
 * @endcode
 *
 *          Coordinates are in original-image pixels. An optional "contour"
 *          array of [x, y] points per detection enables principal-axis
 *          measurement without contour extraction.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>

#include <nlohmann/json_fwd.hpp>

#include "services/detection/tooth_detector.hpp"

namespace dentescope::services {

/**
 * @brief Replays recorded detections keyed by image name
 */
class RecordedDetector : public ToothDetector {
public:
    /// Recorded detections with their optional contours
    struct Entry {
        RawDetection raw;
        std::vector<Point2D> contour;
    };

    RecordedDetector(std::map<std::string, std::vector<Entry>> byImage,
                     std::optional<std::vector<Entry>> fallback);

    /**
     * @brief Parse one of the accepted JSON layouts
     * @return Detector, or InvalidOutput when the document has neither layout
     */
    [[nodiscard]] static std::expected<std::unique_ptr<RecordedDetector>, DetectorError>
    fromJson(const nlohmann::json& document);

    /**
     * @brief Load a JSON export from disk
     * @return Detector, Unavailable when the file is missing or unreadable,
     *         InvalidOutput when it cannot be parsed
     */
    [[nodiscard]] static std::expected<std::unique_ptr<RecordedDetector>, DetectorError>
    loadFromFile(const std::filesystem::path& filePath);

    /**
     * @brief Return the recorded detections for `image.sourceName`
     *
     * Lookup tries the exact source name, then its file name component,
     * then the "default" list. Boxes are mapped from original into
     * processed pixel space.
     */
    [[nodiscard]] std::expected<std::vector<Detection>, DetectorError> detect(
        const PreprocessedImage& image,
        double confidenceThreshold,
        double iouThreshold) override;

    [[nodiscard]] std::string name() const override { return "RecordedDetector"; }

    [[nodiscard]] bool isThreadSafe() const noexcept override { return true; }

    [[nodiscard]] size_t imageCount() const noexcept { return byImage_.size(); }

private:
    [[nodiscard]] const std::vector<Entry>* lookup(const std::string& sourceName) const;

    std::map<std::string, std::vector<Entry>> byImage_;
    std::optional<std::vector<Entry>> fallback_;
};

}  // namespace dentescope::services
