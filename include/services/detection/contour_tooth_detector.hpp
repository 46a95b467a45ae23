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

#pragma once

#include <memory>

#include "services/detection/tooth_detector.hpp"

namespace dentescope::services {

/**
 * @brief Classical segmentation-based tooth detector
 *
 * Fallback backend for when no trained detector output is available.
 * Bright regions of the enhanced radiograph are segmented with an Otsu
 * threshold, closed morphologically and split into connected components.
 * Components with tooth-like size, shape and position become detections
 * labelled "tooth" with a heuristic confidence and their boundary contour.
 *
 * Confidence = 0.3 base
 *   + 0.3 (area 300-20000 px) or 0.2 (area 150-30000 px)
 *   + 0.2 (compactness > 0.15) or 0.1 (compactness > 0.1)
 *   + 0.2 (centroid y/height in (0.25, 0.8)) or 0.1 (in (0.2, 0.85))
 *   + 0.1 (aspect ratio 0.5-2.0), capped at 1.0
 *
 * @example
 * @code
 * auto detector = std::make_shared<ContourToothDetector>();
 * auto detections = detector->detect(prepared, 0.25, 0.45);
 * @endcode
 */
class ContourToothDetector : public ToothDetector {
public:
    /**
     * @brief Region filtering parameters
     */
    struct Parameters {
        double minArea = 150.0;
        double maxArea = 30000.0;
        double minAspectRatio = 0.3;
        double maxAspectRatio = 3.0;
        double minCompactness = 0.05;

        /// Dental-arch window: vertical fraction of the image height
        double archTop = 0.25;
        double archBottom = 0.75;

        /// Dental-arch window: centered fraction of the image width
        double archWidth = 0.75;

        unsigned int closingRadius = 2;

        [[nodiscard]] bool isValid() const noexcept {
            return minArea > 0.0 && minArea <= maxArea &&
                   minAspectRatio > 0.0 && minAspectRatio <= maxAspectRatio &&
                   archTop >= 0.0 && archTop < archBottom && archBottom <= 1.0 &&
                   archWidth > 0.0 && archWidth <= 1.0;
        }
    };

    ContourToothDetector();
    explicit ContourToothDetector(const Parameters& params);
    ~ContourToothDetector() override;

    // Non-copyable, movable
    ContourToothDetector(const ContourToothDetector&) = delete;
    ContourToothDetector& operator=(const ContourToothDetector&) = delete;
    ContourToothDetector(ContourToothDetector&&) noexcept;
    ContourToothDetector& operator=(ContourToothDetector&&) noexcept;

    [[nodiscard]] std::expected<std::vector<Detection>, DetectorError> detect(
        const PreprocessedImage& image,
        double confidenceThreshold,
        double iouThreshold) override;

    [[nodiscard]] std::string name() const override { return "ContourToothDetector"; }

    [[nodiscard]] bool isThreadSafe() const noexcept override { return true; }

    /**
     * @brief Heuristic confidence for one segmented region
     * @param area Region area in pixels
     * @param perimeter Region perimeter in pixels
     * @param box Region bounding box
     * @param imageHeight Image height in pixels
     */
    [[nodiscard]] static double scoreRegion(double area,
                                            double perimeter,
                                            const BoundingBox& box,
                                            double imageHeight);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace dentescope::services
