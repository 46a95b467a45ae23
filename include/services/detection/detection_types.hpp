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
 * @file detection_types.hpp
 * @brief Tooth detector contract types
 * @details RawDetection mirrors the external detector output shape
 *          ({bbox: [x1, y1, x2, y2], confidence, class_id, class_name});
 *          Detection is the validated, immutable form consumed by the
 *          classification and measurement stages.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <array>
#include <expected>
#include <string>
#include <vector>

namespace dentescope::services {

/// Pixel-space point, origin top-left
struct Point2D {
    double x = 0.0;
    double y = 0.0;
};

/**
 * @brief Axis-aligned box in pixel space, origin top-left
 */
struct BoundingBox {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    [[nodiscard]] double area() const noexcept { return width * height; }

    [[nodiscard]] Point2D centroid() const noexcept {
        return {x + width / 2.0, y + height / 2.0};
    }

    [[nodiscard]] double right() const noexcept { return x + width; }
    [[nodiscard]] double bottom() const noexcept { return y + height; }

    /// Box with every coordinate multiplied by the given factors
    [[nodiscard]] BoundingBox scaled(double sx, double sy) const noexcept {
        return {x * sx, y * sy, width * sx, height * sy};
    }

    /// [x1, y1, x2, y2]
    [[nodiscard]] std::array<double, 4> corners() const noexcept {
        return {x, y, x + width, y + height};
    }
};

/**
 * @brief Error information for detector invocations
 */
struct DetectorError {
    enum class Code {
        Success,
        Unavailable,      ///< Backend unreachable or not loaded
        InferenceFailed,  ///< Backend reachable but inference raised an error
        InvalidOutput     ///< Output violated the detector contract
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::Unavailable: return "Detector unavailable: " + message;
            case Code::InferenceFailed: return "Inference failed: " + message;
            case Code::InvalidOutput: return "Invalid detector output: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief One candidate tooth region
 *
 * Created per inference call and never modified afterwards.
 */
struct Detection {
    BoundingBox box;

    /// Raw detector label, e.g. "primary_second_molar_upper_left"
    std::string classLabel;

    int classId = -1;

    /// Detector confidence in [0, 1]
    double confidence = 0.0;

    /// Region boundary in the same pixel space as `box`, empty when unknown
    std::vector<Point2D> contour;

    [[nodiscard]] double area() const noexcept { return box.area(); }
    [[nodiscard]] Point2D centroid() const noexcept { return box.centroid(); }

    /// Detection with box and contour multiplied by the given factors
    [[nodiscard]] Detection scaled(double sx, double sy) const;
};

/**
 * @brief Detector output exactly as the external contract shapes it
 */
struct RawDetection {
    /// [x1, y1, x2, y2]
    std::array<double, 4> bbox{};
    double confidence = 0.0;
    int classId = -1;
    std::string className;

    /**
     * @brief Validate and convert to a Detection
     * @return InvalidOutput for degenerate boxes (x2 <= x1 or y2 <= y1),
     *         non-finite coordinates, or confidence outside [0, 1]
     */
    [[nodiscard]] std::expected<Detection, DetectorError> toDetection() const;
};

}  // namespace dentescope::services
