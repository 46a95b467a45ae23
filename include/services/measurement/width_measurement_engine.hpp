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
 * @file width_measurement_engine.hpp
 * @brief Calibrated mesiodistal width measurement
 * @details Converts a classified tooth's pixel geometry into millimeters.
 *
 *          - Bounding box: width_px = min(box width, box height), so crown
 *            height is never mistaken for mesiodistal width
 *          - Principal axis: 2D PCA over the contour points; width_px is the
 *            extent of the projections on the minor axis. Falls back to the
 *            bounding box for fewer than 5 points or a degenerate covariance
 *
 *          width_mm = width_px * calibration_mm_per_pixel / magnification
 *
 *          The engine also applies the molar > premolar size constraint and
 *          the plausibility range check.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <expected>
#include <optional>
#include <vector>

#include "core/analysis_config.hpp"
#include "services/analysis/tooth_types.hpp"
#include "services/measurement/measurement_types.hpp"

namespace dentescope::services {

/**
 * @brief Principal axes of a 2D point set
 */
struct PrincipalAxes2D {
    Point2D centroid;
    Point2D majorAxis;   ///< Unit vector of the largest variance
    Point2D minorAxis;   ///< Unit vector orthogonal to majorAxis
    double majorVariance = 0.0;
    double minorVariance = 0.0;
    double majorExtent = 0.0;
    double minorExtent = 0.0;
};

/**
 * @brief Measures tooth widths and enforces the anatomical size constraint
 *
 * @example
 * @code
 * WidthMeasurementEngine engine(config.anatomy);
 * auto molar = engine.measure(pair.molar, 0.1, 1.25,
 *                             core::MeasurementMethod::PrincipalAxis);
 * auto premolar = engine.measure(pair.premolar, 0.1, 1.25,
 *                                core::MeasurementMethod::PrincipalAxis);
 * auto outcome = engine.applySizeConstraint(*molar, *premolar);
 * if (outcome.clamped) {
 *     // outcome.premolar.widthMm == molar->widthMm * 0.85
 * }
 * @endcode
 */
class WidthMeasurementEngine {
public:
    /// Minimum contour size for a principal-axis fit
    static constexpr size_t kMinContourPoints = 5;

    explicit WidthMeasurementEngine(core::AnatomicalConfig anatomy = {});

    /**
     * @brief Measure one tooth
     *
     * Contour points are pixel centers, so a principal-axis width is the
     * minor extent plus one pixel and matches the bounding box of an
     * axis-aligned region.
     *
     * @param tooth Classified tooth, geometry in original-image pixels
     * @param calibrationMmPerPixel Pixel size in mm (> 0)
     * @param magnificationFactor Geometric magnification (> 0)
     * @param method Requested method
     * @return Measurement, or InvalidParameters for non-positive calibration
     *         or magnification, InvalidInput for an empty box
     */
    [[nodiscard]] std::expected<Measurement, MeasurementError>
    measure(const ClassifiedTooth& tooth,
            double calibrationMmPerPixel,
            double magnificationFactor,
            core::MeasurementMethod method) const;

    /**
     * @brief Measure the distance between two landmarks on a tooth's edges
     *
     * @param first Mesial edge point in original-image pixels
     * @param second Distal edge point in original-image pixels
     * @return Landmark measurement, or InvalidParameters for non-positive
     *         calibration or magnification, InvalidInput for non-finite or
     *         coincident points
     */
    [[nodiscard]] std::expected<Measurement, MeasurementError>
    measureBetween(Point2D first, Point2D second,
                   double calibrationMmPerPixel,
                   double magnificationFactor) const;

    /**
     * @brief Apply the molar > premolar constraint to a measured pair
     *
     * When the premolar is wider than the molar the violation is always
     * flagged; the width is replaced by molar width * clamp ratio only when
     * the clamp is enabled.
     */
    [[nodiscard]] SizeConstraintOutcome applySizeConstraint(const Measurement& molar,
                                                            const Measurement& premolar) const;

    /**
     * @brief Whether a width lies in the configured plausible range
     */
    [[nodiscard]] bool isPlausible(const Measurement& measurement) const noexcept;

    [[nodiscard]] static double boundingBoxWidthPx(const BoundingBox& box) noexcept;

    /**
     * @brief Fit principal axes to a contour
     * @return Axes, or nullopt for fewer than kMinContourPoints points or a
     *         degenerate covariance
     */
    [[nodiscard]] static std::optional<PrincipalAxes2D>
    fitPrincipalAxes(const std::vector<Point2D>& points);

private:
    core::AnatomicalConfig anatomy_;
};

}  // namespace dentescope::services
