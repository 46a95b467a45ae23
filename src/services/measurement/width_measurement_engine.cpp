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

#include "services/measurement/width_measurement_engine.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <utility>

namespace dentescope::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("WidthMeasurement");
    return logger;
}

constexpr double kDegenerateVariance = 1e-9;

/// Footprint of one pixel added to extents spanned by pixel centers
constexpr double kPixelFootprint = 1.0;

std::expected<void, MeasurementError> checkCalibration(double calibrationMmPerPixel,
                                                       double magnificationFactor) {
    if (!(calibrationMmPerPixel > 0.0) || !(magnificationFactor > 0.0)) {
        return std::unexpected(MeasurementError{
            MeasurementError::Code::InvalidParameters,
            std::format("calibration ({}) and magnification ({}) must be positive",
                        calibrationMmPerPixel, magnificationFactor)
        });
    }
    return {};
}
}  // anonymous namespace

WidthMeasurementEngine::WidthMeasurementEngine(core::AnatomicalConfig anatomy)
    : anatomy_(std::move(anatomy)) {}

double WidthMeasurementEngine::boundingBoxWidthPx(const BoundingBox& box) noexcept {
    return std::min(box.width, box.height);
}

std::optional<PrincipalAxes2D>
WidthMeasurementEngine::fitPrincipalAxes(const std::vector<Point2D>& points) {
    if (points.size() < kMinContourPoints) {
        return std::nullopt;
    }

    PrincipalAxes2D axes;
    for (const auto& p : points) {
        axes.centroid.x += p.x;
        axes.centroid.y += p.y;
    }
    const double n = static_cast<double>(points.size());
    axes.centroid.x /= n;
    axes.centroid.y /= n;

    // Covariance matrix [[sxx, sxy], [sxy, syy]]
    double sxx = 0.0;
    double sxy = 0.0;
    double syy = 0.0;
    for (const auto& p : points) {
        const double dx = p.x - axes.centroid.x;
        const double dy = p.y - axes.centroid.y;
        sxx += dx * dx;
        sxy += dx * dy;
        syy += dy * dy;
    }
    sxx /= n;
    sxy /= n;
    syy /= n;

    if (sxx + syy < kDegenerateVariance) {
        return std::nullopt;
    }

    // Closed-form eigen decomposition of a symmetric 2x2 matrix
    const double mean = (sxx + syy) / 2.0;
    const double radius = std::sqrt(((sxx - syy) / 2.0) * ((sxx - syy) / 2.0) + sxy * sxy);
    axes.majorVariance = mean + radius;
    axes.minorVariance = std::max(0.0, mean - radius);

    if (std::abs(sxy) > kDegenerateVariance) {
        const double vx = axes.majorVariance - syy;
        const double vy = sxy;
        const double length = std::hypot(vx, vy);
        axes.majorAxis = {vx / length, vy / length};
    } else if (sxx >= syy) {
        axes.majorAxis = {1.0, 0.0};
    } else {
        axes.majorAxis = {0.0, 1.0};
    }
    axes.minorAxis = {-axes.majorAxis.y, axes.majorAxis.x};

    double minMajor = std::numeric_limits<double>::max();
    double maxMajor = std::numeric_limits<double>::lowest();
    double minMinor = std::numeric_limits<double>::max();
    double maxMinor = std::numeric_limits<double>::lowest();
    for (const auto& p : points) {
        const double dx = p.x - axes.centroid.x;
        const double dy = p.y - axes.centroid.y;
        const double major = dx * axes.majorAxis.x + dy * axes.majorAxis.y;
        const double minor = dx * axes.minorAxis.x + dy * axes.minorAxis.y;
        minMajor = std::min(minMajor, major);
        maxMajor = std::max(maxMajor, major);
        minMinor = std::min(minMinor, minor);
        maxMinor = std::max(maxMinor, minor);
    }
    axes.majorExtent = maxMajor - minMajor;
    axes.minorExtent = maxMinor - minMinor;

    if (axes.minorExtent <= 0.0) {
        return std::nullopt;
    }
    return axes;
}

std::expected<Measurement, MeasurementError>
WidthMeasurementEngine::measure(const ClassifiedTooth& tooth,
                                double calibrationMmPerPixel,
                                double magnificationFactor,
                                core::MeasurementMethod method) const {
    if (auto valid = checkCalibration(calibrationMmPerPixel, magnificationFactor); !valid) {
        return std::unexpected(valid.error());
    }

    const auto& box = tooth.detection.box;
    if (box.width <= 0.0 || box.height <= 0.0) {
        return std::unexpected(MeasurementError{
            MeasurementError::Code::InvalidInput,
            "Bounding box has no extent"
        });
    }

    Measurement measurement;
    measurement.calibrationFactorUsed = calibrationMmPerPixel;
    measurement.magnificationUsed = magnificationFactor;
    measurement.method = core::MeasurementMethod::BoundingBox;
    measurement.widthPx = boundingBoxWidthPx(box);

    if (method == core::MeasurementMethod::PrincipalAxis) {
        auto axes = fitPrincipalAxes(tooth.detection.contour);
        if (axes) {
            measurement.method = core::MeasurementMethod::PrincipalAxis;
            measurement.widthPx = axes->minorExtent + kPixelFootprint;
        } else {
            measurement.fellBack = true;
            getLogger()->warn("Principal-axis fit failed for '{}' ({} contour points), "
                              "using bounding box",
                              tooth.detection.classLabel, tooth.detection.contour.size());
        }
    }

    measurement.widthMm = measurement.widthPx * calibrationMmPerPixel / magnificationFactor;

    getLogger()->debug("'{}' width {:.2f}px -> {:.2f}mm ({})", tooth.detection.classLabel,
                       measurement.widthPx, measurement.widthMm,
                       core::toString(measurement.method));
    return measurement;
}

std::expected<Measurement, MeasurementError>
WidthMeasurementEngine::measureBetween(Point2D first, Point2D second,
                                       double calibrationMmPerPixel,
                                       double magnificationFactor) const {
    if (auto valid = checkCalibration(calibrationMmPerPixel, magnificationFactor); !valid) {
        return std::unexpected(valid.error());
    }
    for (const auto& p : {first, second}) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
            return std::unexpected(MeasurementError{
                MeasurementError::Code::InvalidInput,
                "Landmark coordinates must be finite"
            });
        }
    }

    const double distance = std::hypot(second.x - first.x, second.y - first.y);
    if (distance <= 0.0) {
        return std::unexpected(MeasurementError{
            MeasurementError::Code::InvalidInput,
            std::format("Landmarks coincide at ({}, {})", first.x, first.y)
        });
    }

    Measurement measurement;
    measurement.method = core::MeasurementMethod::Landmark;
    measurement.widthPx = distance;
    measurement.widthMm = distance * calibrationMmPerPixel / magnificationFactor;
    measurement.calibrationFactorUsed = calibrationMmPerPixel;
    measurement.magnificationUsed = magnificationFactor;

    getLogger()->debug("Landmarks ({:.1f}, {:.1f})-({:.1f}, {:.1f}) {:.2f}px -> {:.2f}mm",
                       first.x, first.y, second.x, second.y, distance, measurement.widthMm);
    return measurement;
}

SizeConstraintOutcome
WidthMeasurementEngine::applySizeConstraint(const Measurement& molar,
                                            const Measurement& premolar) const {
    SizeConstraintOutcome outcome;
    outcome.premolar = premolar;
    outcome.rawPremolarWidthMm = premolar.widthMm;

    if (premolar.widthMm <= molar.widthMm) {
        return outcome;
    }

    outcome.violated = true;
    if (!anatomy_.premolarClampEnabled) {
        getLogger()->warn("Premolar width {:.2f}mm exceeds molar width {:.2f}mm "
                          "(clamp disabled, value kept)",
                          premolar.widthMm, molar.widthMm);
        return outcome;
    }

    const double clampedMm = molar.widthMm * anatomy_.premolarClampRatio;
    outcome.premolar.widthMm = clampedMm;
    outcome.premolar.widthPx =
        clampedMm * premolar.magnificationUsed / premolar.calibrationFactorUsed;
    outcome.clamped = true;

    getLogger()->warn("Premolar width {:.2f}mm exceeds molar width {:.2f}mm, "
                      "clamped to {:.2f}mm (ratio {:.2f})",
                      premolar.widthMm, molar.widthMm, clampedMm,
                      anatomy_.premolarClampRatio);
    return outcome;
}

bool WidthMeasurementEngine::isPlausible(const Measurement& measurement) const noexcept {
    return measurement.widthMm >= anatomy_.minWidthMm &&
           measurement.widthMm <= anatomy_.maxWidthMm;
}

}  // namespace dentescope::services
