#include "services/detection/detection_types.hpp"

#include <cmath>
#include <format>

namespace dentescope::services {

Detection Detection::scaled(double sx, double sy) const {
    Detection result = *this;
    result.box = box.scaled(sx, sy);
    for (auto& point : result.contour) {
        point.x *= sx;
        point.y *= sy;
    }
    return result;
}

std::expected<Detection, DetectorError> RawDetection::toDetection() const {
    for (double value : bbox) {
        if (!std::isfinite(value)) {
            return std::unexpected(DetectorError{
                DetectorError::Code::InvalidOutput,
                std::format("non-finite box coordinate for '{}'", className)
            });
        }
    }

    const double x1 = bbox[0];
    const double y1 = bbox[1];
    const double x2 = bbox[2];
    const double y2 = bbox[3];
    if (x2 <= x1 || y2 <= y1) {
        return std::unexpected(DetectorError{
            DetectorError::Code::InvalidOutput,
            std::format("degenerate box [{}, {}, {}, {}] for '{}'", x1, y1, x2, y2, className)
        });
    }

    if (!std::isfinite(confidence) || confidence < 0.0 || confidence > 1.0) {
        return std::unexpected(DetectorError{
            DetectorError::Code::InvalidOutput,
            std::format("confidence {} outside [0, 1] for '{}'", confidence, className)
        });
    }

    Detection detection;
    detection.box = BoundingBox{x1, y1, x2 - x1, y2 - y1};
    detection.classLabel = className;
    detection.classId = classId;
    detection.confidence = confidence;
    return detection;
}

}  // namespace dentescope::services
