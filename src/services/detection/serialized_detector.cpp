#include "services/detection/serialized_detector.hpp"

#include <utility>

namespace dentescope::services {

SerializedDetector::SerializedDetector(std::shared_ptr<ToothDetector> inner)
    : inner_(std::move(inner)) {}

std::expected<std::vector<Detection>, DetectorError>
SerializedDetector::detect(const PreprocessedImage& image,
                           double confidenceThreshold,
                           double iouThreshold) {
    if (!inner_) {
        return std::unexpected(DetectorError{
            DetectorError::Code::Unavailable,
            "No detector backend configured"
        });
    }

    std::lock_guard lock(mutex_);
    return inner_->detect(image, confidenceThreshold, iouThreshold);
}

std::string SerializedDetector::name() const {
    return inner_ ? "Serialized(" + inner_->name() + ")" : "Serialized(none)";
}

std::shared_ptr<ToothDetector>
SerializedDetector::ensureThreadSafe(std::shared_ptr<ToothDetector> detector) {
    if (!detector || detector->isThreadSafe()) {
        return detector;
    }
    return std::make_shared<SerializedDetector>(std::move(detector));
}

}  // namespace dentescope::services
