#include "services/detection/recorded_detector.hpp"
#include "core/logging.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

namespace dentescope::services {

using json = nlohmann::json;

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("RecordedDetector");
    return logger;
}

std::expected<RecordedDetector::Entry, DetectorError> jsonToEntry(const json& j) {
    if (!j.is_object() || !j.contains("bbox") || !j["bbox"].is_array() ||
        j["bbox"].size() != 4) {
        return std::unexpected(DetectorError{
            DetectorError::Code::InvalidOutput,
            "detection requires a 4-element 'bbox' array"
        });
    }

    RecordedDetector::Entry entry;
    for (size_t i = 0; i < 4; ++i) {
        entry.raw.bbox[i] = j["bbox"][i].get<double>();
    }
    entry.raw.confidence = j.value("confidence", 0.0);
    entry.raw.classId = j.value("class_id", -1);
    entry.raw.className = j.value("class_name", std::string{});

    if (j.contains("contour") && j["contour"].is_array()) {
        for (const auto& point : j["contour"]) {
            if (point.is_array() && point.size() >= 2) {
                entry.contour.push_back({point[0].get<double>(), point[1].get<double>()});
            }
        }
    }
    return entry;
}

std::expected<std::vector<RecordedDetector::Entry>, DetectorError>
jsonToEntries(const json& j) {
    if (!j.is_array()) {
        return std::unexpected(DetectorError{
            DetectorError::Code::InvalidOutput,
            "detection list must be an array"
        });
    }

    std::vector<RecordedDetector::Entry> entries;
    entries.reserve(j.size());
    for (const auto& item : j) {
        auto entry = jsonToEntry(item);
        if (!entry) {
            return std::unexpected(entry.error());
        }
        entries.push_back(std::move(*entry));
    }
    return entries;
}

}  // anonymous namespace

RecordedDetector::RecordedDetector(std::map<std::string, std::vector<Entry>> byImage,
                                   std::optional<std::vector<Entry>> fallback)
    : byImage_(std::move(byImage))
    , fallback_(std::move(fallback)) {}

std::expected<std::unique_ptr<RecordedDetector>, DetectorError>
RecordedDetector::fromJson(const json& document) {
    try {
        std::map<std::string, std::vector<Entry>> byImage;
        std::optional<std::vector<Entry>> fallback;

        if (document.contains("detections")) {
            auto entries = jsonToEntries(document["detections"]);
            if (!entries) {
                return std::unexpected(entries.error());
            }
            fallback = std::move(*entries);
        }

        if (document.contains("images")) {
            if (!document["images"].is_object()) {
                return std::unexpected(DetectorError{
                    DetectorError::Code::InvalidOutput,
                    "'images' must map image names to detection lists"
                });
            }
            for (const auto& [imageName, list] : document["images"].items()) {
                auto entries = jsonToEntries(list);
                if (!entries) {
                    return std::unexpected(DetectorError{
                        entries.error().code,
                        imageName + ": " + entries.error().message
                    });
                }
                byImage.emplace(imageName, std::move(*entries));
            }
        }

        if (document.contains("default")) {
            auto entries = jsonToEntries(document["default"]);
            if (!entries) {
                return std::unexpected(entries.error());
            }
            fallback = std::move(*entries);
        }

        if (byImage.empty() && !fallback) {
            return std::unexpected(DetectorError{
                DetectorError::Code::InvalidOutput,
                "expected 'detections' or 'images' in recorded detector output"
            });
        }

        return std::make_unique<RecordedDetector>(std::move(byImage), std::move(fallback));
    } catch (const json::exception& e) {
        return std::unexpected(DetectorError{
            DetectorError::Code::InvalidOutput,
            std::string("Type mismatch: ") + e.what()
        });
    }
}

std::expected<std::unique_ptr<RecordedDetector>, DetectorError>
RecordedDetector::loadFromFile(const std::filesystem::path& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return std::unexpected(DetectorError{
            DetectorError::Code::Unavailable,
            "Cannot open recorded detections " + filePath.string()
        });
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        return std::unexpected(DetectorError{
            DetectorError::Code::InvalidOutput,
            e.what()
        });
    }

    auto detector = fromJson(document);
    if (detector) {
        getLogger()->info("Loaded recorded detections from {} ({} images{})",
                          filePath.string(), (*detector)->imageCount(),
                          (*detector)->fallback_ ? " + default" : "");
    }
    return detector;
}

const std::vector<RecordedDetector::Entry>*
RecordedDetector::lookup(const std::string& sourceName) const {
    if (auto it = byImage_.find(sourceName); it != byImage_.end()) {
        return &it->second;
    }
    auto fileName = std::filesystem::path(sourceName).filename().string();
    if (auto it = byImage_.find(fileName); it != byImage_.end()) {
        return &it->second;
    }
    if (fallback_) {
        return &*fallback_;
    }
    return nullptr;
}

std::expected<std::vector<Detection>, DetectorError>
RecordedDetector::detect(const PreprocessedImage& image,
                         double confidenceThreshold,
                         double /*iouThreshold*/) {
    const auto* entries = lookup(image.sourceName);
    if (!entries) {
        return std::unexpected(DetectorError{
            DetectorError::Code::Unavailable,
            "No recorded detections for " + image.sourceName
        });
    }

    // Recorded coordinates are in original pixels
    const double toProcessedX = 1.0 / image.scaleX;
    const double toProcessedY = 1.0 / image.scaleY;

    std::vector<Detection> detections;
    for (const auto& entry : *entries) {
        auto detection = entry.raw.toDetection();
        if (!detection) {
            return std::unexpected(detection.error());
        }
        if (detection->confidence < confidenceThreshold) {
            continue;
        }
        detection->contour = entry.contour;
        detections.push_back(detection->scaled(toProcessedX, toProcessedY));
    }

    getLogger()->debug("{}: {} of {} recorded detections above {:.2f}",
                       image.sourceName, detections.size(), entries->size(),
                       confidenceThreshold);
    return detections;
}

}  // namespace dentescope::services
