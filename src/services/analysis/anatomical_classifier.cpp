#include "services/analysis/anatomical_classifier.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace dentescope::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("AnatomicalClassifier");
    return logger;
}

/// (rank + 1) / n where rank counts strictly smaller areas
std::vector<double> areaPercentiles(const std::vector<Detection>& detections) {
    std::vector<double> percentiles(detections.size(), 1.0);
    const double n = static_cast<double>(detections.size());
    for (size_t i = 0; i < detections.size(); ++i) {
        size_t smaller = 0;
        for (const auto& other : detections) {
            if (other.area() < detections[i].area()) {
                ++smaller;
            }
        }
        percentiles[i] = (static_cast<double>(smaller) + 1.0) / n;
    }
    return percentiles;
}
}  // anonymous namespace

std::string toString(ToothCategory category) {
    switch (category) {
        case ToothCategory::PrimaryMolar: return "primary_molar";
        case ToothCategory::Premolar: return "premolar";
        case ToothCategory::Rejected: return "rejected";
    }
    return "rejected";
}

AnatomicalClassifier::AnatomicalClassifier(core::AnatomicalConfig config)
    : config_(std::move(config)) {}

double AnatomicalClassifier::horizontalFraction(double x, double imageWidth) const noexcept {
    if (imageWidth <= 0.0) {
        return 0.0;
    }
    switch (config_.sideConvention) {
        case core::SideConvention::PosteriorRight:
            return x / imageWidth;
        case core::SideConvention::PosteriorLeft:
            return 1.0 - x / imageWidth;
        case core::SideConvention::MidlineOut: {
            const double half = imageWidth / 2.0;
            return std::abs(x - half) / half;
        }
    }
    return x / imageWidth;
}

ArchSide AnatomicalClassifier::archSide(double x, double imageWidth) const noexcept {
    if (config_.sideConvention != core::SideConvention::MidlineOut) {
        return ArchSide::Whole;
    }
    return x < imageWidth / 2.0 ? ArchSide::Left : ArchSide::Right;
}

LabelHint AnatomicalClassifier::labelHintFor(const std::string& classLabel) {
    std::string lower = classLabel;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // "premolar" contains "molar", so it is tested first
    if (lower.find("premolar") != std::string::npos ||
        lower.find("bicuspid") != std::string::npos) {
        return LabelHint::Premolar;
    }
    if (lower.find("primary") != std::string::npos ||
        lower.find("deciduous") != std::string::npos) {
        return LabelHint::PrimaryMolar;
    }
    return LabelHint::None;
}

ToothCategory AnatomicalClassifier::resolveBands(const RegionTests& tests) const noexcept {
    if (tests.molarEligible && tests.premolarEligible) {
        if (config_.useDetectorLabels) {
            if (tests.labelHint == LabelHint::PrimaryMolar) {
                return ToothCategory::PrimaryMolar;
            }
            if (tests.labelHint == LabelHint::Premolar) {
                return ToothCategory::Premolar;
            }
        }
        const double toMolar =
            std::abs(tests.horizontalFraction - config_.molarHorizontal.center());
        const double toPremolar =
            std::abs(tests.horizontalFraction - config_.premolarHorizontal.center());
        return toMolar <= toPremolar ? ToothCategory::PrimaryMolar : ToothCategory::Premolar;
    }
    if (tests.molarEligible) {
        return ToothCategory::PrimaryMolar;
    }
    if (tests.premolarEligible) {
        return ToothCategory::Premolar;
    }
    return ToothCategory::Rejected;
}

ClassificationResult
AnatomicalClassifier::classify(const std::vector<Detection>& detections,
                               unsigned int imageWidth,
                               unsigned int imageHeight) const {
    ClassificationResult result;
    if (detections.empty() || imageWidth == 0 || imageHeight == 0) {
        for (const auto& detection : detections) {
            ClassifiedTooth tooth;
            tooth.detection = detection;
            result.rejected.push_back(std::move(tooth));
        }
        return result;
    }

    const auto percentiles = areaPercentiles(detections);
    const double width = static_cast<double>(imageWidth);
    const double height = static_cast<double>(imageHeight);

    for (size_t i = 0; i < detections.size(); ++i) {
        ClassifiedTooth tooth;
        tooth.detection = detections[i];

        auto& tests = tooth.regionTests;
        const auto center = detections[i].centroid();
        tests.horizontalFraction = horizontalFraction(center.x, width);
        tests.verticalFraction = center.y / height;
        tests.archSide = archSide(center.x, width);
        tests.molarEligible = config_.molarHorizontal.contains(tests.horizontalFraction) &&
                              config_.molarVertical.contains(tests.verticalFraction);
        tests.premolarEligible = config_.premolarHorizontal.contains(tests.horizontalFraction) &&
                                 config_.premolarVertical.contains(tests.verticalFraction);
        tests.labelHint = labelHintFor(detections[i].classLabel);
        tests.areaPercentile = percentiles[i];

        tooth.category = resolveBands(tests);

        if (tooth.category == ToothCategory::PrimaryMolar && config_.enforceRelativeSize &&
            tests.areaPercentile < config_.molarMinAreaPercentile) {
            tests.demotedBySize = true;
            tooth.category = tests.premolarEligible ? ToothCategory::Premolar
                                                    : ToothCategory::Rejected;
        }

        if (tooth.category != ToothCategory::Rejected) {
            tooth.positionalBonus = config_.positionalBonus;
        }

        getLogger()->debug("'{}' at ({:.3f}, {:.3f}) area pct {:.2f} -> {}{}",
                           detections[i].classLabel, tests.horizontalFraction,
                           tests.verticalFraction, tests.areaPercentile,
                           toString(tooth.category),
                           tests.demotedBySize ? " (demoted by size)" : "");

        switch (tooth.category) {
            case ToothCategory::PrimaryMolar:
                result.molars.push_back(std::move(tooth));
                break;
            case ToothCategory::Premolar:
                result.premolars.push_back(std::move(tooth));
                break;
            case ToothCategory::Rejected:
                result.rejected.push_back(std::move(tooth));
                break;
        }
    }

    getLogger()->debug("Classified {} detections: {} molars, {} premolars, {} rejected",
                       detections.size(), result.molars.size(), result.premolars.size(),
                       result.rejected.size());
    return result;
}

}  // namespace dentescope::services
