#include "services/analysis/result_assembler.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace dentescope::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ResultAssembler");
    return logger;
}

void appendUnique(std::vector<std::string>& target, const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        if (std::find(target.begin(), target.end(), line) == target.end()) {
            target.push_back(line);
        }
    }
}

void appendPairWarnings(std::vector<std::string>& warnings, const PairReport& report,
                        size_t index) {
    const auto& molar = report.pair.molar.detection;
    const auto& premolar = report.pair.premolar.detection;

    if (report.molarMeasurement.fellBack) {
        warnings.push_back(std::format(
            "pair {}: molar '{}' measured with bounding box after principal-axis fit failed",
            index, molar.classLabel));
    }
    if (report.premolarMeasurement.fellBack) {
        warnings.push_back(std::format(
            "pair {}: premolar '{}' measured with bounding box after principal-axis fit failed",
            index, premolar.classLabel));
    }
    if (report.sizeClamped) {
        warnings.push_back(std::format(
            "pair {}: premolar width clamped from {:.2f}mm to {:.2f}mm",
            index, report.rawPremolarWidthMm, report.premolarMeasurement.widthMm));
    } else if (report.sizeConstraintViolated) {
        warnings.push_back(std::format(
            "pair {}: premolar width {:.2f}mm exceeds molar width {:.2f}mm",
            index, report.premolarMeasurement.widthMm, report.molarMeasurement.widthMm));
    }
    if (report.implausibleWidth) {
        warnings.push_back(std::format(
            "pair {}: width outside plausible range (molar {:.2f}mm, premolar {:.2f}mm)",
            index, report.molarMeasurement.widthMm, report.premolarMeasurement.widthMm));
    }
    if (report.pair.premolar.regionTests.demotedBySize) {
        warnings.push_back(std::format(
            "pair {}: premolar '{}' was demoted from molar by relative size",
            index, premolar.classLabel));
    }
}
}  // anonymous namespace

std::string toString(EmptyReason reason) {
    switch (reason) {
        case EmptyReason::None:              return "none";
        case EmptyReason::NoDetections:      return "no_detections";
        case EmptyReason::NoEligibleTeeth:   return "no_eligible_teeth";
        case EmptyReason::PairingImpossible: return "pairing_impossible";
    }
    return "unknown";
}

ResultAssembler::ResultAssembler(ClinicalAnalyzer clinicalAnalyzer)
    : clinicalAnalyzer_(std::move(clinicalAnalyzer)) {}

EmptyReason ResultAssembler::emptyReasonFor(const AssemblyContext& context) noexcept {
    if (context.detectedTeethCount == 0) {
        return EmptyReason::NoDetections;
    }
    if (context.molarCandidates == 0 || context.premolarCandidates == 0) {
        return EmptyReason::NoEligibleTeeth;
    }
    return EmptyReason::PairingImpossible;
}

std::vector<std::string> ResultAssembler::emptyRecommendations(EmptyReason reason) {
    std::vector<std::string> lines{"Insufficient detections for analysis"};
    switch (reason) {
        case EmptyReason::NoDetections:
            lines.emplace_back("Ensure image shows clear dental structures");
            lines.emplace_back("Check image quality and contrast");
            break;
        case EmptyReason::NoEligibleTeeth:
            lines.emplace_back("Verify panoramic radiograph includes posterior teeth");
            lines.emplace_back("Check image quality and contrast");
            break;
        case EmptyReason::PairingImpossible:
            lines.emplace_back("Verify panoramic radiograph includes posterior teeth");
            lines.emplace_back("Ensure image shows clear dental structures");
            break;
        case EmptyReason::None:
            break;
    }
    return lines;
}

AnalysisResult ResultAssembler::assemble(const AssemblyContext& context,
                                         std::vector<PairReport> pairs) const {
    AnalysisResult result;
    result.sourceName = context.sourceName;
    result.analyzerName = context.analyzerName;
    result.imageQuality = context.imageQuality;
    result.calibrationMmPerPixel = context.calibrationMmPerPixel;
    result.magnificationFactor = context.magnificationFactor;
    result.detectedTeethCount = context.detectedTeethCount;
    result.unpairedMolars = context.unpairedMolars;
    result.processingTimeMs = context.elapsed.count();
    result.warnings = context.warnings;

    if (pairs.empty()) {
        result.emptyReason = emptyReasonFor(context);
        result.clinicalRecommendations = emptyRecommendations(result.emptyReason);
        getLogger()->info("'{}': no measurable pair ({})", context.sourceName,
                          toString(result.emptyReason));
        return result;
    }

    for (size_t i = 0; i < pairs.size(); ++i) {
        appendPairWarnings(result.warnings, pairs[i], i);
    }

    // Most severe pair first, pairing order among equals
    std::vector<size_t> order(pairs.size());
    for (size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    std::stable_sort(order.begin(), order.end(), [&pairs](size_t a, size_t b) {
        return static_cast<int>(pairs[a].widthDifference.severity) >
               static_cast<int>(pairs[b].widthDifference.severity);
    });
    for (size_t index : order) {
        const auto& report = pairs[index];
        appendUnique(result.clinicalRecommendations,
                     clinicalAnalyzer_.recommendations(report.widthDifference,
                                                       report.sizeClamped,
                                                       report.implausibleWidth));
    }

    result.pairs = std::move(pairs);
    result.emptyReason = EmptyReason::None;

    getLogger()->info("'{}': {} pair(s), {} warning(s)", context.sourceName,
                      result.pairs.size(), result.warnings.size());
    return result;
}

}  // namespace dentescope::services
