#include "services/analysis/landmark_analyzer.hpp"
#include "services/analysis/clinical_analyzer.hpp"
#include "services/analysis/pairing_engine.hpp"
#include "services/analysis/result_assembler.hpp"
#include "services/measurement/width_measurement_engine.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <utility>

namespace dentescope::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("LandmarkAnalyzer");
    return logger;
}

ClassifiedTooth landmarkTooth(const LandmarkSegment& segment, const std::string& label,
                              ToothCategory category) {
    ClassifiedTooth tooth;
    tooth.detection.box = {
        std::min(segment.first.x, segment.second.x),
        std::min(segment.first.y, segment.second.y),
        std::abs(segment.second.x - segment.first.x),
        std::abs(segment.second.y - segment.first.y)
    };
    tooth.detection.classLabel = label;
    tooth.detection.confidence = 1.0;
    tooth.detection.contour = {segment.first, segment.second};
    tooth.category = category;
    return tooth;
}
}  // anonymous namespace

LandmarkAnalyzer::LandmarkAnalyzer(core::AnalysisConfig config)
    : config_(std::move(config)) {}

std::expected<AnalysisResult, core::AnalysisError>
LandmarkAnalyzer::analyze(const LandmarkRequest& request,
                          const core::AnalysisOptions& options) const {
    const auto start = std::chrono::steady_clock::now();
    const auto config = config_.withOverrides(options);
    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }

    WidthMeasurementEngine engine(config.anatomy);
    auto molar = engine.measureBetween(request.molar.first, request.molar.second,
                                       config.calibrationMmPerPixel,
                                       config.magnificationFactor);
    auto premolar = engine.measureBetween(request.premolar.first, request.premolar.second,
                                          config.calibrationMmPerPixel,
                                          config.magnificationFactor);
    if (!molar || !premolar) {
        const auto& error = !molar ? molar.error() : premolar.error();
        getLogger()->error("'{}': {} landmarks rejected: {}", request.sourceName,
                           !molar ? "molar" : "premolar", error.toString());
        return std::unexpected(core::AnalysisError{
            core::AnalysisError::Code::InvalidConfiguration,
            std::string(!molar ? "molar" : "premolar") + " landmarks: " + error.toString()
        });
    }

    ClinicalAnalyzer clinical(config.bands);
    auto outcome = engine.applySizeConstraint(*molar, *premolar);

    PairReport report;
    report.pair.molar = landmarkTooth(request.molar, "primary_second_molar",
                                      ToothCategory::PrimaryMolar);
    report.pair.premolar = landmarkTooth(request.premolar, "second_premolar",
                                         ToothCategory::Premolar);
    report.pair.centroidDistancePx =
        PairingEngine::centroidDistance(report.pair.molar, report.pair.premolar);
    report.pair.pairConfidence = 1.0;
    report.molarMeasurement = *molar;
    report.premolarMeasurement = outcome.premolar;
    report.sizeConstraintViolated = outcome.violated;
    report.sizeClamped = outcome.clamped;
    report.rawPremolarWidthMm = outcome.rawPremolarWidthMm;
    report.widthDifference = clinical.analyze(*molar, outcome.premolar);
    report.implausibleWidth = !engine.isPlausible(*molar) ||
                              !engine.isPlausible(outcome.premolar);

    AssemblyContext context;
    context.sourceName = request.sourceName;
    context.analyzerName = "LandmarkAnalyzer";
    context.detectedTeethCount = 2;
    context.molarCandidates = 1;
    context.premolarCandidates = 1;
    context.calibrationMmPerPixel = config.calibrationMmPerPixel;
    context.magnificationFactor = config.magnificationFactor;
    context.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    getLogger()->info("'{}': landmark widths {:.2f}mm / {:.2f}mm, difference {:.2f}mm ({})",
                      request.sourceName, molar->widthMm, outcome.premolar.widthMm,
                      report.widthDifference.valueMm,
                      report.widthDifference.clinicalSignificance);

    std::vector<PairReport> reports;
    reports.push_back(std::move(report));

    ResultAssembler assembler(std::move(clinical));
    return assembler.assemble(context, std::move(reports));
}

}  // namespace dentescope::services
