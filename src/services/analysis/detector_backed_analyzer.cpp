#include "services/analysis/detector_backed_analyzer.hpp"
#include "services/analysis/anatomical_classifier.hpp"
#include "services/analysis/clinical_analyzer.hpp"
#include "services/analysis/pairing_engine.hpp"
#include "services/analysis/result_assembler.hpp"
#include "services/detection/serialized_detector.hpp"
#include "services/measurement/tooth_contour_extractor.hpp"
#include "services/measurement/width_measurement_engine.hpp"
#include "services/preprocessing/image_quality.hpp"
#include "services/preprocessing/radiograph_preprocessor.hpp"
#include "core/logging.hpp"

#include <chrono>
#include <format>
#include <semaphore>
#include <utility>

namespace dentescope::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("DetectorBackedAnalyzer");
    return logger;
}

using Clock = std::chrono::steady_clock;

/// Releases an acquired inference slot on scope exit
class SlotGuard {
public:
    explicit SlotGuard(std::counting_semaphore<>& slots) : slots_(slots) {}
    ~SlotGuard() { slots_.release(); }

    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

private:
    std::counting_semaphore<>& slots_;
};

std::expected<void, core::AnalysisError>
checkDeadline(Clock::time_point deadline, const char* stage, const std::string& sourceName) {
    if (Clock::now() > deadline) {
        getLogger()->warn("'{}': deadline exceeded before {}", sourceName, stage);
        return std::unexpected(core::AnalysisError{
            core::AnalysisError::Code::Timeout,
            std::format("deadline exceeded before {} of '{}'", stage, sourceName)
        });
    }
    return {};
}

core::AnalysisError toAnalysisError(const DetectorError& error) {
    return core::AnalysisError{core::AnalysisError::Code::DetectorUnavailable,
                               error.toString()};
}
}  // anonymous namespace

class DetectorBackedAnalyzer::Impl {
public:
    Impl(std::shared_ptr<ToothDetector> detector, core::AnalysisConfig config)
        : detector_(SerializedDetector::ensureThreadSafe(std::move(detector)))
        , config_(std::move(config))
        , slots_(static_cast<std::ptrdiff_t>(config_.effectiveInferenceSlots())) {}

    std::expected<AnalysisResult, core::AnalysisError>
    analyze(const ImageInput& input, const core::AnalysisOptions& options) {
        const auto start = Clock::now();
        const auto config = config_.withOverrides(options);
        if (auto valid = config.validate(); !valid) {
            getLogger()->error("'{}': {}", input.name, valid.error().toString());
            return std::unexpected(valid.error());
        }
        const auto deadline = options.deadline.value_or(start + config.timeout);

        if (auto ok = checkDeadline(deadline, "preprocessing", input.name); !ok) {
            return std::unexpected(ok.error());
        }
        auto prepared = preprocessor_.preprocess(input.bytes, input.name,
                                                 config.preprocessing);
        if (!prepared) {
            getLogger()->error("'{}': {}", input.name, prepared.error().toString());
            return std::unexpected(prepared.error());
        }

        auto quality = assessor_.assess(*prepared);
        if (!quality) {
            return std::unexpected(core::AnalysisError{
                core::AnalysisError::Code::PreprocessingFailed,
                quality.error().toString()
            });
        }

        auto detections = runDetector(*prepared, config, deadline, input.name);
        if (!detections) {
            return std::unexpected(detections.error());
        }
        if (auto ok = checkDeadline(deadline, "classification", input.name); !ok) {
            return std::unexpected(ok.error());
        }

        // Measurements and anatomical fractions refer to the original image
        std::vector<Detection> original;
        original.reserve(detections->size());
        for (const auto& detection : *detections) {
            original.push_back(detection.scaled(prepared->scaleX, prepared->scaleY));
        }

        AnatomicalClassifier classifier(config.anatomy);
        auto classified = classifier.classify(original, prepared->originalWidth,
                                              prepared->originalHeight);

        PairingEngine pairing(config.anatomy);
        auto paired = pairing.pair(classified);

        AssemblyContext context;
        context.sourceName = input.name;
        context.analyzerName = name();
        context.imageQuality = *quality;
        context.detectedTeethCount = original.size();
        context.molarCandidates = classified.molars.size();
        context.premolarCandidates = classified.premolars.size();
        context.unpairedMolars = paired.unpairedMolars;
        context.calibrationMmPerPixel = config.calibrationMmPerPixel;
        context.magnificationFactor = config.magnificationFactor;

        WidthMeasurementEngine engine(config.anatomy);
        ClinicalAnalyzer clinical(config.bands);

        std::vector<PairReport> reports;
        reports.reserve(paired.pairs.size());
        for (auto& pair : paired.pairs) {
            if (config.measurementMethod == core::MeasurementMethod::PrincipalAxis) {
                attachContour(pair.molar, *prepared, context.warnings);
                attachContour(pair.premolar, *prepared, context.warnings);
            }

            auto molar = engine.measure(pair.molar, config.calibrationMmPerPixel,
                                        config.magnificationFactor,
                                        config.measurementMethod);
            auto premolar = engine.measure(pair.premolar, config.calibrationMmPerPixel,
                                           config.magnificationFactor,
                                           config.measurementMethod);
            if (!molar || !premolar) {
                const auto& error = !molar ? molar.error() : premolar.error();
                getLogger()->error("'{}': {}", input.name, error.toString());
                return std::unexpected(core::AnalysisError{
                    core::AnalysisError::Code::InternalError, error.toString()
                });
            }

            auto outcome = engine.applySizeConstraint(*molar, *premolar);

            PairReport report;
            report.molarMeasurement = *molar;
            report.premolarMeasurement = outcome.premolar;
            report.sizeConstraintViolated = outcome.violated;
            report.sizeClamped = outcome.clamped;
            report.rawPremolarWidthMm = outcome.rawPremolarWidthMm;
            report.widthDifference = clinical.analyze(*molar, outcome.premolar);
            report.implausibleWidth = !engine.isPlausible(*molar) ||
                                      !engine.isPlausible(outcome.premolar);
            report.pair = std::move(pair);
            reports.push_back(std::move(report));
        }

        if (auto ok = checkDeadline(deadline, "assembly", input.name); !ok) {
            return std::unexpected(ok.error());
        }

        context.elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        ResultAssembler assembler(std::move(clinical));
        return assembler.assemble(context, std::move(reports));
    }

    std::string name() const {
        return detector_ ? std::format("DetectorBackedAnalyzer({})", detector_->name())
                         : std::string("DetectorBackedAnalyzer");
    }

    const core::AnalysisConfig& config() const noexcept { return config_; }

private:
    std::expected<std::vector<Detection>, core::AnalysisError>
    runDetector(const PreprocessedImage& prepared,
                const core::AnalysisConfig& config,
                Clock::time_point deadline,
                const std::string& sourceName) {
        if (!detector_) {
            return std::unexpected(core::AnalysisError{
                core::AnalysisError::Code::DetectorUnavailable,
                "no detector backend configured"
            });
        }

        if (!slots_.try_acquire_until(deadline)) {
            return std::unexpected(core::AnalysisError{
                core::AnalysisError::Code::Timeout,
                std::format("no inference slot available before the deadline of '{}'",
                            sourceName)
            });
        }
        SlotGuard guard(slots_);

        if (auto ok = checkDeadline(deadline, "detection", sourceName); !ok) {
            return std::unexpected(ok.error());
        }

        auto detections = detector_->detect(prepared, config.confidenceThreshold,
                                            config.iouThreshold);
        if (!detections) {
            getLogger()->error("'{}': {} failed: {}", sourceName, detector_->name(),
                               detections.error().toString());
            return std::unexpected(toAnalysisError(detections.error()));
        }
        getLogger()->debug("'{}': {} returned {} detection(s)", sourceName,
                           detector_->name(), detections->size());
        return std::move(*detections);
    }

    /// Extract a contour from the enhanced image when the detector gave none
    void attachContour(ClassifiedTooth& tooth,
                       const PreprocessedImage& prepared,
                       std::vector<std::string>& warnings) const {
        auto& detection = tooth.detection;
        if (!detection.contour.empty()) {
            return;
        }

        const double toProcessedX = 1.0 / prepared.scaleX;
        const double toProcessedY = 1.0 / prepared.scaleY;
        auto contour = extractor_.extract(prepared.enhanced,
                                          detection.box.scaled(toProcessedX, toProcessedY));
        if (!contour) {
            warnings.push_back(std::format("contour extraction failed for '{}': {}",
                                           detection.classLabel,
                                           contour.error().toString()));
            return;
        }

        detection.contour.reserve(contour->size());
        for (const auto& point : *contour) {
            detection.contour.push_back({point.x * prepared.scaleX,
                                         point.y * prepared.scaleY});
        }
    }

    std::shared_ptr<ToothDetector> detector_;
    core::AnalysisConfig config_;
    std::counting_semaphore<> slots_;

    RadiographPreprocessor preprocessor_;
    ImageQualityAssessor assessor_;
    ToothContourExtractor extractor_;
};

DetectorBackedAnalyzer::DetectorBackedAnalyzer(std::shared_ptr<ToothDetector> detector,
                                               core::AnalysisConfig config)
    : impl_(std::make_unique<Impl>(std::move(detector), std::move(config))) {}

DetectorBackedAnalyzer::~DetectorBackedAnalyzer() = default;

DetectorBackedAnalyzer::DetectorBackedAnalyzer(DetectorBackedAnalyzer&&) noexcept = default;
DetectorBackedAnalyzer& DetectorBackedAnalyzer::operator=(DetectorBackedAnalyzer&&) noexcept = default;

std::expected<AnalysisResult, core::AnalysisError>
DetectorBackedAnalyzer::analyze(const ImageInput& input, const core::AnalysisOptions& options) {
    return impl_->analyze(input, options);
}

std::string DetectorBackedAnalyzer::name() const {
    return impl_->name();
}

const core::AnalysisConfig& DetectorBackedAnalyzer::config() const noexcept {
    return impl_->config();
}

}  // namespace dentescope::services
