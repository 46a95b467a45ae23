#include "services/analysis/mock_analyzer.hpp"
#include "services/analysis/clinical_analyzer.hpp"
#include "services/analysis/pairing_engine.hpp"
#include "services/analysis/result_assembler.hpp"
#include "services/measurement/width_measurement_engine.hpp"
#include "services/preprocessing/image_quality.hpp"
#include "services/preprocessing/radiograph_preprocessor.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <random>
#include <utility>

namespace dentescope::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("MockAnalyzer");
    return logger;
}

constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

// Width ranges (mm) of the simulated teeth
constexpr double kMolarMinMm = 10.5;
constexpr double kMolarMaxMm = 12.5;
constexpr double kPremolarMinMm = 8.2;
constexpr double kPremolarMaxMm = 9.7;

/// Image x coordinate of an anterior-to-posterior fraction
double xForFraction(double fraction, double width, core::SideConvention convention) {
    switch (convention) {
        case core::SideConvention::PosteriorLeft:
            return (1.0 - fraction) * width;
        case core::SideConvention::MidlineOut:
            return width / 2.0 + fraction * width / 2.0;
        case core::SideConvention::PosteriorRight:
            break;
    }
    return fraction * width;
}

ClassifiedTooth simulatedTooth(const std::string& label, int classId, double confidence,
                               double widthPx, Point2D center, ToothCategory category,
                               double positionalBonus) {
    ClassifiedTooth tooth;
    const double heightPx = widthPx * 1.15;
    tooth.detection.box = {center.x - widthPx / 2.0, center.y - heightPx / 2.0,
                           widthPx, heightPx};
    tooth.detection.classLabel = label;
    tooth.detection.classId = classId;
    tooth.detection.confidence = confidence;
    tooth.category = category;
    tooth.positionalBonus = positionalBonus;
    return tooth;
}

std::expected<void, core::AnalysisError>
checkDeadline(std::chrono::steady_clock::time_point deadline, const char* stage,
              const std::string& sourceName) {
    if (std::chrono::steady_clock::now() > deadline) {
        getLogger()->warn("'{}': deadline exceeded before {}", sourceName, stage);
        return std::unexpected(core::AnalysisError{
            core::AnalysisError::Code::Timeout,
            std::format("deadline exceeded before {} of '{}'", stage, sourceName)
        });
    }
    return {};
}
}  // anonymous namespace

class MockAnalyzer::Impl {
public:
    explicit Impl(core::AnalysisConfig config) : config_(std::move(config)) {}

    std::expected<AnalysisResult, core::AnalysisError>
    analyze(const ImageInput& input, const core::AnalysisOptions& options) const {
        const auto start = std::chrono::steady_clock::now();
        const auto config = config_.withOverrides(options);
        if (auto valid = config.validate(); !valid) {
            return std::unexpected(valid.error());
        }

        const auto deadline = options.deadline.value_or(start + config.timeout);
        if (auto ok = checkDeadline(deadline, "preprocessing", input.name); !ok) {
            return std::unexpected(ok.error());
        }

        auto prepared = preprocessor_.preprocess(input.bytes, input.name,
                                                 config.preprocessing);
        if (!prepared) {
            return std::unexpected(prepared.error());
        }
        auto quality = assessor_.assess(*prepared);
        if (!quality) {
            return std::unexpected(core::AnalysisError{
                core::AnalysisError::Code::PreprocessingFailed,
                quality.error().toString()
            });
        }

        std::mt19937_64 rng(fnv1a(input.bytes));
        std::uniform_real_distribution<double> molarWidth(kMolarMinMm, kMolarMaxMm);
        std::uniform_real_distribution<double> premolarWidth(kPremolarMinMm, kPremolarMaxMm);
        std::uniform_real_distribution<double> molarConfidence(0.85, 0.95);
        std::uniform_real_distribution<double> premolarConfidence(0.82, 0.94);

        const auto& anatomy = config.anatomy;
        const double pxPerMm = config.magnificationFactor / config.calibrationMmPerPixel;
        const double width = prepared->originalWidth;
        const double height = prepared->originalHeight;

        Point2D molarCenter{
            xForFraction(anatomy.molarHorizontal.center(), width, anatomy.sideConvention),
            anatomy.molarVertical.center() * height};
        Point2D premolarCenter{
            xForFraction(anatomy.premolarHorizontal.center(), width, anatomy.sideConvention),
            anatomy.premolarVertical.center() * height};

        ToothPair pair;
        pair.molar = simulatedTooth("primary_second_molar", 0, molarConfidence(rng),
                                    molarWidth(rng) * pxPerMm, molarCenter,
                                    ToothCategory::PrimaryMolar, anatomy.positionalBonus);
        pair.premolar = simulatedTooth("second_premolar", 1, premolarConfidence(rng),
                                       premolarWidth(rng) * pxPerMm, premolarCenter,
                                       ToothCategory::Premolar, anatomy.positionalBonus);
        pair.centroidDistancePx = PairingEngine::centroidDistance(pair.molar, pair.premolar);
        pair.pairConfidence = std::min(pair.molar.rawConfidence(),
                                       pair.premolar.rawConfidence());

        WidthMeasurementEngine engine(anatomy);
        ClinicalAnalyzer clinical(config.bands);

        auto molar = engine.measure(pair.molar, config.calibrationMmPerPixel,
                                    config.magnificationFactor,
                                    core::MeasurementMethod::BoundingBox);
        auto premolar = engine.measure(pair.premolar, config.calibrationMmPerPixel,
                                       config.magnificationFactor,
                                       core::MeasurementMethod::BoundingBox);
        if (!molar || !premolar) {
            const auto& error = !molar ? molar.error() : premolar.error();
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

        if (auto ok = checkDeadline(deadline, "assembly", input.name); !ok) {
            return std::unexpected(ok.error());
        }

        AssemblyContext context;
        context.sourceName = input.name;
        context.analyzerName = "MockAnalyzer";
        context.imageQuality = *quality;
        context.detectedTeethCount = 2;
        context.molarCandidates = 1;
        context.premolarCandidates = 1;
        context.calibrationMmPerPixel = config.calibrationMmPerPixel;
        context.magnificationFactor = config.magnificationFactor;
        context.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        std::vector<PairReport> reports;
        reports.push_back(std::move(report));

        getLogger()->debug("'{}': simulated pair {:.2f}mm / {:.2f}mm", input.name,
                           reports.front().molarMeasurement.widthMm,
                           reports.front().premolarMeasurement.widthMm);

        ResultAssembler assembler(std::move(clinical));
        return assembler.assemble(context, std::move(reports));
    }

private:
    core::AnalysisConfig config_;
    RadiographPreprocessor preprocessor_;
    ImageQualityAssessor assessor_;
};

MockAnalyzer::MockAnalyzer(core::AnalysisConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

MockAnalyzer::~MockAnalyzer() = default;

MockAnalyzer::MockAnalyzer(MockAnalyzer&&) noexcept = default;
MockAnalyzer& MockAnalyzer::operator=(MockAnalyzer&&) noexcept = default;

std::expected<AnalysisResult, core::AnalysisError>
MockAnalyzer::analyze(const ImageInput& input, const core::AnalysisOptions& options) {
    return impl_->analyze(input, options);
}

uint64_t MockAnalyzer::fnv1a(std::span<const uint8_t> bytes) noexcept {
    uint64_t hash = kFnvOffsetBasis;
    for (uint8_t byte : bytes) {
        hash ^= byte;
        hash *= kFnvPrime;
    }
    return hash;
}

}  // namespace dentescope::services
