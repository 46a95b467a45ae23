#include "services/analysis/clinical_analyzer.hpp"
#include "core/logging.hpp"

#include <cmath>
#include <utility>

namespace dentescope::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ClinicalAnalyzer");
    return logger;
}
}  // anonymous namespace

ClinicalAnalyzer::ClinicalAnalyzer(core::ClinicalBandTable table)
    : table_(std::move(table)) {}

core::Severity ClinicalAnalyzer::classify(double valueMm, double percentage) const noexcept {
    const double absValue = std::abs(valueMm);
    const double absPercentage = std::abs(percentage);

    for (const auto& band : table_.bands) {
        bool exceeded = false;
        switch (table_.basis) {
            case core::ClassificationBasis::ValueMm:
                exceeded = absValue > band.minValueMm;
                break;
            case core::ClassificationBasis::Percentage:
                exceeded = absPercentage > band.minPercentage;
                break;
            case core::ClassificationBasis::Either:
                exceeded = absValue > band.minValueMm || absPercentage > band.minPercentage;
                break;
        }
        if (exceeded) {
            return band.severity;
        }
    }
    return core::Severity::Normal;
}

std::string ClinicalAnalyzer::labelFor(core::Severity severity) const {
    for (const auto& band : table_.bands) {
        if (band.severity == severity) {
            return band.label;
        }
    }
    return table_.normalLabel;
}

WidthDifferenceResult ClinicalAnalyzer::analyze(const Measurement& molar,
                                                const Measurement& premolar) const {
    WidthDifferenceResult result;
    result.valueMm = molar.widthMm - premolar.widthMm;
    result.percentage = premolar.widthMm > 0.0 ? result.valueMm / premolar.widthMm * 100.0
                                               : 0.0;
    result.severity = classify(result.valueMm, result.percentage);
    result.clinicalSignificance = labelFor(result.severity);
    result.withinNormalRange = result.valueMm >= table_.normalRangeMinMm &&
                               result.valueMm <= table_.normalRangeMaxMm;

    getLogger()->debug("Width difference {:.2f}mm ({:.1f}%) -> {}", result.valueMm,
                       result.percentage, result.clinicalSignificance);
    return result;
}

std::vector<std::string> ClinicalAnalyzer::bandRecommendations(core::Severity severity) {
    switch (severity) {
        case core::Severity::HighlySignificant:
            return {
                "Significant width discrepancy detected (>3mm)",
                "Space maintainer placement strongly recommended",
                "Immediate orthodontic consultation advised",
                "Monitor for potential crowding issues"
            };
        case core::Severity::Significant:
            return {
                "Moderate width discrepancy detected (2-3mm)",
                "Consider space maintainer placement",
                "Orthodontic consultation recommended",
                "Regular monitoring advised"
            };
        case core::Severity::Moderate:
            return {
                "Minor width discrepancy detected (1-2mm)",
                "Monitor eruption pattern closely",
                "Consider preventive measures",
                "Regular follow-up recommended"
            };
        case core::Severity::Normal:
            break;
    }
    return {
        "Normal width relationship detected",
        "Continue routine monitoring",
        "No immediate intervention required"
    };
}

std::vector<std::string>
ClinicalAnalyzer::recommendations(const WidthDifferenceResult& result,
                                  bool sizeClamped,
                                  bool implausibleWidth) const {
    auto lines = bandRecommendations(result.severity);

    const double absPercentage = std::abs(result.percentage);
    if (absPercentage > 30.0) {
        lines.emplace_back("Percentage difference >30% indicates high risk");
    } else if (absPercentage > 20.0) {
        lines.emplace_back("Percentage difference >20% requires attention");
    }

    if (sizeClamped) {
        lines.emplace_back("Premolar width was adjusted by the size constraint; "
                           "verify the measurement manually");
    }
    if (implausibleWidth) {
        lines.emplace_back("A measured width lies outside the plausible range; "
                           "check calibration and image framing");
    }
    return lines;
}

}  // namespace dentescope::services
