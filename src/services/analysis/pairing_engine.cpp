#include "services/analysis/pairing_engine.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace dentescope::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("PairingEngine");
    return logger;
}
}  // anonymous namespace

PairingEngine::PairingEngine(core::AnatomicalConfig config)
    : config_(std::move(config)) {}

bool PairingEngine::isAnatomicallyOrdered(const ClassifiedTooth& molar,
                                          const ClassifiedTooth& premolar) noexcept {
    // Fractions are only comparable within one arch half
    if (molar.regionTests.archSide != premolar.regionTests.archSide) {
        return false;
    }
    return molar.regionTests.horizontalFraction > premolar.regionTests.horizontalFraction;
}

double PairingEngine::centroidDistance(const ClassifiedTooth& a,
                                       const ClassifiedTooth& b) noexcept {
    const auto ca = a.detection.centroid();
    const auto cb = b.detection.centroid();
    return std::hypot(ca.x - cb.x, ca.y - cb.y);
}

PairingResult PairingEngine::pair(const ClassificationResult& classified) const {
    PairingResult result;

    const auto& molars = classified.molars;
    const auto& premolars = classified.premolars;

    std::vector<size_t> molarOrder(molars.size());
    std::iota(molarOrder.begin(), molarOrder.end(), 0);
    std::stable_sort(molarOrder.begin(), molarOrder.end(), [&](size_t a, size_t b) {
        return molars[a].rawConfidence() > molars[b].rawConfidence();
    });

    std::vector<bool> claimed(premolars.size(), false);

    for (size_t molarIndex : molarOrder) {
        const auto& molar = molars[molarIndex];

        // Unclaimed premolars, nearest first
        std::vector<std::pair<double, size_t>> candidates;
        for (size_t p = 0; p < premolars.size(); ++p) {
            if (!claimed[p]) {
                candidates.emplace_back(centroidDistance(molar, premolars[p]), p);
            }
        }
        std::stable_sort(candidates.begin(), candidates.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });

        bool paired = false;
        for (const auto& [distance, p] : candidates) {
            if (!isAnatomicallyOrdered(molar, premolars[p])) {
                getLogger()->debug("Premolar '{}' not anterior to molar '{}' on its arch half, skipped",
                                   premolars[p].detection.classLabel,
                                   molar.detection.classLabel);
                continue;
            }
            if (config_.maxPairDistancePx > 0.0 && distance > config_.maxPairDistancePx) {
                getLogger()->debug("Premolar '{}' at {:.1f}px exceeds max pair distance {:.1f}px",
                                   premolars[p].detection.classLabel, distance,
                                   config_.maxPairDistancePx);
                // Remaining candidates are farther still
                break;
            }

            claimed[p] = true;
            ToothPair toothPair;
            toothPair.molar = molar;
            toothPair.premolar = premolars[p];
            toothPair.centroidDistancePx = distance;
            toothPair.pairConfidence =
                std::min(molar.rawConfidence(), premolars[p].rawConfidence());
            result.pairs.push_back(std::move(toothPair));
            paired = true;
            break;
        }

        if (!paired) {
            ++result.unpairedMolars;
        }
    }

    getLogger()->debug("Paired {} of {} molars ({} premolars available)",
                       result.pairs.size(), molars.size(), premolars.size());
    return result;
}

}  // namespace dentescope::services
