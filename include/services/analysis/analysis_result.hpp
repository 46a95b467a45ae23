// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file analysis_result.hpp
 * @brief Output contract of a single radiograph analysis
 * @details An AnalysisResult is returned for every request that ran to
 *          completion, including those that found nothing to measure.
 *          Empty results carry an EmptyReason so callers can tell "no
 *          detections" from "no valid pair" without treating either as a
 *          failure.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "services/analysis/clinical_analyzer.hpp"
#include "services/analysis/tooth_types.hpp"
#include "services/measurement/measurement_types.hpp"
#include "services/preprocessing/image_quality.hpp"

namespace dentescope::services {

/**
 * @brief Why a successful result contains no pairs
 */
enum class EmptyReason {
    None,               ///< At least one pair was measured
    NoDetections,       ///< Detector returned zero regions
    NoEligibleTeeth,    ///< No molar or no premolar candidate after classification
    PairingImpossible   ///< Candidates exist but no anatomically valid pair
};

/**
 * @brief One measured molar / premolar pair
 */
struct PairReport {
    ToothPair pair;

    Measurement molarMeasurement;

    /// Premolar measurement after the size constraint
    Measurement premolarMeasurement;

    bool sizeConstraintViolated = false;
    bool sizeClamped = false;
    double rawPremolarWidthMm = 0.0;

    WidthDifferenceResult widthDifference;

    /// Either width lies outside the plausible range
    bool implausibleWidth = false;
};

/**
 * @brief Complete result of one radiograph analysis
 */
struct AnalysisResult {
    std::string sourceName;

    /// Strategy that produced the result
    std::string analyzerName;

    std::vector<PairReport> pairs;

    ImageQuality imageQuality;

    std::vector<std::string> clinicalRecommendations;

    /// Heuristic overrides and fallbacks applied during the analysis
    std::vector<std::string> warnings;

    EmptyReason emptyReason = EmptyReason::None;

    int64_t processingTimeMs = 0;

    double calibrationMmPerPixel = 0.0;
    double magnificationFactor = 1.0;

    size_t detectedTeethCount = 0;
    size_t unpairedMolars = 0;

    [[nodiscard]] size_t totalPairsDetected() const noexcept { return pairs.size(); }

    [[nodiscard]] bool isEmpty() const noexcept { return pairs.empty(); }
};

[[nodiscard]] std::string toString(EmptyReason reason);

}  // namespace dentescope::services
