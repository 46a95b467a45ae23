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
 * @file landmark_analyzer.hpp
 * @brief Width analysis from operator-placed edge landmarks
 * @details An operator marks the mesial and distal edges of the primary
 *          molar and of the premolar. The two distances are calibrated,
 *          pass the same size constraint and clinical classification as
 *          detector-based pairs, and are assembled into an AnalysisResult.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <expected>
#include <string>

#include "core/analysis_config.hpp"
#include "core/analysis_error.hpp"
#include "services/analysis/analysis_result.hpp"

namespace dentescope::services {

/// Two edge points of one tooth in original-image pixels
struct LandmarkSegment {
    Point2D first;
    Point2D second;
};

struct LandmarkRequest {
    /// Radiograph the landmarks were placed on
    std::string sourceName;

    LandmarkSegment molar;
    LandmarkSegment premolar;
};

/**
 * @brief Measures a molar / premolar pair from landmarks
 *
 * @example
 * @code
 * LandmarkAnalyzer analyzer(config);
 * auto result = analyzer.analyze({"pano.png", {{100, 200}, {212, 204}},
 *                                 {{300, 210}, {386, 212}}});
 * // result->pairs[0].widthDifference.withinNormalRange
 * @endcode
 */
class LandmarkAnalyzer {
public:
    explicit LandmarkAnalyzer(core::AnalysisConfig config = {});

    /**
     * @brief Measure both segments and classify their width difference
     * @return One-pair result, or CalibrationMisconfigured /
     *         InvalidConfiguration for bad calibration or degenerate landmarks
     */
    [[nodiscard]] std::expected<AnalysisResult, core::AnalysisError>
    analyze(const LandmarkRequest& request, const core::AnalysisOptions& options = {}) const;

private:
    core::AnalysisConfig config_;
};

}  // namespace dentescope::services
