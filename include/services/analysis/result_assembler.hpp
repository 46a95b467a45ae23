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

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "services/analysis/analysis_result.hpp"
#include "services/analysis/clinical_analyzer.hpp"

namespace dentescope::services {

/**
 * @brief Request-level facts gathered by the pipeline before assembly
 */
struct AssemblyContext {
    std::string sourceName;
    std::string analyzerName;
    ImageQuality imageQuality;

    size_t detectedTeethCount = 0;
    size_t molarCandidates = 0;
    size_t premolarCandidates = 0;
    size_t unpairedMolars = 0;

    double calibrationMmPerPixel = 0.0;
    double magnificationFactor = 1.0;

    /// Warnings raised before measurement (e.g. contour extraction failures)
    std::vector<std::string> warnings;

    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Packages measured pairs and image metadata into an AnalysisResult
 *
 * Empty pair lists become successful results with an EmptyReason and the
 * insufficient-detection guidance. Recommendations of several pairs are
 * merged most severe first without duplicates.
 */
class ResultAssembler {
public:
    explicit ResultAssembler(ClinicalAnalyzer clinicalAnalyzer = ClinicalAnalyzer{});

    [[nodiscard]] AnalysisResult assemble(const AssemblyContext& context,
                                          std::vector<PairReport> pairs) const;

    /// Reason for an empty result derived from the candidate counts
    [[nodiscard]] static EmptyReason emptyReasonFor(const AssemblyContext& context) noexcept;

    /// Guidance returned when no pair could be measured
    [[nodiscard]] static std::vector<std::string> emptyRecommendations(EmptyReason reason);

private:
    ClinicalAnalyzer clinicalAnalyzer_;
};

}  // namespace dentescope::services
