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

#include <string>
#include <vector>

#include "core/analysis_config.hpp"
#include "services/measurement/measurement_types.hpp"

namespace dentescope::services {

/**
 * @brief Width difference between a primary molar and its premolar
 */
struct WidthDifferenceResult {
    /// molar width - premolar width
    double valueMm = 0.0;

    /// valueMm / premolar width * 100
    double percentage = 0.0;

    core::Severity severity = core::Severity::Normal;

    /// Band label from the significance table
    std::string clinicalSignificance;

    /// valueMm inside the clinical leeway reference range
    bool withinNormalRange = false;
};

/**
 * @brief Derives width differences and clinical guidance
 *
 * Classification walks the band table from the most severe row down and
 * returns the first row whose threshold is exceeded, so a larger difference
 * never lands in a less severe band. Recommendation text is a fixed lookup
 * by severity.
 */
class ClinicalAnalyzer {
public:
    explicit ClinicalAnalyzer(core::ClinicalBandTable table = {});

    [[nodiscard]] WidthDifferenceResult analyze(const Measurement& molar,
                                                const Measurement& premolar) const;

    [[nodiscard]] core::Severity classify(double valueMm, double percentage) const noexcept;

    /// Table label for a severity, the normal label for Severity::Normal
    [[nodiscard]] std::string labelFor(core::Severity severity) const;

    /**
     * @brief Recommendations for one pair
     * @param result Classified width difference
     * @param sizeClamped Premolar width was replaced by the size clamp
     * @param implausibleWidth A width fell outside the plausible range
     */
    [[nodiscard]] std::vector<std::string> recommendations(const WidthDifferenceResult& result,
                                                           bool sizeClamped,
                                                           bool implausibleWidth) const;

    /// Fixed recommendation list of a severity band
    [[nodiscard]] static std::vector<std::string> bandRecommendations(core::Severity severity);

    [[nodiscard]] const core::ClinicalBandTable& table() const noexcept { return table_; }

private:
    core::ClinicalBandTable table_;
};

}  // namespace dentescope::services
