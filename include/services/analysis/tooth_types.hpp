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

#include <algorithm>
#include <string>
#include <vector>

#include "services/detection/detection_types.hpp"

namespace dentescope::services {

/**
 * @brief Anatomical category resolved for a detection
 */
enum class ToothCategory {
    PrimaryMolar,
    Premolar,
    Rejected
};

/// Category suggested by the detector's own class label
enum class LabelHint {
    None,
    PrimaryMolar,
    Premolar
};

/**
 * @brief Half of the dental arch a detection lies in
 *
 * Single-sided conventions put every detection on the same half (Whole);
 * MidlineOut splits the image at its vertical midline.
 */
enum class ArchSide {
    Whole,
    Left,
    Right
};

/**
 * @brief Anatomical region tests that produced a ToothCategory
 */
struct RegionTests {
    /// 0 = anterior edge, 1 = posterior edge, per side convention
    double horizontalFraction = 0.0;

    /// 0 = top, 1 = bottom
    double verticalFraction = 0.0;

    ArchSide archSide = ArchSide::Whole;

    bool molarEligible = false;
    bool premolarEligible = false;

    LabelHint labelHint = LabelHint::None;

    /// (rank + 1) / n of the detection's area among all detections
    double areaPercentile = 0.0;

    /// Molar-band winner moved out of the molar category for being too small
    bool demotedBySize = false;
};

/**
 * @brief Detection annotated with its resolved category
 *
 * The detector confidence is kept untouched; the positional bonus is a
 * separate heuristic adjustment.
 */
struct ClassifiedTooth {
    Detection detection;
    ToothCategory category = ToothCategory::Rejected;
    RegionTests regionTests;

    /// Heuristic confidence bonus for lying inside the category's band
    double positionalBonus = 0.0;

    [[nodiscard]] double rawConfidence() const noexcept {
        return detection.confidence;
    }

    [[nodiscard]] double adjustedConfidence() const noexcept {
        return std::min(1.0, detection.confidence + positionalBonus);
    }
};

/**
 * @brief Output of the anatomical classifier, one list per category
 */
struct ClassificationResult {
    std::vector<ClassifiedTooth> molars;
    std::vector<ClassifiedTooth> premolars;
    std::vector<ClassifiedTooth> rejected;

    [[nodiscard]] size_t total() const noexcept {
        return molars.size() + premolars.size() + rejected.size();
    }
};

/**
 * @brief One primary molar matched with one premolar
 */
struct ToothPair {
    ClassifiedTooth molar;
    ClassifiedTooth premolar;

    double centroidDistancePx = 0.0;

    /// min(molar, premolar) raw detector confidence
    double pairConfidence = 0.0;
};

/**
 * @brief Output of the pairing engine
 */
struct PairingResult {
    std::vector<ToothPair> pairs;

    /// Molars left without a valid premolar
    size_t unpairedMolars = 0;
};

[[nodiscard]] std::string toString(ToothCategory category);

}  // namespace dentescope::services
