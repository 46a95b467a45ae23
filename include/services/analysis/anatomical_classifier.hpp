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
 * @file anatomical_classifier.hpp
 * @brief Positional classification of detections into molar / premolar
 * @details Detector labels are unreliable near class boundaries, so each
 *          detection is categorized from where its centroid lies in the
 *          dental arch. Horizontal position is expressed as a fraction from
 *          the anterior (0) to the posterior (1) edge according to the
 *          configured side convention; vertical position from top (0) to
 *          bottom (1).
 *
 *          - Primary molar: centroid in the molar horizontal and vertical bands
 *          - Premolar: centroid in the premolar horizontal and vertical bands
 *          - Both: the band whose horizontal center is nearer wins, unless a
 *            detector label hint names one of the eligible categories
 *          - Neither: rejected
 *
 *          A molar-band winner whose area is small relative to the other
 *          detections is demoted to premolar (if eligible) or rejected.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <string>
#include <vector>

#include "core/analysis_config.hpp"
#include "services/analysis/tooth_types.hpp"

namespace dentescope::services {

/**
 * @brief Assigns each detection to primary molar, premolar or rejected
 *
 * @example
 * @code
 * AnatomicalClassifier classifier(core::AnatomicalConfig{});
 * auto classified = classifier.classify(detections, 2000, 1000);
 * for (const auto& molar : classified.molars) {
 *     // molar.regionTests.horizontalFraction in [0.55, 0.90]
 * }
 * @endcode
 */
class AnatomicalClassifier {
public:
    explicit AnatomicalClassifier(core::AnatomicalConfig config);

    /**
     * @brief Classify all detections of one radiograph
     *
     * @param detections Detections in original-image pixel space
     * @param imageWidth Original image width in pixels
     * @param imageHeight Original image height in pixels
     * @return One list per category; every detection appears exactly once
     */
    [[nodiscard]] ClassificationResult classify(const std::vector<Detection>& detections,
                                                unsigned int imageWidth,
                                                unsigned int imageHeight) const;

    /**
     * @brief Anterior (0) to posterior (1) fraction of an x coordinate
     */
    [[nodiscard]] double horizontalFraction(double x, double imageWidth) const noexcept;

    /// Arch half holding @p x; Whole unless the convention is MidlineOut
    [[nodiscard]] ArchSide archSide(double x, double imageWidth) const noexcept;

    /**
     * @brief Category suggested by a detector class label
     *
     * "premolar" / "bicuspid" hint premolar; "primary" / "deciduous" hint
     * primary molar. Matching is case-insensitive.
     */
    [[nodiscard]] static LabelHint labelHintFor(const std::string& classLabel);

    [[nodiscard]] const core::AnatomicalConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] ToothCategory resolveBands(const RegionTests& tests) const noexcept;

    core::AnatomicalConfig config_;
};

}  // namespace dentescope::services
