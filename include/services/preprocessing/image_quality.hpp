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

#include <expected>
#include <string>

#include "services/preprocessing/radiograph_preprocessor.hpp"

namespace dentescope::services {

/**
 * @brief Global image-quality metadata reported with every analysis
 *
 * Scores are normalized to [0, 1].
 */
struct ImageQuality {
    /// "WIDTHxHEIGHT" of the original radiograph
    std::string resolution;

    /// Mean intensity / 255
    double brightness = 0.0;

    /// Intensity standard deviation / 127.5, clamped to 1
    double contrast = 0.0;

    /// var(Laplacian) / (var(Laplacian) + 1000)
    double sharpness = 0.0;
};

/**
 * @brief Computes statistical quality scores of a preprocessed radiograph
 */
class ImageQualityAssessor {
public:
    /// Laplacian variance at which sharpness reaches 0.5
    static constexpr double kSharpnessHalfPoint = 1000.0;

    [[nodiscard]] std::expected<ImageQuality, PreprocessingError>
    assess(const PreprocessedImage& image) const;
};

}  // namespace dentescope::services
