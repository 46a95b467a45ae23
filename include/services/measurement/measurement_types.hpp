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

#include "core/analysis_config.hpp"

namespace dentescope::services {

/**
 * @brief Error information for measurement operations
 */
struct MeasurementError {
    enum class Code {
        Success,
        InvalidInput,
        InvalidParameters,
        ExtractionFailed,
        InternalError
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::InvalidInput: return "Invalid input: " + message;
            case Code::InvalidParameters: return "Invalid parameters: " + message;
            case Code::ExtractionFailed: return "Extraction failed: " + message;
            case Code::InternalError: return "Internal error: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Calibrated mesiodistal width of one tooth
 */
struct Measurement {
    /// Calibrated width in millimeters
    double widthMm = 0.0;

    /// Width in original-image pixels before calibration
    double widthPx = 0.0;

    /// Method that actually produced the width
    core::MeasurementMethod method = core::MeasurementMethod::BoundingBox;

    double calibrationFactorUsed = 0.0;
    double magnificationUsed = 1.0;

    /// Principal-axis was requested but the bounding box had to be used
    bool fellBack = false;
};

/**
 * @brief Result of the molar > premolar size constraint
 */
struct SizeConstraintOutcome {
    Measurement premolar;

    /// Premolar measured wider than its molar
    bool violated = false;

    /// The premolar width was replaced by molar width * clamp ratio
    bool clamped = false;

    /// Premolar width before any correction
    double rawPremolarWidthMm = 0.0;
};

}  // namespace dentescope::services
