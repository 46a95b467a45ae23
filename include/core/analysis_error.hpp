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
 * @file analysis_error.hpp
 * @brief Request-level error taxonomy for radiograph analysis
 * @details AnalysisError is what a ToothAnalyzer returns when a request
 *          cannot produce a result at all. Absence of detections or of
 *          valid pairs is never an AnalysisError; those cases are reported
 *          as successful results with an empty reason.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <string>

namespace dentescope::core {

/**
 * @brief Error information for a single analysis request
 */
struct AnalysisError {
    enum class Code {
        Success,
        ImageDecodeError,          ///< Payload is not a supported raster image
        DetectorUnavailable,       ///< Detector backend unreachable or failing
        CalibrationMisconfigured,  ///< Calibration or magnification <= 0
        InvalidConfiguration,      ///< Any other configuration inconsistency
        PreprocessingFailed,       ///< Image filters failed on decoded data
        Timeout,                   ///< Request exceeded its deadline
        InternalError
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    /// Infrastructure failures that may succeed when the request is repeated
    [[nodiscard]] bool isRetryable() const noexcept {
        return code == Code::DetectorUnavailable || code == Code::Timeout;
    }

    [[nodiscard]] std::string retryGuidance() const {
        switch (code) {
            case Code::DetectorUnavailable:
                return "Detector backend is unavailable; retry the request once "
                       "the detector service is reachable";
            case Code::Timeout:
                return "Analysis exceeded its deadline; retry with a longer "
                       "timeout or fewer concurrent images";
            default:
                return {};
        }
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::ImageDecodeError: return "Image decode error: " + message;
            case Code::DetectorUnavailable: return "Detector unavailable: " + message;
            case Code::CalibrationMisconfigured:
                return "Calibration misconfigured: " + message;
            case Code::InvalidConfiguration: return "Invalid configuration: " + message;
            case Code::PreprocessingFailed: return "Preprocessing failed: " + message;
            case Code::Timeout: return "Timeout: " + message;
            case Code::InternalError: return "Internal error: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Stable identifier used in JSON output ("image_decode_error", ...)
 */
[[nodiscard]] inline std::string toErrorId(AnalysisError::Code code) {
    switch (code) {
        case AnalysisError::Code::Success: return "success";
        case AnalysisError::Code::ImageDecodeError: return "image_decode_error";
        case AnalysisError::Code::DetectorUnavailable: return "detector_unavailable";
        case AnalysisError::Code::CalibrationMisconfigured:
            return "calibration_misconfigured";
        case AnalysisError::Code::InvalidConfiguration: return "invalid_configuration";
        case AnalysisError::Code::PreprocessingFailed: return "preprocessing_failed";
        case AnalysisError::Code::Timeout: return "timeout";
        case AnalysisError::Code::InternalError: return "internal_error";
    }
    return "internal_error";
}

}  // namespace dentescope::core
