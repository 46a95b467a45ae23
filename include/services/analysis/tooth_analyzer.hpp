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

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

#include "core/analysis_config.hpp"
#include "core/analysis_error.hpp"
#include "services/analysis/analysis_result.hpp"

namespace dentescope::services {

/**
 * @brief One radiograph to analyze
 */
struct ImageInput {
    /// File name or other identifier, also used for detector lookups
    std::string name;

    /// Encoded image payload (PNG, JPEG, TIFF, BMP, DICOM)
    std::vector<uint8_t> bytes;
};

/**
 * @brief Interface for radiograph analysis strategies
 *
 * Implementations must be safe to call concurrently from batch workers and
 * must not keep per-request state between calls.
 */
class ToothAnalyzer {
public:
    virtual ~ToothAnalyzer() = default;

    /**
     * @brief Analyze one radiograph
     * @param input Image payload and name
     * @param options Per-request overrides merged on top of the analyzer's
     *        configuration
     * @return Result (possibly empty with an EmptyReason) or the error that
     *         stopped the request
     */
    [[nodiscard]] virtual std::expected<AnalysisResult, core::AnalysisError>
    analyze(const ImageInput& input, const core::AnalysisOptions& options) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

}  // namespace dentescope::services
