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
 * @file detector_backed_analyzer.hpp
 * @brief Full detection, pairing and measurement pipeline
 * @details Runs preprocess, detect, classify, pair, measure and clinical
 *          analysis for one radiograph. Detector calls are bounded by a
 *          counting semaphore sized to the configured inference slots, and
 *          the request deadline is checked between stages so an overdue
 *          request fails with Timeout instead of returning partial results.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <memory>

#include "services/analysis/tooth_analyzer.hpp"
#include "services/detection/tooth_detector.hpp"

namespace dentescope::services {

/**
 * @brief ToothAnalyzer backed by a ToothDetector
 *
 * @example
 * @code
 * auto detector = RecordedDetector::loadFromFile("detections.json");
 * DetectorBackedAnalyzer analyzer(std::move(*detector), AnalysisConfig{});
 *
 * auto result = analyzer.analyze({"pano_001.png", bytes}, {});
 * if (result && result->isEmpty()) {
 *     // result->emptyReason explains why no pair was measured
 * }
 * @endcode
 */
class DetectorBackedAnalyzer : public ToothAnalyzer {
public:
    /**
     * @param detector Detector backend; wrapped in a SerializedDetector when
     *        it is not thread-safe. A null detector makes every request fail
     *        with DetectorUnavailable.
     * @param config Base configuration
     */
    DetectorBackedAnalyzer(std::shared_ptr<ToothDetector> detector,
                           core::AnalysisConfig config);
    ~DetectorBackedAnalyzer() override;

    // Non-copyable, movable
    DetectorBackedAnalyzer(const DetectorBackedAnalyzer&) = delete;
    DetectorBackedAnalyzer& operator=(const DetectorBackedAnalyzer&) = delete;
    DetectorBackedAnalyzer(DetectorBackedAnalyzer&&) noexcept;
    DetectorBackedAnalyzer& operator=(DetectorBackedAnalyzer&&) noexcept;

    [[nodiscard]] std::expected<AnalysisResult, core::AnalysisError>
    analyze(const ImageInput& input, const core::AnalysisOptions& options) override;

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] const core::AnalysisConfig& config() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace dentescope::services
