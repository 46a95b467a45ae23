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
 * @file batch_analyzer.hpp
 * @brief Parallel analysis of multiple radiographs
 * @details Each image runs the full pipeline as one task on a fixed worker
 *          pool. Results keep input order, per-image failures are recorded
 *          on their item without aborting the others, and a single batch
 *          deadline turns unfinished items into Timeout errors.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "core/analysis_config.hpp"
#include "core/analysis_error.hpp"
#include "services/analysis/tooth_analyzer.hpp"

namespace dentescope::services {

/**
 * @brief Outcome of one image in a batch
 */
struct BatchItemResult {
    std::string fileName;
    size_t fileSize = 0;
    std::expected<AnalysisResult, core::AnalysisError> outcome;

    [[nodiscard]] bool succeeded() const noexcept { return outcome.has_value(); }
};

/**
 * @brief Aggregates over the successful items of a batch
 */
struct BatchSummary {
    size_t totalFiles = 0;
    size_t processedFiles = 0;
    size_t failedFiles = 0;
    int64_t totalProcessingTimeMs = 0;

    /// Mean |value_mm| over all pairs of successful items, 0 without pairs
    double averageWidthDifference = 0.0;

    /// Pair counts indexed by core::Severity
    std::array<size_t, 4> severityCounts{};

    [[nodiscard]] size_t countFor(core::Severity severity) const noexcept {
        return severityCounts[static_cast<size_t>(severity)];
    }
};

struct BatchResult {
    std::vector<BatchItemResult> items;
    BatchSummary summary;
};

/**
 * @brief Runs a ToothAnalyzer over many images concurrently
 *
 * @example
 * @code
 * auto analyzer = std::make_shared<DetectorBackedAnalyzer>(detector, config);
 * BatchAnalyzer batch(analyzer, 4, std::chrono::minutes(5));
 *
 * auto result = batch.analyze(std::move(images));
 * std::cout << result.summary.processedFiles << " of "
 *           << result.summary.totalFiles << " analyzed\n";
 * @endcode
 */
class BatchAnalyzer {
public:
    /**
     * @param analyzer Strategy used for every image; must be thread-safe
     * @param workerCount Worker threads, 0 selects hardware concurrency
     * @param timeout Batch deadline measured from the start of analyze()
     */
    BatchAnalyzer(std::shared_ptr<ToothAnalyzer> analyzer,
                  unsigned int workerCount = 0,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds{300000});
    ~BatchAnalyzer();

    // Non-copyable, movable
    BatchAnalyzer(const BatchAnalyzer&) = delete;
    BatchAnalyzer& operator=(const BatchAnalyzer&) = delete;
    BatchAnalyzer(BatchAnalyzer&&) noexcept;
    BatchAnalyzer& operator=(BatchAnalyzer&&) noexcept;

    /**
     * @brief Analyze all inputs and return one item per input, in order
     *
     * `options.deadline`, when set, replaces the batch timeout. Items not
     * finished by the deadline are reported as Timeout; their late results
     * are discarded.
     */
    [[nodiscard]] BatchResult analyze(std::vector<ImageInput> inputs,
                                      const core::AnalysisOptions& options = {});

    [[nodiscard]] size_t workerCount() const noexcept;

    /// Summary over already collected items
    [[nodiscard]] static BatchSummary summarize(const std::vector<BatchItemResult>& items,
                                                std::chrono::milliseconds elapsed);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace dentescope::services
