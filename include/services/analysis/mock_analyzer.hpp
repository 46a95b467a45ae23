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
#include <memory>
#include <span>

#include "services/analysis/tooth_analyzer.hpp"

namespace dentescope::services {

/**
 * @brief Deterministic stand-in for the detector pipeline
 *
 * Produces one plausible molar / premolar pair per image. Widths, boxes and
 * confidences come from a std::mt19937_64 created for the request and seeded
 * with the FNV-1a hash of the image bytes, so the same image always yields
 * the same result and concurrent requests share no generator state. The
 * image is still decoded and assessed, and the pair flows through the same
 * size constraint, clinical analysis and assembly as the real pipeline.
 */
class MockAnalyzer : public ToothAnalyzer {
public:
    explicit MockAnalyzer(core::AnalysisConfig config = {});
    ~MockAnalyzer() override;

    // Non-copyable, movable
    MockAnalyzer(const MockAnalyzer&) = delete;
    MockAnalyzer& operator=(const MockAnalyzer&) = delete;
    MockAnalyzer(MockAnalyzer&&) noexcept;
    MockAnalyzer& operator=(MockAnalyzer&&) noexcept;

    [[nodiscard]] std::expected<AnalysisResult, core::AnalysisError>
    analyze(const ImageInput& input, const core::AnalysisOptions& options) override;

    [[nodiscard]] std::string name() const override { return "MockAnalyzer"; }

    /// 64-bit FNV-1a hash of a byte payload
    [[nodiscard]] static uint64_t fnv1a(std::span<const uint8_t> bytes) noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace dentescope::services
