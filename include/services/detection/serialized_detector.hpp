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

#include <memory>
#include <mutex>

#include "services/detection/tooth_detector.hpp"

namespace dentescope::services {

/**
 * @brief Decorator that serializes calls into a non-thread-safe detector
 *
 * Batch workers share one backend instance; this wrapper guards it with a
 * mutex so only one inference runs at a time.
 */
class SerializedDetector : public ToothDetector {
public:
    explicit SerializedDetector(std::shared_ptr<ToothDetector> inner);

    [[nodiscard]] std::expected<std::vector<Detection>, DetectorError> detect(
        const PreprocessedImage& image,
        double confidenceThreshold,
        double iouThreshold) override;

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] bool isThreadSafe() const noexcept override { return true; }

    /**
     * @brief Wrap `detector` only when it is not already thread-safe
     */
    [[nodiscard]] static std::shared_ptr<ToothDetector>
    ensureThreadSafe(std::shared_ptr<ToothDetector> detector);

private:
    std::shared_ptr<ToothDetector> inner_;
    std::mutex mutex_;
};

}  // namespace dentescope::services
