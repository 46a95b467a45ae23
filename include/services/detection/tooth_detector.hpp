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
#include <vector>

#include "services/detection/detection_types.hpp"
#include "services/preprocessing/radiograph_preprocessor.hpp"

namespace dentescope::services {

/**
 * @brief Interface for tooth detector backends
 *
 * Strategy pattern interface: the pipeline only relies on this contract,
 * never on a model architecture. Returned detections are in the processed
 * image's pixel space and already filtered by the confidence threshold;
 * non-max suppression with the IoU threshold is the backend's concern.
 * Zero, one or many detections per class are all valid outputs.
 */
class ToothDetector {
public:
    virtual ~ToothDetector() = default;

    /**
     * @brief Run detection on a preprocessed radiograph
     * @param image Detector-ready image
     * @param confidenceThreshold Detections below this score are dropped
     * @param iouThreshold Overlap threshold for the backend's NMS
     * @return Detections, or Unavailable / InferenceFailed / InvalidOutput
     */
    [[nodiscard]] virtual std::expected<std::vector<Detection>, DetectorError> detect(
        const PreprocessedImage& image,
        double confidenceThreshold,
        double iouThreshold) = 0;

    /**
     * @brief Human-readable backend name for logs
     */
    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * @brief Whether detect() may be called concurrently
     */
    [[nodiscard]] virtual bool isThreadSafe() const noexcept = 0;
};

}  // namespace dentescope::services
