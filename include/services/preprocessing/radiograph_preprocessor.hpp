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
#include <memory>
#include <span>
#include <string>

#include <itkImage.h>
#include <itkRGBPixel.h>

#include "core/analysis_config.hpp"
#include "core/analysis_error.hpp"
#include "core/radiograph_loader.hpp"

namespace dentescope::services {

/**
 * @brief Error information for preprocessing operations
 */
struct PreprocessingError {
    enum class Code {
        Success,
        InvalidInput,
        InvalidParameters,
        ProcessingFailed,
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
            case Code::ProcessingFailed: return "Processing failed: " + message;
            case Code::InternalError: return "Internal error: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Detector-ready radiograph with the geometry needed to map back
 *
 * All images are in processed pixel space (spacing 1, origin 0). Multiply a
 * processed-space x coordinate by scaleX to obtain the original-image x.
 */
struct PreprocessedImage {
    using GrayImageType = itk::Image<float, 2>;
    using RgbPixelType = itk::RGBPixel<unsigned char>;
    using RgbImageType = itk::Image<RgbPixelType, 2>;

    /// Contrast-enhanced, denoised grayscale image on the 0-255 scale
    GrayImageType::Pointer enhanced;

    /// Three-channel rendition of `enhanced` handed to the detector
    RgbImageType::Pointer rgb;

    std::string sourceName;

    unsigned int originalWidth = 0;
    unsigned int originalHeight = 0;
    unsigned int width = 0;
    unsigned int height = 0;

    double scaleX = 1.0;
    double scaleY = 1.0;
};

/**
 * @brief Normalizes decoded radiographs into the detector input representation
 *
 * Pipeline:
 * 1. Min-max rescale of the decoded grayscale image to 0-255
 * 2. CLAHE-style adaptive histogram equalization (clip limit, tile size)
 * 3. Denoising (bilateral by default, median, or none)
 * 4. Renormalization to the full 0-255 range
 * 5. Optional resize to a target width, aspect ratio preserved
 * 6. Composition into an RGB image
 *
 * @example
 * @code
 * RadiographPreprocessor preprocessor;
 * core::PreprocessingParameters params;
 * params.denoise = core::DenoiseMethod::Median;
 *
 * auto prepared = preprocessor.preprocess(pngBytes, "pano_001.png", params);
 * if (!prepared) {
 *     // prepared.error().code == AnalysisError::Code::ImageDecodeError
 * }
 * @endcode
 */
class RadiographPreprocessor {
public:
    using ImageType = PreprocessedImage::GrayImageType;

    RadiographPreprocessor();
    ~RadiographPreprocessor();

    // Non-copyable, movable
    RadiographPreprocessor(const RadiographPreprocessor&) = delete;
    RadiographPreprocessor& operator=(const RadiographPreprocessor&) = delete;
    RadiographPreprocessor(RadiographPreprocessor&&) noexcept;
    RadiographPreprocessor& operator=(RadiographPreprocessor&&) noexcept;

    /**
     * @brief Apply the preprocessing chain to a decoded image
     *
     * @param input Decoded grayscale image
     * @param sourceName Name carried into the result
     * @param params Filter parameters
     * @return Preprocessed image, or InvalidInput / InvalidParameters /
     *         ProcessingFailed
     */
    [[nodiscard]] std::expected<PreprocessedImage, PreprocessingError>
    apply(ImageType::Pointer input,
          const std::string& sourceName,
          const core::PreprocessingParameters& params) const;

    /**
     * @brief Decode raw bytes and apply the preprocessing chain
     *
     * @return Preprocessed image, ImageDecodeError when the bytes are not a
     *         supported raster format, PreprocessingFailed when filtering fails
     */
    [[nodiscard]] std::expected<PreprocessedImage, core::AnalysisError>
    preprocess(std::span<const uint8_t> bytes,
               const std::string& sourceName,
               const core::PreprocessingParameters& params) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace dentescope::services
