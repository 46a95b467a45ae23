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

#include "services/preprocessing/image_quality.hpp"

#include <algorithm>
#include <format>

#include <itkLaplacianImageFilter.h>
#include <itkStatisticsImageFilter.h>

namespace dentescope::services {

std::expected<ImageQuality, PreprocessingError>
ImageQualityAssessor::assess(const PreprocessedImage& image) const {
    if (!image.enhanced) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidInput,
            "Preprocessed image is null"
        });
    }

    using ImageType = PreprocessedImage::GrayImageType;

    try {
        using StatsFilterType = itk::StatisticsImageFilter<ImageType>;
        auto stats = StatsFilterType::New();
        stats->SetInput(image.enhanced);
        stats->Update();

        using LaplacianFilterType = itk::LaplacianImageFilter<ImageType, ImageType>;
        auto laplacian = LaplacianFilterType::New();
        laplacian->SetInput(image.enhanced);
        laplacian->SetUseImageSpacingOff();

        auto laplacianStats = StatsFilterType::New();
        laplacianStats->SetInput(laplacian->GetOutput());
        laplacianStats->Update();

        ImageQuality quality;
        quality.resolution = std::format("{}x{}", image.originalWidth, image.originalHeight);
        quality.brightness = std::clamp(stats->GetMean() / 255.0, 0.0, 1.0);
        quality.contrast = std::clamp(stats->GetSigma() / 127.5, 0.0, 1.0);

        double laplacianVariance = laplacianStats->GetVariance();
        quality.sharpness = laplacianVariance / (laplacianVariance + kSharpnessHalfPoint);
        return quality;
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
    catch (const std::exception& e) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InternalError,
            std::string("Standard exception: ") + e.what()
        });
    }
}

}  // namespace dentescope::services
