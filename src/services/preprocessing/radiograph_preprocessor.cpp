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

#include "services/preprocessing/radiograph_preprocessor.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <itkAdaptiveHistogramEqualizationImageFilter.h>
#include <itkBilateralImageFilter.h>
#include <itkComposeImageFilter.h>
#include <itkIdentityTransform.h>
#include <itkLinearInterpolateImageFunction.h>
#include <itkMedianImageFilter.h>
#include <itkRescaleIntensityImageFilter.h>
#include <itkResampleImageFilter.h>

namespace dentescope::services {

namespace {

using ImageType = PreprocessedImage::GrayImageType;
using UCharImageType = itk::Image<unsigned char, 2>;
using RgbImageType = PreprocessedImage::RgbImageType;

ImageType::Pointer rescaleTo255(ImageType::Pointer input) {
    using RescaleFilterType = itk::RescaleIntensityImageFilter<ImageType, ImageType>;
    auto rescale = RescaleFilterType::New();
    rescale->SetInput(input);
    rescale->SetOutputMinimum(0.0f);
    rescale->SetOutputMaximum(255.0f);
    rescale->Update();
    return rescale->GetOutput();
}

ImageType::Pointer applyClahe(ImageType::Pointer input,
                              const core::PreprocessingParameters& params) {
    using AdaptiveFilterType = itk::AdaptiveHistogramEqualizationImageFilter<ImageType>;
    auto adaptiveFilter = AdaptiveFilterType::New();
    adaptiveFilter->SetInput(input);

    AdaptiveFilterType::RadiusType radius;
    radius.Fill(std::max(1u, params.claheTileSize / 2));
    adaptiveFilter->SetRadius(radius);

    // Alpha 0.5 blends classic AHE with the unfiltered image.
    // Map clipLimit [0.1, 10.0] to beta [0.1, 0.9]
    adaptiveFilter->SetAlpha(0.5);
    double beta = 1.0 - (params.claheClipLimit / 10.0) * 0.8;
    adaptiveFilter->SetBeta(std::max(0.1, std::min(0.9, beta)));

    adaptiveFilter->Update();
    return adaptiveFilter->GetOutput();
}

ImageType::Pointer applyDenoise(ImageType::Pointer input,
                                const core::PreprocessingParameters& params) {
    switch (params.denoise) {
        case core::DenoiseMethod::Bilateral: {
            using BilateralFilterType = itk::BilateralImageFilter<ImageType, ImageType>;
            auto filter = BilateralFilterType::New();
            filter->SetInput(input);
            filter->SetDomainSigma(params.bilateralDomainSigma);
            filter->SetRangeSigma(params.bilateralRangeSigma);
            filter->Update();
            return filter->GetOutput();
        }
        case core::DenoiseMethod::Median: {
            using MedianFilterType = itk::MedianImageFilter<ImageType, ImageType>;
            auto filter = MedianFilterType::New();
            filter->SetInput(input);
            MedianFilterType::RadiusType radius;
            radius.Fill(std::max(1u, params.medianRadius));
            filter->SetRadius(radius);
            filter->Update();
            return filter->GetOutput();
        }
        case core::DenoiseMethod::None:
            break;
    }
    return input;
}

ImageType::Pointer resizeToWidth(ImageType::Pointer input, unsigned int targetWidth) {
    auto inputSize = input->GetLargestPossibleRegion().GetSize();
    if (targetWidth == 0 || targetWidth == inputSize[0]) {
        return input;
    }

    double factor = static_cast<double>(inputSize[0]) / static_cast<double>(targetWidth);
    auto targetHeight = static_cast<unsigned int>(
        std::max(1.0, std::round(static_cast<double>(inputSize[1]) / factor)));

    using ResampleFilterType = itk::ResampleImageFilter<ImageType, ImageType>;
    using TransformType = itk::IdentityTransform<double, 2>;
    using InterpolatorType = itk::LinearInterpolateImageFunction<ImageType, double>;

    auto resample = ResampleFilterType::New();
    resample->SetInput(input);
    resample->SetTransform(TransformType::New());
    resample->SetInterpolator(InterpolatorType::New());

    ImageType::SizeType outputSize;
    outputSize[0] = targetWidth;
    outputSize[1] = targetHeight;
    resample->SetSize(outputSize);

    ImageType::SpacingType spacing;
    spacing[0] = static_cast<double>(inputSize[0]) / static_cast<double>(targetWidth);
    spacing[1] = static_cast<double>(inputSize[1]) / static_cast<double>(targetHeight);
    resample->SetOutputSpacing(spacing);

    // Align pixel centers of both grids
    ImageType::PointType origin;
    origin[0] = 0.5 * spacing[0] - 0.5;
    origin[1] = 0.5 * spacing[1] - 0.5;
    resample->SetOutputOrigin(origin);
    resample->SetOutputDirection(input->GetDirection());
    resample->SetDefaultPixelValue(0.0f);
    resample->Update();

    ImageType::Pointer output = resample->GetOutput();
    output->DisconnectPipeline();

    ImageType::SpacingType unitSpacing;
    unitSpacing.Fill(1.0);
    output->SetSpacing(unitSpacing);
    ImageType::PointType zeroOrigin;
    zeroOrigin.Fill(0.0);
    output->SetOrigin(zeroOrigin);
    return output;
}

RgbImageType::Pointer composeRgb(ImageType::Pointer input) {
    using ToUCharType = itk::RescaleIntensityImageFilter<ImageType, UCharImageType>;
    auto toUChar = ToUCharType::New();
    toUChar->SetInput(input);
    toUChar->SetOutputMinimum(0);
    toUChar->SetOutputMaximum(255);

    using ComposeFilterType = itk::ComposeImageFilter<UCharImageType, RgbImageType>;
    auto compose = ComposeFilterType::New();
    compose->SetInput1(toUChar->GetOutput());
    compose->SetInput2(toUChar->GetOutput());
    compose->SetInput3(toUChar->GetOutput());
    compose->Update();
    return compose->GetOutput();
}

}  // anonymous namespace

/**
 * @brief PIMPL implementation for RadiographPreprocessor
 */
class RadiographPreprocessor::Impl {
public:
    core::RadiographLoader loader;
    std::shared_ptr<spdlog::logger> logger =
        logging::LoggerFactory::create("RadiographPreprocessor");
};

RadiographPreprocessor::RadiographPreprocessor() : impl_(std::make_unique<Impl>()) {}

RadiographPreprocessor::~RadiographPreprocessor() = default;

RadiographPreprocessor::RadiographPreprocessor(RadiographPreprocessor&&) noexcept = default;

RadiographPreprocessor&
RadiographPreprocessor::operator=(RadiographPreprocessor&&) noexcept = default;

std::expected<PreprocessedImage, PreprocessingError>
RadiographPreprocessor::apply(ImageType::Pointer input,
                              const std::string& sourceName,
                              const core::PreprocessingParameters& params) const {
    if (!input) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidInput,
            "Input image is null"
        });
    }

    if (!params.isValid()) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidParameters,
            "Invalid parameters: check claheClipLimit (0.1-10.0), claheTileSize (1-64), "
            "bilateral sigmas (> 0)"
        });
    }

    auto inputSize = input->GetLargestPossibleRegion().GetSize();
    if (inputSize[0] == 0 || inputSize[1] == 0) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidInput,
            "Input image is empty"
        });
    }

    try {
        auto normalized = rescaleTo255(input);
        auto equalized = applyClahe(normalized, params);
        auto denoised = applyDenoise(equalized, params);
        auto renormalized = rescaleTo255(denoised);
        auto resized = resizeToWidth(renormalized, params.targetWidth);

        PreprocessedImage result;
        result.enhanced = resized;
        result.rgb = composeRgb(resized);
        result.sourceName = sourceName;
        result.originalWidth = static_cast<unsigned int>(inputSize[0]);
        result.originalHeight = static_cast<unsigned int>(inputSize[1]);

        auto outputSize = resized->GetLargestPossibleRegion().GetSize();
        result.width = static_cast<unsigned int>(outputSize[0]);
        result.height = static_cast<unsigned int>(outputSize[1]);
        result.scaleX = static_cast<double>(result.originalWidth) / result.width;
        result.scaleY = static_cast<double>(result.originalHeight) / result.height;

        impl_->logger->debug("Preprocessed {}: {}x{} -> {}x{} (denoise={})",
                             sourceName, result.originalWidth, result.originalHeight,
                             result.width, result.height, core::toString(params.denoise));
        return result;
    }
    catch (const itk::ExceptionObject& e) {
        impl_->logger->error("Preprocessing {} failed: {}", sourceName, e.GetDescription());
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
    catch (const std::exception& e) {
        impl_->logger->error("Preprocessing {} failed: {}", sourceName, e.what());
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InternalError,
            std::string("Standard exception: ") + e.what()
        });
    }
}

std::expected<PreprocessedImage, core::AnalysisError>
RadiographPreprocessor::preprocess(std::span<const uint8_t> bytes,
                                   const std::string& sourceName,
                                   const core::PreprocessingParameters& params) const {
    auto decoded = impl_->loader.decode(bytes, sourceName);
    if (!decoded) {
        auto code = decoded.error().code == core::DecodeError::Code::IoError
                        ? core::AnalysisError::Code::InternalError
                        : core::AnalysisError::Code::ImageDecodeError;
        return std::unexpected(core::AnalysisError{code, decoded.error().toString()});
    }

    auto prepared = apply(decoded->image, sourceName, params);
    if (!prepared) {
        auto code = prepared.error().code == PreprocessingError::Code::InvalidParameters
                        ? core::AnalysisError::Code::InvalidConfiguration
                        : core::AnalysisError::Code::PreprocessingFailed;
        return std::unexpected(core::AnalysisError{code, prepared.error().toString()});
    }
    return std::move(*prepared);
}

}  // namespace dentescope::services
