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

#include "services/detection/contour_tooth_detector.hpp"
#include "services/measurement/tooth_contour_extractor.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

#include <itkBinaryBallStructuringElement.h>
#include <itkBinaryMorphologicalClosingImageFilter.h>
#include <itkConnectedComponentImageFilter.h>
#include <itkLabelImageToShapeLabelMapFilter.h>
#include <itkOtsuThresholdImageFilter.h>

namespace dentescope::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ContourToothDetector");
    return logger;
}

double compactnessOf(double area, double perimeter) {
    if (perimeter <= 0.0) {
        return 0.0;
    }
    return 4.0 * std::numbers::pi * area / (perimeter * perimeter);
}
}  // anonymous namespace

/**
 * @brief PIMPL implementation for ContourToothDetector
 */
class ContourToothDetector::Impl {
public:
    Parameters params;
};

ContourToothDetector::ContourToothDetector() : impl_(std::make_unique<Impl>()) {}

ContourToothDetector::ContourToothDetector(const Parameters& params)
    : impl_(std::make_unique<Impl>()) {
    impl_->params = params;
}

ContourToothDetector::~ContourToothDetector() = default;

ContourToothDetector::ContourToothDetector(ContourToothDetector&&) noexcept = default;

ContourToothDetector&
ContourToothDetector::operator=(ContourToothDetector&&) noexcept = default;

double ContourToothDetector::scoreRegion(double area,
                                         double perimeter,
                                         const BoundingBox& box,
                                         double imageHeight) {
    double confidence = 0.3;

    if (area >= 300.0 && area <= 20000.0) {
        confidence += 0.3;
    } else if (area >= 150.0 && area <= 30000.0) {
        confidence += 0.2;
    }

    if (perimeter > 0.0) {
        double compactness = compactnessOf(area, perimeter);
        if (compactness > 0.15) {
            confidence += 0.2;
        } else if (compactness > 0.1) {
            confidence += 0.1;
        }
    }

    if (imageHeight > 0.0) {
        double relY = box.centroid().y / imageHeight;
        if (relY > 0.25 && relY < 0.8) {
            confidence += 0.2;
        } else if (relY > 0.2 && relY < 0.85) {
            confidence += 0.1;
        }
    }

    if (box.height > 0.0) {
        double aspect = box.width / box.height;
        if (aspect >= 0.5 && aspect <= 2.0) {
            confidence += 0.1;
        }
    }

    return std::min(confidence, 1.0);
}

std::expected<std::vector<Detection>, DetectorError>
ContourToothDetector::detect(const PreprocessedImage& image,
                             double confidenceThreshold,
                             double /*iouThreshold*/) {
    const auto& params = impl_->params;

    if (!image.enhanced) {
        return std::unexpected(DetectorError{
            DetectorError::Code::InferenceFailed,
            "Preprocessed image is null"
        });
    }
    if (!params.isValid()) {
        return std::unexpected(DetectorError{
            DetectorError::Code::Unavailable,
            "Invalid contour detector parameters"
        });
    }

    using ImageType = PreprocessedImage::GrayImageType;
    using MaskType = ToothContourExtractor::MaskType;
    using LabelImageType = ToothContourExtractor::LabelImageType;

    try {
        using OtsuFilterType = itk::OtsuThresholdImageFilter<ImageType, MaskType>;
        auto otsu = OtsuFilterType::New();
        otsu->SetInput(image.enhanced);
        otsu->SetInsideValue(0);
        otsu->SetOutsideValue(1);

        using StructuringElementType = itk::BinaryBallStructuringElement<unsigned char, 2>;
        StructuringElementType element;
        element.SetRadius(params.closingRadius);
        element.CreateStructuringElement();

        using ClosingFilterType = itk::BinaryMorphologicalClosingImageFilter<
            MaskType, MaskType, StructuringElementType>;
        auto closing = ClosingFilterType::New();
        closing->SetInput(otsu->GetOutput());
        closing->SetKernel(element);
        closing->SetForegroundValue(1);

        using ConnectedFilterType = itk::ConnectedComponentImageFilter<MaskType, LabelImageType>;
        auto connected = ConnectedFilterType::New();
        connected->SetInput(closing->GetOutput());
        connected->SetFullyConnected(false);
        connected->Update();

        LabelImageType::Pointer labels = connected->GetOutput();

        using ShapeFilterType = itk::LabelImageToShapeLabelMapFilter<LabelImageType>;
        auto shapes = ShapeFilterType::New();
        shapes->SetInput(labels);
        shapes->SetComputePerimeter(true);
        shapes->Update();

        const double width = static_cast<double>(image.width);
        const double height = static_cast<double>(image.height);
        const double archTop = height * params.archTop;
        const double archBottom = height * params.archBottom;
        const double archLeft = width * (1.0 - params.archWidth) / 2.0;
        const double archRight = width * (1.0 + params.archWidth) / 2.0;

        std::vector<Detection> detections;
        auto* labelMap = shapes->GetOutput();
        for (size_t i = 0; i < labelMap->GetNumberOfLabelObjects(); ++i) {
            const auto* object = labelMap->GetNthLabelObject(i);

            const double area = static_cast<double>(object->GetNumberOfPixels());
            if (area < params.minArea || area > params.maxArea) {
                continue;
            }

            const double perimeter = object->GetPerimeter();
            if (compactnessOf(area, perimeter) < params.minCompactness) {
                continue;
            }

            const auto region = object->GetBoundingBox();
            BoundingBox box{
                static_cast<double>(region.GetIndex(0)),
                static_cast<double>(region.GetIndex(1)),
                static_cast<double>(region.GetSize(0)),
                static_cast<double>(region.GetSize(1))
            };

            const double aspect = box.width / box.height;
            if (aspect < params.minAspectRatio || aspect > params.maxAspectRatio) {
                continue;
            }

            const auto center = box.centroid();
            if (center.x < archLeft || center.x > archRight ||
                center.y < archTop || center.y > archBottom) {
                continue;
            }

            const double confidence = scoreRegion(area, perimeter, box, height);
            if (confidence < confidenceThreshold) {
                continue;
            }

            Detection detection;
            detection.box = box;
            detection.classLabel = "tooth";
            detection.classId = 0;
            detection.confidence = confidence;
            detection.contour = ToothContourExtractor::boundaryPoints(
                labels, object->GetLabel(), region);
            detections.push_back(std::move(detection));
        }

        getLogger()->debug("{}: {} components, {} tooth-like regions",
                           image.sourceName, labelMap->GetNumberOfLabelObjects(),
                           detections.size());
        return detections;
    }
    catch (const itk::ExceptionObject& e) {
        getLogger()->error("Segmentation failed for {}: {}", image.sourceName,
                           e.GetDescription());
        return std::unexpected(DetectorError{
            DetectorError::Code::InferenceFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
    catch (const std::exception& e) {
        return std::unexpected(DetectorError{
            DetectorError::Code::InferenceFailed,
            std::string("Standard exception: ") + e.what()
        });
    }
}

}  // namespace dentescope::services
