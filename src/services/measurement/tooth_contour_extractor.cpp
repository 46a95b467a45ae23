#include "services/measurement/tooth_contour_extractor.hpp"

#include <algorithm>
#include <cmath>

#include <itkBinaryBallStructuringElement.h>
#include <itkBinaryMorphologicalClosingImageFilter.h>
#include <itkConnectedComponentImageFilter.h>
#include <itkImageRegionConstIteratorWithIndex.h>
#include <itkOtsuThresholdImageFilter.h>
#include <itkRegionOfInterestImageFilter.h>
#include <itkRelabelComponentImageFilter.h>

namespace dentescope::services {

std::vector<Point2D>
ToothContourExtractor::boundaryPoints(LabelImageType::Pointer labels,
                                      unsigned int label,
                                      const LabelImageType::RegionType& region) {
    std::vector<Point2D> points;
    if (!labels) {
        return points;
    }

    auto isLabel = [&](const LabelImageType::IndexType& index) {
        return region.IsInside(index) && labels->GetPixel(index) == label;
    };

    itk::ImageRegionConstIteratorWithIndex<LabelImageType> it(labels, region);
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        if (it.Get() != label) {
            continue;
        }

        auto index = it.GetIndex();
        const LabelImageType::OffsetType offsets[4] = {{{-1, 0}}, {{1, 0}}, {{0, -1}}, {{0, 1}}};
        bool onBoundary = false;
        for (const auto& offset : offsets) {
            if (!isLabel(index + offset)) {
                onBoundary = true;
                break;
            }
        }

        if (onBoundary) {
            points.push_back({static_cast<double>(index[0]), static_cast<double>(index[1])});
        }
    }
    return points;
}

std::expected<std::vector<Point2D>, MeasurementError>
ToothContourExtractor::extract(ImageType::Pointer enhanced,
                               const BoundingBox& box,
                               const Parameters& params) const {
    if (!enhanced) {
        return std::unexpected(MeasurementError{
            MeasurementError::Code::InvalidInput,
            "Input image is null"
        });
    }

    if (!params.isValid()) {
        return std::unexpected(MeasurementError{
            MeasurementError::Code::InvalidParameters,
            "paddingFraction must lie in [0, 0.5] and closingRadius <= 8"
        });
    }

    auto imageRegion = enhanced->GetLargestPossibleRegion();
    auto imageSize = imageRegion.GetSize();

    const double padX = box.width * params.paddingFraction;
    const double padY = box.height * params.paddingFraction;
    auto x0 = static_cast<long>(std::floor(std::max(0.0, box.x - padX)));
    auto y0 = static_cast<long>(std::floor(std::max(0.0, box.y - padY)));
    auto x1 = static_cast<long>(std::ceil(std::min<double>(imageSize[0], box.right() + padX)));
    auto y1 = static_cast<long>(std::ceil(std::min<double>(imageSize[1], box.bottom() + padY)));

    if (x1 - x0 < 3 || y1 - y0 < 3) {
        return std::unexpected(MeasurementError{
            MeasurementError::Code::InvalidInput,
            "Bounding box does not overlap the image"
        });
    }

    ImageType::RegionType roi;
    roi.SetIndex(0, x0);
    roi.SetIndex(1, y0);
    roi.SetSize(0, static_cast<ImageType::SizeValueType>(x1 - x0));
    roi.SetSize(1, static_cast<ImageType::SizeValueType>(y1 - y0));

    try {
        using RoiFilterType = itk::RegionOfInterestImageFilter<ImageType, ImageType>;
        auto roiFilter = RoiFilterType::New();
        roiFilter->SetInput(enhanced);
        roiFilter->SetRegionOfInterest(roi);

        // Otsu marks pixels at or below the threshold as inside; teeth are bright
        using OtsuFilterType = itk::OtsuThresholdImageFilter<ImageType, MaskType>;
        auto otsu = OtsuFilterType::New();
        otsu->SetInput(roiFilter->GetOutput());
        otsu->SetInsideValue(0);
        otsu->SetOutsideValue(1);
        otsu->Update();

        MaskType::Pointer mask = otsu->GetOutput();

        if (params.closingRadius > 0) {
            using StructuringElementType = itk::BinaryBallStructuringElement<unsigned char, 2>;
            StructuringElementType element;
            element.SetRadius(params.closingRadius);
            element.CreateStructuringElement();

            using ClosingFilterType = itk::BinaryMorphologicalClosingImageFilter<
                MaskType, MaskType, StructuringElementType>;
            auto closing = ClosingFilterType::New();
            closing->SetInput(mask);
            closing->SetKernel(element);
            closing->SetForegroundValue(1);
            closing->Update();
            mask = closing->GetOutput();
        }

        using ConnectedFilterType = itk::ConnectedComponentImageFilter<MaskType, LabelImageType>;
        auto connected = ConnectedFilterType::New();
        connected->SetInput(mask);
        connected->SetFullyConnected(false);

        using RelabelFilterType = itk::RelabelComponentImageFilter<LabelImageType, LabelImageType>;
        auto relabel = RelabelFilterType::New();
        relabel->SetInput(connected->GetOutput());
        relabel->Update();

        const auto& sizes = relabel->GetSizeOfObjectsInPixels();
        if (sizes.empty() || static_cast<size_t>(sizes.front()) < params.minPixels) {
            return std::unexpected(MeasurementError{
                MeasurementError::Code::ExtractionFailed,
                "No tooth-sized bright region inside the box"
            });
        }

        LabelImageType::Pointer labels = relabel->GetOutput();
        auto points = boundaryPoints(labels, 1, labels->GetLargestPossibleRegion());

        // Back to full-image pixel coordinates
        const auto roiStart = labels->GetLargestPossibleRegion().GetIndex();
        for (auto& point : points) {
            point.x += static_cast<double>(x0 - roiStart[0]);
            point.y += static_cast<double>(y0 - roiStart[1]);
        }
        return points;
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(MeasurementError{
            MeasurementError::Code::ExtractionFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
    catch (const std::exception& e) {
        return std::unexpected(MeasurementError{
            MeasurementError::Code::InternalError,
            std::string("Standard exception: ") + e.what()
        });
    }
}

}  // namespace dentescope::services
