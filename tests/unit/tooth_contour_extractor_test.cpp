#include "services/measurement/tooth_contour_extractor.hpp"
#include "services/measurement/width_measurement_engine.hpp"

#include "../test_utils/radiograph_generator.hpp"

#include <gtest/gtest.h>

namespace dentescope::services {
namespace {

using test_utils::createPanoramic;

class ToothContourExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        image_ = createPanoramic(300, 300, {{100.0, 100.0, 40.0, 60.0}});
    }

    ToothContourExtractor extractor_;
    ToothContourExtractor::ImageType::Pointer image_;
};

TEST_F(ToothContourExtractorTest, NullImageIsInvalidInput) {
    auto result = extractor_.extract(nullptr, {0.0, 0.0, 10.0, 10.0});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, MeasurementError::Code::InvalidInput);
}

TEST_F(ToothContourExtractorTest, InvalidParametersAreRejected) {
    ToothContourExtractor::Parameters params;
    params.paddingFraction = 0.8;

    auto result = extractor_.extract(image_, {95.0, 95.0, 50.0, 70.0}, params);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, MeasurementError::Code::InvalidParameters);
}

TEST_F(ToothContourExtractorTest, BoxOutsideImageIsInvalidInput) {
    auto result = extractor_.extract(image_, {400.0, 400.0, 50.0, 50.0});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, MeasurementError::Code::InvalidInput);
}

TEST_F(ToothContourExtractorTest, ContourTracesBrightRegion) {
    auto result = extractor_.extract(image_, {95.0, 95.0, 50.0, 70.0});
    ASSERT_TRUE(result.has_value()) << result.error().toString();
    ASSERT_FALSE(result->empty());

    for (const auto& point : *result) {
        EXPECT_GE(point.x, 100.0);
        EXPECT_LE(point.x, 139.0);
        EXPECT_GE(point.y, 100.0);
        EXPECT_LE(point.y, 159.0);
    }
}

TEST_F(ToothContourExtractorTest, ContourGivesToothWidthThroughPrincipalAxes) {
    auto result = extractor_.extract(image_, {95.0, 95.0, 50.0, 70.0});
    ASSERT_TRUE(result.has_value());

    auto axes = WidthMeasurementEngine::fitPrincipalAxes(*result);
    ASSERT_TRUE(axes.has_value());
    EXPECT_NEAR(axes->minorExtent, 39.0, 1.0);
    EXPECT_NEAR(axes->majorExtent, 59.0, 1.0);
}

TEST_F(ToothContourExtractorTest, TinyRegionFailsExtraction) {
    auto image = createPanoramic(100, 100, {{50.0, 50.0, 3.0, 3.0}});

    auto result = extractor_.extract(image, {40.0, 40.0, 20.0, 20.0});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, MeasurementError::Code::ExtractionFailed);
}

TEST_F(ToothContourExtractorTest, BoundaryPointsOfSquare) {
    using LabelImageType = ToothContourExtractor::LabelImageType;
    auto labels = LabelImageType::New();
    LabelImageType::RegionType region;
    region.SetIndex(0, 0);
    region.SetIndex(1, 0);
    region.SetSize(0, 10);
    region.SetSize(1, 10);
    labels->SetRegions(region);
    labels->Allocate();
    labels->FillBuffer(0);
    for (long y = 3; y < 7; ++y) {
        for (long x = 3; x < 7; ++x) {
            labels->SetPixel({x, y}, 1);
        }
    }

    auto points = ToothContourExtractor::boundaryPoints(labels, 1, region);
    EXPECT_EQ(points.size(), 12u);
    EXPECT_TRUE(ToothContourExtractor::boundaryPoints(nullptr, 1, region).empty());
}

}  // anonymous namespace
}  // namespace dentescope::services
