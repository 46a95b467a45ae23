#include "services/detection/recorded_detector.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

namespace dentescope::services {
namespace {

using json = nlohmann::json;

class RecordedDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "dentescope_recorded_test";
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    static PreprocessedImage imageNamed(const std::string& name, double scale = 1.0) {
        PreprocessedImage image;
        image.sourceName = name;
        image.originalWidth = 1000;
        image.originalHeight = 500;
        image.width = static_cast<unsigned int>(1000 / scale);
        image.height = static_cast<unsigned int>(500 / scale);
        image.scaleX = scale;
        image.scaleY = scale;
        return image;
    }

    static json detectionJson(double x1, double y1, double x2, double y2, double confidence,
                              const std::string& name) {
        return {{"bbox", {x1, y1, x2, y2}},
                {"confidence", confidence},
                {"class_id", 0},
                {"class_name", name}};
    }

    std::filesystem::path tempDir_;
};

// =============================================================================
// Parsing
// =============================================================================

TEST_F(RecordedDetectorTest, FlatLayoutAppliesToEveryImage) {
    json document = {{"detections", {detectionJson(100, 100, 200, 220, 0.9, "molar")}}};

    auto detector = RecordedDetector::fromJson(document);
    ASSERT_TRUE(detector.has_value()) << detector.error().toString();

    auto result = (*detector)->detect(imageNamed("anything.png"), 0.25, 0.45);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1u);
    EXPECT_EQ((*result)[0].classLabel, "molar");
    EXPECT_DOUBLE_EQ((*result)[0].box.width, 100.0);
    EXPECT_DOUBLE_EQ((*result)[0].box.height, 120.0);
}

TEST_F(RecordedDetectorTest, PerImageLayoutSelectsByName) {
    json document = {{"images",
                      {{"a.png", {detectionJson(0, 0, 10, 10, 0.9, "first")}},
                       {"b.png", {detectionJson(0, 0, 20, 20, 0.9, "second"),
                                  detectionJson(30, 0, 50, 20, 0.9, "third")}}}}};

    auto detector = RecordedDetector::fromJson(document);
    ASSERT_TRUE(detector.has_value());
    EXPECT_EQ((*detector)->imageCount(), 2u);

    auto b = (*detector)->detect(imageNamed("b.png"), 0.25, 0.45);
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->size(), 2u);
}

TEST_F(RecordedDetectorTest, LookupFallsBackToFileName) {
    json document = {{"images", {{"pano.png", {detectionJson(0, 0, 10, 10, 0.9, "t")}}}}};

    auto detector = RecordedDetector::fromJson(document);
    ASSERT_TRUE(detector.has_value());

    auto result = (*detector)->detect(imageNamed("/data/scans/pano.png"), 0.25, 0.45);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), 1u);
}

TEST_F(RecordedDetectorTest, UnknownImageUsesDefaultList) {
    json document = {{"images", {{"pano.png", {detectionJson(0, 0, 10, 10, 0.9, "t")}}}},
                     {"default", json::array()}};

    auto detector = RecordedDetector::fromJson(document);
    ASSERT_TRUE(detector.has_value());

    auto result = (*detector)->detect(imageNamed("other.png"), 0.25, 0.45);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST_F(RecordedDetectorTest, UnknownImageWithoutDefaultIsUnavailable) {
    json document = {{"images", {{"pano.png", {detectionJson(0, 0, 10, 10, 0.9, "t")}}}}};

    auto detector = RecordedDetector::fromJson(document);
    ASSERT_TRUE(detector.has_value());

    auto result = (*detector)->detect(imageNamed("other.png"), 0.25, 0.45);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DetectorError::Code::Unavailable);
}

TEST_F(RecordedDetectorTest, DocumentWithoutKnownLayoutIsInvalid) {
    auto detector = RecordedDetector::fromJson(json{{"boxes", json::array()}});
    ASSERT_FALSE(detector.has_value());
    EXPECT_EQ(detector.error().code, DetectorError::Code::InvalidOutput);
}

TEST_F(RecordedDetectorTest, ShortBboxIsInvalid) {
    json document = {{"detections", {{{"bbox", {1, 2, 3}}, {"confidence", 0.5}}}}};

    auto detector = RecordedDetector::fromJson(document);
    ASSERT_FALSE(detector.has_value());
    EXPECT_EQ(detector.error().code, DetectorError::Code::InvalidOutput);
}

// =============================================================================
// Detection
// =============================================================================

TEST_F(RecordedDetectorTest, ThresholdDropsLowConfidence) {
    json document = {{"detections", {detectionJson(0, 0, 10, 10, 0.9, "keep"),
                                     detectionJson(20, 0, 30, 10, 0.2, "drop")}}};

    auto detector = RecordedDetector::fromJson(document);
    ASSERT_TRUE(detector.has_value());

    auto result = (*detector)->detect(imageNamed("x.png"), 0.5, 0.45);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1u);
    EXPECT_EQ((*result)[0].classLabel, "keep");
}

TEST_F(RecordedDetectorTest, DegenerateRecordedBoxFailsDetection) {
    json document = {{"detections", {detectionJson(50, 0, 10, 10, 0.9, "bad")}}};

    auto detector = RecordedDetector::fromJson(document);
    ASSERT_TRUE(detector.has_value());

    auto result = (*detector)->detect(imageNamed("x.png"), 0.25, 0.45);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DetectorError::Code::InvalidOutput);
}

TEST_F(RecordedDetectorTest, BoxesMapIntoProcessedSpace) {
    json entry = detectionJson(200, 100, 400, 300, 0.9, "t");
    entry["contour"] = {{200, 100}, {400, 300}};
    json document = {{"detections", {entry}}};

    auto detector = RecordedDetector::fromJson(document);
    ASSERT_TRUE(detector.has_value());

    // Processed image is half the original size
    auto result = (*detector)->detect(imageNamed("x.png", 2.0), 0.25, 0.45);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1u);

    const auto& detection = (*result)[0];
    EXPECT_DOUBLE_EQ(detection.box.x, 100.0);
    EXPECT_DOUBLE_EQ(detection.box.y, 50.0);
    EXPECT_DOUBLE_EQ(detection.box.width, 100.0);
    ASSERT_EQ(detection.contour.size(), 2u);
    EXPECT_DOUBLE_EQ(detection.contour[1].x, 200.0);
    EXPECT_DOUBLE_EQ(detection.contour[1].y, 150.0);
}

TEST_F(RecordedDetectorTest, ReportsThreadSafe) {
    auto detector = RecordedDetector::fromJson(json{{"detections", json::array()}});
    ASSERT_TRUE(detector.has_value());
    EXPECT_TRUE((*detector)->isThreadSafe());
    EXPECT_EQ((*detector)->name(), "RecordedDetector");
}

// =============================================================================
// Files
// =============================================================================

TEST_F(RecordedDetectorTest, LoadMissingFileIsUnavailable) {
    auto detector = RecordedDetector::loadFromFile(tempDir_ / "missing.json");
    ASSERT_FALSE(detector.has_value());
    EXPECT_EQ(detector.error().code, DetectorError::Code::Unavailable);
}

TEST_F(RecordedDetectorTest, LoadMalformedFileIsInvalidOutput) {
    auto path = tempDir_ / "broken.json";
    std::ofstream(path) << "[{";

    auto detector = RecordedDetector::loadFromFile(path);
    ASSERT_FALSE(detector.has_value());
    EXPECT_EQ(detector.error().code, DetectorError::Code::InvalidOutput);
}

TEST_F(RecordedDetectorTest, LoadFromFile) {
    auto path = tempDir_ / "detections.json";
    std::ofstream(path) << json{{"detections", {detectionJson(0, 0, 10, 10, 0.9, "t")}}}.dump();

    auto detector = RecordedDetector::loadFromFile(path);
    ASSERT_TRUE(detector.has_value());

    auto result = (*detector)->detect(imageNamed("x.png"), 0.25, 0.45);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), 1u);
}

}  // anonymous namespace
}  // namespace dentescope::services
