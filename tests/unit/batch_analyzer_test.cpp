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

#include "services/analysis/batch_analyzer.hpp"
#include "services/analysis/detector_backed_analyzer.hpp"
#include "services/analysis/mock_analyzer.hpp"

#include "../test_utils/fake_detector.hpp"
#include "../test_utils/radiograph_generator.hpp"
#include "../test_utils/result_builder.hpp"

#include <gtest/gtest.h>

namespace dentescope::services {
namespace {

using test_utils::makeDetection;

class BatchAnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const std::vector<BoundingBox> offsets = {
            {250.0, 60.0, 40.0, 50.0}, {200.0, 70.0, 50.0, 50.0}, {150.0, 80.0, 30.0, 40.0}
        };
        for (size_t i = 0; i < offsets.size(); ++i) {
            auto image = test_utils::createPanoramic(400, 200, {offsets[i]});
            images_.push_back({"pano_" + std::to_string(i) + ".png",
                               test_utils::encodePng(image)});
        }
    }

    static AnalysisResult resultWithPairs(std::vector<PairReport> pairs) {
        AnalysisResult result;
        result.pairs = std::move(pairs);
        return result;
    }

    std::vector<ImageInput> images_;
};

// =============================================================================
// analyze()
// =============================================================================

TEST_F(BatchAnalyzerTest, ResultsKeepInputOrder) {
    BatchAnalyzer batch(std::make_shared<MockAnalyzer>(), 3);
    EXPECT_EQ(batch.workerCount(), 3u);

    auto result = batch.analyze(images_);
    ASSERT_EQ(result.items.size(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(result.items[i].fileName, images_[i].name);
        EXPECT_EQ(result.items[i].fileSize, images_[i].bytes.size());
        ASSERT_TRUE(result.items[i].succeeded());
        EXPECT_EQ(result.items[i].outcome->sourceName, images_[i].name);
    }
    EXPECT_EQ(result.summary.totalFiles, 3u);
    EXPECT_EQ(result.summary.processedFiles, 3u);
    EXPECT_EQ(result.summary.failedFiles, 0u);
}

TEST_F(BatchAnalyzerTest, FailedItemDoesNotAbortOthers) {
    images_.insert(images_.begin() + 1, ImageInput{"broken.png", std::vector<uint8_t>(16, 0)});

    BatchAnalyzer batch(std::make_shared<MockAnalyzer>(), 2);
    auto result = batch.analyze(images_);

    ASSERT_EQ(result.items.size(), 4u);
    EXPECT_TRUE(result.items[0].succeeded());
    ASSERT_FALSE(result.items[1].succeeded());
    EXPECT_EQ(result.items[1].outcome.error().code,
              core::AnalysisError::Code::ImageDecodeError);
    EXPECT_TRUE(result.items[2].succeeded());
    EXPECT_EQ(result.summary.totalFiles, 4u);
    EXPECT_EQ(result.summary.processedFiles, 3u);
    EXPECT_EQ(result.summary.failedFiles, 1u);
}

TEST_F(BatchAnalyzerTest, MockResultsAreDeterministicAcrossRuns) {
    BatchAnalyzer batch(std::make_shared<MockAnalyzer>(), 3);

    auto first = batch.analyze(images_);
    auto second = batch.analyze(images_);
    ASSERT_EQ(first.items.size(), second.items.size());
    for (size_t i = 0; i < first.items.size(); ++i) {
        ASSERT_TRUE(first.items[i].succeeded() && second.items[i].succeeded());
        EXPECT_DOUBLE_EQ(first.items[i].outcome->pairs[0].widthDifference.valueMm,
                         second.items[i].outcome->pairs[0].widthDifference.valueMm);
    }
    EXPECT_DOUBLE_EQ(first.summary.averageWidthDifference,
                     second.summary.averageWidthDifference);
}

TEST_F(BatchAnalyzerTest, EmptyBatch) {
    BatchAnalyzer batch(std::make_shared<MockAnalyzer>(), 1);

    auto result = batch.analyze({});
    EXPECT_TRUE(result.items.empty());
    EXPECT_EQ(result.summary.totalFiles, 0u);
    EXPECT_DOUBLE_EQ(result.summary.averageWidthDifference, 0.0);
}

TEST_F(BatchAnalyzerTest, DetectorOutageFailsItemsIndividually) {
    auto analyzer = std::make_shared<DetectorBackedAnalyzer>(
        std::make_shared<test_utils::FailingDetector>(), core::AnalysisConfig{});
    BatchAnalyzer batch(analyzer, 2);

    auto result = batch.analyze(images_);
    ASSERT_EQ(result.items.size(), 3u);
    for (const auto& item : result.items) {
        ASSERT_FALSE(item.succeeded());
        EXPECT_EQ(item.outcome.error().code, core::AnalysisError::Code::DetectorUnavailable);
    }
    EXPECT_EQ(result.summary.failedFiles, 3u);
}

TEST_F(BatchAnalyzerTest, DeadlineTurnsUnfinishedItemsIntoTimeouts) {
    auto detector = std::make_shared<test_utils::SlowDetector>(
        std::chrono::milliseconds(400), std::vector<Detection>{});
    core::AnalysisConfig config;
    config.inferenceSlots = 1;
    auto analyzer = std::make_shared<DetectorBackedAnalyzer>(detector, config);
    BatchAnalyzer batch(analyzer, 3, std::chrono::milliseconds(150));

    const auto start = std::chrono::steady_clock::now();
    auto result = batch.analyze(images_);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::milliseconds(390));
    ASSERT_EQ(result.items.size(), 3u);
    for (const auto& item : result.items) {
        ASSERT_FALSE(item.succeeded());
        EXPECT_EQ(item.outcome.error().code, core::AnalysisError::Code::Timeout);
    }
}

TEST_F(BatchAnalyzerTest, UnsafeDetectorNeverRunsConcurrently) {
    auto detector = std::make_shared<test_utils::SlowDetector>(
        std::chrono::milliseconds(20), std::vector<Detection>{}, false);
    auto analyzer = std::make_shared<DetectorBackedAnalyzer>(detector, core::AnalysisConfig{});
    BatchAnalyzer batch(analyzer, 3);

    auto result = batch.analyze(images_);
    EXPECT_EQ(result.summary.processedFiles, 3u);
    EXPECT_EQ(detector->calls(), 3);
    EXPECT_EQ(detector->peakConcurrency(), 1);
}

// =============================================================================
// summarize()
// =============================================================================

TEST_F(BatchAnalyzerTest, SummaryAveragesAllPairs) {
    std::vector<BatchItemResult> items;
    items.push_back({"a.png", 10, resultWithPairs({test_utils::pairReportOf(10.24, 8.14),
                                                   test_utils::pairReportOf(9.0, 8.5)})});
    items.push_back({"b.png", 10, resultWithPairs({test_utils::pairReportOf(12.0, 8.0)})});
    items.push_back({"c.png", 10, resultWithPairs({})});
    items.push_back({"d.png", 10, std::unexpected(core::AnalysisError{
        core::AnalysisError::Code::Timeout, "late"})});

    auto summary = BatchAnalyzer::summarize(items, std::chrono::milliseconds(500));
    EXPECT_EQ(summary.totalFiles, 4u);
    EXPECT_EQ(summary.processedFiles, 3u);
    EXPECT_EQ(summary.failedFiles, 1u);
    EXPECT_EQ(summary.totalProcessingTimeMs, 500);
    EXPECT_NEAR(summary.averageWidthDifference, (2.10 + 0.5 + 4.0) / 3.0, 1e-9);
    EXPECT_EQ(summary.countFor(core::Severity::HighlySignificant), 1u);
    EXPECT_EQ(summary.countFor(core::Severity::Significant), 1u);
    EXPECT_EQ(summary.countFor(core::Severity::Moderate), 0u);
    EXPECT_EQ(summary.countFor(core::Severity::Normal), 1u);
}

TEST_F(BatchAnalyzerTest, SummaryWithoutPairsHasZeroAverage) {
    std::vector<BatchItemResult> items;
    items.push_back({"a.png", 10, resultWithPairs({})});

    auto summary = BatchAnalyzer::summarize(items, std::chrono::milliseconds(1));
    EXPECT_DOUBLE_EQ(summary.averageWidthDifference, 0.0);
    EXPECT_EQ(summary.processedFiles, 1u);
}

}  // anonymous namespace
}  // namespace dentescope::services
