#include "services/analysis/pairing_engine.hpp"
#include "services/analysis/anatomical_classifier.hpp"

#include "../test_utils/fake_detector.hpp"

#include <gtest/gtest.h>

#include <set>

namespace dentescope::services {
namespace {

using test_utils::makeDetection;

class PairingEngineTest : public ::testing::Test {
protected:
    /// Classified tooth centered at (cx, cy) in a 1000 px wide image
    static ClassifiedTooth tooth(ToothCategory category, double cx, double cy,
                                 double confidence, const std::string& label) {
        ClassifiedTooth result;
        result.detection = makeDetection(cx - 40.0, cy - 40.0, 80.0, 80.0, label, confidence);
        result.category = category;
        result.regionTests.horizontalFraction = cx / 1000.0;
        result.regionTests.verticalFraction = cy / 500.0;
        return result;
    }

    static ClassifiedTooth molar(double cx, double confidence = 0.9,
                                 const std::string& label = "molar") {
        return tooth(ToothCategory::PrimaryMolar, cx, 250.0, confidence, label);
    }

    static ClassifiedTooth premolar(double cx, double confidence = 0.9,
                                    const std::string& label = "premolar") {
        return tooth(ToothCategory::Premolar, cx, 250.0, confidence, label);
    }

    core::AnatomicalConfig config_;
};

TEST_F(PairingEngineTest, SinglePairRecordsDistanceAndConfidence) {
    PairingEngine engine(config_);
    ClassificationResult classified;
    classified.molars = {molar(730.0, 0.9)};
    classified.premolars = {premolar(550.0, 0.8)};

    auto result = engine.pair(classified);
    ASSERT_EQ(result.pairs.size(), 1u);
    EXPECT_EQ(result.unpairedMolars, 0u);
    EXPECT_DOUBLE_EQ(result.pairs[0].centroidDistancePx, 180.0);
    EXPECT_DOUBLE_EQ(result.pairs[0].pairConfidence, 0.8);
}

TEST_F(PairingEngineTest, NoPremolarsLeavesMolarsUnpaired) {
    PairingEngine engine(config_);
    ClassificationResult classified;
    classified.molars = {molar(730.0), molar(800.0)};

    auto result = engine.pair(classified);
    EXPECT_TRUE(result.pairs.empty());
    EXPECT_EQ(result.unpairedMolars, 2u);
}

TEST_F(PairingEngineTest, PremolarMustBeAnterior) {
    PairingEngine engine(config_);
    ClassificationResult classified;
    classified.molars = {molar(600.0)};
    classified.premolars = {premolar(700.0)};

    auto result = engine.pair(classified);
    EXPECT_TRUE(result.pairs.empty());
    EXPECT_EQ(result.unpairedMolars, 1u);
}

TEST_F(PairingEngineTest, NearestAnteriorPremolarWins) {
    PairingEngine engine(config_);
    ClassificationResult classified;
    classified.molars = {molar(750.0)};
    classified.premolars = {premolar(400.0, 0.9, "far"), premolar(620.0, 0.9, "near"),
                            premolar(780.0, 0.9, "posterior")};

    auto result = engine.pair(classified);
    ASSERT_EQ(result.pairs.size(), 1u);
    EXPECT_EQ(result.pairs[0].premolar.detection.classLabel, "near");
}

TEST_F(PairingEngineTest, HigherConfidenceMolarChoosesFirst) {
    PairingEngine engine(config_);
    ClassificationResult classified;
    classified.molars = {molar(700.0, 0.6, "weak"), molar(720.0, 0.95, "strong")};
    classified.premolars = {premolar(600.0)};

    auto result = engine.pair(classified);
    ASSERT_EQ(result.pairs.size(), 1u);
    EXPECT_EQ(result.pairs[0].molar.detection.classLabel, "strong");
    EXPECT_EQ(result.unpairedMolars, 1u);
}

TEST_F(PairingEngineTest, PremolarClaimedAtMostOnce) {
    PairingEngine engine(config_);
    ClassificationResult classified;
    classified.molars = {molar(700.0, 0.9, "m1"), molar(720.0, 0.85, "m2"),
                         molar(880.0, 0.8, "m3")};
    classified.premolars = {premolar(600.0, 0.9, "p1"), premolar(450.0, 0.9, "p2")};

    auto result = engine.pair(classified);
    ASSERT_EQ(result.pairs.size(), 2u);
    EXPECT_EQ(result.unpairedMolars, 1u);

    std::set<std::string> premolarLabels;
    std::set<std::string> molarLabels;
    for (const auto& pair : result.pairs) {
        premolarLabels.insert(pair.premolar.detection.classLabel);
        molarLabels.insert(pair.molar.detection.classLabel);
    }
    EXPECT_EQ(premolarLabels.size(), 2u);
    EXPECT_EQ(molarLabels.size(), 2u);
    EXPECT_EQ(result.pairs[0].molar.detection.classLabel, "m1");
    EXPECT_EQ(result.pairs[0].premolar.detection.classLabel, "p1");
    EXPECT_EQ(result.pairs[1].premolar.detection.classLabel, "p2");
}

TEST_F(PairingEngineTest, MaxDistanceRejectsFarPremolars) {
    config_.maxPairDistancePx = 100.0;
    PairingEngine engine(config_);
    ClassificationResult classified;
    classified.molars = {molar(730.0)};
    classified.premolars = {premolar(550.0)};

    auto result = engine.pair(classified);
    EXPECT_TRUE(result.pairs.empty());
    EXPECT_EQ(result.unpairedMolars, 1u);
}

TEST_F(PairingEngineTest, PairingIsDeterministic) {
    PairingEngine engine(config_);
    ClassificationResult classified;
    classified.molars = {molar(700.0, 0.9, "m1"), molar(760.0, 0.9, "m2")};
    classified.premolars = {premolar(600.0, 0.9, "p1"), premolar(640.0, 0.9, "p2")};

    auto first = engine.pair(classified);
    auto second = engine.pair(classified);
    ASSERT_EQ(first.pairs.size(), second.pairs.size());
    for (size_t i = 0; i < first.pairs.size(); ++i) {
        EXPECT_EQ(first.pairs[i].molar.detection.classLabel,
                  second.pairs[i].molar.detection.classLabel);
        EXPECT_EQ(first.pairs[i].premolar.detection.classLabel,
                  second.pairs[i].premolar.detection.classLabel);
    }
}

TEST_F(PairingEngineTest, OrderingUsesHorizontalFraction) {
    auto m = molar(730.0);
    auto p = premolar(550.0);
    EXPECT_TRUE(PairingEngine::isAnatomicallyOrdered(m, p));
    EXPECT_FALSE(PairingEngine::isAnatomicallyOrdered(p, m));
}

TEST_F(PairingEngineTest, OrderingRequiresSameArchSide) {
    auto m = molar(730.0);
    auto p = premolar(550.0);
    m.regionTests.archSide = ArchSide::Right;
    p.regionTests.archSide = ArchSide::Left;
    EXPECT_FALSE(PairingEngine::isAnatomicallyOrdered(m, p));

    p.regionTests.archSide = ArchSide::Right;
    EXPECT_TRUE(PairingEngine::isAnatomicallyOrdered(m, p));
}

// =============================================================================
// MidlineOut scans
// =============================================================================

TEST_F(PairingEngineTest, MidlineOutNeverPairsAcrossTheArch) {
    config_.sideConvention = core::SideConvention::MidlineOut;
    AnatomicalClassifier classifier(config_);
    PairingEngine engine(config_);

    // Molar on the right half (fraction 0.7), premolar on the left (0.5)
    std::vector<Detection> detections = {
        makeDetection(800.0, 200.0, 100.0, 100.0, "primary_molar", 0.9),
        makeDetection(210.0, 210.0, 80.0, 80.0, "premolar", 0.9)};

    auto classified = classifier.classify(detections, 1000, 500);
    ASSERT_EQ(classified.molars.size(), 1u);
    ASSERT_EQ(classified.premolars.size(), 1u);

    auto result = engine.pair(classified);
    EXPECT_TRUE(result.pairs.empty());
    EXPECT_EQ(result.unpairedMolars, 1u);
}

TEST_F(PairingEngineTest, MidlineOutPairsWithinOneArchHalf) {
    config_.sideConvention = core::SideConvention::MidlineOut;
    AnatomicalClassifier classifier(config_);
    PairingEngine engine(config_);

    std::vector<Detection> detections = {
        makeDetection(800.0, 200.0, 100.0, 100.0, "primary_molar", 0.9),
        makeDetection(210.0, 210.0, 80.0, 80.0, "left_premolar", 0.9),
        makeDetection(710.0, 210.0, 80.0, 80.0, "right_premolar", 0.9)};

    auto classified = classifier.classify(detections, 1000, 500);
    ASSERT_EQ(classified.premolars.size(), 2u);

    auto result = engine.pair(classified);
    ASSERT_EQ(result.pairs.size(), 1u);
    EXPECT_EQ(result.pairs[0].premolar.detection.classLabel, "right_premolar");
}

}  // anonymous namespace
}  // namespace dentescope::services
