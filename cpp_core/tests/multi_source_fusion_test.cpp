#include "multi_source_fusion.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

namespace {
ImageRecognition Image(std::vector<TextObservation> observations, bool success = true) {
    ImageRecognition rec;
    rec.success = success;
    rec.observations = std::move(observations);
    return rec;
}

ImageRecognition ImageWithLines(std::vector<std::pair<std::string, double>> lines) {
    ImageRecognition rec;
    rec.success = true;
    for (const auto& [text, confidence] : lines) {
        rec.observations.push_back(MakeObservation(text, confidence));
        TextLine line;
        line.text = text;
        line.confidence = confidence;
        rec.lines.push_back(line);
    }
    return rec;
}

std::vector<ImageRecognition> TireSidewall() {
    return {
        Image({MakeObservation("MICHELIN", 0.95)}),
        Image({MakeObservation("MICHELIN", 0.92), MakeObservation("91V", 0.78)}),
        Image({MakeObservation("MICHELIN", 0.89), MakeObservation("91V", 0.82)}),
    };
}

FusionConfig WithMethod(const std::string& method) {
    FusionConfig config;
    config.fusion_method = method;
    return config;
}
}

TEST(MultiSourceFusionTest, SupportedMethods) {
    EXPECT_TRUE(MultiSourceFusion::IsSupportedMethod("voting"));
    EXPECT_TRUE(MultiSourceFusion::IsSupportedMethod("weighted"));
    EXPECT_TRUE(MultiSourceFusion::IsSupportedMethod("smart"));
    EXPECT_TRUE(MultiSourceFusion::IsSupportedMethod("merge"));
    EXPECT_FALSE(MultiSourceFusion::IsSupportedMethod("median"));
}

TEST(MultiSourceFusionTest, VotingPrefersMostFrequentText) {
    FusedResult result = MultiSourceFusion(WithMethod("voting")).Fuse(TireSidewall());
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.merged_text, "MICHELIN");
    EXPECT_NEAR(result.confidence, 0.92, 1e-9);
    EXPECT_EQ(result.source_count, 3);
    EXPECT_EQ(result.fusion_method, "voting");
    EXPECT_TRUE(result.alternatives.empty());
}

TEST(MultiSourceFusionTest, WeightedSumsConfidence) {
    FusedResult result = MultiSourceFusion(WithMethod("weighted")).Fuse(TireSidewall());
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.merged_text, "MICHELIN");
}

TEST(MultiSourceFusionTest, WeightedLetsConfidentMinorityWin) {
    std::vector<ImageRecognition> images = {
        Image({MakeObservation("AT60202", 0.99), MakeObservation("AT60202", 0.98)}),
        Image({MakeObservation("AT6O2O2", 0.40)}),
        Image({MakeObservation("AT6O2O2", 0.40)}),
        Image({MakeObservation("AT6O2O2", 0.40)}),
    };
    FusedResult result = MultiSourceFusion(WithMethod("weighted")).Fuse(images);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.merged_text, "AT60202");
}

TEST(MultiSourceFusionTest, SmartTakesMostConfidentAndListsCloseRunnersUp) {
    FusedResult result = MultiSourceFusion(WithMethod("smart")).Fuse(TireSidewall());
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.merged_text, "MICHELIN");
    EXPECT_NEAR(result.confidence, 0.95, 1e-9);
    ASSERT_EQ(result.alternatives.size(), 1u);
    EXPECT_EQ(result.alternatives[0].text, "91V");
    EXPECT_NEAR(result.alternatives[0].confidence, 0.82, 1e-9);
}

TEST(MultiSourceFusionTest, AlternativesCanBeSuppressed) {
    FusionConfig config = WithMethod("smart");
    config.return_alternatives = false;
    FusedResult result = MultiSourceFusion(config).Fuse(TireSidewall());
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.alternatives.empty());
}

TEST(MultiSourceFusionTest, MergeJoinsDistinctTextsByBestConfidence) {
    FusedResult result = MultiSourceFusion(WithMethod("merge")).Fuse(TireSidewall());
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.merged_text, "MICHELIN 91V");
    EXPECT_NEAR(result.confidence, (0.95 + 0.82) / 2.0, 1e-9);
}

TEST(MultiSourceFusionTest, EmptyInputFails) {
    FusedResult result = MultiSourceFusion(FusionConfig{}).Fuse({});
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.empty());
}

TEST(MultiSourceFusionTest, AllFailedImagesFail) {
    FusedResult result = MultiSourceFusion(FusionConfig{}).Fuse({
        Image({MakeObservation("MICHELIN", 0.9)}, false),
        Image({}),
    });
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "All images failed to produce any text");
}

TEST(MultiSourceFusionTest, UnsupportedMethodFailsBeforeFusing) {
    FusedResult result = MultiSourceFusion(WithMethod("median")).Fuse(TireSidewall());
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("Unsupported fusion method"), std::string::npos);
    EXPECT_TRUE(result.merged_text.empty());
}

TEST(MultiSourceFusionTest, SingleImageIsFusedWithWarning) {
    FusedResult result = MultiSourceFusion(FusionConfig{}).Fuse({Image({MakeObservation("91V", 0.8)})});
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.merged_text, "91V");
    EXPECT_EQ(result.source_count, 1);
}

TEST(MultiSourceFusionTest, OnlyFirstMaxImagesAreUsed) {
    std::vector<ImageRecognition> images;
    for (int i = 0; i < 10; ++i) images.push_back(Image({MakeObservation("AT64202", 0.9)}));
    // Late images would outvote the first ten if they were counted.
    images.push_back(Image({MakeObservation("ZZZZZZZ", 0.99), MakeObservation("ZZZZZZZ", 0.99)}));
    images.push_back(Image({MakeObservation("ZZZZZZZ", 0.99)}));
    for (int i = 0; i < 10; ++i) images.back().observations.push_back(MakeObservation("ZZZZZZZ", 0.99));

    FusedResult result = MultiSourceFusion(FusionConfig{}).Fuse(images);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.source_count, 10);
    EXPECT_EQ(result.merged_text, "AT64202");
}

TEST(MultiSourceFusionTest, SimilarLinesAreFusedByRow) {
    MultiSourceFusion fusion(FusionConfig{});
    auto lines = fusion.FuseLines({
        ImageWithLines({{"AT64202", 0.90}}),
        ImageWithLines({{"AT64202", 0.85}}),
        ImageWithLines({{"AT64203", 0.70}}),
    });

    // One character apart is within the 0.8 line similarity, so all three agree.
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].text, "AT64202");
    EXPECT_EQ(lines[0].occurrence_count, 3);
    EXPECT_NEAR(lines[0].confidence, (0.90 + 0.85 + 0.70) / 3.0, 1e-9);
}

TEST(MultiSourceFusionTest, MajorityLineBeatsDissimilarOutlier) {
    MultiSourceFusion fusion(FusionConfig{});
    auto lines = fusion.FuseLines({
        ImageWithLines({{"AT64202", 0.90}, {"MICHELIN", 0.80}}),
        ImageWithLines({{"AT64202", 0.85}}),
        ImageWithLines({{"91V", 0.99}}),
    });

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].text, "AT64202");
    EXPECT_EQ(lines[0].occurrence_count, 2);
    EXPECT_NEAR(lines[0].confidence, 0.875, 1e-9);
    EXPECT_EQ(lines[1].text, "MICHELIN");
    EXPECT_EQ(lines[1].occurrence_count, 1);
}

TEST(MultiSourceFusionTest, FusedResultCarriesLines) {
    FusedResult result = MultiSourceFusion(FusionConfig{}).Fuse({
        ImageWithLines({{"AT64202", 0.90}}),
        ImageWithLines({{"AT 64202", 0.80}}),
    });
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.lines.size(), 1u);
    EXPECT_EQ(result.lines[0].occurrence_count, 2);
}

TEST(MultiSourceFusionTest, LineSimilarity) {
    EXPECT_TRUE(MultiSourceFusion::LinesSimilar("AT 64202", "at64202"));
    EXPECT_TRUE(MultiSourceFusion::LinesSimilar("AT64202", "AT64203"));
    EXPECT_FALSE(MultiSourceFusion::LinesSimilar("AT64202", "AT6420212345"));
    EXPECT_FALSE(MultiSourceFusion::LinesSimilar("MICHELIN", "91V"));
}

TEST(MultiSourceFusionTest, VotingListsRunnerUpAboveCutoff) {
    std::vector<ImageRecognition> images = {
        Image({MakeObservation("AT64202", 0.90)}),
        Image({MakeObservation("AT64203", 0.85)}),
    };
    FusedResult result = MultiSourceFusion(WithMethod("voting")).Fuse(images);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.merged_text, "AT64202");

    // 0.5 * 0.85 * 1.5 against a cutoff of 0.675 * 0.85
    ASSERT_EQ(result.alternatives.size(), 1u);
    EXPECT_EQ(result.alternatives[0].text, "AT64203");
    EXPECT_NEAR(result.alternatives[0].score, 0.6375, 1e-9);
    EXPECT_NEAR(result.alternatives[0].confidence, 0.85, 1e-9);
}

TEST(MultiSourceFusionTest, WeightedListsRunnerUpAboveCutoff) {
    std::vector<ImageRecognition> images = {
        Image({MakeObservation("AT64202", 0.90)}),
        Image({MakeObservation("AT64203", 0.85)}),
    };
    FusedResult result = MultiSourceFusion(WithMethod("weighted")).Fuse(images);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.merged_text, "AT64202");
    ASSERT_EQ(result.alternatives.size(), 1u);
    EXPECT_EQ(result.alternatives[0].text, "AT64203");
    EXPECT_NEAR(result.alternatives[0].score, 0.85, 1e-9);
}

TEST(MultiSourceFusionTest, VotingLengthWeightCountsCharacters) {
    std::vector<ImageRecognition> images = {
        Image({MakeObservation("米其林", 0.80)}),
        Image({MakeObservation("ABCD", 0.70)}),
    };
    FusedResult result = MultiSourceFusion(WithMethod("voting")).Fuse(images);
    ASSERT_TRUE(result.success);
    // Three characters weigh 1.0, four weigh 4/3.
    EXPECT_EQ(result.merged_text, "ABCD");
    ASSERT_EQ(result.alternatives.size(), 1u);
    EXPECT_EQ(result.alternatives[0].text, "米其林");
    EXPECT_NEAR(result.alternatives[0].score, 0.4, 1e-9);
}
