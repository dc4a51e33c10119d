#include "result_filter_pipeline.hpp"
#include "ocr_utils.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>

namespace {
std::vector<TextObservation> SampleObservations() {
    return {
        MakeObservation("MICHELIN", 0.95),
        MakeObservation("MICHELIN", 0.91),
        MakeObservation("AT64202", 0.88),
        MakeObservation("AT64203", 0.81),
        MakeObservation("91V", 0.78),
        MakeObservation("X", 0.55),
        MakeObservation("2019", 0.40),
        MakeObservation("MICHEL1N", 0.70),
    };
}

std::vector<std::string> Texts(const std::vector<TextObservation>& observations) {
    std::vector<std::string> out;
    for (const auto& obs : observations) out.push_back(obs.text);
    return out;
}
}

TEST(ResultFilterPipelineTest, EmptyInputGivesEmptyOutput) {
    ResultFilterPipeline pipeline(FilterConfig{});
    EXPECT_TRUE(pipeline.Process({}).empty());
}

TEST(ResultFilterPipelineTest, NothingBelowMinConfidenceSurvives) {
    FilterConfig config;
    config.min_confidence = 0.8;
    ResultFilterPipeline pipeline(config);

    auto out = pipeline.Process(SampleObservations());
    ASSERT_FALSE(out.empty());
    for (const auto& obs : out) EXPECT_GE(obs.confidence, 0.8) << obs.text;
}

TEST(ResultFilterPipelineTest, ProcessingOwnOutputIsStable) {
    ResultFilterPipeline pipeline(FilterConfig{});
    auto once = pipeline.Process(SampleObservations());
    auto twice = pipeline.Process(once);
    EXPECT_EQ(Texts(once), Texts(twice));
}

TEST(ResultFilterPipelineTest, KeptPairsAreNotSimilar) {
    FilterConfig config;
    config.min_confidence = 0.0;
    ResultFilterPipeline pipeline(config);

    auto out = pipeline.Process(SampleObservations());
    for (size_t i = 0; i < out.size(); ++i) {
        for (size_t j = i + 1; j < out.size(); ++j) {
            EXPECT_LT(OcrUtils::Similarity(out[i].text, out[j].text), config.similarity_threshold)
                << out[i].text << " vs " << out[j].text;
        }
    }
}

TEST(ResultFilterPipelineTest, DeduplicateKeepsFirstOccurrence) {
    ResultFilterPipeline pipeline(FilterConfig{});
    auto out = pipeline.Deduplicate({MakeObservation("MICHELIN", 0.7), MakeObservation("MICHELIN", 0.9),
                                     MakeObservation("AT64202", 0.8), MakeObservation("AT64203", 0.8)});
    ASSERT_EQ(out.size(), 3u);
    EXPECT_DOUBLE_EQ(out[0].confidence, 0.7);
    EXPECT_EQ(out[1].text, "AT64202");
    EXPECT_EQ(out[2].text, "AT64203");
}

TEST(ResultFilterPipelineTest, OutputIsSortedByRankScore) {
    FilterConfig config;
    config.min_confidence = 0.0;
    ResultFilterPipeline pipeline(config);

    auto out = pipeline.Process(SampleObservations());
    for (size_t i = 1; i < out.size(); ++i) {
        EXPECT_GE(ResultFilterPipeline::RankScore(out[i - 1]), ResultFilterPipeline::RankScore(out[i]));
    }
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.front().text, "AT64202");
}

TEST(ResultFilterPipelineTest, RankScoreBonuses) {
    EXPECT_DOUBLE_EQ(ResultFilterPipeline::RankScore(MakeObservation("AT64202", 0.5)), 0.5 + 2.0 + 0.5);
    EXPECT_DOUBLE_EQ(ResultFilterPipeline::RankScore(MakeObservation("ATX", 0.5)), 0.5 + 1.5);
    EXPECT_DOUBLE_EQ(ResultFilterPipeline::RankScore(MakeObservation("642021", 0.5)), 0.5 + 0.5 + 0.5);
    EXPECT_DOUBLE_EQ(ResultFilterPipeline::RankScore(MakeObservation("91V", 0.5)), 0.5);
}

TEST(ResultFilterPipelineTest, LengthFilterUsesTrimmedText) {
    FilterConfig config;
    config.min_length = 2;
    config.max_length = 8;
    ResultFilterPipeline pipeline(config);

    auto out = pipeline.FilterByLength({MakeObservation("  X  ", 0.9), MakeObservation(" 91V ", 0.9),
                                        MakeObservation("MICHELIN TYRE", 0.9)});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].text, " 91V ");
}

TEST(ResultFilterPipelineTest, AllowListStripsAndDropsEmpty) {
    FilterConfig config;
    config.allowed_chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    ResultFilterPipeline pipeline(config);

    auto out = pipeline.FilterByChars({MakeObservation("AT 64-202", 0.9), MakeObservation("###", 0.9)});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].text, "AT64202");
}

TEST(ResultFilterPipelineTest, CorrectionRulesApplyInOrder) {
    ResultFilterPipeline pipeline(FilterConfig{});
    EXPECT_EQ(pipeline.ApplyCorrectionRules("MICHEL1N"), "MICHELIN");
    EXPECT_EQ(pipeline.ApplyCorrectionRules("12O45"), "12045");
    EXPECT_EQ(pipeline.ApplyCorrectionRules("AT6O2O2"), "AT60202");
    EXPECT_EQ(pipeline.ApplyCorrectionRules("12L45"), "12445");
    EXPECT_EQ(pipeline.ApplyCorrectionRules("91V"), "91V");
}

TEST(ResultFilterPipelineTest, CorrectionRecordsOriginalText) {
    ResultFilterPipeline pipeline(FilterConfig{});
    auto out = pipeline.CorrectCharacters({MakeObservation("AT6O2O2", 0.9), MakeObservation("91V", 0.9)});
    ASSERT_EQ(out.size(), 2u);

    EXPECT_EQ(out[0].text, "AT60202");
    EXPECT_TRUE(out[0].corrected);
    ASSERT_TRUE(out[0].original_text.has_value());
    EXPECT_EQ(*out[0].original_text, "AT6O2O2");

    EXPECT_FALSE(out[1].corrected);
    EXPECT_FALSE(out[1].original_text.has_value());
}

TEST(ResultFilterPipelineTest, BackfillTopsUpFromOriginalObservations) {
    FilterConfig config;
    config.min_confidence = 0.9;
    config.min_results = 2;
    ResultFilterPipeline pipeline(config);

    auto out = pipeline.Process({MakeObservation("AT64202", 0.95), MakeObservation("91V", 0.85),
                                 MakeObservation("MICHELIN", 0.70), MakeObservation("AT64202", 0.60)});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].text, "AT64202");
    EXPECT_EQ(out[1].text, "MICHELIN");
}

TEST(ResultFilterPipelineTest, BackfillStripsAndRejectsShortText) {
    FilterConfig config;
    config.min_confidence = 0.9;
    config.min_results = 3;
    config.allowed_chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    ResultFilterPipeline pipeline(config);

    // "9 1V" strips to three characters; "AT-64202" strips to a text already kept.
    auto out = pipeline.Process({MakeObservation("AT64202", 0.95), MakeObservation("M-ICH", 0.80),
                                 MakeObservation("9 1V", 0.70), MakeObservation("AT-64202", 0.60)});
    EXPECT_EQ(Texts(out), (std::vector<std::string>{"AT64202", "MICH"}));
}

TEST(ResultFilterPipelineTest, DeduplicateComparesCharactersNotBytes) {
    ResultFilterPipeline pipeline(FilterConfig{});
    // One character apart out of four: similarity 0.75.
    auto out = pipeline.Deduplicate({MakeObservation("轮毂编号", 0.9), MakeObservation("轮毅编号", 0.8)});
    EXPECT_EQ(out.size(), 2u);
}

TEST(ResultFilterPipelineTest, LengthFilterCountsCharacters) {
    FilterConfig config;
    config.min_length = 4;
    config.max_length = 4;
    ResultFilterPipeline pipeline(config);

    auto out = pipeline.FilterByLength({MakeObservation("轮毂编号", 0.9), MakeObservation("米其林", 0.9)});
    EXPECT_EQ(Texts(out), std::vector<std::string>{"轮毂编号"});
}

TEST(ResultFilterPipelineTest, RankLengthBonusCountsCharacters) {
    EXPECT_DOUBLE_EQ(ResultFilterPipeline::RankScore(MakeObservation("轮毂编号米其", 0.5)), 0.5 + 0.5);
    EXPECT_DOUBLE_EQ(ResultFilterPipeline::RankScore(MakeObservation("米其林", 0.5)), 0.5);
}

TEST(ResultFilterPipelineTest, AllowListKeepsMultiByteCharacters) {
    FilterConfig config;
    config.allowed_chars = "米其林0123456789";
    ResultFilterPipeline pipeline(config);

    auto out = pipeline.FilterByChars({MakeObservation("米其林-2019", 0.9), MakeObservation("轮毂", 0.9)});
    EXPECT_EQ(Texts(out), std::vector<std::string>{"米其林2019"});
}

class RegionFilterTest : public ::testing::Test {
protected:
    RegionFilterTest() {
        config.enable_region_filter = true;
    }

    // Defines a 1000x1000 extent without crossing any other box.
    TextObservation Frame() const { return MakeObservation("MICHELIN", 0.9, 990, 990, 10, 10); }

    FilterConfig config;
};

TEST_F(RegionFilterTest, EngravedBandOverridesLongNumericHeuristic) {
    ResultFilterPipeline pipeline(config);
    // 30x20 in 1000x1000: area ratio 0.0006, aspect 1.5
    auto engraved = MakeObservation("12345678", 0.9, 485, 490, 30, 20);

    auto out = pipeline.FilterByRegion({engraved, Frame()});
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out[0].text, "12345678");
}

TEST_F(RegionFilterTest, LongNumericLabelOutsideBandIsRejected) {
    ResultFilterPipeline pipeline(config);
    // 125x80: area ratio 0.01, aspect 1.5625
    auto label = MakeObservation("12345678", 0.9, 440, 460, 125, 80);

    auto out = pipeline.FilterByRegion({label, Frame()});
    for (const auto& obs : out) EXPECT_NE(obs.text, "12345678");
}

TEST_F(RegionFilterTest, HardLimitsAreNotExempt) {
    config.region.max_aspect_ratio = 1.0;
    ResultFilterPipeline pipeline(config);
    auto engraved = MakeObservation("12345678", 0.9, 485, 490, 30, 20);

    auto out = pipeline.FilterByRegion({engraved, Frame()});
    for (const auto& obs : out) EXPECT_NE(obs.text, "12345678");
}

TEST_F(RegionFilterTest, MissingGeometryPassesThrough) {
    ResultFilterPipeline pipeline(config);
    auto no_box = MakeObservation("91V", 0.9);

    auto out = pipeline.FilterByRegion({no_box, Frame()});
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out[0].text, "91V");
}

TEST_F(RegionFilterTest, CenterRegionOnly) {
    config.region.center_region_only = true;
    config.region.center_region_ratio = 0.6;
    ResultFilterPipeline pipeline(config);

    auto center = MakeObservation("AT64202", 0.9, 480, 490, 40, 20);
    auto corner = MakeObservation("91V", 0.9, 20, 20, 40, 20);

    auto out = pipeline.FilterByRegion({center, corner, Frame()});
    std::vector<std::string> texts = Texts(out);
    EXPECT_NE(std::find(texts.begin(), texts.end(), "AT64202"), texts.end());
    EXPECT_EQ(std::find(texts.begin(), texts.end(), "91V"), texts.end());
}

TEST_F(RegionFilterTest, LargeRegularBlobIsRejected) {
    ResultFilterPipeline pipeline(config);
    // 150x150: area ratio 0.0225, aspect 1
    auto blob = MakeObservation("HUBCAP", 0.9, 425, 425, 150, 150);
    // 300x60: area ratio 0.018, aspect 5
    auto banner = MakeObservation("AT64202", 0.9, 350, 470, 300, 60);

    std::vector<std::string> texts = Texts(pipeline.FilterByRegion({blob, banner, Frame()}));
    EXPECT_EQ(std::find(texts.begin(), texts.end(), "HUBCAP"), texts.end());
    EXPECT_NE(std::find(texts.begin(), texts.end(), "AT64202"), texts.end());
}

TEST_F(RegionFilterTest, PeripheralStickerIsRejected) {
    ResultFilterPipeline pipeline(config);
    // 200x50: area ratio 0.01, aspect 4. Center x 110 lies in the left edge margin.
    auto sticker = MakeObservation("SALE", 0.9, 10, 475, 200, 50);
    auto centered = MakeObservation("91V", 0.9, 400, 475, 200, 50);

    std::vector<std::string> texts = Texts(pipeline.FilterByRegion({sticker, centered, Frame()}));
    EXPECT_EQ(std::find(texts.begin(), texts.end(), "SALE"), texts.end());
    EXPECT_NE(std::find(texts.begin(), texts.end(), "91V"), texts.end());
}

TEST_F(RegionFilterTest, EngravedTextNearEdgeIsKept) {
    ResultFilterPipeline pipeline(config);
    // 30x20 at the left edge: area ratio 0.0006
    auto engraved = MakeObservation("91V", 0.9, 10, 490, 30, 20);

    std::vector<std::string> texts = Texts(pipeline.FilterByRegion({engraved, Frame()}));
    EXPECT_NE(std::find(texts.begin(), texts.end(), "91V"), texts.end());
}
