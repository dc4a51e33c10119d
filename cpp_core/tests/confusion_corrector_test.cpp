#include "confusion_corrector.hpp"
#include <gtest/gtest.h>

class ConfusionCorrectorTest : public ::testing::Test {
protected:
    ConfusionCorrector corrector;
};

TEST_F(ConfusionCorrectorTest, KnownGrammars) {
    EXPECT_TRUE(corrector.MatchesGrammar("AT60202"));
    EXPECT_TRUE(corrector.MatchesGrammar("ABC1234"));
    EXPECT_TRUE(corrector.MatchesGrammar("1234A5"));
    EXPECT_TRUE(corrector.MatchesGrammar("1234AB5"));
    EXPECT_FALSE(corrector.MatchesGrammar("AT6O2O2"));
    EXPECT_FALSE(corrector.MatchesGrammar("at60202"));
}

TEST_F(ConfusionCorrectorTest, MatchingTextIsReturnedAloneAndBoosted) {
    auto candidates = corrector.Correct("AT60202", 0.8);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].text, "AT60202");
    EXPECT_TRUE(candidates[0].pattern_match);
    EXPECT_TRUE(candidates[0].edits.empty());
    EXPECT_NEAR(candidates[0].confidence, 0.96, 1e-9);
}

TEST_F(ConfusionCorrectorTest, TwoLookAlikeLettersAreRepaired) {
    auto candidates = corrector.Correct("AT6O2O2", 0.8);
    ASSERT_FALSE(candidates.empty());
    EXPECT_LE(candidates.size(), ConfusionCorrector::kMaxCandidates);

    const CorrectionCandidate& best = candidates.front();
    EXPECT_EQ(best.text, "AT60202");
    EXPECT_TRUE(best.pattern_match);
    EXPECT_NEAR(best.confidence, 1.2, 1e-9);
    ASSERT_EQ(best.edits.size(), 2u);
    EXPECT_EQ(best.edits[0].position, 3u);
    EXPECT_EQ(best.edits[0].from, 'O');
    EXPECT_EQ(best.edits[0].to, '0');
    EXPECT_EQ(best.edits[1].position, 5u);
}

TEST_F(ConfusionCorrectorTest, GrammarMatchesRankAheadOfPlainCandidates) {
    auto candidates = corrector.Correct("AT6O2O2", 0.8);
    bool seen_plain = false;
    for (const auto& c : candidates) {
        if (!c.pattern_match) seen_plain = true;
        else EXPECT_FALSE(seen_plain) << c.text;
    }
}

TEST_F(ConfusionCorrectorTest, UnrepairableTextKeepsOriginalFirst) {
    auto candidates = corrector.Correct("HELLO", 0.8);
    ASSERT_FALSE(candidates.empty());
    EXPECT_EQ(candidates.front().text, "HELLO");
    EXPECT_FALSE(candidates.front().pattern_match);
    EXPECT_TRUE(candidates.front().edits.empty());
    for (size_t i = 1; i < candidates.size(); ++i) {
        EXPECT_LT(candidates[i].confidence, 0.8);
    }
}

TEST_F(ConfusionCorrectorTest, BatchCorrectKeepsOriginalAndAlternatives) {
    TextObservation broken;
    broken.text = "AT6O2O2";
    broken.confidence = 0.8;
    TextObservation clean;
    clean.text = "AT60202";
    clean.confidence = 0.9;

    auto corrected = corrector.BatchCorrect({broken, clean});
    ASSERT_EQ(corrected.size(), 2u);

    EXPECT_EQ(corrected[0].text, "AT60202");
    EXPECT_EQ(corrected[0].original_text, "AT6O2O2");
    EXPECT_TRUE(corrected[0].pattern_match);
    EXPECT_LE(corrected[0].alternatives.size(), 2u);

    EXPECT_EQ(corrected[1].text, "AT60202");
    EXPECT_TRUE(corrected[1].edits.empty());
    EXPECT_TRUE(corrected[1].alternatives.empty());
}
