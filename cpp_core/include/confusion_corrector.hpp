#pragma once
#include "ocr_types.hpp"
#include <map>
#include <regex>
#include <string>
#include <vector>

/// Best-candidate rewrite of one record produced by ConfusionCorrector::BatchCorrect.
struct CorrectedText {
    std::string text;
    double confidence = 0.0;
    std::string original_text;
    bool pattern_match = false;
    std::vector<CharEdit> edits;
    std::vector<std::string> alternatives;
};

/**
 * @class ConfusionCorrector
 * @brief Re-ranks a recognized string against the known wheel-code grammars by
 *        trying look-alike character substitutions (at most two per candidate).
 */
class ConfusionCorrector {
public:
    static constexpr size_t kMaxCandidates = 5;

    ConfusionCorrector();

    std::vector<CorrectionCandidate> Correct(const std::string& text, double confidence) const;
    std::vector<CorrectedText> BatchCorrect(const std::vector<TextObservation>& records) const;

    bool MatchesGrammar(const std::string& text) const;

private:
    struct Substitution {
        std::string text;
        std::vector<CharEdit> edits;
    };

    std::vector<Substitution> GenerateSubstitutions(const std::string& text) const;

    std::map<char, std::string> confusions_;
    std::vector<std::regex> grammars_;
};
