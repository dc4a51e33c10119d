#include "confusion_corrector.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace {
constexpr double GRAMMAR_ORIGINAL_BOOST = 1.2;
constexpr double GRAMMAR_CANDIDATE_BOOST = 1.5;
constexpr double PER_EDIT_PENALTY = 0.9;
constexpr size_t MIN_LENGTH_FOR_PAIRS = 5;
constexpr size_t MAX_BATCH_ALTERNATIVES = 2;
}

ConfusionCorrector::ConfusionCorrector()
    : confusions_{
          {'0', "OQD"}, {'O', "0QD"},
          {'1', "Il|i"}, {'I', "1l|"},
          {'2', "Z3"}, {'3', "82"},
          {'4', "A6"}, {'5', "S6"},
          {'6', "G8549"}, {'7', "T16"},
          {'8', "B36"}, {'9', "gq6"},
          {'B', "8R"}, {'G', "6C"},
          {'S', "58"}, {'Z', "27"},
          {'T', "71"}, {'A', "4"},
      },
      grammars_{
          std::regex("[A-Z]{2}[0-9]{5}"),        // AT66202
          std::regex("[A-Z]{3}[0-9]{4}"),
          std::regex("[0-9]{4}[A-Z][0-9]"),
          std::regex("[0-9]{4}[A-Z]{2}[0-9]"),
      } {}

bool ConfusionCorrector::MatchesGrammar(const std::string& text) const {
    return std::any_of(grammars_.begin(), grammars_.end(), [&text](const std::regex& re) {
        return std::regex_match(text, re);
    });
}

std::vector<ConfusionCorrector::Substitution> ConfusionCorrector::GenerateSubstitutions(const std::string& text) const {
    std::vector<Substitution> out;

    for (size_t i = 0; i < text.size(); ++i) {
        auto it = confusions_.find(text[i]);
        if (it == confusions_.end()) continue;
        for (char replacement : it->second) {
            std::string candidate = text;
            candidate[i] = replacement;
            out.push_back({std::move(candidate), {{i, text[i], replacement}}});
        }
    }

    if (text.size() < MIN_LENGTH_FOR_PAIRS) return out;

    for (size_t i = 0; i < text.size(); ++i) {
        auto first = confusions_.find(text[i]);
        if (first == confusions_.end()) continue;
        for (char r1 : first->second) {
            for (size_t j = i + 1; j < text.size(); ++j) {
                auto second = confusions_.find(text[j]);
                if (second == confusions_.end()) continue;
                for (char r2 : second->second) {
                    std::string candidate = text;
                    candidate[i] = r1;
                    candidate[j] = r2;
                    out.push_back({std::move(candidate), {{i, text[i], r1}, {j, text[j], r2}}});
                }
            }
        }
    }
    return out;
}

std::vector<CorrectionCandidate> ConfusionCorrector::Correct(const std::string& text, double confidence) const {
    std::vector<CorrectionCandidate> results;
    results.push_back({text, confidence, {}, MatchesGrammar(text)});

    if (results.front().pattern_match) {
        results.front().confidence *= GRAMMAR_ORIGINAL_BOOST;
        return results;
    }

    for (auto& sub : GenerateSubstitutions(text)) {
        CorrectionCandidate candidate;
        candidate.pattern_match = MatchesGrammar(sub.text);
        candidate.confidence = candidate.pattern_match
            ? confidence * GRAMMAR_CANDIDATE_BOOST
            : confidence * std::pow(PER_EDIT_PENALTY, static_cast<double>(sub.edits.size()));
        candidate.text = std::move(sub.text);
        candidate.edits = std::move(sub.edits);
        results.push_back(std::move(candidate));
    }

    std::stable_sort(results.begin(), results.end(), [](const CorrectionCandidate& a, const CorrectionCandidate& b) {
        if (a.pattern_match != b.pattern_match) return a.pattern_match;
        return a.confidence > b.confidence;
    });

    if (results.size() > kMaxCandidates) results.resize(kMaxCandidates);

    if (results.front().pattern_match) {
        std::cerr << "[Corrector] '" << text << "' -> '" << results.front().text << "' (grammar match)" << std::endl;
    }
    return results;
}

std::vector<CorrectedText> ConfusionCorrector::BatchCorrect(const std::vector<TextObservation>& records) const {
    std::vector<CorrectedText> corrected;
    corrected.reserve(records.size());

    for (const auto& record : records) {
        auto candidates = Correct(record.text, record.confidence);
        const CorrectionCandidate& best = candidates.front();

        CorrectedText out;
        out.text = best.text;
        out.confidence = best.confidence;
        out.original_text = record.text;
        out.pattern_match = best.pattern_match;
        out.edits = best.edits;
        if (!best.edits.empty()) {
            for (size_t k = 1; k < candidates.size() && out.alternatives.size() < MAX_BATCH_ALTERNATIVES; ++k) {
                out.alternatives.push_back(candidates[k].text);
            }
        }
        corrected.push_back(std::move(out));
    }
    return corrected;
}
