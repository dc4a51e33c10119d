#include "result_filter_pipeline.hpp"
#include "ocr_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <map>
#include <regex>
#include <iterator>

namespace {
// Area band of text engraved into the hub surface, relative to the image.
constexpr double ENGRAVED_MIN_AREA = 0.0005;
constexpr double ENGRAVED_MAX_AREA = 0.008;
constexpr double EDGE_MARGIN = 0.15;
constexpr size_t MIN_BACKFILL_LENGTH = 4;

const std::map<char, char>& LetterToDigit() {
    static const std::map<char, char> table = {
        {'O', '0'}, {'Q', '0'}, {'D', '0'},
        {'I', '1'}, {'l', '1'},
        {'Z', '2'}, {'A', '4'}, {'S', '5'}, {'G', '6'}, {'T', '7'}, {'B', '8'},
        {'g', '9'}, {'q', '9'},
    };
    return table;
}

bool IsDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
bool IsAlpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }

bool HasCodePrefix(const std::string& text) {
    return text.compare(0, 2, "AT") == 0 && OcrUtils::CharLength(text) >= 7;
}

std::string ReplaceChars(std::string text, const std::map<char, char>& mapping) {
    for (char& c : text) {
        auto it = mapping.find(c);
        if (it != mapping.end()) c = it->second;
    }
    return text;
}

void LogStage(const char* stage, size_t before, size_t after) {
    std::cerr << "[Filter] " << stage << ": " << before << " -> " << after << std::endl;
}
}

ResultFilterPipeline::ResultFilterPipeline(const FilterConfig& config) : config_(config) {
    const RegionFilterConfig& rc = config_.region;

    region_rules_ = {
        {"area out of range", false, [rc](const RegionFeatures& f, const std::string&) {
            return f.area_ratio < rc.min_area_ratio || f.area_ratio > rc.max_area_ratio;
        }},
        {"aspect out of range", false, [rc](const RegionFeatures& f, const std::string&) {
            return f.aspect_ratio < rc.min_aspect_ratio || f.aspect_ratio > rc.max_aspect_ratio;
        }},
        {"outside center region", false, [rc](const RegionFeatures& f, const std::string&) {
            return rc.center_region_only && f.dist_ratio > 1.0 - rc.center_region_ratio;
        }},
        {"long numeric label", true, [](const RegionFeatures& f, const std::string& text) {
            return OcrUtils::IsAllDigits(text) && OcrUtils::CharLength(text) >= 7 &&
                   f.aspect_ratio >= 0.8 && f.aspect_ratio <= 3.0;
        }},
        {"large regular blob", true, [](const RegionFeatures& f, const std::string&) {
            return f.area_ratio > 0.015 && f.aspect_ratio >= 0.8 && f.aspect_ratio <= 4.0;
        }},
        {"peripheral sticker", true, [](const RegionFeatures& f, const std::string&) {
            bool near_edge = f.center.x < f.image_width * EDGE_MARGIN ||
                             f.center.x > f.image_width * (1.0 - EDGE_MARGIN) ||
                             f.center.y < f.image_height * EDGE_MARGIN ||
                             f.center.y > f.image_height * (1.0 - EDGE_MARGIN);
            return near_edge && f.area_ratio > 0.005;
        }},
    };

    correction_rules_ = {
        {"mostly letters", [](const std::string& t) { return OcrUtils::IsMostlyLetters(t); },
         [](const std::string& t) { return ReplaceChars(t, {{'0', 'O'}, {'1', 'I'}, {'5', 'S'}}); }},
        {"mostly digits",
         [](const std::string& t) { return !OcrUtils::IsMostlyLetters(t) && OcrUtils::IsMostlyDigits(t); },
         [](const std::string& t) { return ReplaceChars(t, {{'O', '0'}, {'I', '1'}}); }},
        {"code prefix", HasCodePrefix,
         [](const std::string& t) {
             std::string out = t;
             for (size_t i = 2; i < out.size(); ++i) {
                 if (!IsAlpha(out[i])) continue;
                 auto it = LetterToDigit().find(out[i]);
                 if (it != LetterToDigit().end()) out[i] = it->second;
             }
             return out;
         }},
        {"digit flanked letter",
         [](const std::string& t) {
             static const std::regex code("[A-Z0-9]{3,}");
             return !HasCodePrefix(t) && std::regex_match(t, code);
         },
         [](const std::string& t) {
             std::string out = t;
             for (size_t i = 1; i + 1 < out.size(); ++i) {
                 if (!IsDigit(out[i - 1]) || !IsDigit(out[i + 1])) continue;
                 if (out[i] == 'L') {
                     out[i] = '4';
                     continue;
                 }
                 auto it = LetterToDigit().find(out[i]);
                 if (it != LetterToDigit().end()) out[i] = it->second;
             }
             return out;
         }},
    };
}

std::vector<TextObservation> ResultFilterPipeline::Process(const std::vector<TextObservation>& observations) const {
    if (observations.empty()) return {};

    std::vector<TextObservation> results = observations;

    if (config_.enable_region_filter) results = FilterByRegion(results);
    results = FilterByConfidence(results);
    results = FilterByLength(results);
    if (config_.enable_char_filter) results = FilterByChars(results);
    if (config_.enable_correction) results = CorrectCharacters(results);
    if (config_.enable_deduplication) results = Deduplicate(results);
    if (config_.min_results > 0 && results.size() < config_.min_results) {
        results = Backfill(results, observations);
    }
    return Rank(results);
}

std::vector<TextObservation> ResultFilterPipeline::FilterByRegion(const std::vector<TextObservation>& in) const {
    double image_width = 0.0;
    double image_height = 0.0;
    for (const auto& obs : in) {
        auto bounds = OcrUtils::BoxBounds(obs.box);
        if (!bounds) continue;
        image_width = std::max(image_width, bounds->x + bounds->width);
        image_height = std::max(image_height, bounds->y + bounds->height);
    }

    if (image_width <= 0.0 || image_height <= 0.0) {
        std::cerr << "[Filter] Warning: cannot infer image size, skipping region filter" << std::endl;
        return in;
    }

    const double image_area = image_width * image_height;
    const double cx = image_width / 2.0;
    const double cy = image_height / 2.0;
    const double max_dist = std::sqrt(cx * cx + cy * cy);

    std::vector<TextObservation> out;
    for (const auto& obs : in) {
        auto bounds = OcrUtils::BoxBounds(obs.box);
        if (!bounds) {
            out.push_back(obs);
            continue;
        }

        RegionFeatures f;
        f.image_width = image_width;
        f.image_height = image_height;
        f.center = {bounds->x + bounds->width / 2.0, bounds->y + bounds->height / 2.0};
        f.area_ratio = bounds->width * bounds->height / image_area;
        f.aspect_ratio = bounds->height > 0.0 ? bounds->width / bounds->height : 0.0;
        double dist = std::hypot(f.center.x - cx, f.center.y - cy);
        f.dist_ratio = max_dist > 0.0 ? dist / max_dist : 1.0;

        const bool engraved = f.area_ratio >= ENGRAVED_MIN_AREA && f.area_ratio <= ENGRAVED_MAX_AREA;

        const RegionRule* hit = nullptr;
        for (const auto& rule : region_rules_) {
            if (rule.exemptable && engraved) continue;
            if (rule.rejects(f, obs.text)) {
                hit = &rule;
                break;
            }
        }

        if (hit) {
            std::cerr << "[Filter] region reject '" << obs.text << "': " << hit->name
                      << " (area " << f.area_ratio << ", aspect " << f.aspect_ratio << ")" << std::endl;
        } else {
            out.push_back(obs);
        }
    }
    LogStage("region", in.size(), out.size());
    return out;
}

std::vector<TextObservation> ResultFilterPipeline::FilterByConfidence(const std::vector<TextObservation>& in) const {
    std::vector<TextObservation> out;
    std::copy_if(in.begin(), in.end(), std::back_inserter(out), [this](const TextObservation& obs) {
        return obs.confidence >= config_.min_confidence;
    });
    LogStage("confidence", in.size(), out.size());
    return out;
}

std::vector<TextObservation> ResultFilterPipeline::FilterByLength(const std::vector<TextObservation>& in) const {
    std::vector<TextObservation> out;
    std::copy_if(in.begin(), in.end(), std::back_inserter(out), [this](const TextObservation& obs) {
        size_t length = OcrUtils::CharLength(OcrUtils::Trim(obs.text));
        return length >= config_.min_length && length <= config_.max_length;
    });
    LogStage("length", in.size(), out.size());
    return out;
}

std::string ResultFilterPipeline::StripDisallowed(const std::string& text) const {
    if (config_.allowed_chars.empty()) return text;
    const std::u32string allowed = OcrUtils::DecodeUtf8(config_.allowed_chars);
    std::u32string out;
    for (char32_t c : OcrUtils::DecodeUtf8(text)) {
        if (allowed.find(c) != std::u32string::npos) out += c;
    }
    return OcrUtils::EncodeUtf8(out);
}

std::vector<TextObservation> ResultFilterPipeline::FilterByChars(const std::vector<TextObservation>& in) const {
    if (config_.allowed_chars.empty()) return in;

    std::vector<TextObservation> out;
    for (const auto& obs : in) {
        std::string stripped = StripDisallowed(obs.text);
        if (stripped.empty()) continue;
        TextObservation kept = obs;
        kept.text = std::move(stripped);
        out.push_back(std::move(kept));
    }
    LogStage("chars", in.size(), out.size());
    return out;
}

std::string ResultFilterPipeline::ApplyCorrectionRules(const std::string& text) const {
    std::string current = text;
    for (const auto& rule : correction_rules_) {
        if (rule.applies(current)) current = rule.rewrite(current);
    }
    return current;
}

std::vector<TextObservation> ResultFilterPipeline::CorrectCharacters(const std::vector<TextObservation>& in) const {
    std::vector<TextObservation> out;
    out.reserve(in.size());
    for (const auto& obs : in) {
        TextObservation next = obs;
        std::string corrected = ApplyCorrectionRules(obs.text);
        if (corrected != obs.text) {
            next.corrected = true;
            next.original_text = obs.text;
            next.text = std::move(corrected);
        }
        out.push_back(std::move(next));
    }
    return out;
}

bool ResultFilterPipeline::IsDuplicateOf(const std::string& text, const std::vector<std::string>& kept) const {
    return std::any_of(kept.begin(), kept.end(), [&](const std::string& other) {
        return OcrUtils::Similarity(text, other) >= config_.similarity_threshold;
    });
}

std::vector<TextObservation> ResultFilterPipeline::Deduplicate(const std::vector<TextObservation>& in) const {
    std::vector<TextObservation> out;
    std::vector<std::string> seen;
    for (const auto& obs : in) {
        if (IsDuplicateOf(obs.text, seen)) continue;
        seen.push_back(obs.text);
        out.push_back(obs);
    }
    LogStage("dedup", in.size(), out.size());
    return out;
}

std::vector<TextObservation> ResultFilterPipeline::Backfill(const std::vector<TextObservation>& kept,
                                                            const std::vector<TextObservation>& original) const {
    std::vector<TextObservation> pool = original;
    std::stable_sort(pool.begin(), pool.end(), [](const TextObservation& a, const TextObservation& b) {
        return a.confidence > b.confidence;
    });

    std::vector<TextObservation> out = kept;
    std::vector<std::string> texts;
    for (const auto& obs : kept) texts.push_back(obs.text);

    for (const auto& obs : pool) {
        if (out.size() >= config_.min_results) break;
        std::string cleaned = StripDisallowed(obs.text);
        if (OcrUtils::CharLength(cleaned) < MIN_BACKFILL_LENGTH || IsDuplicateOf(cleaned, texts)) continue;

        TextObservation extra = obs;
        extra.text = cleaned;
        texts.push_back(cleaned);
        out.push_back(std::move(extra));
    }

    if (out.size() > config_.min_results) out.resize(config_.min_results);
    LogStage("backfill", kept.size(), out.size());
    return out;
}

double ResultFilterPipeline::RankScore(const TextObservation& observation) {
    static const std::regex full_code("AT[0-9]{3,}");
    const std::string& t = observation.text;

    double bonus = 0.0;
    if (std::regex_match(t, full_code)) {
        bonus += 2.0;
    } else if (t.compare(0, 2, "AT") == 0) {
        bonus += 1.5;
    }
    const size_t length = OcrUtils::CharLength(t);
    if (length >= 6 && length <= 8) bonus += 0.5;
    if (OcrUtils::IsAllDigits(t)) bonus += 0.5;
    return observation.confidence + bonus;
}

std::vector<TextObservation> ResultFilterPipeline::Rank(const std::vector<TextObservation>& in) const {
    std::vector<std::pair<double, TextObservation>> scored;
    scored.reserve(in.size());
    for (const auto& obs : in) scored.emplace_back(RankScore(obs), obs);

    std::stable_sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        return a.first > b.first;
    });

    std::vector<TextObservation> out;
    out.reserve(scored.size());
    for (auto& entry : scored) out.push_back(std::move(entry.second));
    return out;
}
