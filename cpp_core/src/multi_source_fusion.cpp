#include "multi_source_fusion.hpp"
#include "ocr_utils.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <unordered_map>

namespace {
constexpr double MAX_LENGTH_WEIGHT = 1.5;
constexpr double MAX_LINE_LENGTH_GAP = 0.3;

struct TextStats {
    std::string text;
    int count = 0;
    double sum = 0.0;
    double max = 0.0;
};

// Exact-text groups in order of first appearance.
std::vector<TextStats> GroupByText(const std::vector<MultiSourceFusion::PooledText>& pool) {
    std::vector<TextStats> groups;
    std::unordered_map<std::string, size_t> index;
    for (const auto& item : pool) {
        auto it = index.find(item.text);
        if (it == index.end()) {
            index.emplace(item.text, groups.size());
            groups.push_back({item.text, 1, item.confidence, item.confidence});
        } else {
            TextStats& g = groups[it->second];
            g.count += 1;
            g.sum += item.confidence;
            g.max = std::max(g.max, item.confidence);
        }
    }
    return groups;
}

void SortByScore(std::vector<FusionCandidate>& candidates) {
    std::stable_sort(candidates.begin(), candidates.end(), [](const FusionCandidate& a, const FusionCandidate& b) {
        return a.score > b.score;
    });
}
}

MultiSourceFusion::MultiSourceFusion(const FusionConfig& config) : config_(config) {}

bool MultiSourceFusion::IsSupportedMethod(const std::string& method) {
    return method == "voting" || method == "weighted" || method == "smart" || method == "merge";
}

FusedResult MultiSourceFusion::Fuse(const std::vector<ImageRecognition>& per_image) const {
    FusedResult result;
    result.fusion_method = config_.fusion_method;

    if (per_image.empty()) {
        result.error = "No recognition results to fuse";
        return result;
    }
    if (!IsSupportedMethod(config_.fusion_method)) {
        std::cerr << "[Fusion] Unsupported fusion method: " << config_.fusion_method << std::endl;
        result.error = "Unsupported fusion method: " + config_.fusion_method;
        return result;
    }

    if (per_image.size() < config_.min_images) {
        std::cerr << "[Fusion] Warning: only " << per_image.size() << " image(s), at least "
                  << config_.min_images << " recommended" << std::endl;
    }

    std::vector<ImageRecognition> used(per_image.begin(),
                                       per_image.begin() + std::min(per_image.size(), config_.max_images));
    if (per_image.size() > config_.max_images) {
        std::cerr << "[Fusion] Warning: " << per_image.size() << " images supplied, using the first "
                  << config_.max_images << std::endl;
    }

    std::vector<PooledText> pool;
    for (size_t i = 0; i < used.size(); ++i) {
        if (!used[i].success) continue;
        for (const auto& obs : used[i].observations) {
            pool.push_back({obs.text, obs.confidence, static_cast<int>(i)});
        }
    }
    if (pool.empty()) {
        result.error = "All images failed to produce any text";
        return result;
    }

    Decision decision;
    if (config_.fusion_method == "voting") {
        decision = Voting(pool);
    } else if (config_.fusion_method == "weighted") {
        decision = Weighted(pool);
    } else if (config_.fusion_method == "smart") {
        decision = Smart(pool);
    } else {
        decision = Merge(pool);
    }

    result.success = true;
    result.merged_text = decision.text;
    result.confidence = decision.confidence;
    result.source_count = static_cast<int>(used.size());
    result.lines = FuseLines(used);
    if (config_.return_alternatives) result.alternatives = std::move(decision.alternatives);

    std::cerr << "[Fusion] " << config_.fusion_method << ": '" << result.merged_text
              << "' (confidence " << result.confidence << ", " << result.lines.size() << " fused lines)" << std::endl;
    return result;
}

std::vector<FusionAlternative> MultiSourceFusion::Alternatives(const std::vector<FusionCandidate>& ranked) const {
    std::vector<FusionAlternative> alternatives;
    if (ranked.empty()) return alternatives;

    const double cutoff = ranked.front().score * config_.alternative_threshold;
    for (size_t i = 1; i < ranked.size(); ++i) {
        if (ranked[i].score >= cutoff) {
            alternatives.push_back({ranked[i].text, ranked[i].score, ranked[i].avg_confidence});
        }
    }
    return alternatives;
}

MultiSourceFusion::Decision MultiSourceFusion::Voting(const std::vector<PooledText>& pool) const {
    const double total = static_cast<double>(pool.size());

    std::vector<FusionCandidate> ranked;
    for (const auto& g : GroupByText(pool)) {
        FusionCandidate c;
        c.text = g.text;
        c.count = g.count;
        c.frequency = g.count / total;
        c.avg_confidence = g.sum / g.count;
        double length_weight = std::min(static_cast<double>(OcrUtils::CharLength(g.text)) / 3.0, MAX_LENGTH_WEIGHT);
        c.score = c.frequency * c.avg_confidence * length_weight;
        ranked.push_back(std::move(c));
    }
    SortByScore(ranked);

    const FusionCandidate& best = ranked.front();
    return {best.text, best.avg_confidence, Alternatives(ranked)};
}

MultiSourceFusion::Decision MultiSourceFusion::Weighted(const std::vector<PooledText>& pool) const {
    const double total = static_cast<double>(pool.size());

    std::vector<FusionCandidate> ranked;
    for (const auto& g : GroupByText(pool)) {
        FusionCandidate c;
        c.text = g.text;
        c.count = g.count;
        c.frequency = g.count / total;
        c.avg_confidence = g.sum / g.count;
        c.score = g.sum;
        ranked.push_back(std::move(c));
    }
    SortByScore(ranked);

    const FusionCandidate& best = ranked.front();
    return {best.text, best.avg_confidence, Alternatives(ranked)};
}

MultiSourceFusion::Decision MultiSourceFusion::Smart(const std::vector<PooledText>& pool) const {
    std::vector<PooledText> sorted = pool;
    std::stable_sort(sorted.begin(), sorted.end(), [](const PooledText& a, const PooledText& b) {
        return a.confidence > b.confidence;
    });

    Decision decision;
    decision.text = sorted.front().text;
    decision.confidence = sorted.front().confidence;

    std::vector<std::string> seen = {decision.text};
    const double cutoff = decision.confidence * config_.alternative_threshold;
    for (size_t i = 1; i < sorted.size(); ++i) {
        const PooledText& item = sorted[i];
        if (item.confidence < cutoff) continue;
        if (std::find(seen.begin(), seen.end(), item.text) != seen.end()) continue;
        seen.push_back(item.text);
        decision.alternatives.push_back({item.text, item.confidence, item.confidence});
    }
    return decision;
}

MultiSourceFusion::Decision MultiSourceFusion::Merge(const std::vector<PooledText>& pool) const {
    std::vector<TextStats> groups = GroupByText(pool);
    std::stable_sort(groups.begin(), groups.end(), [](const TextStats& a, const TextStats& b) {
        return a.max > b.max;
    });

    std::vector<std::string> texts;
    double sum = 0.0;
    for (const auto& g : groups) {
        texts.push_back(g.text);
        sum += g.max;
    }

    Decision decision;
    decision.text = OcrUtils::Join(texts, " ");
    decision.confidence = sum / static_cast<double>(groups.size());
    return decision;
}

bool MultiSourceFusion::LinesSimilar(const std::string& a, const std::string& b, double threshold) {
    if (a == b) return true;

    std::string na = OcrUtils::Compact(a);
    std::string nb = OcrUtils::Compact(b);
    if (na == nb) return true;

    const double la = static_cast<double>(OcrUtils::CharLength(na));
    const double lb = static_cast<double>(OcrUtils::CharLength(nb));
    double longest = std::max(la, lb);
    double gap = std::abs(la - lb);
    if (gap > longest * MAX_LINE_LENGTH_GAP) return false;

    return OcrUtils::Similarity(na, nb) >= threshold;
}

std::vector<FusedLine> MultiSourceFusion::FuseLines(const std::vector<ImageRecognition>& per_image) const {
    std::vector<const std::vector<TextLine>*> line_sets;
    for (const auto& image : per_image) {
        if (image.success && !image.lines.empty()) line_sets.push_back(&image.lines);
    }
    if (line_sets.empty()) return {};

    size_t max_lines = 0;
    for (const auto* lines : line_sets) max_lines = std::max(max_lines, lines->size());

    struct LineGroup {
        std::string text;
        double best_confidence;
        double sum;
        int count;
    };

    std::vector<FusedLine> fused;
    for (size_t position = 0; position < max_lines; ++position) {
        std::vector<LineGroup> groups;
        for (const auto* lines : line_sets) {
            if (position >= lines->size()) continue;
            const TextLine& line = (*lines)[position];
            std::string text = OcrUtils::Trim(line.text);
            if (text.empty()) continue;

            auto match = std::find_if(groups.begin(), groups.end(), [&text](const LineGroup& g) {
                return LinesSimilar(text, g.text);
            });
            if (match == groups.end()) {
                groups.push_back({text, line.confidence, line.confidence, 1});
                continue;
            }
            match->sum += line.confidence;
            match->count += 1;
            if (line.confidence > match->best_confidence) {
                match->text = text;
                match->best_confidence = line.confidence;
            }
        }
        if (groups.empty()) continue;

        const LineGroup* best = &groups.front();
        for (const auto& g : groups) {
            double avg = g.sum / g.count;
            double best_avg = best->sum / best->count;
            if (g.count > best->count || (g.count == best->count && avg > best_avg)) best = &g;
        }
        fused.push_back({best->text, best->sum / best->count, best->count});
    }
    return fused;
}
