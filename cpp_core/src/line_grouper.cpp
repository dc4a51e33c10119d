#include "line_grouper.hpp"
#include "ocr_utils.hpp"
#include <algorithm>
#include <cmath>

LineGrouper::LineGrouper(double y_threshold) : y_threshold_(y_threshold) {}

std::vector<TextLine> LineGrouper::Group(const std::vector<TextObservation>& observations) const {
    if (observations.empty()) return {};

    struct Placed {
        cv::Point2d center;
        const TextObservation* obs;
    };

    std::vector<Placed> placed;
    placed.reserve(observations.size());
    for (const auto& obs : observations) {
        placed.push_back({OcrUtils::BoxCenter(obs.box), &obs});
    }
    std::stable_sort(placed.begin(), placed.end(), [](const Placed& a, const Placed& b) {
        return a.center.y < b.center.y;
    });

    // Each row is anchored on the vertical centre of its first member.
    std::vector<std::vector<Placed>> rows;
    double anchor_y = 0.0;
    for (const auto& p : placed) {
        if (rows.empty() || std::abs(p.center.y - anchor_y) > y_threshold_) {
            rows.push_back({p});
            anchor_y = p.center.y;
        } else {
            rows.back().push_back(p);
        }
    }

    std::vector<TextLine> lines;
    lines.reserve(rows.size());
    for (auto& row : rows) {
        std::stable_sort(row.begin(), row.end(), [](const Placed& a, const Placed& b) {
            return a.center.x < b.center.x;
        });

        TextLine line;
        std::vector<std::string> texts;
        double confidence_sum = 0.0;
        for (const auto& p : row) {
            texts.push_back(p.obs->text);
            confidence_sum += p.obs->confidence;
            line.members.push_back(*p.obs);
        }
        line.text = OcrUtils::Join(texts, " ");
        line.confidence = confidence_sum / static_cast<double>(row.size());
        lines.push_back(std::move(line));
    }
    return lines;
}
