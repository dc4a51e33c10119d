#include "paddle_utils.hpp"
#include <clipper2/clipper.h>
#include <algorithm>
#include <cmath>

namespace PaddleUtils {

    namespace {
        constexpr double kMinQuadArea = 80.0;

        int RoundUpTo32(int v) {
            return std::max(32, ((v + 31) / 32) * 32);
        }

        double Perimeter(const Clipper2Lib::Path64& path) {
            if (path.size() < 2) return 0.0;
            double total = 0.0;
            for (size_t i = 0; i < path.size(); ++i) {
                const auto& a = path[i];
                const auto& b = path[(i + 1) % path.size()];
                total += std::hypot(static_cast<double>(b.x - a.x), static_cast<double>(b.y - a.y));
            }
            return total;
        }

        std::vector<cv::Point2f> MinAreaQuad(const std::vector<cv::Point>& contour) {
            cv::Point2f corners[4];
            cv::minAreaRect(contour).points(corners);
            return {corners[0], corners[1], corners[2], corners[3]};
        }

        // DB post-processing grows the shrunk text kernel back by area * ratio / perimeter.
        std::vector<cv::Point2f> Unclip(const std::vector<cv::Point2f>& quad, float ratio) {
            Clipper2Lib::Path64 path;
            for (const auto& p : quad) path.emplace_back(static_cast<int64_t>(p.x), static_cast<int64_t>(p.y));

            double length = Perimeter(path);
            if (length <= 0.0) return quad;
            double distance = std::abs(Clipper2Lib::Area(path)) * ratio / length;

            Clipper2Lib::ClipperOffset offset;
            offset.AddPath(path, Clipper2Lib::JoinType::Round, Clipper2Lib::EndType::Polygon);
            Clipper2Lib::Paths64 grown;
            offset.Execute(distance, grown);
            if (grown.empty() || grown.front().empty()) return quad;

            std::vector<cv::Point> contour;
            contour.reserve(grown.front().size());
            for (const auto& p : grown.front()) contour.emplace_back(static_cast<int>(p.x), static_cast<int>(p.y));
            return MinAreaQuad(contour);
        }

        float MeanScoreInside(const cv::Mat& prob, const std::vector<cv::Point2f>& quad) {
            std::vector<cv::Point> poly;
            for (const auto& p : quad) poly.emplace_back(cvRound(p.x), cvRound(p.y));
            cv::Mat mask = cv::Mat::zeros(prob.size(), CV_8U);
            cv::fillPoly(mask, std::vector<std::vector<cv::Point>>{poly}, cv::Scalar(1));
            return static_cast<float>(cv::mean(prob, mask)[0]);
        }

        // Top-left, top-right, bottom-right, bottom-left.
        std::vector<cv::Point2f> OrderClockwise(const std::vector<cv::Point2f>& pts) {
            std::vector<cv::Point2f> ordered(4);
            auto sum = [](const cv::Point2f& p) { return p.x + p.y; };
            auto diff = [](const cv::Point2f& p) { return p.y - p.x; };
            ordered[0] = *std::min_element(pts.begin(), pts.end(), [&](const auto& a, const auto& b) { return sum(a) < sum(b); });
            ordered[2] = *std::max_element(pts.begin(), pts.end(), [&](const auto& a, const auto& b) { return sum(a) < sum(b); });
            ordered[1] = *std::min_element(pts.begin(), pts.end(), [&](const auto& a, const auto& b) { return diff(a) < diff(b); });
            ordered[3] = *std::max_element(pts.begin(), pts.end(), [&](const auto& a, const auto& b) { return diff(a) < diff(b); });
            return ordered;
        }
    }

    std::pair<cv::Mat, float> ResizeForDetection(const cv::Mat& img, int max_side) {
        const int longest = std::max(img.rows, img.cols);
        const float scale = longest > max_side ? static_cast<float>(max_side) / static_cast<float>(longest) : 1.0f;

        cv::Mat resized;
        cv::resize(img, resized, cv::Size(RoundUpTo32(static_cast<int>(img.cols * scale)),
                                          RoundUpTo32(static_cast<int>(img.rows * scale))));
        return {resized, scale};
    }

    cv::Mat NormalizeImageNet(const cv::Mat& img) {
        cv::Mat f32;
        img.convertTo(f32, CV_32FC3, 1.0 / 255.0);
        cv::subtract(f32, cv::Scalar(0.485, 0.456, 0.406), f32);
        cv::divide(f32, cv::Scalar(0.229, 0.224, 0.225), f32);
        return cv::dnn::blobFromImage(f32);
    }

    std::vector<DetectedQuad> ExtractQuads(const float* prob_map, const cv::Size& original_shape,
                                           const cv::Size& resized_shape,
                                           float bitmap_thresh, float box_thresh, float unclip_ratio) {
        cv::Mat prob(resized_shape, CV_32F, const_cast<float*>(prob_map));
        cv::Mat bitmap = prob > bitmap_thresh;

        std::vector<std::vector<cv::Point>> contours;
        cv::findContours(bitmap, contours, cv::RETR_LIST, cv::CHAIN_APPROX_SIMPLE);

        const float fx = static_cast<float>(original_shape.width) / static_cast<float>(resized_shape.width);
        const float fy = static_cast<float>(original_shape.height) / static_cast<float>(resized_shape.height);

        std::vector<DetectedQuad> quads;
        for (const auto& contour : contours) {
            if (contour.size() < 4) continue;

            std::vector<cv::Point2f> kernel = MinAreaQuad(contour);
            float score = MeanScoreInside(prob, kernel);
            if (score < box_thresh) continue;

            std::vector<cv::Point2f> grown = Unclip(kernel, unclip_ratio);
            for (auto& p : grown) {
                p.x = std::clamp(p.x * fx, 0.0f, static_cast<float>(original_shape.width - 1));
                p.y = std::clamp(p.y * fy, 0.0f, static_cast<float>(original_shape.height - 1));
            }
            if (cv::contourArea(grown) < kMinQuadArea) continue;

            quads.push_back({OrderClockwise(grown), score});
        }

        std::sort(quads.begin(), quads.end(), [](const DetectedQuad& a, const DetectedQuad& b) {
            if (std::abs(a.points[0].y - b.points[0].y) > 1e-3f) return a.points[0].y < b.points[0].y;
            return a.points[0].x < b.points[0].x;
        });
        return quads;
    }

    cv::Mat CropQuad(const cv::Mat& bgr_image, const std::vector<cv::Point2f>& quad) {
        if (quad.size() != 4) return cv::Mat();

        const float w = static_cast<float>(std::max(cv::norm(quad[0] - quad[1]), cv::norm(quad[2] - quad[3])));
        const float h = static_cast<float>(std::max(cv::norm(quad[0] - quad[3]), cv::norm(quad[1] - quad[2])));
        if (w < 1.0f || h < 1.0f) return cv::Mat();

        const std::vector<cv::Point2f> target = {{0, 0}, {w, 0}, {w, h}, {0, h}};
        cv::Mat crop;
        cv::warpPerspective(bgr_image, crop, cv::getPerspectiveTransform(quad, target),
                            cv::Size(static_cast<int>(w), static_cast<int>(h)),
                            cv::INTER_CUBIC, cv::BORDER_REPLICATE);

        // Vertical text: rotate so the recognizer sees a horizontal strip.
        if (static_cast<float>(crop.rows) / static_cast<float>(crop.cols) >= 1.5f) {
            cv::rotate(crop, crop, cv::ROTATE_90_COUNTERCLOCKWISE);
        }
        return crop;
    }

    std::vector<cv::Mat> SplitWideCrop(const cv::Mat& crop, int chunk_width, int overlap) {
        if (crop.cols <= chunk_width) return {crop};

        std::vector<cv::Mat> chunks;
        const int step = std::max(1, chunk_width - overlap);
        for (int x = 0; x < crop.cols; x += step) {
            const int end = std::min(x + chunk_width, crop.cols);
            chunks.push_back(crop(cv::Rect(x, 0, end - x, crop.rows)).clone());
            if (end == crop.cols) break;
        }
        return chunks;
    }

    cv::Mat PrepareRecognitionInput(const cv::Mat& img) {
        if (img.empty()) return cv::Mat();

        cv::Mat src = img;
        if (src.channels() == 1) cv::cvtColor(src, src, cv::COLOR_GRAY2BGR);

        const float ratio = static_cast<float>(src.cols) / static_cast<float>(src.rows);
        const int target_w = std::min(kRecWidth, static_cast<int>(std::ceil(kRecHeight * ratio)));
        if (target_w <= 0) return cv::Mat();

        cv::Mat resized;
        cv::resize(src, resized, cv::Size(target_w, kRecHeight), 0, 0, cv::INTER_LINEAR);

        // Paddle recognition normalises to [-1, 1] and right-pads with zeros.
        cv::Mat normalized;
        resized.convertTo(normalized, CV_32FC3, 2.0 / 255.0, -1.0);

        cv::Mat padded = cv::Mat::zeros(kRecHeight, kRecWidth, CV_32FC3);
        normalized.copyTo(padded(cv::Rect(0, 0, target_w, kRecHeight)));
        return cv::dnn::blobFromImage(padded, 1.0, cv::Size(), cv::Scalar(), false, false, CV_32F);
    }

    DecodedText CtcGreedyDecode(const float* preds, const std::vector<int64_t>& shape,
                                const std::vector<std::string>& charset) {
        DecodedText decoded;
        if (shape.size() < 3) return decoded;

        const int64_t steps = shape[1];
        const int64_t classes = shape[2];
        double prob_sum = 0.0;
        int64_t previous = 0;

        for (int64_t t = 0; t < steps; ++t) {
            const float* row = preds + t * classes;
            const int64_t best = std::max_element(row, row + classes) - row;
            if (best != 0 && best != previous && best < static_cast<int64_t>(charset.size())) {
                decoded.text += charset[static_cast<size_t>(best)];
                prob_sum += row[best];
                ++decoded.emitted;
            }
            previous = best;
        }
        if (decoded.emitted > 0) decoded.confidence = prob_sum / static_cast<double>(decoded.emitted);
        return decoded;
    }
}
