#pragma once
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

// Stateless string and geometry helpers shared by the filtering and fusion stages.
// Text is UTF-8; lengths, distances and ratios are counted in code points.
namespace OcrUtils {
    /// Malformed bytes decode to themselves (U+0080..U+00FF) so every byte is counted once.
    std::u32string DecodeUtf8(const std::string& s);
    std::string EncodeUtf8(const std::u32string& s);
    size_t CharLength(const std::string& s);

    size_t LevenshteinDistance(const std::string& a, const std::string& b);

    /// 1 - distance / max_len; identical or both empty strings give 1.0.
    double Similarity(const std::string& a, const std::string& b);

    std::string Trim(const std::string& s);
    std::string Join(const std::vector<std::string>& parts, const std::string& sep);

    /// Removes spaces and upper-cases ASCII letters.
    std::string Compact(const std::string& s);

    bool IsDigitCodePoint(char32_t c);
    bool IsLetterCodePoint(char32_t c);

    bool IsAllDigits(const std::string& s);
    bool IsMostlyLetters(const std::string& s, double ratio = 0.6);
    bool IsMostlyDigits(const std::string& s, double ratio = 0.6);

    /// Axis-aligned bounds of a quad, or nullopt when fewer than two finite points.
    std::optional<cv::Rect2d> BoxBounds(const std::vector<cv::Point2f>& box);

    /// Centre of the bounds, (0,0) when the box is unusable.
    cv::Point2d BoxCenter(const std::vector<cv::Point2f>& box);
}
