#include "ocr_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace OcrUtils {

    std::u32string DecodeUtf8(const std::string& s) {
        std::u32string out;
        out.reserve(s.size());
        size_t i = 0;
        while (i < s.size()) {
            const unsigned char lead = static_cast<unsigned char>(s[i]);
            size_t extra = 0;
            char32_t cp = lead;
            if (lead >= 0xF0 && lead <= 0xF4) {
                extra = 3;
                cp = lead & 0x07;
            } else if (lead >= 0xE0) {
                extra = (lead <= 0xEF) ? 2 : 0;
                cp = lead & 0x0F;
            } else if (lead >= 0xC2) {
                extra = 1;
                cp = lead & 0x1F;
            }

            bool valid = extra > 0 && i + extra < s.size();
            for (size_t k = 1; valid && k <= extra; ++k) {
                const unsigned char next = static_cast<unsigned char>(s[i + k]);
                if ((next & 0xC0) != 0x80) valid = false;
                else cp = (cp << 6) | (next & 0x3F);
            }

            if (valid) {
                out.push_back(cp);
                i += extra + 1;
            } else {
                out.push_back(static_cast<char32_t>(lead));
                ++i;
            }
        }
        return out;
    }

    std::string EncodeUtf8(const std::u32string& s) {
        std::string out;
        out.reserve(s.size());
        for (char32_t c : s) {
            if (c < 0x80) {
                out += static_cast<char>(c);
            } else if (c < 0x800) {
                out += static_cast<char>(0xC0 | (c >> 6));
                out += static_cast<char>(0x80 | (c & 0x3F));
            } else if (c < 0x10000) {
                out += static_cast<char>(0xE0 | (c >> 12));
                out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (c & 0x3F));
            } else {
                out += static_cast<char>(0xF0 | (c >> 18));
                out += static_cast<char>(0x80 | ((c >> 12) & 0x3F));
                out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (c & 0x3F));
            }
        }
        return out;
    }

    size_t CharLength(const std::string& s) {
        return DecodeUtf8(s).size();
    }

    size_t LevenshteinDistance(const std::string& a, const std::string& b) {
        const std::u32string ua = DecodeUtf8(a);
        const std::u32string ub = DecodeUtf8(b);
        const std::u32string& longer = ua.size() >= ub.size() ? ua : ub;
        const std::u32string& shorter = ua.size() >= ub.size() ? ub : ua;
        if (shorter.empty()) return longer.size();

        std::vector<size_t> prev(shorter.size() + 1);
        std::vector<size_t> curr(shorter.size() + 1);
        for (size_t j = 0; j <= shorter.size(); ++j) prev[j] = j;

        for (size_t i = 0; i < longer.size(); ++i) {
            curr[0] = i + 1;
            for (size_t j = 0; j < shorter.size(); ++j) {
                size_t insertion = prev[j + 1] + 1;
                size_t deletion = curr[j] + 1;
                size_t substitution = prev[j] + (longer[i] != shorter[j] ? 1 : 0);
                curr[j + 1] = std::min({insertion, deletion, substitution});
            }
            std::swap(prev, curr);
        }
        return prev[shorter.size()];
    }

    double Similarity(const std::string& a, const std::string& b) {
        if (a == b) return 1.0;
        size_t max_len = std::max(CharLength(a), CharLength(b));
        if (max_len == 0) return 1.0;
        return 1.0 - static_cast<double>(LevenshteinDistance(a, b)) / static_cast<double>(max_len);
    }

    std::string Trim(const std::string& s) {
        size_t begin = 0;
        size_t end = s.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
        return s.substr(begin, end - begin);
    }

    std::string Join(const std::vector<std::string>& parts, const std::string& sep) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) out += sep;
            out += parts[i];
        }
        return out;
    }

    std::string Compact(const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (char c : s) {
            if (c == ' ') continue;
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return out;
    }

    bool IsDigitCodePoint(char32_t c) {
        return (c >= U'0' && c <= U'9') || (c >= 0xFF10 && c <= 0xFF19);    // ASCII and fullwidth
    }

    bool IsLetterCodePoint(char32_t c) {
        if (c < 0x80) return std::isalpha(static_cast<int>(c)) != 0;
        if (c < 0xC0 || c == 0xD7 || c == 0xF7) return false;                // Latin-1 symbols
        if (c >= 0x2000 && c <= 0x2BFF) return false;                        // punctuation, symbols, arrows
        if (c >= 0x3000 && c <= 0x303F) return false;                        // CJK punctuation
        if (c >= 0xFF00 && c <= 0xFF20) return false;                        // fullwidth punctuation and digits
        if (c >= 0xFF3B && c <= 0xFF40) return false;
        if (c >= 0xFF5B && c <= 0xFF65) return false;
        return true;
    }

    bool IsAllDigits(const std::string& s) {
        const std::u32string u = DecodeUtf8(s);
        if (u.empty()) return false;
        return std::all_of(u.begin(), u.end(), IsDigitCodePoint);
    }

    bool IsMostlyLetters(const std::string& s, double ratio) {
        const std::u32string u = DecodeUtf8(s);
        if (u.empty()) return false;
        auto letters = std::count_if(u.begin(), u.end(), IsLetterCodePoint);
        return static_cast<double>(letters) / static_cast<double>(u.size()) > ratio;
    }

    bool IsMostlyDigits(const std::string& s, double ratio) {
        const std::u32string u = DecodeUtf8(s);
        if (u.empty()) return false;
        auto digits = std::count_if(u.begin(), u.end(), IsDigitCodePoint);
        return static_cast<double>(digits) / static_cast<double>(u.size()) > ratio;
    }

    std::optional<cv::Rect2d> BoxBounds(const std::vector<cv::Point2f>& box) {
        if (box.size() < 2) return std::nullopt;

        double min_x = box[0].x, max_x = box[0].x;
        double min_y = box[0].y, max_y = box[0].y;
        for (const auto& p : box) {
            if (!std::isfinite(p.x) || !std::isfinite(p.y)) return std::nullopt;
            min_x = std::min(min_x, static_cast<double>(p.x));
            max_x = std::max(max_x, static_cast<double>(p.x));
            min_y = std::min(min_y, static_cast<double>(p.y));
            max_y = std::max(max_y, static_cast<double>(p.y));
        }
        return cv::Rect2d(min_x, min_y, max_x - min_x, max_y - min_y);
    }

    cv::Point2d BoxCenter(const std::vector<cv::Point2f>& box) {
        auto bounds = BoxBounds(box);
        if (!bounds) return {0.0, 0.0};
        return {bounds->x + bounds->width / 2.0, bounds->y + bounds->height / 2.0};
    }
}
