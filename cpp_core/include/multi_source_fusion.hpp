#pragma once
#include "ocr_types.hpp"
#include "wheel_config.hpp"
#include <string>
#include <vector>

/**
 * @class MultiSourceFusion
 * @brief Combines the per-image results of several photos of the same hub
 *        into one answer with alternatives and row-aligned fused lines.
 *
 * Image order matters: it defines the source index of every observation and
 * the row alignment used by line fusion.
 */
class MultiSourceFusion {
public:
    struct PooledText {
        std::string text;
        double confidence;
        int source_index;
    };

    explicit MultiSourceFusion(const FusionConfig& config);

    FusedResult Fuse(const std::vector<ImageRecognition>& per_image) const;

    static bool IsSupportedMethod(const std::string& method);

    /// Row-index alignment of the per-image TextLines. Independent of fusion_method.
    std::vector<FusedLine> FuseLines(const std::vector<ImageRecognition>& per_image) const;

    static bool LinesSimilar(const std::string& a, const std::string& b, double threshold = 0.8);

private:
    struct Decision {
        std::string text;
        double confidence = 0.0;
        std::vector<FusionAlternative> alternatives;
    };

    Decision Voting(const std::vector<PooledText>& pool) const;
    Decision Weighted(const std::vector<PooledText>& pool) const;
    Decision Smart(const std::vector<PooledText>& pool) const;
    Decision Merge(const std::vector<PooledText>& pool) const;

    std::vector<FusionAlternative> Alternatives(const std::vector<FusionCandidate>& ranked) const;

    FusionConfig config_;
};
