#pragma once
#include "ocr_types.hpp"
#include "wheel_config.hpp"
#include <functional>
#include <string>
#include <vector>

/**
 * @class ResultFilterPipeline
 * @brief Turns the raw observations of one image into a ranked, deduplicated
 *        candidate list.
 *
 * Stages always run in this order: region, confidence, length, allow-list,
 * correction, deduplication, backfill, ranking. Every stage consumes the
 * previous stage's output and the input list is never modified.
 */
class ResultFilterPipeline {
public:
    /// Geometry of one observation relative to the inferred image extent.
    struct RegionFeatures {
        double area_ratio = 0.0;
        double aspect_ratio = 0.0;
        double dist_ratio = 0.0;
        cv::Point2d center;
        double image_width = 0.0;
        double image_height = 0.0;
    };

    struct RegionRule {
        std::string name;
        bool exemptable;    // heuristic rules yield to the engraved-text band
        std::function<bool(const RegionFeatures&, const std::string&)> rejects;
    };

    struct CorrectionRule {
        std::string name;
        std::function<bool(const std::string&)> applies;
        std::function<std::string(const std::string&)> rewrite;
    };

    explicit ResultFilterPipeline(const FilterConfig& config);

    std::vector<TextObservation> Process(const std::vector<TextObservation>& observations) const;

    // Individual stages, exposed for testing.
    std::vector<TextObservation> FilterByRegion(const std::vector<TextObservation>& in) const;
    std::vector<TextObservation> FilterByConfidence(const std::vector<TextObservation>& in) const;
    std::vector<TextObservation> FilterByLength(const std::vector<TextObservation>& in) const;
    std::vector<TextObservation> FilterByChars(const std::vector<TextObservation>& in) const;
    std::vector<TextObservation> CorrectCharacters(const std::vector<TextObservation>& in) const;
    std::vector<TextObservation> Deduplicate(const std::vector<TextObservation>& in) const;
    std::vector<TextObservation> Backfill(const std::vector<TextObservation>& kept,
                                          const std::vector<TextObservation>& original) const;
    std::vector<TextObservation> Rank(const std::vector<TextObservation>& in) const;

    std::string ApplyCorrectionRules(const std::string& text) const;
    static double RankScore(const TextObservation& observation);

    const FilterConfig& config() const { return config_; }

private:
    std::string StripDisallowed(const std::string& text) const;
    bool IsDuplicateOf(const std::string& text, const std::vector<std::string>& kept) const;

    FilterConfig config_;
    std::vector<RegionRule> region_rules_;
    std::vector<CorrectionRule> correction_rules_;
};
