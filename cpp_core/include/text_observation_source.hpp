#pragma once
#include "ocr_types.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

/// Outcome of one OCR call. Engines report failures here instead of throwing.
struct ObservationOutcome {
    bool success = false;
    std::vector<TextObservation> observations;
    std::string error;
};

/**
 * @class TextObservationSource
 * @brief Anything that turns an image into text observations (local engine,
 *        remote service, recorded fixtures).
 */
class TextObservationSource {
public:
    virtual ~TextObservationSource() = default;
    virtual ObservationOutcome Observe(const cv::Mat& image) = 0;
    virtual std::string Name() const = 0;
};
