#pragma once
#include "ocr_types.hpp"
#include <vector>

/**
 * @class LineGrouper
 * @brief Clusters observations of one image into rows and merges each row
 *        into a single left-to-right TextLine.
 */
class LineGrouper {
public:
    explicit LineGrouper(double y_threshold = 50.0);

    std::vector<TextLine> Group(const std::vector<TextObservation>& observations) const;

private:
    double y_threshold_;
};
