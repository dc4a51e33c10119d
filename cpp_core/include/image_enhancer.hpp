#pragma once
#include "wheel_config.hpp"
#include <opencv2/opencv.hpp>

/**
 * @class ImageEnhancer
 * @brief Photo clean-up applied before OCR: CLAHE, denoise and the optional
 *        edge / binarization / morphology passes. Input and output are BGR.
 */
class ImageEnhancer {
public:
    explicit ImageEnhancer(const EnhanceConfig& config);
    cv::Mat Enhance(const cv::Mat& bgr_image) const;

private:
    cv::Mat AdjustContrast(const cv::Mat& img) const;
    cv::Mat Denoise(const cv::Mat& img) const;
    cv::Mat EnhanceEdges(const cv::Mat& img) const;
    cv::Mat Binarize(const cv::Mat& img) const;
    cv::Mat Morphology(const cv::Mat& img) const;

    EnhanceConfig config_;
};
