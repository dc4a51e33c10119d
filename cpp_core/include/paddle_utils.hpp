#pragma once
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

// Stateless pre/post-processing for the PaddleOCR detection and recognition models.
namespace PaddleUtils {
    struct DetectedQuad {
        std::vector<cv::Point2f> points;    // 4 corners in original image pixels
        float score = 0.0f;
    };

    struct DecodedText {
        std::string text;
        double confidence = 0.0;
        size_t emitted = 0;                 // number of characters the CTC path emitted
    };

    constexpr int kRecHeight = 48;
    constexpr int kRecWidth = 320;

    std::pair<cv::Mat, float> ResizeForDetection(const cv::Mat& img, int max_side = 960);
    cv::Mat NormalizeImageNet(const cv::Mat& img);
    std::vector<DetectedQuad> ExtractQuads(const float* prob_map, const cv::Size& original_shape,
                                           const cv::Size& resized_shape,
                                           float bitmap_thresh = 0.3f, float box_thresh = 0.6f,
                                           float unclip_ratio = 1.5f);
    cv::Mat CropQuad(const cv::Mat& bgr_image, const std::vector<cv::Point2f>& quad);
    std::vector<cv::Mat> SplitWideCrop(const cv::Mat& crop, int chunk_width = kRecWidth, int overlap = 64);
    cv::Mat PrepareRecognitionInput(const cv::Mat& img);
    DecodedText CtcGreedyDecode(const float* preds, const std::vector<int64_t>& shape,
                                const std::vector<std::string>& charset);
}
