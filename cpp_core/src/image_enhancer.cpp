#include "image_enhancer.hpp"
#include <algorithm>
#include <iostream>

namespace {
// OpenCV filters want odd, positive kernel sizes.
int OddKernel(int k) {
    if (k < 1) k = 1;
    return (k % 2 == 0) ? k + 1 : k;
}

cv::Mat ToBgr(const cv::Mat& img) {
    if (img.channels() == 3) return img;
    cv::Mat bgr;
    cv::cvtColor(img, bgr, img.channels() == 4 ? cv::COLOR_BGRA2BGR : cv::COLOR_GRAY2BGR);
    return bgr;
}
}

ImageEnhancer::ImageEnhancer(const EnhanceConfig& config) : config_(config) {}

cv::Mat ImageEnhancer::Enhance(const cv::Mat& bgr_image) const {
    if (!config_.enable || bgr_image.empty()) return bgr_image;

    cv::Mat result = ToBgr(bgr_image).clone();
    if (config_.clahe_enable) result = AdjustContrast(result);
    if (config_.denoise_enable) result = Denoise(result);
    if (config_.edge_enable) result = EnhanceEdges(result);
    if (config_.binarize_enable) result = Binarize(result);
    if (config_.morphology_enable) result = Morphology(result);
    return result;
}

cv::Mat ImageEnhancer::AdjustContrast(const cv::Mat& img) const {
    cv::Mat lab;
    cv::cvtColor(img, lab, cv::COLOR_BGR2Lab);
    std::vector<cv::Mat> channels;
    cv::split(lab, channels);

    int tile = std::max(1, config_.clahe_tile_size);
    auto clahe = cv::createCLAHE(config_.clahe_clip_limit, cv::Size(tile, tile));
    clahe->apply(channels[0], channels[0]);

    cv::merge(channels, lab);
    cv::Mat out;
    cv::cvtColor(lab, out, cv::COLOR_Lab2BGR);
    return out;
}

cv::Mat ImageEnhancer::Denoise(const cv::Mat& img) const {
    const int k = OddKernel(config_.denoise_kernel_size);
    const double sigma = config_.denoise_sigma;
    cv::Mat out;

    if (config_.denoise_method == "gaussian") {
        cv::GaussianBlur(img, out, cv::Size(k, k), sigma);
    } else if (config_.denoise_method == "median") {
        cv::medianBlur(img, out, k);
    } else if (config_.denoise_method == "bilateral") {
        cv::bilateralFilter(img, out, k, sigma * 20.0, sigma * 20.0);
    } else {
        std::cerr << "[Enhance] Unknown denoise method: " << config_.denoise_method << ", skipping" << std::endl;
        return img;
    }
    return out;
}

cv::Mat ImageEnhancer::EnhanceEdges(const cv::Mat& img) const {
    const int k = OddKernel(config_.edge_kernel_size);
    cv::Mat gray;
    cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);

    cv::Mat edges;
    if (config_.edge_method == "sobel") {
        cv::Mat gx, gy;
        cv::Sobel(gray, gx, CV_64F, 1, 0, k);
        cv::Sobel(gray, gy, CV_64F, 0, 1, k);
        cv::magnitude(gx, gy, edges);
    } else if (config_.edge_method == "laplacian") {
        cv::Laplacian(gray, edges, CV_64F, k);
        edges = cv::abs(edges);
    } else {
        std::cerr << "[Enhance] Unknown edge method: " << config_.edge_method << ", skipping" << std::endl;
        return img;
    }

    cv::Mat edges8u;
    edges.convertTo(edges8u, CV_8U);
    cv::normalize(edges8u, edges8u, 0, 255, cv::NORM_MINMAX);
    cv::cvtColor(edges8u, edges8u, cv::COLOR_GRAY2BGR);

    cv::Mat out;
    cv::addWeighted(img, 0.7, edges8u, 0.3, 0.0, out);
    return out;
}

cv::Mat ImageEnhancer::Binarize(const cv::Mat& img) const {
    cv::Mat gray;
    cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);

    cv::Mat binary;
    if (config_.binarize_method == "adaptive") {
        int block = std::max(3, OddKernel(config_.binarize_block_size));
        cv::adaptiveThreshold(gray, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                              cv::THRESH_BINARY, block, config_.binarize_c_value);
    } else if (config_.binarize_method == "otsu") {
        cv::threshold(gray, binary, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
    } else {
        std::cerr << "[Enhance] Unknown binarization method: " << config_.binarize_method << ", skipping" << std::endl;
        return img;
    }

    cv::Mat out;
    cv::cvtColor(binary, out, cv::COLOR_GRAY2BGR);
    return out;
}

cv::Mat ImageEnhancer::Morphology(const cv::Mat& img) const {
    const int k = std::max(1, config_.morphology_kernel_size);
    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(k, k));

    int op;
    if (config_.morphology_operation == "open") {
        op = cv::MORPH_OPEN;
    } else if (config_.morphology_operation == "close") {
        op = cv::MORPH_CLOSE;
    } else if (config_.morphology_operation == "dilate") {
        op = cv::MORPH_DILATE;
    } else if (config_.morphology_operation == "erode") {
        op = cv::MORPH_ERODE;
    } else {
        std::cerr << "[Enhance] Unknown morphology operation: " << config_.morphology_operation << ", skipping" << std::endl;
        return img;
    }

    cv::Mat out;
    cv::morphologyEx(img, out, op, kernel);
    return out;
}
