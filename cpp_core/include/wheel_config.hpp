#pragma once
#include <array>
#include <string>

// Plain value types. Every run receives its own copy, nothing here is shared
// mutable state.

struct RegionFilterConfig {
    double min_area_ratio = 0.0001;
    double max_area_ratio = 0.1;
    double min_aspect_ratio = 0.2;
    double max_aspect_ratio = 10.0;
    bool center_region_only = false;
    double center_region_ratio = 0.6;
};

struct FilterConfig {
    double min_confidence = 0.6;
    size_t min_length = 1;
    size_t max_length = 30;
    bool enable_char_filter = true;
    std::string allowed_chars;          // empty disables the allow-list
    bool enable_correction = true;
    bool enable_deduplication = true;
    double similarity_threshold = 0.9;
    size_t min_results = 0;
    bool enable_region_filter = false;
    RegionFilterConfig region;
};

struct LineGroupingConfig {
    double y_threshold = 50.0;
};

struct FusionConfig {
    std::string fusion_method = "voting";   // voting | weighted | smart | merge
    size_t min_images = 2;
    size_t max_images = 10;
    bool return_alternatives = true;
    double alternative_threshold = 0.85;
};

struct EnhanceConfig {
    bool enable = true;

    bool clahe_enable = true;
    double clahe_clip_limit = 2.0;
    int clahe_tile_size = 8;

    bool denoise_enable = true;
    std::string denoise_method = "bilateral";   // bilateral | gaussian | median
    int denoise_kernel_size = 5;
    double denoise_sigma = 1.5;

    bool edge_enable = false;
    std::string edge_method = "sobel";          // sobel | laplacian
    int edge_kernel_size = 3;

    bool binarize_enable = false;
    std::string binarize_method = "adaptive";   // adaptive | otsu
    int binarize_block_size = 11;
    double binarize_c_value = 2.0;

    bool morphology_enable = false;
    std::string morphology_operation = "close"; // open | close | dilate | erode
    int morphology_kernel_size = 3;
};

struct SystemConfig {
    bool use_gpu = false;
    int num_workers = 4;
};

struct VisualizationConfig {
    bool draw_bbox = true;
    bool draw_text = true;
    bool draw_confidence = true;
    std::array<int, 3> bbox_color{0, 255, 0};   // BGR
    std::array<int, 3> text_color{255, 0, 0};
    int thickness = 2;
    double font_scale = 0.6;
};

struct WheelConfig {
    EnhanceConfig preprocessing;
    FilterConfig postprocessing;
    LineGroupingConfig line_grouping;
    FusionConfig multi_angle;
    SystemConfig system;
    VisualizationConfig visualization;
    bool grammar_correction = false;    // re-rank final candidates with ConfusionCorrector
};
