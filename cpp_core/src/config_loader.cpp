#include "config_loader.hpp"
#include <array>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {
// Colors are three-element sequences such as [0, 255, 0]; a missing key keeps the fallback.
std::array<int, 3> ReadColor(const YAML::Node& node, const std::string& key_path, const std::array<int, 3>& fallback) {
    if (!node) return fallback;
    if (!node.IsSequence() || node.size() != 3) {
        throw std::runtime_error("Invalid value for '" + key_path + "': expected [b, g, r]");
    }
    try {
        return {node[0].as<int>(), node[1].as<int>(), node[2].as<int>()};
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid value for '" + key_path + "': " + e.what());
    }
}
}

YAML::Node ConfigLoader::Find(const YAML::Node& root, const std::string& key_path) {
    // Node::operator= rebinds the underlying tree, so walk with a trail of copies.
    std::vector<YAML::Node> trail{root};
    std::stringstream ss(key_path);
    std::string key;
    while (std::getline(ss, key, '.')) {
        const YAML::Node& parent = trail.back();
        if (!parent || !parent.IsMap()) return YAML::Node();
        YAML::Node child = parent[key];
        if (!child) return YAML::Node();
        trail.push_back(child);
    }
    return trail.back();
}

WheelConfig ConfigLoader::FromNode(const YAML::Node& root) {
    WheelConfig cfg;
    if (!root || !root.IsMap()) return cfg;

    EnhanceConfig& pre = cfg.preprocessing;
    pre.enable = GetValue(root, "preprocessing.enable", pre.enable);
    pre.clahe_enable = GetValue(root, "preprocessing.brightness_contrast.enable", pre.clahe_enable);
    pre.clahe_clip_limit = GetValue(root, "preprocessing.brightness_contrast.clip_limit", pre.clahe_clip_limit);
    YAML::Node tile = Find(root, "preprocessing.brightness_contrast.tile_size");
    if (tile && tile.IsSequence() && tile.size() > 0) {
        pre.clahe_tile_size = tile[0].as<int>();
    } else {
        pre.clahe_tile_size = GetValue(root, "preprocessing.brightness_contrast.tile_size", pre.clahe_tile_size);
    }
    pre.denoise_enable = GetValue(root, "preprocessing.denoise.enable", pre.denoise_enable);
    pre.denoise_method = GetValue(root, "preprocessing.denoise.method", pre.denoise_method);
    pre.denoise_kernel_size = GetValue(root, "preprocessing.denoise.kernel_size", pre.denoise_kernel_size);
    pre.denoise_sigma = GetValue(root, "preprocessing.denoise.sigma", pre.denoise_sigma);
    pre.edge_enable = GetValue(root, "preprocessing.edge_enhancement.enable", pre.edge_enable);
    pre.edge_method = GetValue(root, "preprocessing.edge_enhancement.method", pre.edge_method);
    pre.edge_kernel_size = GetValue(root, "preprocessing.edge_enhancement.kernel_size", pre.edge_kernel_size);
    pre.binarize_enable = GetValue(root, "preprocessing.binarization.enable", pre.binarize_enable);
    pre.binarize_method = GetValue(root, "preprocessing.binarization.method", pre.binarize_method);
    pre.binarize_block_size = GetValue(root, "preprocessing.binarization.block_size", pre.binarize_block_size);
    pre.binarize_c_value = GetValue(root, "preprocessing.binarization.c_value", pre.binarize_c_value);
    pre.morphology_enable = GetValue(root, "preprocessing.morphology.enable", pre.morphology_enable);
    pre.morphology_operation = GetValue(root, "preprocessing.morphology.operation", pre.morphology_operation);
    pre.morphology_kernel_size = GetValue(root, "preprocessing.morphology.kernel_size", pre.morphology_kernel_size);

    FilterConfig& post = cfg.postprocessing;
    post.min_confidence = GetValue(root, "postprocessing.min_confidence", post.min_confidence);
    post.min_length = GetValue(root, "postprocessing.min_length", post.min_length);
    post.max_length = GetValue(root, "postprocessing.max_length", post.max_length);
    post.allowed_chars = GetValue(root, "postprocessing.allowed_chars", post.allowed_chars);
    post.enable_char_filter = GetValue(root, "postprocessing.enable_char_filter", post.enable_char_filter);
    post.enable_correction = GetValue(root, "postprocessing.enable_correction", post.enable_correction);
    post.enable_deduplication = GetValue(root, "postprocessing.enable_deduplication", post.enable_deduplication);
    post.similarity_threshold = GetValue(root, "postprocessing.similarity_threshold", post.similarity_threshold);
    post.min_results = GetValue(root, "postprocessing.min_results", post.min_results);
    post.enable_region_filter = GetValue(root, "postprocessing.enable_region_filter", post.enable_region_filter);

    RegionFilterConfig& region = post.region;
    region.min_area_ratio = GetValue(root, "postprocessing.min_area_ratio", region.min_area_ratio);
    region.max_area_ratio = GetValue(root, "postprocessing.max_area_ratio", region.max_area_ratio);
    region.min_aspect_ratio = GetValue(root, "postprocessing.min_aspect_ratio", region.min_aspect_ratio);
    region.max_aspect_ratio = GetValue(root, "postprocessing.max_aspect_ratio", region.max_aspect_ratio);
    region.center_region_only = GetValue(root, "postprocessing.center_region_only", region.center_region_only);
    region.center_region_ratio = GetValue(root, "postprocessing.center_region_ratio", region.center_region_ratio);

    cfg.grammar_correction = GetValue(root, "postprocessing.grammar_correction", cfg.grammar_correction);

    cfg.line_grouping.y_threshold = GetValue(root, "line_grouping.y_threshold", cfg.line_grouping.y_threshold);

    FusionConfig& fusion = cfg.multi_angle;
    fusion.fusion_method = GetValue(root, "multi_angle.fusion_method", fusion.fusion_method);
    fusion.min_images = GetValue(root, "multi_angle.min_images", fusion.min_images);
    fusion.max_images = GetValue(root, "multi_angle.max_images", fusion.max_images);
    fusion.return_alternatives = GetValue(root, "multi_angle.return_alternatives", fusion.return_alternatives);
    fusion.alternative_threshold = GetValue(root, "multi_angle.alternative_threshold", fusion.alternative_threshold);

    cfg.system.use_gpu = GetValue(root, "system.use_gpu", cfg.system.use_gpu);
    cfg.system.num_workers = GetValue(root, "system.num_workers", cfg.system.num_workers);

    VisualizationConfig& vis = cfg.visualization;
    vis.draw_bbox = GetValue(root, "visualization.draw_bbox", vis.draw_bbox);
    vis.draw_text = GetValue(root, "visualization.draw_text", vis.draw_text);
    vis.draw_confidence = GetValue(root, "visualization.draw_confidence", vis.draw_confidence);
    vis.bbox_color = ReadColor(Find(root, "visualization.bbox_color"), "visualization.bbox_color", vis.bbox_color);
    vis.text_color = ReadColor(Find(root, "visualization.text_color"), "visualization.text_color", vis.text_color);
    vis.thickness = GetValue(root, "visualization.thickness", vis.thickness);
    vis.font_scale = GetValue(root, "visualization.font_scale", vis.font_scale);

    return cfg;
}

WheelConfig ConfigLoader::FromString(const std::string& yaml_text) {
    try {
        return FromNode(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse configuration: ") + e.what());
    }
}

WheelConfig ConfigLoader::Load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        std::cerr << "[Config] Warning: config file not found: " << path << ", using defaults" << std::endl;
        return WheelConfig{};
    }

    try {
        WheelConfig cfg = FromNode(YAML::LoadFile(path));
        std::cout << "Loaded configuration from: " << path << std::endl;
        return cfg;
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load configuration " + path + ": " + e.what());
    }
}
