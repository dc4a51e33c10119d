#pragma once
#include "confusion_corrector.hpp"
#include "image_enhancer.hpp"
#include "line_grouper.hpp"
#include "multi_source_fusion.hpp"
#include "result_filter_pipeline.hpp"
#include "text_observation_source.hpp"
#include "wheel_config.hpp"
#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace Ort { struct Env; }

/**
 * @class WheelOCR
 * @brief End-to-end recognizer for wheel-hub photos: enhancement, OCR,
 *        filtering, line grouping and, across several photos, fusion.
 */
class WheelOCR {
public:
    /// Loads the PaddleOCR models from `models_directory`. Throws if they cannot be loaded.
    WheelOCR(const std::string& models_directory, const WheelConfig& config);
    /// Uses an already constructed observation source.
    WheelOCR(std::unique_ptr<TextObservationSource> source, const WheelConfig& config);
    ~WheelOCR();

    ImageRecognition Recognize(const std::string& image_path) const;
    ImageRecognition Recognize(const cv::Mat& image, const std::string& image_name) const;

    /// Results are returned in input order regardless of worker count.
    std::vector<ImageRecognition> RecognizeBatch(const std::vector<std::string>& image_paths) const;

    /// Views of one wheel. `per_image`, when given, receives the per-image results fed to fusion.
    FusedResult RecognizeMultiAngle(const std::vector<std::string>& image_paths,
                                    std::vector<ImageRecognition>* per_image = nullptr) const;

    /// Copy of `image` (converted to BGR) with each candidate's box and label drawn on it.
    cv::Mat Visualize(const cv::Mat& image, const ImageRecognition& recognition) const;
    /// Writes `<stem>_result.jpg` into `output_dir`, or beside the input when empty. Returns the path written.
    std::string SaveVisualization(const ImageRecognition& recognition, const std::string& output_dir) const;

    static std::string FormatRecognition(const ImageRecognition& recognition);
    static std::string FormatRecognitionTable(const ImageRecognition& recognition);
    static std::string FormatRecognitionJson(const ImageRecognition& recognition);
    static std::string FormatFusion(const FusedResult& fused, const std::vector<ImageRecognition>& per_image);
    static std::string FormatFusionJson(const FusedResult& fused, const std::vector<ImageRecognition>& per_image);

    const WheelConfig& config() const { return config_; }

private:
    std::vector<TextObservation> ApplyGrammarCorrection(const std::vector<TextObservation>& observations) const;

    WheelConfig config_;
    std::unique_ptr<Ort::Env> env_;
    std::unique_ptr<TextObservationSource> source_;
    ImageEnhancer enhancer_;
    ResultFilterPipeline filter_;
    LineGrouper grouper_;
    MultiSourceFusion fusion_;
    ConfusionCorrector corrector_;
};
