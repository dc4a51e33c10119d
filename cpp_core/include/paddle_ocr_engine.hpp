#pragma once
#include "paddle_utils.hpp"
#include "text_observation_source.hpp"
#include <string>
#include <vector>
#include <memory>
#include <onnxruntime_cxx_api.h>

/**
 * @class PaddleOcrEngine
 * @brief Runs the PaddleOCR detection + recognition models and reports each
 *        text region as a TextObservation with its quad and CTC confidence.
 */
class PaddleOcrEngine : public TextObservationSource {
public:
    PaddleOcrEngine(Ort::Env& env, Ort::SessionOptions& session_options, const std::string& models_dir);

    ObservationOutcome Observe(const cv::Mat& image) override;
    std::string Name() const override { return "paddleocr"; }

private:
    void LoadCharset(const std::string& path);
    std::vector<PaddleUtils::DetectedQuad> Detect(const cv::Mat& image, Ort::MemoryInfo& memory_info);
    PaddleUtils::DecodedText Recognize(const cv::Mat& crop, Ort::MemoryInfo& memory_info);

    std::unique_ptr<Ort::Session> det_session_;
    std::unique_ptr<Ort::Session> rec_session_;

    std::vector<std::string> det_input_names_str_;
    std::vector<std::string> det_output_names_str_;
    std::vector<const char*> det_input_names_;
    std::vector<const char*> det_output_names_;

    std::vector<std::string> rec_input_names_str_;
    std::vector<std::string> rec_output_names_str_;
    std::vector<const char*> rec_input_names_;
    std::vector<const char*> rec_output_names_;

    std::vector<std::string> charset_;
};
