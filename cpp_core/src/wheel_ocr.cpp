#include "wheel_ocr.hpp"
#include "ocr_utils.hpp"
#include "paddle_ocr_engine.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <filesystem>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <nlohmann/json.hpp>
#include <onnxruntime_cxx_api.h>

namespace {
cv::Scalar ToScalar(const std::array<int, 3>& bgr) {
    return cv::Scalar(bgr[0], bgr[1], bgr[2]);
}

nlohmann::json ObservationJson(const TextObservation& obs) {
    nlohmann::json j;
    j["text"] = obs.text;
    j["confidence"] = obs.confidence;
    nlohmann::json box = nlohmann::json::array();
    for (const auto& p : obs.box) box.push_back({p.x, p.y});
    j["bbox"] = box;
    j["source_image_index"] = obs.source_image_index;
    j["corrected"] = obs.corrected;
    if (obs.original_text) j["original_text"] = *obs.original_text;
    return j;
}

nlohmann::json RecognitionJson(const ImageRecognition& recognition) {
    nlohmann::json j;
    j["success"] = recognition.success;
    j["image_path"] = recognition.image_path;
    if (!recognition.success) j["error"] = recognition.error;
    j["processing_time_ms"] = recognition.processing_time_ms;
    j["total_texts"] = recognition.observations.size();

    j["results"] = nlohmann::json::array();
    for (const auto& obs : recognition.observations) j["results"].push_back(ObservationJson(obs));

    j["lines"] = nlohmann::json::array();
    for (const auto& line : recognition.lines) {
        j["lines"].push_back({{"text", line.text}, {"confidence", line.confidence}, {"members", line.members.size()}});
    }
    return j;
}

// Non-UTF-8 bytes become U+FFFD instead of throwing.
std::string Dump(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}
}

WheelOCR::WheelOCR(const std::string& models_directory, const WheelConfig& config)
    : config_(config),
      enhancer_(config.preprocessing),
      filter_(config.postprocessing),
      grouper_(config.line_grouping.y_threshold),
      fusion_(config.multi_angle) {
    env_ = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "wheelocr");
    Ort::SessionOptions session_options;

    // Workers run images concurrently, so split the cores between them.
    int num_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (num_cores == 0) num_cores = 4;
    int workers = std::max(1, config_.system.num_workers);
    int intra_threads = std::max(1, num_cores / workers);

    std::cout << "[WheelOCR] Threading: " << num_cores << " cores, " << workers
              << " worker(s), " << intra_threads << " intra-op thread(s) each" << std::endl;
    session_options.SetIntraOpNumThreads(intra_threads);
    session_options.SetInterOpNumThreads(1);

    if (config_.system.use_gpu) {
        OrtCUDAProviderOptions cuda_options{};
        session_options.AppendExecutionProvider_CUDA(cuda_options);
        std::cout << "[WheelOCR] CUDA execution provider enabled" << std::endl;
    }

    source_ = std::make_unique<PaddleOcrEngine>(*env_, session_options, models_directory);
}

WheelOCR::WheelOCR(std::unique_ptr<TextObservationSource> source, const WheelConfig& config)
    : config_(config),
      source_(std::move(source)),
      enhancer_(config.preprocessing),
      filter_(config.postprocessing),
      grouper_(config.line_grouping.y_threshold),
      fusion_(config.multi_angle) {
    if (!source_) throw std::invalid_argument("WheelOCR requires an observation source");
}

// Out of line so Ort::Env is complete where the unique_ptr is destroyed.
WheelOCR::~WheelOCR() = default;

ImageRecognition WheelOCR::Recognize(const std::string& image_path) const {
    cv::Mat image = cv::imread(image_path);
    if (image.empty()) {
        ImageRecognition failed;
        failed.image_path = image_path;
        failed.error = "Failed to load image at: " + image_path;
        std::cerr << "[WheelOCR] " << failed.error << std::endl;
        return failed;
    }
    return Recognize(image, image_path);
}

ImageRecognition WheelOCR::Recognize(const cv::Mat& image, const std::string& image_name) const {
    auto start = std::chrono::steady_clock::now();

    ImageRecognition recognition;
    recognition.image_path = image_name;

    cv::Mat enhanced = enhancer_.Enhance(image);
    ObservationOutcome outcome = source_->Observe(enhanced);
    if (!outcome.success) {
        recognition.error = outcome.error.empty() ? source_->Name() + " failed" : outcome.error;
        std::cerr << "[WheelOCR] OCR failed for " << image_name << ": " << recognition.error << std::endl;
    } else {
        std::vector<TextObservation> kept = filter_.Process(outcome.observations);
        if (config_.grammar_correction) {
            // Rewrites can merge candidates and change their bonuses.
            kept = ApplyGrammarCorrection(kept);
            if (config_.postprocessing.enable_deduplication) kept = filter_.Deduplicate(kept);
            kept = filter_.Rank(kept);
        }

        recognition.lines = grouper_.Group(kept);
        recognition.observations = std::move(kept);
        recognition.success = true;
    }

    auto end = std::chrono::steady_clock::now();
    recognition.processing_time_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return recognition;
}

std::vector<TextObservation> WheelOCR::ApplyGrammarCorrection(const std::vector<TextObservation>& observations) const {
    std::vector<CorrectedText> corrected = corrector_.BatchCorrect(observations);
    std::vector<TextObservation> out = observations;

    for (size_t i = 0; i < out.size(); ++i) {
        const CorrectedText& c = corrected[i];
        if (!c.pattern_match || c.edits.empty()) continue;

        if (!out[i].original_text) out[i].original_text = out[i].text;
        out[i].text = c.text;
        out[i].corrected = true;
    }
    return out;
}

std::vector<ImageRecognition> WheelOCR::RecognizeBatch(const std::vector<std::string>& image_paths) const {
    std::vector<ImageRecognition> results;
    results.reserve(image_paths.size());

    const size_t workers = static_cast<size_t>(std::max(1, config_.system.num_workers));
    if (workers == 1) {
        for (const auto& path : image_paths) results.push_back(Recognize(path));
        return results;
    }

    // Launch in waves of `workers` and collect in submission order.
    for (size_t begin = 0; begin < image_paths.size(); begin += workers) {
        const size_t end = std::min(begin + workers, image_paths.size());
        std::vector<std::future<ImageRecognition>> wave;
        for (size_t i = begin; i < end; ++i) {
            wave.push_back(std::async(std::launch::async, [this, &image_paths, i]() {
                return Recognize(image_paths[i]);
            }));
        }
        for (auto& f : wave) results.push_back(f.get());
    }
    return results;
}

FusedResult WheelOCR::RecognizeMultiAngle(const std::vector<std::string>& image_paths,
                                          std::vector<ImageRecognition>* per_image) const {
    std::vector<ImageRecognition> results = RecognizeBatch(image_paths);
    for (size_t i = 0; i < results.size(); ++i) {
        for (auto& obs : results[i].observations) obs.source_image_index = static_cast<int>(i);
    }

    std::cout << "[WheelOCR] Fusing " << results.size() << " image(s) with method '"
              << config_.multi_angle.fusion_method << "'" << std::endl;
    FusedResult fused = fusion_.Fuse(results);
    if (per_image) *per_image = std::move(results);
    return fused;
}

cv::Mat WheelOCR::Visualize(const cv::Mat& image, const ImageRecognition& recognition) const {
    cv::Mat canvas;
    if (image.channels() == 1) {
        cv::cvtColor(image, canvas, cv::COLOR_GRAY2BGR);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, canvas, cv::COLOR_BGRA2BGR);
    } else {
        canvas = image.clone();
    }

    const VisualizationConfig& vis = config_.visualization;
    for (const auto& obs : recognition.observations) {
        if (obs.box.size() < 2) continue;

        std::vector<cv::Point> polygon;
        polygon.reserve(obs.box.size());
        for (const auto& p : obs.box) polygon.emplace_back(cvRound(p.x), cvRound(p.y));

        if (vis.draw_bbox) {
            cv::polylines(canvas, polygon, true, ToScalar(vis.bbox_color), vis.thickness);
        }
        if (vis.draw_text) {
            std::ostringstream label;
            label << obs.text;
            if (vis.draw_confidence) label << " (" << std::fixed << std::setprecision(2) << obs.confidence << ")";

            // Hershey fonts only cover ASCII; other glyphs render as '?'.
            cv::Point origin(polygon[0].x, std::max(0, polygon[0].y - 10));
            cv::putText(canvas, label.str(), origin, cv::FONT_HERSHEY_SIMPLEX, vis.font_scale,
                        ToScalar(vis.text_color), std::max(1, vis.thickness / 2));
        }
    }
    return canvas;
}

std::string WheelOCR::SaveVisualization(const ImageRecognition& recognition, const std::string& output_dir) const {
    cv::Mat image = cv::imread(recognition.image_path);
    if (image.empty()) {
        std::cerr << "[WheelOCR] Cannot visualize, failed to load: " << recognition.image_path << std::endl;
        return "";
    }

    std::filesystem::path input(recognition.image_path);
    std::string name = input.stem().string() + "_result.jpg";
    std::filesystem::path out_path;
    if (output_dir.empty()) {
        out_path = input.parent_path() / name;
    } else {
        std::filesystem::create_directories(output_dir);
        out_path = std::filesystem::path(output_dir) / name;
    }

    if (!cv::imwrite(out_path.string(), Visualize(image, recognition))) {
        std::cerr << "[WheelOCR] Failed to write visualization: " << out_path << std::endl;
        return "";
    }
    std::cout << "[WheelOCR] Visualization saved: " << out_path << std::endl;
    return out_path.string();
}

std::string WheelOCR::FormatRecognition(const ImageRecognition& recognition) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3);
    out << "=== OCR Results for " << std::filesystem::path(recognition.image_path).filename().string() << " ===\n";

    if (!recognition.success) {
        out << "Error: " << recognition.error << "\n";
        return out.str();
    }

    if (recognition.observations.empty()) {
        out << "No text detected in image.\n";
    } else {
        out << "\n--- Candidates ---\n";
        for (const auto& obs : recognition.observations) {
            out << obs.text << "  (confidence " << obs.confidence << ")";
            if (obs.corrected && obs.original_text) out << "  [from " << *obs.original_text << "]";
            out << "\n";
        }
        out << "\n--- Lines ---\n";
        for (const auto& line : recognition.lines) {
            out << line.text << "  (confidence " << line.confidence << ")\n";
        }
    }
    out << "\nProcessed in " << std::setprecision(1) << recognition.processing_time_ms << " ms\n";
    return out.str();
}

std::string WheelOCR::FormatRecognitionTable(const ImageRecognition& recognition) {
    std::ostringstream out;
    out << "=== " << std::filesystem::path(recognition.image_path).filename().string() << " ===\n";
    if (!recognition.success) {
        out << "Error: " << recognition.error << "\n";
        return out.str();
    }

    out << std::left << std::setw(6) << "#" << std::setw(30) << "Text" << "Confidence\n";
    out << std::string(48, '-') << "\n";
    for (size_t i = 0; i < recognition.observations.size(); ++i) {
        const TextObservation& obs = recognition.observations[i];
        // setw pads by bytes, so pad by code points instead.
        size_t width = OcrUtils::CharLength(obs.text);
        out << std::left << std::setw(6) << (i + 1) << obs.text
            << std::string(width < 30 ? 30 - width : 1, ' ')
            << std::fixed << std::setprecision(2) << obs.confidence * 100.0 << "%\n";
    }
    return out.str();
}

std::string WheelOCR::FormatRecognitionJson(const ImageRecognition& recognition) {
    return Dump(RecognitionJson(recognition));
}

std::string WheelOCR::FormatFusion(const FusedResult& fused, const std::vector<ImageRecognition>& per_image) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3);
    out << "=== Multi-angle fusion (" << fused.fusion_method << ") ===\n";

    for (const auto& rec : per_image) {
        out << "- " << std::filesystem::path(rec.image_path).filename().string() << ": "
            << (rec.success ? std::to_string(rec.observations.size()) + " candidate(s)" : "failed (" + rec.error + ")")
            << "\n";
    }

    if (!fused.success) {
        out << "\nError: " << fused.error << "\n";
        return out.str();
    }

    out << "\nResult: " << fused.merged_text << "\n";
    out << "Confidence: " << fused.confidence << "\n";
    out << "Images used: " << fused.source_count << "\n";

    if (!fused.alternatives.empty()) {
        out << "\n--- Alternatives ---\n";
        for (const auto& alt : fused.alternatives) {
            out << alt.text << "  (score " << alt.score << ", confidence " << alt.confidence << ")\n";
        }
    }
    if (!fused.lines.empty()) {
        out << "\n--- Lines ---\n";
        for (const auto& line : fused.lines) {
            out << line.text << "  (confidence " << line.confidence << ", seen " << line.occurrence_count << "x)\n";
        }
    }
    return out.str();
}

std::string WheelOCR::FormatFusionJson(const FusedResult& fused, const std::vector<ImageRecognition>& per_image) {
    nlohmann::json j;
    j["success"] = fused.success;
    if (!fused.success) j["error"] = fused.error;
    j["merged_text"] = fused.merged_text;
    j["confidence"] = fused.confidence;
    j["source_count"] = fused.source_count;
    j["fusion_method"] = fused.fusion_method;

    j["alternatives"] = nlohmann::json::array();
    for (const auto& alt : fused.alternatives) {
        j["alternatives"].push_back({{"text", alt.text}, {"score", alt.score}, {"confidence", alt.confidence}});
    }
    j["lines"] = nlohmann::json::array();
    for (const auto& line : fused.lines) {
        j["lines"].push_back({{"text", line.text},
                              {"confidence", line.confidence},
                              {"occurrence_count", line.occurrence_count}});
    }
    j["images"] = nlohmann::json::array();
    for (const auto& rec : per_image) j["images"].push_back(RecognitionJson(rec));
    return Dump(j);
}
