#include "paddle_ocr_engine.hpp"
#include <iostream>
#include <fstream>
#include <stdexcept>

PaddleOcrEngine::PaddleOcrEngine(Ort::Env& env, Ort::SessionOptions& session_options, const std::string& models_dir) {
    Ort::AllocatorWithDefaultOptions allocator;

    std::cout << "[Paddle] Loading detection model..." << std::endl;
    std::string det_path = models_dir + "/ocr_detection_multilingual/inference.onnx";
    det_session_ = std::make_unique<Ort::Session>(env, det_path.c_str(), session_options);

    std::cout << "[Paddle] Loading recognition model..." << std::endl;
    std::string rec_path = models_dir + "/ocr_recognition_multilingual/inference.onnx";
    rec_session_ = std::make_unique<Ort::Session>(env, rec_path.c_str(), session_options);

    det_input_names_str_.push_back(det_session_->GetInputNameAllocated(0, allocator).get());
    det_output_names_str_.push_back(det_session_->GetOutputNameAllocated(0, allocator).get());
    det_input_names_.push_back(det_input_names_str_[0].c_str());
    det_output_names_.push_back(det_output_names_str_[0].c_str());

    rec_input_names_str_.push_back(rec_session_->GetInputNameAllocated(0, allocator).get());
    rec_output_names_str_.push_back(rec_session_->GetOutputNameAllocated(0, allocator).get());
    rec_input_names_.push_back(rec_input_names_str_[0].c_str());
    rec_output_names_.push_back(rec_output_names_str_[0].c_str());

    LoadCharset(models_dir + "/ocr_recognition_multilingual/ppocrv5_dict.txt");
}

void PaddleOcrEngine::LoadCharset(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open charset file: " + path);
    }

    charset_.clear();
    charset_.push_back("blank");    // CTC blank, index 0

    std::string line;
    while (std::getline(file, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }
        if (!line.empty()) charset_.push_back(line);
    }

    // PP-OCR models reserve the last class for space.
    charset_.push_back(" ");
    std::cout << "[Paddle] Loaded charset with " << charset_.size() << " classes." << std::endl;
}

std::vector<PaddleUtils::DetectedQuad> PaddleOcrEngine::Detect(const cv::Mat& image, Ort::MemoryInfo& memory_info) {
    cv::Mat resized = PaddleUtils::ResizeForDetection(image).first;
    cv::Mat blob = PaddleUtils::NormalizeImageNet(resized);

    std::vector<int64_t> dims = {1, 3, static_cast<int64_t>(resized.rows), static_cast<int64_t>(resized.cols)};
    Ort::Value input = Ort::Value::CreateTensor<float>(
        memory_info, blob.ptr<float>(), blob.total(), dims.data(), dims.size()
    );

    auto outputs = det_session_->Run(
        Ort::RunOptions{nullptr}, det_input_names_.data(), &input, 1, det_output_names_.data(), 1
    );

    const float* prob_map = outputs[0].GetTensorData<float>();
    return PaddleUtils::ExtractQuads(prob_map, image.size(), resized.size());
}

PaddleUtils::DecodedText PaddleOcrEngine::Recognize(const cv::Mat& crop, Ort::MemoryInfo& memory_info) {
    PaddleUtils::DecodedText joined;
    double weighted = 0.0;

    for (const auto& chunk : PaddleUtils::SplitWideCrop(crop)) {
        cv::Mat blob = PaddleUtils::PrepareRecognitionInput(chunk);
        if (blob.empty()) continue;

        std::vector<int64_t> dims = {1, 3, PaddleUtils::kRecHeight, PaddleUtils::kRecWidth};
        Ort::Value input = Ort::Value::CreateTensor<float>(
            memory_info, blob.ptr<float>(), blob.total(), dims.data(), dims.size()
        );
        auto outputs = rec_session_->Run(
            Ort::RunOptions{nullptr}, rec_input_names_.data(), &input, 1, rec_output_names_.data(), 1
        );

        const float* preds = outputs[0].GetTensorData<float>();
        auto shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        PaddleUtils::DecodedText part = PaddleUtils::CtcGreedyDecode(preds, shape, charset_);
        if (part.emitted == 0) continue;

        if (!joined.text.empty()) joined.text += " ";
        joined.text += part.text;
        weighted += part.confidence * static_cast<double>(part.emitted);
        joined.emitted += part.emitted;
    }

    // Chunks are weighted by how many characters each contributed.
    if (joined.emitted > 0) joined.confidence = weighted / static_cast<double>(joined.emitted);
    return joined;
}

ObservationOutcome PaddleOcrEngine::Observe(const cv::Mat& image) {
    ObservationOutcome outcome;
    if (image.empty()) {
        outcome.error = "Empty image";
        return outcome;
    }

    try {
        auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        for (const auto& quad : Detect(image, memory_info)) {
            cv::Mat crop = PaddleUtils::CropQuad(image, quad.points);
            if (crop.empty()) continue;

            PaddleUtils::DecodedText decoded = Recognize(crop, memory_info);
            if (decoded.text.empty()) continue;

            TextObservation obs;
            obs.text = decoded.text;
            obs.confidence = decoded.confidence;
            obs.box = quad.points;
            outcome.observations.push_back(std::move(obs));
        }
        outcome.success = true;
    } catch (const Ort::Exception& e) {
        std::cerr << "[Paddle] Inference failed: " << e.what() << std::endl;
        outcome.error = e.what();
    } catch (const cv::Exception& e) {
        std::cerr << "[Paddle] Image processing failed: " << e.what() << std::endl;
        outcome.error = e.what();
    }
    return outcome;
}
