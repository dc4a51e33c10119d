#pragma once
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * @struct TextObservation
 * @brief One detected text region as reported by an OCR source.
 */
struct TextObservation {
    std::string text;
    double confidence = 0.0;
    std::vector<cv::Point2f> box;       // clockwise from top-left, empty if unknown
    int source_image_index = 0;

    bool corrected = false;
    std::optional<std::string> original_text;
};

/**
 * @struct TextLine
 * @brief Observations sharing one row, merged left-to-right.
 */
struct TextLine {
    std::string text;
    double confidence = 0.0;
    std::vector<TextObservation> members;
};

struct CharEdit {
    size_t position = 0;
    char from = '\0';
    char to = '\0';
};

struct CorrectionCandidate {
    std::string text;
    double confidence = 0.0;
    std::vector<CharEdit> edits;
    bool pattern_match = false;
};

struct FusionCandidate {
    std::string text;
    double score = 0.0;
    int count = 0;
    double frequency = 0.0;
    double avg_confidence = 0.0;
};

struct FusionAlternative {
    std::string text;
    double score = 0.0;
    double confidence = 0.0;
};

struct FusedLine {
    std::string text;
    double confidence = 0.0;
    int occurrence_count = 0;
};

/**
 * @struct FusedResult
 * @brief Cross-image answer. Callers must check `success` before reading.
 */
struct FusedResult {
    bool success = false;
    std::string error;

    std::string merged_text;
    double confidence = 0.0;
    int source_count = 0;
    std::string fusion_method;
    std::vector<FusionAlternative> alternatives;
    std::vector<FusedLine> lines;
};

/// Output of one image going through the recognizer, and input to fusion.
struct ImageRecognition {
    bool success = false;
    std::string error;
    std::string image_path;
    std::vector<TextObservation> observations;
    std::vector<TextLine> lines;
    double processing_time_ms = 0.0;
};
